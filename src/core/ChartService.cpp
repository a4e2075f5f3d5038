#include "core/ChartService.hpp"

#include <memory>
#include <utility>

#include "common/Log.hpp"
#include "core/CandleBuilder.hpp"

namespace mdc::core {

ChartService::ChartService(ChartCache& cache, domain::IMarketChartSource& source, std::string pairLabel)
    : ChartService(cache, source, std::move(pairLabel), [] { return std::chrono::system_clock::now(); }) {}

ChartService::ChartService(ChartCache& cache,
                           domain::IMarketChartSource& source,
                           std::string pairLabel,
                           SystemNowFn systemNow)
    : cache_(cache),
      source_(source),
      pairLabel_(std::move(pairLabel)),
      systemNow_(systemNow ? std::move(systemNow) : SystemNowFn{[] { return std::chrono::system_clock::now(); }}) {}

domain::ChartResponsePtr ChartService::getChart(domain::Timeframe timeframe) {
    return cache_.getOrRefresh(timeframe, [this, timeframe] { return loadChart(timeframe); });
}

domain::ChartResponsePtr ChartService::loadChart(domain::Timeframe timeframe) {
    const auto& config = domain::timeframeConfig(timeframe);
    const auto series = source_.fetch_market_chart(config);

    auto response = std::make_shared<domain::ChartResponse>();
    response->pair = pairLabel_;
    response->timeframe = timeframe;
    response->bucketWidthSeconds = config.bucketWidthSeconds();
    response->source = source_.source_name();
    response->candles = CandleBuilder::build(series.prices, series.volumes, config.bucketWidthMs);
    response->generatedAt = systemNow_();

    LOG_INFO("Chart built pair=" << pairLabel_ << " timeframe=" << domain::timeframeLabel(timeframe)
             << " prices=" << series.prices.size() << " volumes=" << series.volumes.size()
             << " candles=" << response->candles.size());
    return response;
}

}  // namespace mdc::core
