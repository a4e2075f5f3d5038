#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "core/ChartCache.hpp"
#include "domain/Models.hpp"
#include "domain/Ports.hpp"
#include "domain/Timeframe.hpp"

namespace mdc::core {

// Wires ChartCache -> IMarketChartSource -> CandleBuilder for a single trading pair.
class ChartService {
public:
    using SystemNowFn = std::function<std::chrono::system_clock::time_point()>;

    ChartService(ChartCache& cache, domain::IMarketChartSource& source, std::string pairLabel);
    ChartService(ChartCache& cache,
                 domain::IMarketChartSource& source,
                 std::string pairLabel,
                 SystemNowFn systemNow);

    // Throws the domain::Upstream* errors raised by the source, unchanged.
    domain::ChartResponsePtr getChart(domain::Timeframe timeframe);

    const std::string& pairLabel() const { return pairLabel_; }

private:
    domain::ChartResponsePtr loadChart(domain::Timeframe timeframe);

    ChartCache& cache_;
    domain::IMarketChartSource& source_;
    std::string pairLabel_;
    SystemNowFn systemNow_;
};

}  // namespace mdc::core
