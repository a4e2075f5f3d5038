#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

#include "adapters/coingecko/CoinGeckoClient.hpp"
#include "api/ChartJson.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "core/ChartCache.hpp"
#include "core/ChartService.hpp"
#include "domain/Errors.hpp"
#include "domain/Timeframe.hpp"
#include "http/HttpJson.hpp"

// One-shot fetch: prints the chart JSON for --timeframe to stdout, logs go to stderr.
int main(int argc, char** argv) {
    try {
        auto config = mdc::common::Config::fromArgs(argc, argv);
        mdc::log::setLevel(config.logLevel);
        mdc::log::setSink([](mdc::log::Level, const std::string& line) { std::cerr << line << '\n'; });

        const auto timeframe = mdc::domain::parseTimeframe(config.timeframe);

        mdc::adapters::coingecko::CoinGeckoClient::Options options{};
        options.baseUrl = config.upstreamBaseUrl;
        options.coinId = config.coinId;
        options.timeout = std::chrono::seconds(config.upstreamTimeoutSec);
        mdc::adapters::coingecko::CoinGeckoClient source(std::move(options));

        mdc::core::ChartCache cache;
        mdc::core::ChartService service(cache, source, config.pairLabel);

        const auto chart = service.getChart(timeframe);
        std::cout << mdc::http::serialize_json(mdc::api::chart_to_json(*chart)) << std::endl;
    } catch (const mdc::domain::InvalidTimeframe& ex) {
        LOG_ERR("Invalid timeframe '" << ex.value() << "', expected one of 1D, 7D, 30D, 90D");
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        LOG_ERR("mdc_chart failed: " << ex.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
