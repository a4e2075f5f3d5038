#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <thread>
#include <utility>

#include "adapters/coingecko/CoinGeckoClient.hpp"
#include "api/HttpServer.hpp"
#include "api/Router.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "core/ChartCache.hpp"
#include "core/ChartService.hpp"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        auto eptr = std::current_exception();
        if (eptr) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& ex) {
                std::fprintf(stderr, "std::terminate: %s\n", ex.what());
            } catch (...) {
                std::fprintf(stderr, "std::terminate: unknown exception\n");
            }
        } else {
            std::fprintf(stderr, "std::terminate without current_exception\n");
        }
        std::_Exit(1);
    });

    try {
        auto config = mdc::common::Config::fromArgs(argc, argv);
        mdc::log::setLevel(config.logLevel);

        LOG_INFO("Configuration loaded");
        LOG_INFO("  Port: " << config.port);
        LOG_INFO("  Log level: " << mdc::log::levelToString(config.logLevel));
        LOG_INFO("  Worker threads: " << config.threads);
        LOG_INFO("  Upstream: " << config.upstreamBaseUrl << " coin=" << config.coinId
                 << " timeout=" << config.upstreamTimeoutSec << "s");
        LOG_INFO("  Pair: " << config.pairLabel);
        LOG_INFO("  CORS: " << (config.httpCorsEnable ? "on" : "off") << " origin=" << config.httpCorsOrigin);

        mdc::adapters::coingecko::CoinGeckoClient::Options options{};
        options.baseUrl = config.upstreamBaseUrl;
        options.coinId = config.coinId;
        options.timeout = std::chrono::seconds(config.upstreamTimeoutSec);
        mdc::adapters::coingecko::CoinGeckoClient source(std::move(options));

        mdc::core::ChartCache cache;
        mdc::core::ChartService service(cache, source, config.pairLabel);
        mdc::api::Router router(service);

        mdc::api::Endpoint endpoint{"0.0.0.0", config.port};
        mdc::api::HttpServer server(endpoint, config.threads, router);

        mdc::api::HttpServer::CorsConfig corsConfig{};
        corsConfig.enabled = config.httpCorsEnable && !config.httpCorsOrigin.empty();
        corsConfig.origin = config.httpCorsOrigin;
        server.setCorsConfig(std::move(corsConfig));

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        server.start();
        LOG_INFO("Server running. Waiting for requests...");

        while (gSignalStatus == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        LOG_INFO("Signal " << gSignalStatus << " received, starting graceful shutdown");
        server.stop();
        LOG_INFO("Shutdown complete");
    } catch (const std::exception& ex) {
        LOG_ERR("Fatal API error: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
