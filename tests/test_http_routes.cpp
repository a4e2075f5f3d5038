#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/json/parse.hpp>
#include <boost/json/object.hpp>

#include "api/Router.hpp"
#include "core/ChartCache.hpp"
#include "core/ChartService.hpp"
#include "domain/Errors.hpp"
#include "http/QueryParams.hpp"
#include "http/Validation.hpp"

namespace {

using mdc::api::Request;
using mdc::api::Response;
using mdc::domain::MarketChartSeries;
using mdc::domain::Timeframe;
using mdc::domain::TimeframeConfig;

enum class Failure { None, Unreachable, HttpStatus, Malformed, Unexpected };

class ScriptedSource : public mdc::domain::IMarketChartSource {
public:
    MarketChartSeries fetch_market_chart(const TimeframeConfig& config) override {
        lastLookbackDays = config.lookbackDays;
        switch (failure) {
        case Failure::Unreachable:
            throw mdc::domain::UpstreamUnreachable("Unable to contact CoinGecko API: timeout");
        case Failure::HttpStatus:
            throw mdc::domain::UpstreamHttpError(429, "CoinGecko request failed with status 429");
        case Failure::Malformed:
            throw mdc::domain::UpstreamMalformedResponse("missing 'prices'");
        case Failure::Unexpected:
            throw std::runtime_error("boom");
        case Failure::None:
            break;
        }
        MarketChartSeries series;
        series.prices = {{0, 1.0}, {1000, 2.0}};
        return series;
    }

    std::string source_name() const override { return "coingecko"; }

    Failure failure{Failure::None};
    int lastLookbackDays{0};
};

Request makeRequest(const std::string& method, const std::string& path, const std::string& query = {}) {
    Request request{};
    request.method = method;
    request.path = path;
    request.query = query;
    request.target = query.empty() ? path : path + "?" + query;
    request.version = "HTTP/1.1";
    return request;
}

boost::json::object parseBody(const Response& response) {
    return boost::json::parse(response.body).as_object();
}

bool expectError(const Response& response, int status, const char* code) {
    if (response.statusCode != status) {
        std::cerr << "Expected status " << status << " but got " << response.statusCode << " body=" << response.body
                  << "\n";
        return false;
    }
    const auto body = parseBody(response);
    if (body.at("error").as_string() != code) {
        std::cerr << "Expected error code " << code << " but got " << response.body << "\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    // Query parameter decoding and timeframe selection.
    {
        const auto decoded = mdc::http::opt_string(makeRequest("GET", "/x", "a=1&timeframe=%37d&b"), "timeframe");
        if (!decoded || *decoded != "7d") {
            std::cerr << "Expected URL-decoded timeframe value\n";
            return 1;
        }
        if (mdc::http::opt_string(makeRequest("GET", "/x", "a=1"), "timeframe").has_value()) {
            std::cerr << "Absent key must yield nullopt\n";
            return 1;
        }

        using mdc::http::validation::timeframe_from_query;
        if (timeframe_from_query(std::nullopt) != Timeframe::OneDay || timeframe_from_query(std::string{}) != Timeframe::OneDay
            || timeframe_from_query(std::string{"30d"}) != Timeframe::ThirtyDays
            || timeframe_from_query(std::string{"90D"}) != Timeframe::NinetyDays) {
            std::cerr << "Unexpected timeframe selection\n";
            return 1;
        }
        try {
            (void)timeframe_from_query(std::string{"1W"});
            std::cerr << "Expected InvalidTimeframe for 1W\n";
            return 1;
        } catch (const mdc::domain::InvalidTimeframe& ex) {
            if (ex.value() != "1W") {
                std::cerr << "InvalidTimeframe should carry the rejected value\n";
                return 1;
            }
        }
    }

    ScriptedSource source;
    mdc::core::ChartCache cache;
    mdc::core::ChartService service(cache, source, "KTA/USDT");
    mdc::api::Router router(service);

    const std::string chartPath = "/api/market-data/v1/charts/kta-usdt";

    // Successful chart request.
    {
        const auto response = router.handle(makeRequest("GET", chartPath, "timeframe=7D"));
        if (response.statusCode != 200) {
            std::cerr << "Expected 200 for the chart route but got " << response.statusCode << "\n";
            return 1;
        }
        const auto body = parseBody(response);
        if (body.at("pair").as_string() != "KTA/USDT" || body.at("timeframe").as_string() != "7D"
            || body.at("granularitySeconds").as_int64() != 3600 || body.at("candles").as_array().size() != 1
            || source.lastLookbackDays != 7) {
            std::cerr << "Unexpected chart body " << response.body << "\n";
            return 1;
        }
    }

    // Default timeframe when the parameter is missing.
    {
        const auto response = router.handle(makeRequest("GET", chartPath + "/"));
        if (response.statusCode != 200 || parseBody(response).at("timeframe").as_string() != "1D") {
            std::cerr << "Expected the default 1D chart\n";
            return 1;
        }
    }

    if (!expectError(router.handle(makeRequest("GET", chartPath, "timeframe=2D")), 400, "timeframe_invalid")) {
        return 1;
    }

    source.failure = Failure::Unreachable;
    if (!expectError(router.handle(makeRequest("GET", chartPath, "timeframe=30D")), 502, "upstream_unreachable")) {
        return 1;
    }
    source.failure = Failure::HttpStatus;
    {
        const auto response = router.handle(makeRequest("GET", chartPath, "timeframe=30D"));
        if (!expectError(response, 502, "upstream_http_error")) {
            return 1;
        }
        if (parseBody(response).at("status").as_int64() != 429) {
            std::cerr << "upstream_http_error should report the upstream status\n";
            return 1;
        }
    }
    source.failure = Failure::Malformed;
    if (!expectError(router.handle(makeRequest("GET", chartPath, "timeframe=30D")), 502, "upstream_malformed_response")) {
        return 1;
    }
    source.failure = Failure::Unexpected;
    if (!expectError(router.handle(makeRequest("GET", chartPath, "timeframe=90D")), 500, "internal_error")) {
        return 1;
    }

    // Cached timeframes keep serving while the upstream is failing.
    {
        const auto response = router.handle(makeRequest("GET", chartPath, "timeframe=7d"));
        if (response.statusCode != 200) {
            std::cerr << "Fresh 7D entry should be served from cache\n";
            return 1;
        }
    }

    if (!expectError(router.handle(makeRequest("GET", "/nope")), 404, "not_found")) {
        return 1;
    }
    if (router.handle(makeRequest("GET", "/healthz")).statusCode != 200) {
        std::cerr << "healthz should answer 200\n";
        return 1;
    }
    if (router.handle(makeRequest("OPTIONS", chartPath)).statusCode != 204) {
        std::cerr << "CORS preflight should answer 204\n";
        return 1;
    }
    {
        const auto response = router.handle(makeRequest("GET", "/stats"));
        const auto body = parseBody(response);
        if (response.statusCode != 200 || !body.contains("counters")) {
            std::cerr << "stats should report counters\n";
            return 1;
        }
    }

    return 0;
}
