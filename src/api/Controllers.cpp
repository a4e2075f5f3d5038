#include "api/Controllers.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <thread>
#include <utility>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include "api/ChartJson.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/ChartService.hpp"
#include "domain/Errors.hpp"
#include "http/ErrorCodes.hpp"
#include "http/HttpJson.hpp"
#include "http/QueryParams.hpp"
#include "http/Validation.hpp"
#include "http/json_error.hpp"

namespace mdc::api {

namespace {

constexpr char kMarketChartRouteKey[] = "GET /api/market-data/v1/charts/kta-usdt";
constexpr int kUpstreamFailureStatus = 502;

Response makeJsonResponse(int statusCode, boost::json::value payload) {
    Response response{};
    mdc::http::write_json(response, payload);
    response.statusCode = statusCode;
    response.statusText = mdc::http::status_reason(statusCode);
    return response;
}

}  // namespace

Response healthz() {
    boost::json::object payload;
    payload["status"] = "ok";
    return makeJsonResponse(200, std::move(payload));
}

Response version() {
    boost::json::object payload;
    payload["name"] = "mdc-chart-service";
    payload["version"] = "1.0.0";
    return makeJsonResponse(200, std::move(payload));
}

Response marketChart(const Request& request, core::ChartService& service) {
    common::metrics::Registry::ScopedTimer requestTimer(kMarketChartRouteKey);

    Response response{};

    domain::Timeframe timeframe = domain::kDefaultTimeframe;
    try {
        timeframe = mdc::http::validation::timeframe_from_query(mdc::http::opt_string(request, "timeframe"));
    } catch (const domain::InvalidTimeframe& ex) {
        LOG_WARN("Controllers::marketChart invalid timeframe value=" << ex.value() << " query=" << request.query);
        boost::json::object extra;
        extra["allowed"] = boost::json::array{"1D", "7D", "30D", "90D"};
        mdc::http::json_error(response, 400, mdc::http::errors::timeframe_invalid, extra);
        return response;
    }

    try {
        const auto chart = service.getChart(timeframe);
        mdc::http::write_json(response, chart_to_json(*chart));
    } catch (const domain::UpstreamHttpError& ex) {
        LOG_WARN("Controllers::marketChart upstream status=" << ex.status() << " error=" << ex.what());
        boost::json::object extra;
        extra["status"] = ex.status();
        mdc::http::json_error(response, kUpstreamFailureStatus, mdc::http::errors::upstream_http_error, extra);
    } catch (const domain::UpstreamUnreachable& ex) {
        LOG_WARN("Controllers::marketChart upstream unreachable error=" << ex.what());
        mdc::http::json_error(response, kUpstreamFailureStatus, mdc::http::errors::upstream_unreachable);
    } catch (const domain::UpstreamMalformedResponse& ex) {
        LOG_WARN("Controllers::marketChart upstream malformed error=" << ex.what());
        mdc::http::json_error(response, kUpstreamFailureStatus, mdc::http::errors::upstream_malformed_response);
    } catch (const std::exception& ex) {
        LOG_ERR("Controllers::marketChart unexpected error=" << ex.what());
        mdc::http::json_error(response, 500, mdc::http::errors::internal_error);
    }
    return response;
}

Response stats(const Request&) {
    const auto snapshot = common::metrics::Registry::instance().snapshot();
    const auto uptimeSeconds =
        std::chrono::duration_cast<std::chrono::duration<double>>(snapshot.capturedAt - snapshot.startTime).count();

    auto threadCount = std::thread::hardware_concurrency();
    if (threadCount == 0U) {
        threadCount = 1U;
    }

    boost::json::object counters;
    for (const auto& [key, value] : snapshot.counters) {
        counters[key] = value;
    }

    boost::json::object routes;
    for (const auto& [route, metrics] : snapshot.routes) {
        boost::json::object row;
        row["requests"] = metrics.totalRequests;
        if (metrics.p95Ms.has_value()) {
            row["p95_ms"] = *metrics.p95Ms;
        }
        if (metrics.p99Ms.has_value()) {
            row["p99_ms"] = *metrics.p99Ms;
        }
        routes[route] = std::move(row);
    }

    boost::json::object payload;
    payload["uptime_seconds"] = uptimeSeconds;
    payload["threads"] = threadCount;
    payload["counters"] = std::move(counters);
    payload["routes"] = std::move(routes);
    return makeJsonResponse(200, std::move(payload));
}

}  // namespace mdc::api
