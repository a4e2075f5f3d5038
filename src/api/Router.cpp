#include "api/Router.hpp"

#include <utility>

#include "common/Metrics.hpp"
#include "core/ChartService.hpp"
#include "http/ErrorCodes.hpp"
#include "http/json_error.hpp"

namespace mdc::api {

namespace {

std::string makeKey(const std::string& method, const std::string& path) {
    return method + ' ' + path;
}

std::string normalizePath(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

}  // namespace

Router::Router(core::ChartService& chartService) {
    routes_.emplace(makeKey("GET", "/healthz"), [](const Request&) { return healthz(); });
    routes_.emplace(makeKey("GET", "/version"), [](const Request&) { return version(); });
    routes_.emplace(makeKey("GET", "/stats"), [](const Request& request) { return stats(request); });
    routes_.emplace(makeKey("GET", "/api/market-data/v1/charts/kta-usdt"),
                    [&chartService](const Request& request) { return marketChart(request, chartService); });
}

Response Router::handle(const Request& request) const {
    const auto key = makeKey(request.method, normalizePath(request.path));
    const auto it = routes_.find(key);
    if (it != routes_.end()) {
        common::metrics::Registry::instance().incrementRequest(key);
        return it->second(request);
    }

    if (request.method == "OPTIONS") {
        return Response{204, "No Content", {}, "text/plain", {{"Access-Control-Allow-Methods", "GET, OPTIONS"}}};
    }

    Response response{};
    mdc::http::json_error(response, 404, mdc::http::errors::not_found);
    return response;
}

}  // namespace mdc::api
