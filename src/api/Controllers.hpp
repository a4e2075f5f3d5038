#pragma once

#include <string>
#include <utility>
#include <vector>

namespace mdc::core {
class ChartService;
}

namespace mdc::api {

struct Request {
    std::string method;
    std::string target;
    std::string path;
    std::string query;
    std::string version;
};

struct Response {
    int statusCode;
    std::string statusText;
    std::string body;
    std::string contentType;
    std::vector<std::pair<std::string, std::string>> headers;
};

Response healthz();

Response version();

// GET /api/market-data/v1/charts/kta-usdt?timeframe=1D|7D|30D|90D
Response marketChart(const Request& request, core::ChartService& service);

Response stats(const Request& request);

}  // namespace mdc::api
