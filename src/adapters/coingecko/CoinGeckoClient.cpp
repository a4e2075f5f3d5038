#include "adapters/coingecko/CoinGeckoClient.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/json.hpp>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"

namespace {

using mdc::domain::UpstreamMalformedResponse;

std::int64_t json_to_timestamp(const boost::json::value& value, const std::string& where) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        const auto raw = value.as_uint64();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw UpstreamMalformedResponse(where + ": timestamp out of range");
        }
        return static_cast<std::int64_t>(raw);
    }
    if (value.is_double()) {
        const double raw = value.as_double();
        if (!std::isfinite(raw) || std::fabs(raw) > 9.0e15) {
            throw UpstreamMalformedResponse(where + ": timestamp out of range");
        }
        return static_cast<std::int64_t>(std::floor(raw));
    }
    throw UpstreamMalformedResponse(where + ": timestamp is not a number");
}

double json_to_double(const boost::json::value& value, const std::string& where) {
    double result = 0.0;
    if (value.is_double()) {
        result = value.as_double();
    }
    else if (value.is_int64()) {
        result = static_cast<double>(value.as_int64());
    }
    else if (value.is_uint64()) {
        result = static_cast<double>(value.as_uint64());
    }
    else {
        throw UpstreamMalformedResponse(where + ": value is not a number");
    }
    if (!std::isfinite(result)) {
        throw UpstreamMalformedResponse(where + ": value is not finite");
    }
    return result;
}

template <class Point, class Assign>
std::vector<Point> parse_pairs(const boost::json::value& field, const char* name, Assign assign) {
    if (!field.is_array()) {
        throw UpstreamMalformedResponse(std::string{"'"} + name + "' is not an array");
    }

    const auto& rows = field.as_array();
    std::vector<Point> points;
    points.reserve(rows.size());
    for (std::size_t i = 0; i < rows.size(); ++i) {
        const std::string where = std::string{name} + '[' + std::to_string(i) + ']';
        if (!rows[i].is_array()) {
            throw UpstreamMalformedResponse(where + " is not an array");
        }
        const auto& pair = rows[i].as_array();
        if (pair.size() != 2U) {
            throw UpstreamMalformedResponse(where + " does not have exactly two elements");
        }
        Point point{};
        assign(point, json_to_timestamp(pair[0], where), json_to_double(pair[1], where));
        points.push_back(point);
    }
    return points;
}

}  // namespace

namespace mdc::adapters::coingecko {

CoinGeckoClient::CoinGeckoClient(Options options)
    : CoinGeckoClient(std::move(options), &infra::http::http_get) {}

CoinGeckoClient::CoinGeckoClient(Options options, Transport transport)
    : options_(std::move(options)),
      baseUrl_(infra::http::parse_url(options_.baseUrl)),
      transport_(std::move(transport)) {
    if (options_.coinId.empty()) {
        throw std::invalid_argument("CoinGecko coin id must not be empty");
    }
    if (!transport_) {
        throw std::invalid_argument("CoinGecko transport must be callable");
    }
}

std::string CoinGeckoClient::source_name() const { return kSourceName; }

std::string CoinGeckoClient::request_target(const domain::TimeframeConfig& config) const {
    std::ostringstream target;
    target << baseUrl_.basePath << "/coins/" << options_.coinId << "/market_chart?vs_currency=usd&days="
           << config.lookbackDays;
    return target.str();
}

domain::MarketChartSeries CoinGeckoClient::fetch_market_chart(const domain::TimeframeConfig& config) {
    const auto label = domain::timeframeLabel(config.timeframe);
    const auto target = request_target(config);
    LOG_INFO("Fetching CoinGecko chart for timeframe " << label << ": " << baseUrl_.origin() << target);
    common::metrics::Registry::instance().incrementCounter(common::metrics::kUpstreamRequests);

    infra::http::RequestOptions requestOptions{};
    requestOptions.timeout = options_.timeout;
    requestOptions.userAgent = options_.userAgent;

    infra::http::HttpResponse response;
    try {
        response = transport_(baseUrl_, target, requestOptions);
    } catch (const infra::http::TransportError& ex) {
        LOG_ERR("Failed to reach CoinGecko for timeframe " << label << ": " << ex.what());
        throw domain::UpstreamUnreachable("Unable to contact CoinGecko API: " + std::string{ex.what()});
    }

    if (!response.final_target.empty() && (response.final_host != baseUrl_.host || response.final_target != target)) {
        LOG_INFO("CoinGecko redirected timeframe " << label << " request to " << response.final_host
                 << response.final_target);
    }

    if (response.status < 200U || response.status >= 300U) {
        LOG_ERR("CoinGecko responded with status " << response.status << " for timeframe " << label << ": "
                << response.body.substr(0, kErrorBodyPreview));
        throw domain::UpstreamHttpError(
            response.status, "CoinGecko request failed with status " + std::to_string(response.status));
    }

    try {
        return parse_market_chart(response.body);
    } catch (const domain::UpstreamMalformedResponse& ex) {
        LOG_ERR("CoinGecko response validation failed for timeframe " << label << ": " << ex.what());
        throw;
    }
}

domain::MarketChartSeries CoinGeckoClient::parse_market_chart(std::string_view body) {
    boost::json::error_code ec;
    const auto json = boost::json::parse(boost::json::string_view{body.data(), body.size()}, ec);
    if (ec) {
        throw domain::UpstreamMalformedResponse("Invalid CoinGecko response: " + ec.message());
    }
    if (!json.is_object()) {
        throw domain::UpstreamMalformedResponse("Unexpected CoinGecko response structure: root is not an object");
    }

    const auto& root = json.as_object();
    const auto* prices = root.if_contains("prices");
    if (prices == nullptr) {
        throw domain::UpstreamMalformedResponse("Unexpected CoinGecko response structure: missing 'prices'");
    }

    domain::MarketChartSeries series;
    series.prices = parse_pairs<domain::PricePoint>(
        *prices, "prices", [](domain::PricePoint& point, std::int64_t ts, double value) {
            point.timestampMs = ts;
            point.price = value;
        });

    const auto* volumes = root.if_contains("total_volumes");
    if (volumes != nullptr) {
        series.volumes = parse_pairs<domain::VolumePoint>(
            *volumes, "total_volumes", [](domain::VolumePoint& point, std::int64_t ts, double value) {
                point.timestampMs = ts;
                point.volume = value;
            });
    }
    return series;
}

}  // namespace mdc::adapters::coingecko
