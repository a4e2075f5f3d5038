#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "adapters/coingecko/CoinGeckoClient.hpp"
#include "common/Log.hpp"
#include "domain/Errors.hpp"
#include "infra/http/HttpClient.hpp"

namespace {

using mdc::adapters::coingecko::CoinGeckoClient;
using mdc::domain::Timeframe;
using mdc::domain::UpstreamMalformedResponse;
using mdc::infra::http::HttpResponse;
using mdc::infra::http::RequestOptions;
using mdc::infra::http::Url;

struct RecordedCall {
    Url url;
    std::string target;
    RequestOptions options;
};

struct LogCapture {
    LogCapture() {
        mdc::log::setSink([this](mdc::log::Level level, const std::string& line) {
            std::lock_guard<std::mutex> lock(mutex);
            if (level == mdc::log::Level::Error) {
                errors.push_back(line);
            }
            all.push_back(line);
        });
    }

    ~LogCapture() { mdc::log::setSink({}); }

    bool errorContains(const std::string& needle) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& line : errors) {
            if (line.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    bool anyContains(const std::string& needle) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& line : all) {
            if (line.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::mutex mutex;
    std::vector<std::string> errors;
    std::vector<std::string> all;
};

CoinGeckoClient::Options makeOptions(const std::string& baseUrl) {
    CoinGeckoClient::Options options{};
    options.baseUrl = baseUrl;
    options.coinId = "keeta";
    options.timeout = std::chrono::seconds(3);
    return options;
}

bool expectMalformed(const std::string& body, const char* label) {
    try {
        (void)CoinGeckoClient::parse_market_chart(body);
    } catch (const UpstreamMalformedResponse&) {
        return true;
    }
    std::cerr << "Expected UpstreamMalformedResponse for " << label << "\n";
    return false;
}

}  // namespace

int main() {
    // URL parsing.
    {
        const auto url = mdc::infra::http::parse_url("https://api.coingecko.com/api/v3/");
        if (url.scheme != "https" || url.host != "api.coingecko.com" || url.port != "443" || url.basePath != "/api/v3") {
            std::cerr << "Unexpected parse of the default base URL\n";
            return 1;
        }
        const auto local = mdc::infra::http::parse_url("http://127.0.0.1:8089");
        if (local.port != "8089" || !local.basePath.empty() || local.origin() != "http://127.0.0.1:8089") {
            std::cerr << "Unexpected parse of a local base URL\n";
            return 1;
        }
        for (const char* bad : {"api.coingecko.com", "ftp://host", "https://", "http://host:abc"}) {
            try {
                (void)mdc::infra::http::parse_url(bad);
                std::cerr << "Expected invalid_argument for " << bad << "\n";
                return 1;
            } catch (const std::invalid_argument&) {
            }
        }
    }

    // Request shape and successful decode.
    {
        std::vector<RecordedCall> calls;
        CoinGeckoClient client(makeOptions("https://api.coingecko.com/api/v3"),
                               [&calls](const Url& url, const std::string& target, const RequestOptions& options) {
                                   calls.push_back({url, target, options});
                                   HttpResponse response;
                                   response.status = 200U;
                                   response.body =
                                       R"({"prices":[[1700000000000,0.51],[1700000300000.0,0.52]],)"
                                       R"("market_caps":[[1700000000000,1]],"total_volumes":[[1700000000000,12345.6]]})";
                                   return response;
                               });

        const auto series = client.fetch_market_chart(mdc::domain::timeframeConfig(Timeframe::SevenDays));
        if (calls.size() != 1) {
            std::cerr << "Expected exactly one upstream request\n";
            return 1;
        }
        if (calls[0].target != "/api/v3/coins/keeta/market_chart?vs_currency=usd&days=7") {
            std::cerr << "Unexpected request target " << calls[0].target << "\n";
            return 1;
        }
        if (calls[0].url.host != "api.coingecko.com" || calls[0].options.timeout != std::chrono::seconds(3)) {
            std::cerr << "Transport received the wrong host or timeout\n";
            return 1;
        }
        if (series.prices.size() != 2 || series.prices[1].timestampMs != 1700000300000 || series.prices[1].price != 0.52
            || series.volumes.size() != 1 || series.volumes[0].volume != 12345.6) {
            std::cerr << "Unexpected decoded series\n";
            return 1;
        }
        if (client.source_name() != "coingecko") {
            std::cerr << "Unexpected source name " << client.source_name() << "\n";
            return 1;
        }
    }

    // A redirected response is reported with its final location.
    {
        LogCapture capture;
        CoinGeckoClient client(makeOptions("https://api.coingecko.com/api/v3"),
                               [](const Url&, const std::string&, const RequestOptions&) {
                                   HttpResponse response;
                                   response.status = 200U;
                                   response.body = R"({"prices":[[1,2.0]]})";
                                   response.final_host = "mirror.coingecko.example";
                                   response.final_target = "/v3/coins/keeta/market_chart?vs_currency=usd&days=1";
                                   return response;
                               });
        const auto series = client.fetch_market_chart(mdc::domain::timeframeConfig(Timeframe::OneDay));
        if (series.prices.size() != 1 || !capture.anyContains("mirror.coingecko.example/v3/coins/keeta")) {
            std::cerr << "Redirect target should be logged\n";
            return 1;
        }
    }

    // Non-2xx statuses become UpstreamHttpError and log a body preview.
    {
        LogCapture capture;
        const std::string longBody = std::string(150, 'x') + "coin not found" + std::string(300, 'y');
        CoinGeckoClient client(makeOptions("https://api.coingecko.com/api/v3"),
                               [&longBody](const Url&, const std::string&, const RequestOptions&) {
                                   HttpResponse response;
                                   response.status = 404U;
                                   response.body = longBody;
                                   return response;
                               });
        try {
            (void)client.fetch_market_chart(mdc::domain::timeframeConfig(Timeframe::OneDay));
            std::cerr << "Expected UpstreamHttpError for status 404\n";
            return 1;
        } catch (const mdc::domain::UpstreamHttpError& ex) {
            if (ex.status() != 404U) {
                std::cerr << "Expected status 404 but got " << ex.status() << "\n";
                return 1;
            }
        }
        if (!capture.errorContains("coin not found")) {
            std::cerr << "Error log should include the start of the response body\n";
            return 1;
        }
        if (capture.errorContains(std::string(101, 'y'))) {
            std::cerr << "Error log should truncate the response body to 200 characters\n";
            return 1;
        }
    }

    // Transport failures become UpstreamUnreachable.
    {
        LogCapture capture;
        CoinGeckoClient client(makeOptions("http://127.0.0.1:9"),
                               [](const Url&, const std::string&, const RequestOptions&) -> HttpResponse {
                                   throw mdc::infra::http::TransportError("connection refused");
                               });
        try {
            (void)client.fetch_market_chart(mdc::domain::timeframeConfig(Timeframe::ThirtyDays));
            std::cerr << "Expected UpstreamUnreachable\n";
            return 1;
        } catch (const mdc::domain::UpstreamUnreachable& ex) {
            if (std::string{ex.what()}.find("connection refused") == std::string::npos) {
                std::cerr << "Unreachable error should carry the transport cause: " << ex.what() << "\n";
                return 1;
            }
        }
    }

    // Malformed payloads reach the caller as UpstreamMalformedResponse.
    {
        LogCapture capture;
        CoinGeckoClient client(makeOptions("https://api.coingecko.com/api/v3"),
                               [](const Url&, const std::string&, const RequestOptions&) {
                                   HttpResponse response;
                                   response.status = 200U;
                                   response.body = "<html>rate limited</html>";
                                   return response;
                               });
        try {
            (void)client.fetch_market_chart(mdc::domain::timeframeConfig(Timeframe::NinetyDays));
            std::cerr << "Expected UpstreamMalformedResponse for a non-JSON body\n";
            return 1;
        } catch (const UpstreamMalformedResponse&) {
        }
    }

    // Strict shape validation.
    if (!expectMalformed("[]", "array root") || !expectMalformed("{}", "missing prices")
        || !expectMalformed(R"({"prices":{}})", "object prices")
        || !expectMalformed(R"({"prices":[[1,2,3]]})", "three-element row")
        || !expectMalformed(R"({"prices":[[1]]})", "one-element row")
        || !expectMalformed(R"({"prices":[["1",2]]})", "string timestamp")
        || !expectMalformed(R"({"prices":[[1,"2"]]})", "string price")
        || !expectMalformed(R"({"prices":[[1,null]]})", "null price")
        || !expectMalformed(R"({"prices":[[1,2]],"total_volumes":[[1]]})", "bad volume row")
        || !expectMalformed(R"({"prices":[[1,2]],"total_volumes":"none"})", "string volumes")
        || !expectMalformed(R"({"prices":[[1e300,2]]})", "timestamp out of range")) {
        return 1;
    }

    // Missing total_volumes yields an empty volume series; null is rejected.
    {
        const auto absent = CoinGeckoClient::parse_market_chart(R"({"prices":[[1,2.5]]})");
        if (absent.prices.size() != 1 || !absent.volumes.empty()) {
            std::cerr << "Absent total_volumes should decode to an empty series\n";
            return 1;
        }
        if (!expectMalformed(R"({"prices":[[1,2.5]],"total_volumes":null})", "null total_volumes")) {
            return 1;
        }
        const auto fractional = CoinGeckoClient::parse_market_chart(R"({"prices":[[899999.6,1.0],[-0.5,2.0]]})");
        if (fractional.prices[0].timestampMs != 899999 || fractional.prices[1].timestampMs != -1) {
            std::cerr << "Fractional timestamps must floor, got " << fractional.prices[0].timestampMs << " and "
                      << fractional.prices[1].timestampMs << "\n";
            return 1;
        }
        const auto empty = CoinGeckoClient::parse_market_chart(R"({"prices":[]})");
        if (!empty.prices.empty()) {
            std::cerr << "Empty prices should decode to an empty series\n";
            return 1;
        }
    }

    try {
        CoinGeckoClient::Options options = makeOptions("not a url");
        CoinGeckoClient client(options, [](const Url&, const std::string&, const RequestOptions&) { return HttpResponse{}; });
        std::cerr << "Expected invalid_argument for a bad base URL\n";
        return 1;
    } catch (const std::invalid_argument&) {
    }

    return 0;
}
