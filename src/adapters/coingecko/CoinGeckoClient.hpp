#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <string_view>

#include "domain/Ports.hpp"
#include "infra/http/HttpClient.hpp"

namespace mdc::adapters::coingecko {

class CoinGeckoClient : public domain::IMarketChartSource {
public:
    struct Options {
        std::string baseUrl;
        std::string coinId;
        std::chrono::seconds timeout{10};
        std::string userAgent{"mdc-chart-service/1.0"};
    };

    using Transport = std::function<infra::http::HttpResponse(const infra::http::Url&,
                                                              const std::string&,
                                                              const infra::http::RequestOptions&)>;

    // Throws std::invalid_argument when the base URL is not an absolute http(s) URL.
    explicit CoinGeckoClient(Options options);
    CoinGeckoClient(Options options, Transport transport);
    ~CoinGeckoClient() override = default;

    domain::MarketChartSeries fetch_market_chart(const domain::TimeframeConfig& config) override;
    std::string source_name() const override;

    // Path and query relative to the host, base path included.
    std::string request_target(const domain::TimeframeConfig& config) const;

    // Strict decoder for {"prices": [[ms, price], ...], "total_volumes": [[ms, volume], ...]}.
    // Throws domain::UpstreamMalformedResponse.
    static domain::MarketChartSeries parse_market_chart(std::string_view body);

    static constexpr const char* kSourceName = "coingecko";
    static constexpr std::size_t kErrorBodyPreview = 200;

private:
    Options options_;
    infra::http::Url baseUrl_;
    Transport transport_;
};

}  // namespace mdc::adapters::coingecko
