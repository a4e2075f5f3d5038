#pragma once

#include <string>

#include "domain/Models.hpp"
#include "domain/Timeframe.hpp"

namespace mdc::domain {

class IMarketChartSource {
public:
    virtual ~IMarketChartSource() = default;

    // One upstream round trip for the config's lookback window. Throws UpstreamError subclasses.
    virtual MarketChartSeries fetch_market_chart(const TimeframeConfig& config) = 0;

    // Short identifier reported as ChartResponse::source.
    virtual std::string source_name() const = 0;
};

}  // namespace mdc::domain
