#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "domain/Timeframe.hpp"

namespace mdc::domain {

using TimestampMs = std::int64_t;

struct PricePoint {
    TimestampMs timestampMs{0};
    double price{0.0};
};

struct VolumePoint {
    TimestampMs timestampMs{0};
    double volume{0.0};
};

// Raw upstream series for one lookback window; neither sequence is ordered.
struct MarketChartSeries {
    std::vector<PricePoint> prices;
    std::vector<VolumePoint> volumes;
};

struct Candle {
    std::int64_t time{0};  // bucket start, unix seconds
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};
};

inline bool operator==(const Candle& lhs, const Candle& rhs) {
    return lhs.time == rhs.time && lhs.open == rhs.open && lhs.high == rhs.high && lhs.low == rhs.low
        && lhs.close == rhs.close && lhs.volume == rhs.volume;
}

inline bool operator!=(const Candle& lhs, const Candle& rhs) { return !(lhs == rhs); }

struct ChartResponse {
    std::string pair;
    Timeframe timeframe{kDefaultTimeframe};
    std::int64_t bucketWidthSeconds{0};
    std::chrono::system_clock::time_point generatedAt{};
    std::string source;
    std::vector<Candle> candles;
};

// Responses are shared read-only between the cache and every caller that receives them.
using ChartResponsePtr = std::shared_ptr<const ChartResponse>;

}  // namespace mdc::domain
