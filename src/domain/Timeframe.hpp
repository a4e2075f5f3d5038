#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mdc::domain {

enum class Timeframe {
    OneDay,
    SevenDays,
    ThirtyDays,
    NinetyDays,
};

struct TimeframeConfig {
    Timeframe timeframe;
    std::int32_t lookbackDays;
    std::int64_t bucketWidthMs;
    std::chrono::milliseconds cacheTtl;

    std::int64_t bucketWidthSeconds() const { return bucketWidthMs / 1000; }
};

inline constexpr std::array<Timeframe, 4> kAllTimeframes{
    Timeframe::OneDay,
    Timeframe::SevenDays,
    Timeframe::ThirtyDays,
    Timeframe::NinetyDays,
};

inline constexpr Timeframe kDefaultTimeframe = Timeframe::OneDay;

const TimeframeConfig& timeframeConfig(Timeframe timeframe);

// "1D", "7D", "30D", "90D"
std::string_view timeframeLabel(Timeframe timeframe);

// Case-insensitive; std::nullopt for anything outside the four labels.
std::optional<Timeframe> timeframeFromString(std::string_view text);

// Throws InvalidTimeframe.
Timeframe parseTimeframe(std::string_view text);

std::size_t timeframeIndex(Timeframe timeframe);

}  // namespace mdc::domain
