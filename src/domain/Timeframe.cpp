#include "domain/Timeframe.hpp"

#include <cctype>
#include <stdexcept>
#include <string>

#include "common/Time.hpp"
#include "domain/Errors.hpp"

namespace mdc::domain {
namespace {

using common::time::kMillisPerDay;
using common::time::kMillisPerHour;
using common::time::kMillisPerMinute;
using namespace std::chrono_literals;

const std::array<TimeframeConfig, 4> kTimeframeTable{{
    {Timeframe::OneDay, 1, 15 * kMillisPerMinute, 60s},
    {Timeframe::SevenDays, 7, kMillisPerHour, 300s},
    {Timeframe::ThirtyDays, 30, 4 * kMillisPerHour, 300s},
    {Timeframe::NinetyDays, 90, kMillisPerDay, 600s},
}};

}  // namespace

std::size_t timeframeIndex(Timeframe timeframe) {
    switch (timeframe) {
    case Timeframe::OneDay:
        return 0;
    case Timeframe::SevenDays:
        return 1;
    case Timeframe::ThirtyDays:
        return 2;
    case Timeframe::NinetyDays:
        return 3;
    }
    throw std::invalid_argument("Unsupported timeframe value");
}

const TimeframeConfig& timeframeConfig(Timeframe timeframe) {
    return kTimeframeTable[timeframeIndex(timeframe)];
}

std::string_view timeframeLabel(Timeframe timeframe) {
    switch (timeframe) {
    case Timeframe::OneDay:
        return "1D";
    case Timeframe::SevenDays:
        return "7D";
    case Timeframe::ThirtyDays:
        return "30D";
    case Timeframe::NinetyDays:
        return "90D";
    }
    throw std::invalid_argument("Unsupported timeframe value");
}

std::optional<Timeframe> timeframeFromString(std::string_view text) {
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text) {
        normalized.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }

    for (const auto timeframe : kAllTimeframes) {
        if (normalized == timeframeLabel(timeframe)) {
            return timeframe;
        }
    }
    return std::nullopt;
}

Timeframe parseTimeframe(std::string_view text) {
    if (const auto parsed = timeframeFromString(text)) {
        return *parsed;
    }
    throw InvalidTimeframe(std::string{text});
}

}  // namespace mdc::domain
