#include "core/CandleBuilder.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <map>
#include <stdexcept>

#include "common/Time.hpp"

namespace mdc::core {
namespace {

struct WorkingCandle {
    domain::Candle candle;
    std::size_t samples{0};
};

std::int64_t floorDiv(std::int64_t value, std::int64_t divisor) {
    std::int64_t quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

double roundToDecimals(double value, int decimals) {
    // Largest finite double printed with %.8f stays well below 400 characters.
    std::array<char, 400> buffer{};
    const int written = std::snprintf(buffer.data(), buffer.size(), "%.*f", decimals, value);
    if (written < 0 || static_cast<std::size_t>(written) >= buffer.size()) {
        return value;
    }
    return std::strtod(buffer.data(), nullptr);
}

void creditVolume(std::map<std::int64_t, WorkingCandle>& buckets,
                  const domain::VolumePoint& sample,
                  std::int64_t bucketWidthMs) {
    const auto target = buckets.find(CandleBuilder::bucketStartMs(sample.timestampMs, bucketWidthMs));
    if (target != buckets.end()) {
        target->second.candle.volume += std::max(sample.volume, 0.0);
    }
}

}  // namespace

std::int64_t CandleBuilder::bucketStartMs(domain::TimestampMs timestampMs, std::int64_t bucketWidthMs) {
    return floorDiv(timestampMs, bucketWidthMs) * bucketWidthMs;
}

double CandleBuilder::normalizePrice(double value) {
    return roundToDecimals(value, kPriceDecimals);
}

double CandleBuilder::normalizeVolume(double value) {
    return roundToDecimals(value, kVolumeDecimals);
}

std::vector<domain::Candle> CandleBuilder::build(const std::vector<domain::PricePoint>& prices,
                                                 const std::vector<domain::VolumePoint>& volumes,
                                                 std::int64_t bucketWidthMs) {
    if (bucketWidthMs <= 0) {
        throw std::invalid_argument("Candle bucket width must be positive");
    }
    if (prices.empty()) {
        return {};
    }

    auto sortedPrices = prices;
    auto sortedVolumes = volumes;
    std::stable_sort(sortedPrices.begin(), sortedPrices.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.timestampMs < rhs.timestampMs;
    });
    std::stable_sort(sortedVolumes.begin(), sortedVolumes.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.timestampMs < rhs.timestampMs;
    });

    std::map<std::int64_t, WorkingCandle> buckets;
    std::size_t volumeIndex = 0;

    for (const auto& point : sortedPrices) {
        const auto bucketStart = bucketStartMs(point.timestampMs, bucketWidthMs);
        auto& working = buckets[bucketStart];
        if (working.samples == 0) {
            working.candle.time = floorDiv(bucketStart, common::time::kMillisPerSecond);
            working.candle.open = point.price;
            working.candle.high = point.price;
            working.candle.low = point.price;
            working.candle.close = point.price;
        }
        else {
            working.candle.high = std::max(working.candle.high, point.price);
            working.candle.low = std::min(working.candle.low, point.price);
            working.candle.close = point.price;
        }
        ++working.samples;

        while (volumeIndex < sortedVolumes.size() && sortedVolumes[volumeIndex].timestampMs <= point.timestampMs) {
            creditVolume(buckets, sortedVolumes[volumeIndex++], bucketWidthMs);
        }
    }

    auto first = buckets.begin();
    if (buckets.size() > kMaxCandles) {
        std::advance(first, static_cast<std::ptrdiff_t>(buckets.size() - kMaxCandles));
    }

    std::vector<domain::Candle> candles;
    candles.reserve(std::min(buckets.size(), kMaxCandles));
    for (auto it = first; it != buckets.end(); ++it) {
        const auto& raw = it->second.candle;
        domain::Candle candle;
        candle.time = raw.time;
        candle.open = normalizePrice(raw.open);
        candle.high = normalizePrice(raw.high);
        candle.low = normalizePrice(raw.low);
        candle.close = normalizePrice(raw.close);
        candle.volume = normalizeVolume(raw.volume);
        candles.push_back(candle);
    }
    return candles;
}

}  // namespace mdc::core
