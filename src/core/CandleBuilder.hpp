#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "domain/Models.hpp"

namespace mdc::core {

// Aggregates raw (timestamp, price) and (timestamp, volume) samples into fixed-width OHLCV buckets.
//
// Prices are processed in timestamp order: the first sample of a bucket opens it, later samples
// widen high/low and overwrite close. Volumes are merged with a single forward cursor: after each
// price, every not-yet-consumed volume sample at or before that price's timestamp is credited
// (clamped at zero) to the bucket of its own timestamp, and only if that bucket already holds a
// candle. Volume samples never create a candle, and samples later than the last price are never
// consumed.
//
// Prices are rounded to 8 decimals and volumes to 2 decimals, nearest with exact binary ties to
// even. Only the newest kMaxCandles buckets are returned.
class CandleBuilder {
public:
    static constexpr std::size_t kMaxCandles = 500;
    static constexpr int kPriceDecimals = 8;
    static constexpr int kVolumeDecimals = 2;

    // Inputs are copied before sorting. Throws std::invalid_argument for a non-positive bucket width.
    static std::vector<domain::Candle> build(const std::vector<domain::PricePoint>& prices,
                                             const std::vector<domain::VolumePoint>& volumes,
                                             std::int64_t bucketWidthMs);

    static std::int64_t bucketStartMs(domain::TimestampMs timestampMs, std::int64_t bucketWidthMs);

    static double normalizePrice(double value);
    static double normalizeVolume(double value);
};

}  // namespace mdc::core
