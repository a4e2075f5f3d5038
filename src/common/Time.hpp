#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace mdc::common::time {

constexpr std::int64_t kMillisPerSecond = 1000;
constexpr std::int64_t kSecondsPerMinute = 60;
constexpr std::int64_t kMillisPerMinute = kMillisPerSecond * kSecondsPerMinute;
constexpr std::int64_t kMillisPerHour = kMillisPerMinute * 60;
constexpr std::int64_t kMillisPerDay = kMillisPerHour * 24;

// 2026-10-19T12:00:00.000Z
std::string formatIso8601Utc(std::chrono::system_clock::time_point timePoint);

// 2026-10-19 12:00:00.000, UTC, no zone suffix.
std::string formatLogTimestamp(std::chrono::system_clock::time_point timePoint);

std::int64_t toUnixMillis(std::chrono::system_clock::time_point timePoint);

}  // namespace mdc::common::time
