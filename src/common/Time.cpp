#include "common/Time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace mdc::common::time {
namespace {

std::tm safeGmtime(std::time_t time) {
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    return tm;
}

// Floors toward negative infinity so pre-epoch instants keep a positive millisecond part.
void splitMillis(std::int64_t unixMillis, std::time_t& seconds, int& millis) {
    std::int64_t wholeSeconds = unixMillis / kMillisPerSecond;
    std::int64_t remainder = unixMillis % kMillisPerSecond;
    if (remainder < 0) {
        remainder += kMillisPerSecond;
        --wholeSeconds;
    }
    seconds = static_cast<std::time_t>(wholeSeconds);
    millis = static_cast<int>(remainder);
}

std::string format(std::chrono::system_clock::time_point timePoint, const char* pattern) {
    std::time_t seconds{};
    int millis = 0;
    splitMillis(toUnixMillis(timePoint), seconds, millis);
    const auto tm = safeGmtime(seconds);

    std::ostringstream oss;
    oss << std::put_time(&tm, pattern) << '.' << std::setw(3) << std::setfill('0') << millis;
    return oss.str();
}

}  // namespace

std::string formatIso8601Utc(std::chrono::system_clock::time_point timePoint) {
    return format(timePoint, "%Y-%m-%dT%H:%M:%S") + 'Z';
}

std::string formatLogTimestamp(std::chrono::system_clock::time_point timePoint) {
    return format(timePoint, "%Y-%m-%d %H:%M:%S");
}

std::int64_t toUnixMillis(std::chrono::system_clock::time_point timePoint) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(timePoint.time_since_epoch()).count();
}

}  // namespace mdc::common::time
