#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace mdc::common::metrics {

inline constexpr char kChartCacheHit[] = "chart_cache_hit";
inline constexpr char kChartCacheMiss[] = "chart_cache_miss";
inline constexpr char kChartCacheCoalesced[] = "chart_cache_coalesced";
inline constexpr char kChartCacheLoadFailure[] = "chart_cache_load_failure";
inline constexpr char kUpstreamRequests[] = "upstream_requests_total";

// Process-wide request counts, route latencies and named event counters, reported by GET /stats.
class Registry {
public:
    struct RouteSnapshot {
        std::uint64_t totalRequests{0};
        std::optional<double> p95Ms{};
        std::optional<double> p99Ms{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::map<std::string, RouteSnapshot> routes;
        std::map<std::string, std::uint64_t> counters;

        std::uint64_t counter(const std::string& key) const;
    };

    // Records the elapsed wall time of its scope as one latency sample for the route.
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string routeKey);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        std::string routeKey_;
        std::chrono::steady_clock::time_point start_;
    };

    static Registry& instance();

    void incrementRequest(const std::string& routeKey);
    void incrementCounter(const std::string& counterKey, std::uint64_t value = 1U);
    void recordLatency(const std::string& routeKey, double latencyMs);
    Snapshot snapshot() const;

private:
    // Oldest samples are dropped past this bound.
    static constexpr std::size_t kMaxLatencySamples = 4096;

    struct RouteStats {
        std::uint64_t totalRequests{0};
        std::deque<double> latenciesMs;
    };

    Registry();

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::map<std::string, RouteStats> routes_;
    std::map<std::string, std::uint64_t> counters_;
};

}  // namespace mdc::common::metrics
