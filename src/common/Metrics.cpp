#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace mdc::common::metrics {
namespace {

// Nearest-rank percentile over an ascending sample.
double nearestRank(const std::vector<double>& ascending, double percentile) {
    const auto rank = static_cast<std::size_t>(std::ceil(percentile * static_cast<double>(ascending.size())));
    const auto index = std::min(ascending.size() - 1U, rank == 0U ? 0U : rank - 1U);
    return ascending[index];
}

}  // namespace

std::uint64_t Registry::Snapshot::counter(const std::string& key) const {
    const auto it = counters.find(key);
    return it == counters.end() ? 0U : it->second;
}

Registry::Registry() : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry registry;
    return registry;
}

Registry::ScopedTimer::ScopedTimer(std::string routeKey)
    : routeKey_(std::move(routeKey)), start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimer::~ScopedTimer() {
    const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start_;
    Registry::instance().recordLatency(routeKey_, elapsed.count());
}

void Registry::incrementRequest(const std::string& routeKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++routes_[routeKey].totalRequests;
}

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

void Registry::recordLatency(const std::string& routeKey, double latencyMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& samples = routes_[routeKey].latenciesMs;
    samples.push_back(latencyMs);
    if (samples.size() > kMaxLatencySamples) {
        samples.pop_front();
    }
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot result;
    result.startTime = startTime_;

    std::lock_guard<std::mutex> lock(mutex_);
    result.capturedAt = std::chrono::steady_clock::now();
    result.counters = counters_;
    for (const auto& [routeKey, stats] : routes_) {
        RouteSnapshot route;
        route.totalRequests = stats.totalRequests;
        if (!stats.latenciesMs.empty()) {
            std::vector<double> ascending(stats.latenciesMs.begin(), stats.latenciesMs.end());
            std::sort(ascending.begin(), ascending.end());
            route.p95Ms = nearestRank(ascending, 0.95);
            route.p99Ms = nearestRank(ascending, 0.99);
        }
        result.routes.emplace(routeKey, route);
    }
    return result;
}

}  // namespace mdc::common::metrics
