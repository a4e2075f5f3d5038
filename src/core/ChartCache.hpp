#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>

#include "domain/Models.hpp"
#include "domain/Timeframe.hpp"

namespace mdc::core {

// Per-timeframe TTL cache with single-flight refresh.
//
// Each timeframe owns an independent cell (entry + in-flight future) guarded by its own mutex, so
// loads for different timeframes never wait on each other. While a cell is stale or empty, the
// first caller runs the loader on its own thread; callers arriving before it settles block on the
// same shared future and observe the same value or exception. A failed load leaves the previous
// entry untouched and clears the in-flight marker so the next call retries immediately.
class ChartCache {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;
    using Loader = std::function<domain::ChartResponsePtr()>;

    struct Stats {
        std::uint64_t hits{0};
        std::uint64_t misses{0};
        std::uint64_t coalesced{0};
        std::uint64_t loadFailures{0};
    };

    ChartCache();
    explicit ChartCache(NowFn now);

    ChartCache(const ChartCache&) = delete;
    ChartCache& operator=(const ChartCache&) = delete;

    // Throws whatever the loader throws, to the loading caller and every coalesced waiter.
    // A loader returning nullptr is reported as std::logic_error.
    domain::ChartResponsePtr getOrRefresh(domain::Timeframe timeframe, const Loader& loader);

    // Last stored response regardless of expiry; nullptr when nothing was ever stored.
    domain::ChartResponsePtr peek(domain::Timeframe timeframe) const;

    bool isFresh(domain::Timeframe timeframe) const;
    bool isLoading(domain::Timeframe timeframe) const;

    Stats stats() const;

private:
    struct Entry {
        domain::ChartResponsePtr response;
        Clock::time_point expiresAt;
    };

    struct Cell {
        mutable std::mutex mutex;
        std::optional<Entry> entry;
        std::optional<std::shared_future<domain::ChartResponsePtr>> inflight;
    };

    Cell& cellFor(domain::Timeframe timeframe) const;
    domain::ChartResponsePtr runLoader(domain::Timeframe timeframe,
                                       Cell& cell,
                                       const Loader& loader,
                                       std::promise<domain::ChartResponsePtr>& promise);
    void recordHit();
    void recordMiss();
    void recordCoalesced();
    void recordFailure();

    NowFn now_;
    mutable std::array<Cell, domain::kAllTimeframes.size()> cells_;

    mutable std::mutex statsMutex_;
    Stats stats_{};
};

}  // namespace mdc::core
