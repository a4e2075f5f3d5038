#include "core/ChartCache.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace mdc::core {
namespace {

using common::metrics::Registry;

}  // namespace

ChartCache::ChartCache()
    : ChartCache([] { return Clock::now(); }) {}

ChartCache::ChartCache(NowFn now)
    : now_(now ? std::move(now) : NowFn{[] { return Clock::now(); }}) {}

ChartCache::Cell& ChartCache::cellFor(domain::Timeframe timeframe) const {
    return cells_[domain::timeframeIndex(timeframe)];
}

domain::ChartResponsePtr ChartCache::getOrRefresh(domain::Timeframe timeframe, const Loader& loader) {
    auto& cell = cellFor(timeframe);
    const auto label = domain::timeframeLabel(timeframe);

    std::promise<domain::ChartResponsePtr> promise;
    {
        std::unique_lock<std::mutex> lock(cell.mutex);
        if (cell.entry && now_() < cell.entry->expiresAt) {
            auto response = cell.entry->response;
            lock.unlock();
            recordHit();
            return response;
        }

        if (cell.inflight) {
            auto pending = *cell.inflight;
            lock.unlock();
            recordCoalesced();
            LOG_DEBUG("ChartCache timeframe=" << label << " waiting on in-flight refresh");
            return pending.get();
        }

        cell.inflight = promise.get_future().share();
    }

    recordMiss();
    LOG_DEBUG("ChartCache timeframe=" << label << " refresh started");
    return runLoader(timeframe, cell, loader, promise);
}

domain::ChartResponsePtr ChartCache::runLoader(domain::Timeframe timeframe,
                                               Cell& cell,
                                               const Loader& loader,
                                               std::promise<domain::ChartResponsePtr>& promise) {
    const auto label = domain::timeframeLabel(timeframe);

    domain::ChartResponsePtr response;
    try {
        response = loader ? loader() : nullptr;
        if (!response) {
            throw std::logic_error("Chart loader returned no response");
        }
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(cell.mutex);
            cell.inflight.reset();
        }
        // Settle waiters before any bookkeeping.
        promise.set_exception(std::current_exception());
        recordFailure();
        LOG_DEBUG("ChartCache timeframe=" << label << " refresh failed");
        throw;
    }

    const auto ttl = domain::timeframeConfig(timeframe).cacheTtl;
    try {
        std::lock_guard<std::mutex> lock(cell.mutex);
        cell.entry = Entry{response, now_() + ttl};
        cell.inflight.reset();
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(cell.mutex);
            cell.inflight.reset();
        }
        promise.set_exception(std::current_exception());
        recordFailure();
        throw;
    }
    promise.set_value(response);
    LOG_DEBUG("ChartCache timeframe=" << label << " refresh stored ttl_ms=" << ttl.count());
    return response;
}

void ChartCache::recordHit() {
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        ++stats_.hits;
    }
    Registry::instance().incrementCounter(common::metrics::kChartCacheHit);
}

void ChartCache::recordMiss() {
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        ++stats_.misses;
    }
    Registry::instance().incrementCounter(common::metrics::kChartCacheMiss);
}

void ChartCache::recordCoalesced() {
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        ++stats_.coalesced;
    }
    Registry::instance().incrementCounter(common::metrics::kChartCacheCoalesced);
}

void ChartCache::recordFailure() {
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        ++stats_.loadFailures;
    }
    Registry::instance().incrementCounter(common::metrics::kChartCacheLoadFailure);
}

domain::ChartResponsePtr ChartCache::peek(domain::Timeframe timeframe) const {
    const auto& cell = cellFor(timeframe);
    std::lock_guard<std::mutex> lock(cell.mutex);
    return cell.entry ? cell.entry->response : nullptr;
}

bool ChartCache::isFresh(domain::Timeframe timeframe) const {
    const auto& cell = cellFor(timeframe);
    std::lock_guard<std::mutex> lock(cell.mutex);
    return cell.entry && now_() < cell.entry->expiresAt;
}

bool ChartCache::isLoading(domain::Timeframe timeframe) const {
    const auto& cell = cellFor(timeframe);
    std::lock_guard<std::mutex> lock(cell.mutex);
    return cell.inflight.has_value();
}

ChartCache::Stats ChartCache::stats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

}  // namespace mdc::core
