#pragma once

#include <QThreadPool>

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "common/errors.hpp"

namespace krishi {

using Deadline = std::chrono::steady_clock::time_point;

enum class CacheOperation {
    Location,
    Current,
    History,
    Forecast,
    ActiveAlerts,
    Metrics
};

inline const char *toCacheOperationString(CacheOperation operation)
{
    switch (operation) {
    case CacheOperation::Location:
        return "location";
    case CacheOperation::Current:
        return "current";
    case CacheOperation::History:
        return "history";
    case CacheOperation::Forecast:
        return "forecast";
    case CacheOperation::ActiveAlerts:
        return "active_alerts";
    case CacheOperation::Metrics:
        return "metrics";
    }
    return "unknown";
}

struct CacheKey {
    CacheOperation operation = CacheOperation::Current;
    std::string locationId;
    std::string window;

    std::string toString() const
    {
        return std::string(toCacheOperationString(operation)) + "|" + locationId + "|" + window;
    }
};

struct CacheStats {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t loads = 0;
    std::uint64_t joinedFlights = 0;
    std::uint64_t staleServed = 0;
    std::uint64_t timeouts = 0;
    std::uint64_t invalidations = 0;
    std::uint64_t evictions = 0;
};

template <typename T>
struct CachedResult {
    T value;
    // True only when a stale entry was served because the backend failed.
    bool stale = false;
};

/**
 * TTL cache with single-flight loading.
 *
 * Entries are sharded by location id so that invalidating one location only
 * locks one shard. On a miss the first caller starts a flight on the cache's
 * thread pool and every caller, including the first, waits on the flight's
 * shared future until its own deadline. A caller that times out leaves; the
 * flight keeps running and still populates the cache for the others.
 *
 * invalidateLocation() drops the entries and their flights: a flight that was
 * started before the invalidation completes for its own waiters but never
 * writes its (possibly pre-write) value back into the cache.
 *
 * Every miss sweeps its shard of expired entries that have no flight. With
 * stale serving enabled an expired value is kept for kStaleRetention past its
 * expiry so it can still stand in for a failed load.
 */
template <typename Value>
class SingleFlightCache {
public:
    using Loader = std::function<Value()>;

    explicit SingleFlightCache(std::chrono::milliseconds ttl,
                               bool serveStaleOnBackendFailure = false,
                               int loaderThreads = 4)
        : m_ttl(ttl)
        , m_serveStale(serveStaleOnBackendFailure)
    {
        m_pool.setMaxThreadCount(loaderThreads);
    }

    ~SingleFlightCache()
    {
        m_pool.waitForDone();
    }

    SingleFlightCache(const SingleFlightCache &) = delete;
    SingleFlightCache &operator=(const SingleFlightCache &) = delete;

    CachedResult<Value> get(const CacheKey &key, Deadline deadline, Loader loader)
    {
        const std::string cacheKey = key.toString();
        Shard &shard = shardFor(key.locationId);

        {
            std::shared_lock<std::shared_mutex> lock(shard.mutex);
            auto it = shard.entries.find(cacheKey);
            if (it != shard.entries.end() && isFresh(it->second)) {
                ++m_hits;
                return {*it->second.value, false};
            }
        }

        std::shared_future<Value> pending;
        {
            std::unique_lock<std::shared_mutex> lock(shard.mutex);
            sweepExpired(shard, cacheKey);
            Entry &entry = shard.entries[cacheKey];
            entry.locationId = key.locationId;
            if (isFresh(entry)) {
                ++m_hits;
                return {*entry.value, false};
            }
            ++m_misses;
            if (entry.flight) {
                ++m_joinedFlights;
                pending = entry.flight->result;
            } else {
                pending = startFlight(entry, cacheKey, key.locationId, std::move(loader));
            }
        }

        if (pending.wait_until(deadline) != std::future_status::ready) {
            ++m_timeouts;
            throw TimeoutError("deadline exceeded while waiting for " + cacheKey);
        }

        try {
            return {pending.get(), false};
        } catch (const BackendUnavailableError &) {
            if (m_serveStale) {
                std::optional<Value> stale = staleValue(shard, cacheKey);
                if (stale) {
                    ++m_staleServed;
                    return {std::move(*stale), true};
                }
            }
            throw;
        }
    }

    // Removes every entry of the location, including in-progress flights.
    std::size_t invalidateLocation(const std::string &locationId)
    {
        Shard &shard = shardFor(locationId);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        std::size_t removed = 0;
        for (auto it = shard.entries.begin(); it != shard.entries.end();) {
            if (it->second.locationId == locationId) {
                it = shard.entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        ++m_invalidations;
        return removed;
    }

    std::size_t size() const
    {
        std::size_t total = 0;
        for (const Shard &shard : m_shards) {
            std::shared_lock<std::shared_mutex> lock(shard.mutex);
            for (const auto &item : shard.entries) {
                if (item.second.value) {
                    ++total;
                }
            }
        }
        return total;
    }

    CacheStats stats() const
    {
        CacheStats stats;
        stats.hits = m_hits.load();
        stats.misses = m_misses.load();
        stats.loads = m_loads.load();
        stats.joinedFlights = m_joinedFlights.load();
        stats.staleServed = m_staleServed.load();
        stats.timeouts = m_timeouts.load();
        stats.invalidations = m_invalidations.load();
        stats.evictions = m_evictions.load();
        return stats;
    }

private:
    using Clock = std::chrono::steady_clock;

    struct Flight {
        std::uint64_t id = 0;
        std::shared_future<Value> result;
    };

    struct Entry {
        std::string locationId;
        std::optional<Value> value;
        Clock::time_point expiresAt;
        std::optional<Flight> flight;
    };

    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, Entry> entries;
    };

    static constexpr std::size_t kShardCount = 16;
    static constexpr std::chrono::hours kStaleRetention{24};

    Shard &shardFor(const std::string &locationId)
    {
        return m_shards[std::hash<std::string>{}(locationId) % kShardCount];
    }

    bool isFresh(const Entry &entry) const
    {
        return entry.value.has_value() && Clock::now() < entry.expiresAt;
    }

    // Called with the shard lock held. The entry for `keep` is left in place.
    void sweepExpired(Shard &shard, const std::string &keep)
    {
        const auto now = Clock::now();
        for (auto it = shard.entries.begin(); it != shard.entries.end();) {
            const Entry &entry = it->second;
            bool expired = !entry.flight;
            if (expired && entry.value) {
                const auto retainedUntil =
                    m_serveStale ? entry.expiresAt + kStaleRetention : entry.expiresAt;
                expired = retainedUntil <= now;
            }
            if (expired && it->first != keep) {
                it = shard.entries.erase(it);
                ++m_evictions;
            } else {
                ++it;
            }
        }
    }

    // Called with the shard lock held.
    std::shared_future<Value> startFlight(Entry &entry, const std::string &cacheKey,
                                          const std::string &locationId, Loader loader)
    {
        const std::uint64_t flightId = m_nextFlightId++;
        auto promise = std::make_shared<std::promise<Value>>();

        Flight flight;
        flight.id = flightId;
        flight.result = promise->get_future().share();
        entry.flight = flight;
        ++m_loads;

        m_pool.start([this, promise, loader, cacheKey, locationId, flightId]() {
            try {
                Value value = loader();
                completeFlight(cacheKey, locationId, flightId, value);
                promise->set_value(std::move(value));
            } catch (...) {
                // The failure is delivered to every waiter through the future.
                abandonFlight(cacheKey, locationId, flightId);
                promise->set_exception(std::current_exception());
            }
        });
        return flight.result;
    }

    void completeFlight(const std::string &cacheKey, const std::string &locationId,
                        std::uint64_t flightId, const Value &value)
    {
        Shard &shard = shardFor(locationId);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.entries.find(cacheKey);
        if (it == shard.entries.end() || !it->second.flight
            || it->second.flight->id != flightId) {
            return;
        }
        it->second.value = value;
        it->second.expiresAt = Clock::now() + m_ttl;
        it->second.flight.reset();
    }

    void abandonFlight(const std::string &cacheKey, const std::string &locationId,
                       std::uint64_t flightId)
    {
        Shard &shard = shardFor(locationId);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.entries.find(cacheKey);
        if (it == shard.entries.end() || !it->second.flight
            || it->second.flight->id != flightId) {
            return;
        }
        it->second.flight.reset();
        if (!it->second.value) {
            shard.entries.erase(it);
        }
    }

    std::optional<Value> staleValue(Shard &shard, const std::string &cacheKey) const
    {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.entries.find(cacheKey);
        if (it == shard.entries.end() || !it->second.value) {
            return std::nullopt;
        }
        return it->second.value;
    }

    std::chrono::milliseconds m_ttl;
    bool m_serveStale;
    std::array<Shard, kShardCount> m_shards;

    std::atomic<std::uint64_t> m_nextFlightId{1};
    std::atomic<std::uint64_t> m_hits{0};
    std::atomic<std::uint64_t> m_misses{0};
    std::atomic<std::uint64_t> m_loads{0};
    std::atomic<std::uint64_t> m_joinedFlights{0};
    std::atomic<std::uint64_t> m_staleServed{0};
    std::atomic<std::uint64_t> m_timeouts{0};
    std::atomic<std::uint64_t> m_invalidations{0};
    std::atomic<std::uint64_t> m_evictions{0};

    // Declared last so it is destroyed first; the destructor also waits on it
    // explicitly before any shard goes away.
    QThreadPool m_pool;
};

} // namespace krishi
