#pragma once

/// @file coordinator.hpp
/// @brief Request coalescing in front of the cache and backends

#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace hoard_res {

class BackendRegistry;
class ResourceCache;

/// Counters for one coordinator instance
struct CoordinatorStats {
    std::uint64_t requests = 0;
    std::uint64_t cache_hits = 0;
    std::uint64_t coalesced = 0;
    std::uint64_t fetches = 0;
    std::uint64_t failures = 0;
    std::uint64_t conflicts = 0;
    std::uint64_t refreshes = 0;
    std::uint64_t abandoned = 0;
    std::uint64_t late_completions = 0;
};

// =============================================================================
// LoadCoordinator
// =============================================================================

/// Single entry point for obtaining a resource by key.
///
/// At most one backend fetch is outstanding per key. Every caller that asks
/// before the fetch settles observes the same result and, on success, holds
/// exactly one new reference.
class LoadCoordinator {
public:
    LoadCoordinator(ResourceCache& cache, BackendRegistry& backends);

    LoadCoordinator(const LoadCoordinator&) = delete;
    LoadCoordinator& operator=(const LoadCoordinator&) = delete;

    /// Load without suspending.
    ///
    /// Fails with ConcurrencyConflict when an async fetch for the key is in
    /// flight and with NotSupported when the backend is async-only.
    [[nodiscard]] LoadResult load_sync(const ResourceKey& key);

    /// Load asynchronously. Cache hits complete before this returns.
    RequestId load_async(const ResourceKey& key, LoadCallback on_complete);

    [[nodiscard]] bool is_in_flight(const ResourceKey& key) const {
        return m_in_flight.find(key) != m_in_flight.end();
    }

    [[nodiscard]] std::size_t in_flight_count() const noexcept { return m_in_flight.size(); }

    /// Number of callers waiting on the fetch for a key
    [[nodiscard]] std::size_t waiter_count(const ResourceKey& key) const;

    /// True until the request has been settled
    [[nodiscard]] bool is_pending(RequestId id) const {
        return m_pending.find(id) != m_pending.end();
    }

    /// Settle every in-flight request with the given failure.
    ///
    /// The backend fetches themselves are not cancelled; a completion that
    /// arrives afterwards is released and otherwise ignored. Returns the
    /// number of requests abandoned.
    std::size_t abandon_all(const hoard_core::Error& reason);

    [[nodiscard]] const CoordinatorStats& stats() const noexcept { return m_stats; }

private:
    struct Waiter {
        RequestId id;
        LoadCallback on_complete;
    };

    struct InFlightRequest {
        ResourceKey key;
        std::uint64_t fetch = 0;
        std::vector<Waiter> waiters;
        std::chrono::steady_clock::time_point started;
    };

    void settle(const ResourceKey& key, std::uint64_t fetch, FetchResult result);
    void discard_late(const ResourceKey& key, FetchResult& result);

    ResourceCache& m_cache;
    BackendRegistry& m_backends;
    std::unordered_map<ResourceKey, InFlightRequest> m_in_flight;
    std::unordered_set<RequestId> m_pending;
    hoard_core::IdGenerator m_request_ids;
    std::uint64_t m_next_fetch = 0;
    CoordinatorStats m_stats;
};

} // namespace hoard_res
