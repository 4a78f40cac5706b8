/// @file coordinator.cpp
/// @brief LoadCoordinator implementation

#include <hoard/res/coordinator.hpp>
#include <hoard/res/backend.hpp>
#include <hoard/res/cache.hpp>
#include <hoard/core/log.hpp>

namespace hoard_res {

LoadCoordinator::LoadCoordinator(ResourceCache& cache, BackendRegistry& backends)
    : m_cache(cache)
    , m_backends(backends) {}

LoadResult LoadCoordinator::load_sync(const ResourceKey& key) {
    ++m_stats.requests;

    const CacheEntry* entry = m_cache.get(key);
    if (entry && entry->is_ready()) {
        m_cache.add_ref(key);
        ++m_stats.cache_hits;
        return entry->asset;
    }

    if (is_in_flight(key)) {
        ++m_stats.conflicts;
        hoard_core::res_logger()->warn("sync load of {} refused: async fetch in flight", key.to_string());
        return hoard_core::Err<AssetPtr>(ResError::concurrency_conflict(key.to_string()));
    }

    Backend* backend = m_backends.find(key.kind);
    if (!backend) {
        return hoard_core::Err<AssetPtr>(ResError::no_backend(key.kind));
    }
    if (!backend->supports_sync()) {
        return hoard_core::Err<AssetPtr>(ResError::not_supported(backend->name(), "synchronous fetch"));
    }

    ++m_stats.fetches;
    if (entry) {
        ++m_stats.refreshes;
        hoard_core::res_logger()->debug("sync refetch of invalidated {}", key.to_string());
    } else {
        hoard_core::res_logger()->debug("sync fetch {}", key.to_string());
    }

    auto fetched = backend->fetch_sync(key.path);
    if (!fetched) {
        ++m_stats.failures;
        hoard_core::res_logger()->warn("sync fetch {} failed: {}", key.to_string(), fetched.error().message());
        return hoard_core::Err<AssetPtr>(fetched.error());
    }

    AssetPtr asset = fetched.value().asset;
    m_cache.insert(key, std::move(fetched).value());
    return asset;
}

RequestId LoadCoordinator::load_async(const ResourceKey& key, LoadCallback on_complete) {
    ++m_stats.requests;
    RequestId id = m_request_ids.next();

    const CacheEntry* entry = m_cache.get(key);
    if (entry && entry->is_ready()) {
        m_cache.add_ref(key);
        ++m_stats.cache_hits;
        AssetPtr asset = entry->asset;
        if (on_complete) {
            on_complete(LoadResult(std::move(asset)));
        }
        return id;
    }

    if (auto it = m_in_flight.find(key); it != m_in_flight.end()) {
        ++m_stats.coalesced;
        it->second.waiters.push_back(Waiter{id, std::move(on_complete)});
        m_pending.insert(id);
        return id;
    }

    Backend* backend = m_backends.find(key.kind);
    if (!backend) {
        ++m_stats.failures;
        if (on_complete) {
            on_complete(hoard_core::Err<AssetPtr>(ResError::no_backend(key.kind)));
        }
        return id;
    }

    // Marker goes in before the fetch starts; the backend may settle inline
    std::uint64_t fetch = ++m_next_fetch;
    InFlightRequest request;
    request.key = key;
    request.fetch = fetch;
    request.waiters.push_back(Waiter{id, std::move(on_complete)});
    request.started = std::chrono::steady_clock::now();
    m_in_flight.emplace(key, std::move(request));
    m_pending.insert(id);

    ++m_stats.fetches;
    if (entry) {
        ++m_stats.refreshes;
        m_cache.mark_loading(key);
        hoard_core::res_logger()->debug("async refetch of invalidated {}", key.to_string());
    } else {
        hoard_core::res_logger()->debug("async fetch {}", key.to_string());
    }

    backend->fetch_async(key.path, [this, key, fetch](FetchResult result) {
        settle(key, fetch, std::move(result));
    });
    return id;
}

std::size_t LoadCoordinator::waiter_count(const ResourceKey& key) const {
    auto it = m_in_flight.find(key);
    return it != m_in_flight.end() ? it->second.waiters.size() : 0;
}

std::size_t LoadCoordinator::abandon_all(const hoard_core::Error& reason) {
    std::unordered_map<ResourceKey, InFlightRequest> abandoned;
    abandoned.swap(m_in_flight);

    for (auto& [key, request] : abandoned) {
        for (const auto& waiter : request.waiters) {
            m_pending.erase(waiter.id);
        }
        m_cache.mark_invalid(key);
        ++m_stats.abandoned;
        hoard_core::res_logger()->debug("abandoning fetch {} ({} waiters)", key.to_string(), request.waiters.size());
    }

    for (auto& [key, request] : abandoned) {
        for (auto& waiter : request.waiters) {
            if (waiter.on_complete) {
                waiter.on_complete(hoard_core::Err<AssetPtr>(reason));
            }
        }
    }
    return abandoned.size();
}

void LoadCoordinator::discard_late(const ResourceKey& key, FetchResult& result) {
    ++m_stats.late_completions;
    hoard_core::res_logger()->debug("late completion for {} discarded", key.to_string());
    if (result) {
        if (Backend* backend = m_backends.find(key.kind)) {
            backend->release(result.value());
        }
    }
}

void LoadCoordinator::settle(const ResourceKey& key, std::uint64_t fetch, FetchResult result) {
    auto it = m_in_flight.find(key);
    if (it == m_in_flight.end() || it->second.fetch != fetch) {
        // Abandoned, possibly superseded by a newer fetch for the same key
        discard_late(key, result);
        return;
    }
    auto node = m_in_flight.extract(it);

    InFlightRequest request = std::move(node.mapped());
    for (const auto& waiter : request.waiters) {
        m_pending.erase(waiter.id);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - request.started);

    if (!result) {
        ++m_stats.failures;
        hoard_core::res_logger()->warn("fetch {} failed after {}us ({} waiters): {}",
            key.to_string(), elapsed.count(), request.waiters.size(), result.error().message());
        m_cache.mark_invalid(key);
        for (auto& waiter : request.waiters) {
            if (waiter.on_complete) {
                waiter.on_complete(hoard_core::Err<AssetPtr>(result.error()));
            }
        }
        return;
    }

    hoard_core::res_logger()->debug("fetch {} settled after {}us ({} waiters)",
        key.to_string(), elapsed.count(), request.waiters.size());

    AssetPtr asset = result.value().asset;

    // Every waiter holds its reference before any continuation runs
    m_cache.insert(key, std::move(result).value());
    for (std::size_t i = 1; i < request.waiters.size(); ++i) {
        m_cache.add_ref(key);
    }

    for (auto& waiter : request.waiters) {
        if (waiter.on_complete) {
            waiter.on_complete(LoadResult(asset));
        }
    }
}

} // namespace hoard_res
