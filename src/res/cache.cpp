/// @file cache.cpp
/// @brief ResourceCache implementation

#include <hoard/res/cache.hpp>
#include <hoard/res/backend.hpp>
#include <hoard/core/log.hpp>
#include <vector>

namespace hoard_res {

ResourceCache::ResourceCache(BackendRegistry& backends)
    : m_backends(backends) {}

const CacheEntry* ResourceCache::get(const ResourceKey& key) const {
    auto it = m_entries.find(key);
    return it != m_entries.end() ? &it->second : nullptr;
}

CacheEntry& ResourceCache::insert(const ResourceKey& key, FetchedAsset fetched) {
    auto it = m_entries.find(key);
    if (it != m_entries.end()) {
        CacheEntry& existing = it->second;
        ++existing.ref_count;

        if (!existing.is_ready()) {
            existing.asset = std::move(fetched.asset);
            existing.metadata = std::move(fetched.metadata);
            existing.state = EntryState::Ready;
            ++m_stats.refreshes;
            hoard_core::res_logger()->debug("refreshed {} ({} refs)", key.to_string(), existing.ref_count);
            return existing;
        }

        ++m_stats.duplicate_inserts;
        ++m_stats.duplicate_handles_released;
        hoard_core::res_logger()->warn("duplicate fetch for {}, releasing the extra handle", key.to_string());
        release_to_backend(key, fetched);
        return existing;
    }

    CacheEntry entry;
    entry.key = key;
    entry.asset = std::move(fetched.asset);
    entry.metadata = std::move(fetched.metadata);
    entry.ref_count = 1;
    entry.state = EntryState::Ready;

    ++m_stats.inserts;
    hoard_core::res_logger()->debug("cached {}", key.to_string());

    auto inserted = m_entries.emplace(key, std::move(entry));
    return inserted.first->second;
}

bool ResourceCache::add_ref(const ResourceKey& key) {
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return false;
    }
    ++it->second.ref_count;
    return true;
}

ReleaseOutcome ResourceCache::release(const ResourceKey& key) {
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return ReleaseOutcome::NotFound;
    }

    CacheEntry& entry = it->second;
    if (entry.ref_count == 0) {
        return ReleaseOutcome::Retained;
    }

    --entry.ref_count;
    ++m_stats.releases;

    if (entry.ref_count > 0 || (entry.pinned && entry.is_ready())) {
        return ReleaseOutcome::Retained;
    }

    drop(it);
    return ReleaseOutcome::Released;
}

bool ResourceCache::invalidate(const ResourceKey& key) {
    auto it = m_entries.find(key);
    if (it == m_entries.end() || !it->second.is_ready()) {
        return false;
    }

    ++m_stats.invalidations;
    if (it->second.ref_count == 0) {
        hoard_core::res_logger()->debug("invalidated unreferenced {}", key.to_string());
        drop(it);
        return true;
    }

    CacheEntry& entry = it->second;
    FetchedAsset fetched{std::move(entry.asset), std::move(entry.metadata)};
    entry.asset.reset();
    entry.metadata.reset();
    entry.state = EntryState::Invalid;
    hoard_core::res_logger()->debug("invalidated {} ({} refs outstanding)", key.to_string(), entry.ref_count);
    release_to_backend(key, fetched);
    return true;
}

bool ResourceCache::mark_loading(const ResourceKey& key) {
    auto it = m_entries.find(key);
    if (it == m_entries.end() || it->second.state != EntryState::Invalid) {
        return false;
    }
    it->second.state = EntryState::Loading;
    return true;
}

bool ResourceCache::mark_invalid(const ResourceKey& key) {
    auto it = m_entries.find(key);
    if (it == m_entries.end() || it->second.state != EntryState::Loading) {
        return false;
    }
    it->second.state = EntryState::Invalid;
    return true;
}

bool ResourceCache::pin(const ResourceKey& key) {
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return false;
    }
    it->second.pinned = true;
    return true;
}

bool ResourceCache::unpin(const ResourceKey& key) {
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return false;
    }

    it->second.pinned = false;
    if (it->second.ref_count == 0) {
        drop(it);
    }
    return true;
}

std::uint32_t ResourceCache::ref_count(const ResourceKey& key) const {
    auto it = m_entries.find(key);
    return it != m_entries.end() ? it->second.ref_count : 0;
}

void ResourceCache::clear() {
    std::vector<std::pair<ResourceKey, FetchedAsset>> drained;
    drained.reserve(m_entries.size());
    for (auto& [key, entry] : m_entries) {
        // Invalid entries already gave their asset back
        if (entry.is_ready()) {
            drained.emplace_back(key, FetchedAsset{std::move(entry.asset), std::move(entry.metadata)});
        }
    }
    m_entries.clear();

    for (const auto& [key, fetched] : drained) {
        release_to_backend(key, fetched);
    }
}

void ResourceCache::drop(std::unordered_map<ResourceKey, CacheEntry>::iterator it) {
    ResourceKey key = it->first;
    bool holds_asset = it->second.is_ready();
    FetchedAsset fetched{std::move(it->second.asset), std::move(it->second.metadata)};

    // Erase first: the backend release may re-enter the cache
    m_entries.erase(it);
    if (holds_asset) {
        release_to_backend(key, fetched);
    }
}

void ResourceCache::release_to_backend(const ResourceKey& key, const FetchedAsset& fetched) {
    Backend* backend = m_backends.find(key.kind);
    if (!backend) {
        hoard_core::res_logger()->error("no backend to release {}", key.to_string());
        return;
    }

    ++m_stats.backend_releases;
    hoard_core::res_logger()->debug("releasing {} through '{}'", key.to_string(), backend->name());
    backend->release(fetched);
}

} // namespace hoard_res
