#pragma once

/// @file cache.hpp
/// @brief Reference-counted store of loaded resources

#include "types.hpp"
#include <any>
#include <cstdint>
#include <unordered_map>

namespace hoard_res {

class BackendRegistry;

// =============================================================================
// CacheEntry
// =============================================================================

/// One cached resource
struct CacheEntry {
    ResourceKey key;
    AssetPtr asset;
    std::any metadata;
    std::uint32_t ref_count = 0;
    EntryState state = EntryState::Loading;
    bool pinned = false;

    [[nodiscard]] bool is_ready() const noexcept { return state == EntryState::Ready; }
};

/// Result of ResourceCache::release
enum class ReleaseOutcome : std::uint8_t {
    NotFound,   // No entry for the key
    Retained,   // Entry still cached (references left, pinned, or already at zero)
    Released,   // Entry removed and its backend release invoked
};

[[nodiscard]] inline const char* release_outcome_name(ReleaseOutcome outcome) {
    switch (outcome) {
        case ReleaseOutcome::NotFound: return "NotFound";
        case ReleaseOutcome::Retained: return "Retained";
        case ReleaseOutcome::Released: return "Released";
        default: return "Unknown";
    }
}

/// Counters for one cache instance
struct CacheStats {
    std::uint64_t inserts = 0;
    std::uint64_t duplicate_inserts = 0;
    std::uint64_t duplicate_handles_released = 0;
    std::uint64_t releases = 0;
    std::uint64_t backend_releases = 0;
    std::uint64_t invalidations = 0;
    std::uint64_t refreshes = 0;
};

// =============================================================================
// ResourceCache
// =============================================================================

/// Canonical key -> entry map. Every ref_count transition goes through here.
///
/// Entries become visible once Ready and disappear when their count reaches
/// zero (unless pinned), at which point the owning backend's release runs.
/// Every fetched handle handed to insert is released through its backend
/// exactly once.
class ResourceCache {
public:
    explicit ResourceCache(BackendRegistry& backends);

    ResourceCache(const ResourceCache&) = delete;
    ResourceCache& operator=(const ResourceCache&) = delete;

    /// Lookup without touching ref_count
    [[nodiscard]] const CacheEntry* get(const ResourceKey& key) const;

    /// Record a successful fetch with one reference.
    ///
    /// If a Ready entry exists it gains the reference and the new handle is
    /// released through its backend. An Invalid or Loading entry takes the new
    /// handle, keeps its holders' references and becomes Ready.
    CacheEntry& insert(const ResourceKey& key, FetchedAsset fetched);

    /// Add a reference to a live entry. Unknown key: no-op, returns false.
    bool add_ref(const ResourceKey& key);

    /// Drop a reference; at zero an unpinned entry is removed and released.
    ReleaseOutcome release(const ResourceKey& key);

    /// Release a Ready entry's asset through its backend now.
    ///
    /// An entry nobody references is removed. Otherwise it stays Invalid with
    /// its ref_count intact until every holder releases it or a later load
    /// refetches it. Returns false for unknown or already invalid entries.
    bool invalidate(const ResourceKey& key);

    /// Invalid -> Loading, when a refetch starts
    bool mark_loading(const ResourceKey& key);

    /// Loading -> Invalid, when a refetch fails or is abandoned
    bool mark_invalid(const ResourceKey& key);

    /// Exempt an entry from refcount-driven release
    bool pin(const ResourceKey& key);

    /// Lift the exemption. An entry already at zero is released immediately.
    bool unpin(const ResourceKey& key);

    /// Reference count, 0 for unknown keys
    [[nodiscard]] std::uint32_t ref_count(const ResourceKey& key) const;

    [[nodiscard]] bool contains(const ResourceKey& key) const {
        return m_entries.find(key) != m_entries.end();
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }

    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }

    /// Release every entry through its backend, pinned or not
    void clear();

    /// Visit every entry
    template<typename F>
    void for_each(F&& func) const {
        for (const auto& [key, entry] : m_entries) {
            func(entry);
        }
    }

    [[nodiscard]] const CacheStats& stats() const noexcept { return m_stats; }

private:
    void release_to_backend(const ResourceKey& key, const FetchedAsset& fetched);
    void drop(std::unordered_map<ResourceKey, CacheEntry>::iterator it);

    BackendRegistry& m_backends;
    std::unordered_map<ResourceKey, CacheEntry> m_entries;
    CacheStats m_stats;
};

} // namespace hoard_res
