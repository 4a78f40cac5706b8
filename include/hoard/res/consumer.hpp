#pragma once

/// @file consumer.hpp
/// @brief Pooled, versioned owners of cache references

#include "types.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace hoard_res {

class LoadCoordinator;
class ResourceCache;
class Scheduler;

/// Default number of loads a preload issues together
inline constexpr std::size_t k_default_preload_batch = 5;

enum class ConsumerState : std::uint8_t {
    Pooled,
    Active,
};

[[nodiscard]] inline const char* consumer_state_name(ConsumerState state) {
    switch (state) {
        case ConsumerState::Pooled: return "Pooled";
        case ConsumerState::Active: return "Active";
        default: return "Unknown";
    }
}

// =============================================================================
// Consumer
// =============================================================================

/// Session-scoped owner of cache references.
///
/// A consumer holds at most one reference per key. release_all() bumps the
/// version, which turns every async load issued earlier into a stale result:
/// its reference is handed back on arrival and its continuation never runs.
class Consumer {
public:
    Consumer(std::uint32_t slot,
             LoadCoordinator& coordinator,
             ResourceCache& cache,
             Scheduler& scheduler,
             std::size_t default_batch_size = k_default_preload_batch);

    Consumer(const Consumer&) = delete;
    Consumer& operator=(const Consumer&) = delete;

    // -------------------------------------------------------------------------
    // Loading
    // -------------------------------------------------------------------------

    /// Load synchronously; the key is recorded as owned on success
    [[nodiscard]] LoadResult load(const std::string& path);

    /// Load asynchronously. on_complete is skipped if this consumer is
    /// released or recycled before the load settles.
    RequestId load_async(const std::string& path, LoadCallback on_complete);

    /// Load paths in batches, reporting progress after each settled batch.
    /// Batches after the first are posted to the scheduler.
    void preload(std::vector<std::string> paths, ProgressCallback on_progress);
    void preload(std::vector<std::string> paths, ProgressCallback on_progress, std::size_t batch_size);

    // -------------------------------------------------------------------------
    // Releasing
    // -------------------------------------------------------------------------

    /// Release one owned key. Returns false if the key was not owned.
    bool unload(const std::string& path);

    /// Release every owned key and invalidate outstanding async loads
    void release_all();

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    [[nodiscard]] bool owns(const std::string& path) const;
    [[nodiscard]] bool owns(const ResourceKey& key) const { return m_owned.count(key) != 0; }
    [[nodiscard]] std::size_t owned_count() const noexcept { return m_owned.size(); }
    [[nodiscard]] std::vector<ResourceKey> owned_keys() const;

    [[nodiscard]] ResourceKey key_for(const std::string& path) const { return ResourceKey(m_kind, path); }

    /// (slot, version) identifier; invalid once the consumer is reset
    [[nodiscard]] hoard_core::Id ticket() const noexcept { return hoard_core::Id::create(m_slot, m_version); }

    [[nodiscard]] std::uint32_t slot() const noexcept { return m_slot; }
    [[nodiscard]] std::uint32_t version() const noexcept { return m_version; }
    [[nodiscard]] ConsumerState state() const noexcept { return m_state; }
    [[nodiscard]] bool is_active() const noexcept { return m_state == ConsumerState::Active; }
    [[nodiscard]] BackendKind kind() const noexcept { return m_kind; }

private:
    friend class ConsumerPool;

    struct PreloadState;

    void on_allocated(BackendKind kind);
    void on_recycled();

    void on_async_settled(const ResourceKey& key, std::uint32_t version,
                          LoadResult result, const LoadCallback& on_complete);

    void issue_preload_batch(const std::shared_ptr<PreloadState>& preload);
    void finish_preload_item(const std::shared_ptr<PreloadState>& preload);

    std::uint32_t m_slot;
    std::uint32_t m_version = 0;
    ConsumerState m_state = ConsumerState::Pooled;
    BackendKind m_kind = BackendKind::File;
    std::unordered_set<ResourceKey> m_owned;
    std::size_t m_default_batch_size;

    LoadCoordinator& m_coordinator;
    ResourceCache& m_cache;
    Scheduler& m_scheduler;
};

// =============================================================================
// ConsumerPool
// =============================================================================

/// Generational arena of consumers. Slots are reused LIFO and never freed.
class ConsumerPool {
public:
    ConsumerPool(LoadCoordinator& coordinator,
                 ResourceCache& cache,
                 Scheduler& scheduler,
                 std::size_t default_batch_size = k_default_preload_batch);

    ConsumerPool(const ConsumerPool&) = delete;
    ConsumerPool& operator=(const ConsumerPool&) = delete;

    /// Draw a consumer from the pool (or create one) and activate it
    Consumer& allocate(BackendKind kind);

    /// Release everything the consumer owns and return it to the pool.
    /// Returns false if it was already pooled or belongs to another pool.
    bool recycle(Consumer& consumer);

    /// Look a consumer up by ticket; null, out-of-range and stale tickets fail
    [[nodiscard]] hoard_core::Result<Consumer*> resolve(hoard_core::Id ticket) const;

    /// Recycle every active consumer
    void recycle_all();

    [[nodiscard]] std::size_t capacity() const noexcept { return m_consumers.size(); }
    [[nodiscard]] std::size_t free_count() const noexcept { return m_free.size(); }
    [[nodiscard]] std::size_t active_count() const noexcept { return m_consumers.size() - m_free.size(); }

private:
    LoadCoordinator& m_coordinator;
    ResourceCache& m_cache;
    Scheduler& m_scheduler;
    std::size_t m_default_batch_size;

    std::vector<std::unique_ptr<Consumer>> m_consumers;
    std::vector<std::uint32_t> m_free;
};

} // namespace hoard_res
