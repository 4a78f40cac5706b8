/// @file consumer.cpp
/// @brief Consumer and ConsumerPool implementation

#include <hoard/res/consumer.hpp>
#include <hoard/res/cache.hpp>
#include <hoard/res/coordinator.hpp>
#include <hoard/res/scheduler.hpp>
#include <hoard/core/log.hpp>
#include <algorithm>

namespace hoard_res {

// =============================================================================
// Consumer
// =============================================================================

struct Consumer::PreloadState {
    std::vector<std::string> paths;
    ProgressCallback on_progress;
    std::size_t batch_size = k_default_preload_batch;
    std::uint32_t version = 0;
    std::size_t next = 0;
    std::size_t completed = 0;
    std::size_t outstanding = 0;
};

Consumer::Consumer(std::uint32_t slot,
                   LoadCoordinator& coordinator,
                   ResourceCache& cache,
                   Scheduler& scheduler,
                   std::size_t default_batch_size)
    : m_slot(slot)
    , m_default_batch_size(default_batch_size)
    , m_coordinator(coordinator)
    , m_cache(cache)
    , m_scheduler(scheduler) {}

LoadResult Consumer::load(const std::string& path) {
    if (!is_active()) {
        return hoard_core::Err<AssetPtr>(ResError::inactive_consumer(m_slot));
    }

    ResourceKey key(m_kind, path);
    if (owns(key)) {
        const CacheEntry* entry = m_cache.get(key);
        if (entry && entry->is_ready()) {
            return entry->asset;
        }
        if (!entry) {
            m_owned.erase(key);
        }
    }

    auto result = m_coordinator.load_sync(key);
    if (result && !m_owned.insert(key).second) {
        // Refetched an invalidated entry this consumer already holds
        m_cache.release(key);
    }
    return result;
}

RequestId Consumer::load_async(const std::string& path, LoadCallback on_complete) {
    if (!is_active()) {
        if (on_complete) {
            on_complete(hoard_core::Err<AssetPtr>(ResError::inactive_consumer(m_slot)));
        }
        return RequestId::null();
    }

    ResourceKey key(m_kind, path);
    if (owns(key)) {
        const CacheEntry* entry = m_cache.get(key);
        if (entry && entry->is_ready()) {
            if (on_complete) {
                on_complete(LoadResult(entry->asset));
            }
            return RequestId::null();
        }
        if (!entry) {
            m_owned.erase(key);
        }
    }

    std::uint32_t version = m_version;
    return m_coordinator.load_async(key,
        [this, key, version, on_complete = std::move(on_complete)](LoadResult result) {
            on_async_settled(key, version, std::move(result), on_complete);
        });
}

void Consumer::on_async_settled(const ResourceKey& key, std::uint32_t version,
                                LoadResult result, const LoadCallback& on_complete) {
    if (version != m_version) {
        if (result) {
            hoard_core::res_logger()->warn(
                "discarding stale result for {} (issued at v{}, consumer {} is at v{})",
                key.to_string(), version, m_slot, m_version);
            m_cache.release(key);
        } else {
            hoard_core::res_logger()->debug("dropping stale failure for {}", key.to_string());
        }
        return;
    }

    if (result && !m_owned.insert(key).second) {
        // Already held through an earlier load; keep a single reference
        m_cache.release(key);
    }

    if (on_complete) {
        on_complete(std::move(result));
    }
}

void Consumer::preload(std::vector<std::string> paths, ProgressCallback on_progress) {
    preload(std::move(paths), std::move(on_progress), m_default_batch_size);
}

void Consumer::preload(std::vector<std::string> paths, ProgressCallback on_progress, std::size_t batch_size) {
    if (paths.empty()) {
        if (on_progress) {
            on_progress(1.0f);
        }
        return;
    }

    if (!is_active()) {
        hoard_core::res_logger()->warn("preload on inactive consumer {} ignored", m_slot);
        return;
    }

    auto preload = std::make_shared<PreloadState>();
    preload->paths = std::move(paths);
    preload->on_progress = std::move(on_progress);
    preload->batch_size = std::max<std::size_t>(batch_size, 1);
    preload->version = m_version;

    hoard_core::res_logger()->debug("consumer {} preloading {} paths in batches of {}",
        m_slot, preload->paths.size(), preload->batch_size);
    issue_preload_batch(preload);
}

void Consumer::issue_preload_batch(const std::shared_ptr<PreloadState>& preload) {
    if (preload->version != m_version) {
        hoard_core::res_logger()->debug("consumer {} preload abandoned at {}/{}",
            m_slot, preload->completed, preload->paths.size());
        return;
    }

    std::size_t begin = preload->next;
    std::size_t end = std::min(begin + preload->batch_size, preload->paths.size());
    preload->next = end;

    // One extra count keeps inline completions from closing the batch early
    preload->outstanding = (end - begin) + 1;

    for (std::size_t i = begin; i < end; ++i) {
        load_async(preload->paths[i], [this, preload](LoadResult result) {
            if (!result) {
                hoard_core::res_logger()->warn("preload item failed: {}", result.error().message());
            }
            ++preload->completed;
            finish_preload_item(preload);
        });
    }

    finish_preload_item(preload);
}

void Consumer::finish_preload_item(const std::shared_ptr<PreloadState>& preload) {
    if (--preload->outstanding > 0) {
        return;
    }
    if (preload->version != m_version) {
        return;
    }

    if (preload->on_progress) {
        preload->on_progress(static_cast<float>(preload->completed) /
                             static_cast<float>(preload->paths.size()));
    }

    if (preload->next < preload->paths.size()) {
        m_scheduler.post([this, preload]() {
            issue_preload_batch(preload);
        });
    }
}

bool Consumer::unload(const std::string& path) {
    auto it = m_owned.find(ResourceKey(m_kind, path));
    if (it == m_owned.end()) {
        return false;
    }

    ResourceKey key = *it;
    m_owned.erase(it);
    m_cache.release(key);
    return true;
}

void Consumer::release_all() {
    for (const auto& key : m_owned) {
        m_cache.release(key);
    }

    hoard_core::res_logger()->debug("consumer {} released {} keys (v{} -> v{})",
        m_slot, m_owned.size(), m_version, m_version + 1);

    m_owned.clear();
    ++m_version;
}

bool Consumer::owns(const std::string& path) const {
    return owns(ResourceKey(m_kind, path));
}

std::vector<ResourceKey> Consumer::owned_keys() const {
    return std::vector<ResourceKey>(m_owned.begin(), m_owned.end());
}

void Consumer::on_allocated(BackendKind kind) {
    m_kind = kind;
    m_state = ConsumerState::Active;
    m_owned.clear();
    ++m_version;
}

void Consumer::on_recycled() {
    release_all();
    m_state = ConsumerState::Pooled;
}

// =============================================================================
// ConsumerPool
// =============================================================================

ConsumerPool::ConsumerPool(LoadCoordinator& coordinator,
                           ResourceCache& cache,
                           Scheduler& scheduler,
                           std::size_t default_batch_size)
    : m_coordinator(coordinator)
    , m_cache(cache)
    , m_scheduler(scheduler)
    , m_default_batch_size(default_batch_size) {}

Consumer& ConsumerPool::allocate(BackendKind kind) {
    Consumer* consumer = nullptr;

    if (!m_free.empty()) {
        std::uint32_t slot = m_free.back();
        m_free.pop_back();
        consumer = m_consumers[slot].get();
    } else {
        auto slot = static_cast<std::uint32_t>(m_consumers.size());
        m_consumers.push_back(std::make_unique<Consumer>(
            slot, m_coordinator, m_cache, m_scheduler, m_default_batch_size));
        consumer = m_consumers.back().get();
    }

    consumer->on_allocated(kind);
    hoard_core::res_logger()->debug("allocated consumer {} ({})", consumer->slot(), backend_kind_name(kind));
    return *consumer;
}

bool ConsumerPool::recycle(Consumer& consumer) {
    std::uint32_t slot = consumer.slot();
    if (slot >= m_consumers.size() || m_consumers[slot].get() != &consumer) {
        return false;
    }
    if (!consumer.is_active()) {
        return false;
    }

    consumer.on_recycled();
    m_free.push_back(slot);
    return true;
}

hoard_core::Result<Consumer*> ConsumerPool::resolve(hoard_core::Id ticket) const {
    if (ticket.is_null()) {
        return hoard_core::Err<Consumer*>(hoard_core::Error(hoard_core::HandleError::null()));
    }
    if (ticket.index() >= m_consumers.size()) {
        return hoard_core::Err<Consumer*>(hoard_core::Error(hoard_core::HandleError::out_of_bounds()));
    }

    Consumer* consumer = m_consumers[ticket.index()].get();
    if (!consumer->is_active() || consumer->version() != ticket.generation()) {
        return hoard_core::Err<Consumer*>(hoard_core::Error(hoard_core::HandleError::stale()));
    }
    return hoard_core::Ok(consumer);
}

void ConsumerPool::recycle_all() {
    for (auto& consumer : m_consumers) {
        if (consumer->is_active()) {
            recycle(*consumer);
        }
    }
}

} // namespace hoard_res
