#pragma once

/// @file context.hpp
/// @brief Explicitly constructed owner of the whole resource stack

#include "backend.hpp"
#include "cache.hpp"
#include "config.hpp"
#include "consumer.hpp"
#include "coordinator.hpp"
#include "scheduler.hpp"
#include <memory>

namespace hoard_res {

/// Owns scheduler, backends, cache, coordinator and consumer pool.
///
/// Independent contexts share nothing, so tests can run several side by side.
class ResContext {
public:
    explicit ResContext(ResConfig config = {});
    ~ResContext();

    ResContext(const ResContext&) = delete;
    ResContext& operator=(const ResContext&) = delete;

    // -------------------------------------------------------------------------
    // Backends
    // -------------------------------------------------------------------------

    hoard_core::Result<void> register_backend(std::unique_ptr<Backend> backend);

    /// Register a FileBackend rooted at config().asset_root
    hoard_core::Result<void> install_file_backend();

    // -------------------------------------------------------------------------
    // Consumers
    // -------------------------------------------------------------------------

    Consumer& allocate(BackendKind kind = BackendKind::File);

    /// Release and pool a consumer. Recycling a pooled consumer is a no-op.
    bool recycle(Consumer& consumer);

    [[nodiscard]] hoard_core::Result<Consumer*> resolve(hoard_core::Id ticket) const {
        return m_pool.resolve(ticket);
    }

    // -------------------------------------------------------------------------
    // Driving
    // -------------------------------------------------------------------------

    /// Run one scheduler tick
    std::size_t poll() { return m_scheduler.run_once(); }

    std::size_t run_until_idle(std::size_t max_ticks = 10000) {
        return m_scheduler.run_until_idle(max_ticks);
    }

    /// Recycle every consumer and fail outstanding fetches, then release every
    /// cached entry and drop queued work. Safe to call more than once.
    void shutdown();

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] const ResConfig& config() const noexcept { return m_config; }
    [[nodiscard]] Scheduler& scheduler() noexcept { return m_scheduler; }
    [[nodiscard]] BackendRegistry& backends() noexcept { return m_backends; }
    [[nodiscard]] ResourceCache& cache() noexcept { return m_cache; }
    [[nodiscard]] const ResourceCache& cache() const noexcept { return m_cache; }
    [[nodiscard]] LoadCoordinator& coordinator() noexcept { return m_coordinator; }
    [[nodiscard]] ConsumerPool& pool() noexcept { return m_pool; }

private:
    ResConfig m_config;
    Scheduler m_scheduler;
    BackendRegistry m_backends;
    ResourceCache m_cache;
    LoadCoordinator m_coordinator;
    ConsumerPool m_pool;
};

} // namespace hoard_res
