/// @file context.cpp
/// @brief ResContext implementation

#include <hoard/res/context.hpp>
#include <hoard/res/file_backend.hpp>
#include <hoard/core/log.hpp>

namespace hoard_res {

ResContext::ResContext(ResConfig config)
    : m_config(std::move(config))
    , m_cache(m_backends)
    , m_coordinator(m_cache, m_backends)
    , m_pool(m_coordinator, m_cache, m_scheduler, m_config.preload_batch_size) {}

ResContext::~ResContext() {
    shutdown();
}

hoard_core::Result<void> ResContext::register_backend(std::unique_ptr<Backend> backend) {
    return m_backends.register_backend(std::move(backend));
}

hoard_core::Result<void> ResContext::install_file_backend() {
    return register_backend(std::make_unique<FileBackend>(m_config.asset_root, m_scheduler));
}

Consumer& ResContext::allocate(BackendKind kind) {
    return m_pool.allocate(kind);
}

bool ResContext::recycle(Consumer& consumer) {
    return m_pool.recycle(consumer);
}

void ResContext::shutdown() {
    std::size_t active = m_pool.active_count();
    m_pool.recycle_all();

    // Queued completions are about to be dropped; settle their waiters first
    hoard_core::Error reason = ResError::abandoned();
    m_backends.for_each([&reason](Backend& backend) { backend.abandon_pending(reason); });
    std::size_t abandoned = m_coordinator.abandon_all(reason);

    std::size_t remaining = m_cache.size();
    m_cache.clear();
    m_scheduler.clear();

    if (active > 0 || remaining > 0 || abandoned > 0) {
        HOARD_LOG_INFO("context shut down: {} consumers recycled, {} fetches abandoned, {} entries force-released",
            active, abandoned, remaining);
    }
}

} // namespace hoard_res
