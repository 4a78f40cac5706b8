#pragma once

/// @file backend.hpp
/// @brief Backend capability interface and registry

#include "types.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace hoard_res {

// =============================================================================
// Backend
// =============================================================================

/// Storage-specific fetch/release capability.
///
/// fetch_async must invoke its callback exactly once. The callback may run
/// before fetch_async returns. A backend that completes on its own threads
/// must hand the completion to the Scheduler instead of invoking it directly.
///
/// release is called exactly once for every successful fetch, even when two
/// fetches return the same asset object, so per-fetch bookkeeping stays
/// balanced.
class Backend {
public:
    virtual ~Backend() = default;

    /// Storage kind this backend serves
    [[nodiscard]] virtual BackendKind kind() const = 0;

    /// Display name used in logs and errors
    [[nodiscard]] virtual std::string name() const {
        return backend_kind_name(kind());
    }

    /// True if fetch_sync is available
    [[nodiscard]] virtual bool supports_sync() const { return false; }

    /// Fetch without suspending. Async-only backends keep the default.
    [[nodiscard]] virtual FetchResult fetch_sync(const std::string& path) {
        return hoard_core::Err<FetchedAsset>(
            ResError::not_supported(name(), "synchronous fetch of '" + path + "'"));
    }

    /// Start a fetch; on_complete receives the asset or a typed failure
    virtual void fetch_async(const std::string& path, FetchCallback on_complete) = 0;

    /// Dispose of a fetched asset the cache no longer references
    virtual void release(const FetchedAsset& fetched) = 0;

    /// Fail every fetch this backend still has outstanding with reason.
    /// Called on shutdown, before queued scheduler work is dropped.
    virtual void abandon_pending(const hoard_core::Error& /*reason*/) {}

    /// True for backends whose units reference other units (archives)
    [[nodiscard]] virtual bool has_dependencies() const { return false; }

    /// Ordered dependency list of a bundle
    [[nodiscard]] virtual std::vector<std::string> dependencies(const std::string& /*bundle*/) const {
        return {};
    }
};

// =============================================================================
// BackendRegistry
// =============================================================================

/// Owns one backend per kind
class BackendRegistry {
public:
    BackendRegistry() = default;

    BackendRegistry(const BackendRegistry&) = delete;
    BackendRegistry& operator=(const BackendRegistry&) = delete;

    /// Register a backend. Fails with AlreadyExists if its kind is taken.
    hoard_core::Result<void> register_backend(std::unique_ptr<Backend> backend);

    /// Remove the backend for a kind, returning it
    std::unique_ptr<Backend> unregister(BackendKind kind);

    /// Backend for a kind, or nullptr
    [[nodiscard]] Backend* find(BackendKind kind) const;

    [[nodiscard]] bool has(BackendKind kind) const {
        return m_backends.find(kind) != m_backends.end();
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_backends.size(); }

    [[nodiscard]] std::vector<BackendKind> kinds() const;

    /// Visit every backend in kind order
    template<typename F>
    void for_each(F&& func) const {
        for (const auto& [kind, backend] : m_backends) {
            func(*backend);
        }
    }

private:
    std::map<BackendKind, std::unique_ptr<Backend>> m_backends;
};

} // namespace hoard_res
