#pragma once

/// @file source.hpp
/// @brief Where bundles are opened from and assets read out of

#include "fwd.hpp"
#include <hoard/res/types.hpp>
#include <any>
#include <filesystem>
#include <functional>
#include <string>

namespace hoard_res {
class Scheduler;
}

namespace hoard_bundle {

/// An opened bundle. data is owned by the source that opened it.
struct BundleHandle {
    std::string name;
    std::any data;

    [[nodiscard]] bool is_open() const noexcept { return data.has_value(); }
};

using OpenResult = hoard_core::Result<BundleHandle>;
using OpenCallback = std::function<void(OpenResult)>;

// =============================================================================
// BundleSource
// =============================================================================

/// Injected bundle storage. Async callbacks fire exactly once.
class BundleSource {
public:
    virtual ~BundleSource() = default;

    /// True if open_sync is available
    [[nodiscard]] virtual bool supports_sync() const { return false; }

    /// Open a bundle without suspending
    [[nodiscard]] virtual OpenResult open_sync(const std::string& bundle) {
        return hoard_core::Err<BundleHandle>(hoard_core::Error(hoard_core::ErrorCode::NotSupported,
            "Bundle source cannot open '" + bundle + "' synchronously"));
    }

    virtual void open_async(const std::string& bundle, OpenCallback on_complete) = 0;

    virtual void close(const BundleHandle& handle) = 0;

    /// Read one asset from an open bundle
    [[nodiscard]] virtual hoard_res::LoadResult read_asset(
        const BundleHandle& handle, const std::string& asset_path) = 0;

    /// Asynchronous read; defaults to an inline read_asset
    virtual void read_asset_async(const BundleHandle& handle,
                                  const std::string& asset_path,
                                  hoard_res::LoadCallback on_complete) {
        on_complete(read_asset(handle, asset_path));
    }
};

// =============================================================================
// DirectoryBundleSource
// =============================================================================

/// Each bundle is a directory <root>/<bundle>; each asset a file inside it.
/// Async operations complete on the next scheduler tick.
class DirectoryBundleSource : public BundleSource {
public:
    DirectoryBundleSource(std::filesystem::path root, hoard_res::Scheduler& scheduler);

    [[nodiscard]] bool supports_sync() const override { return true; }

    [[nodiscard]] OpenResult open_sync(const std::string& bundle) override;
    void open_async(const std::string& bundle, OpenCallback on_complete) override;
    void close(const BundleHandle& handle) override;

    [[nodiscard]] hoard_res::LoadResult read_asset(
        const BundleHandle& handle, const std::string& asset_path) override;
    void read_asset_async(const BundleHandle& handle,
                          const std::string& asset_path,
                          hoard_res::LoadCallback on_complete) override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return m_root; }
    [[nodiscard]] std::size_t open_count() const noexcept { return m_open; }

private:
    std::filesystem::path m_root;
    hoard_res::Scheduler& m_scheduler;
    std::size_t m_open = 0;
};

} // namespace hoard_bundle
