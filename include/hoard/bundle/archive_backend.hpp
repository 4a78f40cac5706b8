#pragma once

/// @file archive_backend.hpp
/// @brief Backend serving assets out of dependency-tracked bundles

#include "graph.hpp"
#include "manifest.hpp"
#include "source.hpp"
#include <hoard/res/backend.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace hoard_res {
class ResContext;
}

namespace hoard_bundle {

/// Metadata an ArchiveBackend attaches to every fetched asset
struct ArchiveTicket {
    std::string bundle;
};

// =============================================================================
// ArchiveBackend
// =============================================================================

/// Fetching an asset loads its bundle (and everything the bundle depends on)
/// through the DependencyGraph; releasing the asset unloads it again.
class ArchiveBackend : public hoard_res::Backend {
public:
    ArchiveBackend(BundleManifest manifest, std::unique_ptr<BundleSource> source);
    ~ArchiveBackend() override;

    /// Pin a bundle and open it eagerly. An empty name falls back to the
    /// manifest's "pinned" entry; a name the manifest lacks is skipped.
    [[nodiscard]] hoard_core::Result<void> initialize(const std::string& pinned_bundle);

    [[nodiscard]] hoard_res::BackendKind kind() const override { return hoard_res::BackendKind::Archive; }
    [[nodiscard]] std::string name() const override { return "archive"; }
    [[nodiscard]] bool supports_sync() const override { return m_source->supports_sync(); }

    [[nodiscard]] hoard_res::FetchResult fetch_sync(const std::string& path) override;
    void fetch_async(const std::string& path, hoard_res::FetchCallback on_complete) override;
    void release(const hoard_res::FetchedAsset& fetched) override;

    /// Fail pending bundle opens and asset reads, returning the bundle
    /// references the reads were holding
    void abandon_pending(const hoard_core::Error& reason) override;

    [[nodiscard]] bool has_dependencies() const override { return true; }
    [[nodiscard]] std::vector<std::string> dependencies(const std::string& bundle) const override {
        return m_manifest.dependencies(bundle);
    }

    [[nodiscard]] const BundleManifest& manifest() const noexcept { return m_manifest; }
    [[nodiscard]] DependencyGraph& graph() noexcept { return m_graph; }
    [[nodiscard]] const DependencyGraph& graph() const noexcept { return m_graph; }
    [[nodiscard]] BundleSource& source() noexcept { return *m_source; }

    /// Asset reads issued to the source and not yet completed
    [[nodiscard]] std::size_t pending_reads() const noexcept { return m_reads.size(); }

private:
    struct PendingRead {
        std::string bundle;
        hoard_res::FetchCallback on_complete;
    };

    void on_read(std::uint64_t read, hoard_res::LoadResult asset);

    BundleManifest m_manifest;
    std::unique_ptr<BundleSource> m_source;
    DependencyGraph m_graph;
    std::unordered_map<std::uint64_t, PendingRead> m_reads;
    std::uint64_t m_next_read = 0;
};

/// Load the manifest named by the context's config (or the platform default),
/// serve bundles from the manifest's directory and register an initialized
/// ArchiveBackend with the context.
hoard_core::Result<void> install_archive_backend(hoard_res::ResContext& context);

} // namespace hoard_bundle
