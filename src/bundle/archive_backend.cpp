/// @file archive_backend.cpp
/// @brief ArchiveBackend implementation

#include <hoard/bundle/archive_backend.hpp>
#include <hoard/res/context.hpp>
#include <hoard/core/log.hpp>

namespace hoard_bundle {

ArchiveBackend::ArchiveBackend(BundleManifest manifest, std::unique_ptr<BundleSource> source)
    : m_manifest(std::move(manifest))
    , m_source(std::move(source))
    , m_graph(*m_source, [this](const std::string& bundle) { return m_manifest.dependencies(bundle); }) {}

ArchiveBackend::~ArchiveBackend() {
    m_graph.clear();
}

hoard_core::Result<void> ArchiveBackend::initialize(const std::string& pinned_bundle) {
    std::string pinned = pinned_bundle.empty() ? m_manifest.pinned() : pinned_bundle;
    if (pinned.empty()) {
        return hoard_core::Ok();
    }
    if (!m_manifest.has_bundle(pinned)) {
        hoard_core::bundle_logger()->info("pinned bundle '{}' not in manifest, nothing pinned", pinned);
        return hoard_core::Ok();
    }

    m_graph.set_pinned(pinned);

    if (m_source->supports_sync()) {
        return m_graph.preload_pinned_sync();
    }

    m_graph.preload_pinned_async([pinned](hoard_core::Result<void> result) {
        if (!result) {
            hoard_core::bundle_logger()->error("pinned bundle {} failed to preload: {}",
                pinned, result.error().message());
        }
    });
    return hoard_core::Ok();
}

hoard_res::FetchResult ArchiveBackend::fetch_sync(const std::string& path) {
    auto bundle = m_manifest.bundle_for(path);
    if (!bundle) {
        return hoard_core::Err<hoard_res::FetchedAsset>(BundleError::unknown_asset(path));
    }

    auto loaded = m_graph.load_sync(*bundle);
    if (!loaded) {
        return hoard_core::Err<hoard_res::FetchedAsset>(loaded.error());
    }

    const BundleNode* node = m_graph.node(*bundle);
    auto asset = m_source->read_asset(node->handle, path);
    if (!asset) {
        m_graph.unload(*bundle);
        return hoard_core::Err<hoard_res::FetchedAsset>(asset.error());
    }

    return hoard_res::FetchedAsset{std::move(asset).value(), ArchiveTicket{*bundle}};
}

void ArchiveBackend::fetch_async(const std::string& path, hoard_res::FetchCallback on_complete) {
    auto bundle = m_manifest.bundle_for(path);
    if (!bundle) {
        on_complete(hoard_core::Err<hoard_res::FetchedAsset>(BundleError::unknown_asset(path)));
        return;
    }

    std::string name = *bundle;
    m_graph.load_async(name, [this, name, path, on_complete = std::move(on_complete)](hoard_core::Result<void> loaded) {
        if (!loaded) {
            on_complete(hoard_core::Err<hoard_res::FetchedAsset>(loaded.error()));
            return;
        }

        // Registered first: the source may complete the read inline
        std::uint64_t read = ++m_next_read;
        m_reads.emplace(read, PendingRead{name, on_complete});

        const BundleNode* node = m_graph.node(name);
        m_source->read_asset_async(node->handle, path, [this, read](hoard_res::LoadResult asset) {
            on_read(read, std::move(asset));
        });
    });
}

void ArchiveBackend::on_read(std::uint64_t read, hoard_res::LoadResult asset) {
    auto it = m_reads.find(read);
    if (it == m_reads.end()) {
        // Abandoned; its bundle reference was already returned
        hoard_core::bundle_logger()->debug("late asset read discarded");
        return;
    }

    PendingRead pending = std::move(it->second);
    m_reads.erase(it);

    if (!asset) {
        m_graph.unload(pending.bundle);
        pending.on_complete(hoard_core::Err<hoard_res::FetchedAsset>(asset.error()));
        return;
    }
    pending.on_complete(hoard_res::FetchedAsset{std::move(asset).value(), ArchiveTicket{pending.bundle}});
}

void ArchiveBackend::abandon_pending(const hoard_core::Error& reason) {
    m_graph.abandon_pending(reason);

    std::unordered_map<std::uint64_t, PendingRead> reads;
    reads.swap(m_reads);
    for (auto& [read, pending] : reads) {
        hoard_core::bundle_logger()->debug("abandoning asset read from {}", pending.bundle);
        m_graph.unload(pending.bundle);
        pending.on_complete(hoard_core::Err<hoard_res::FetchedAsset>(reason));
    }
}

void ArchiveBackend::release(const hoard_res::FetchedAsset& fetched) {
    const auto* ticket = std::any_cast<ArchiveTicket>(&fetched.metadata);
    if (!ticket) {
        hoard_core::bundle_logger()->error("archive release without a bundle ticket");
        return;
    }
    m_graph.unload(ticket->bundle);
}

// =============================================================================
// Installation
// =============================================================================

hoard_core::Result<void> install_archive_backend(hoard_res::ResContext& context) {
    const auto& config = context.config();
    std::filesystem::path manifest_path = config.manifest_path.empty()
        ? default_manifest_path(config.asset_root)
        : config.manifest_path;

    auto manifest = BundleManifest::load(manifest_path);
    if (!manifest) {
        return hoard_core::Err(manifest.error());
    }

    HOARD_LOG_INFO("manifest {}: {} bundles, {} assets",
        manifest_path.string(), manifest->bundle_count(), manifest->asset_count());

    auto source = std::make_unique<DirectoryBundleSource>(manifest_path.parent_path(), context.scheduler());
    auto backend = std::make_unique<ArchiveBackend>(std::move(manifest).value(), std::move(source));

    auto initialized = backend->initialize(config.pinned_bundle);
    if (!initialized) {
        return initialized;
    }

    return context.register_backend(std::move(backend));
}

} // namespace hoard_bundle
