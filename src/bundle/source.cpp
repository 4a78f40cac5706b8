/// @file source.cpp
/// @brief DirectoryBundleSource implementation

#include <hoard/bundle/source.hpp>
#include <hoard/bundle/manifest.hpp>
#include <hoard/res/file_backend.hpp>
#include <hoard/res/scheduler.hpp>
#include <hoard/core/log.hpp>

namespace hoard_bundle {

DirectoryBundleSource::DirectoryBundleSource(std::filesystem::path root, hoard_res::Scheduler& scheduler)
    : m_root(std::move(root))
    , m_scheduler(scheduler) {}

OpenResult DirectoryBundleSource::open_sync(const std::string& bundle) {
    auto dir = hoard_res::resolve_below(m_root, bundle);
    std::error_code ec;
    if (!dir || !std::filesystem::is_directory(*dir, ec)) {
        return hoard_core::Err<BundleHandle>(BundleError::open_failed(bundle, "no directory below " + m_root.string()));
    }

    ++m_open;
    hoard_core::bundle_logger()->trace("opened bundle directory {}", dir->string());
    return BundleHandle{bundle, *dir};
}

void DirectoryBundleSource::open_async(const std::string& bundle, OpenCallback on_complete) {
    m_scheduler.post([this, bundle, on_complete = std::move(on_complete)]() {
        on_complete(open_sync(bundle));
    });
}

void DirectoryBundleSource::close(const BundleHandle& handle) {
    if (handle.is_open() && m_open > 0) {
        --m_open;
    }
}

hoard_res::LoadResult DirectoryBundleSource::read_asset(const BundleHandle& handle, const std::string& asset_path) {
    const auto* dir = std::any_cast<std::filesystem::path>(&handle.data);
    if (!dir) {
        return hoard_core::Err<hoard_res::AssetPtr>(hoard_core::Error(hoard_core::ErrorCode::InvalidArgument,
            "Handle for bundle '" + handle.name + "' was not opened by this source"));
    }

    auto file = hoard_res::resolve_below(*dir, asset_path);
    std::error_code ec;
    if (!file || !std::filesystem::is_regular_file(*file, ec)) {
        return hoard_core::Err<hoard_res::AssetPtr>(BundleError::read_failed(handle.name, asset_path));
    }

    auto data = hoard_res::read_binary_file(*file);
    if (!data) {
        return hoard_core::Err<hoard_res::AssetPtr>(BundleError::read_failed(handle.name, asset_path));
    }

    auto asset = std::make_shared<hoard_res::Asset>();
    asset->path = asset_path;
    asset->bytes = std::move(*data);
    return hoard_res::AssetPtr(std::move(asset));
}

void DirectoryBundleSource::read_asset_async(const BundleHandle& handle,
                                             const std::string& asset_path,
                                             hoard_res::LoadCallback on_complete) {
    m_scheduler.post([this, handle, asset_path, on_complete = std::move(on_complete)]() {
        on_complete(read_asset(handle, asset_path));
    });
}

} // namespace hoard_bundle
