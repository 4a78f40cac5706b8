/// @file file_backend.cpp
/// @brief FileBackend implementation

#include <hoard/res/file_backend.hpp>
#include <hoard/res/scheduler.hpp>
#include <hoard/core/log.hpp>
#include <fstream>

namespace hoard_res {

std::optional<std::vector<std::uint8_t>> read_binary_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return std::nullopt;
    }

    auto size = file.tellg();
    if (size < 0) {
        return std::nullopt;
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
        return std::nullopt;
    }

    return data;
}

std::optional<std::filesystem::path> resolve_below(
    const std::filesystem::path& root, const std::string& relative)
{
    std::filesystem::path rel = std::filesystem::path(relative).lexically_normal();
    if (rel.empty() || rel.is_absolute()) {
        return std::nullopt;
    }
    auto first = rel.begin();
    if (first != rel.end() && *first == "..") {
        return std::nullopt;
    }
    return root / rel;
}

FileBackend::FileBackend(std::filesystem::path root, Scheduler& scheduler)
    : m_root(std::move(root))
    , m_scheduler(scheduler) {}

FetchResult FileBackend::fetch_sync(const std::string& path) {
    ++m_fetches;

    auto full_path = resolve_below(m_root, path);
    if (!full_path) {
        return hoard_core::Err<FetchedAsset>(ResError::not_found(path + " (outside asset root)"));
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(*full_path, ec)) {
        return hoard_core::Err<FetchedAsset>(ResError::not_found(full_path->string()));
    }

    auto data = read_binary_file(*full_path);
    if (!data) {
        return hoard_core::Err<FetchedAsset>(ResError::backend_failure(full_path->string(), "read failed"));
    }

    auto asset = std::make_shared<Asset>();
    asset->path = path;
    asset->bytes = std::move(*data);

    return FetchedAsset{std::move(asset), full_path->string()};
}

void FileBackend::fetch_async(const std::string& path, FetchCallback on_complete) {
    m_scheduler.post([this, path, on_complete = std::move(on_complete)]() {
        on_complete(fetch_sync(path));
    });
}

void FileBackend::release(const FetchedAsset& fetched) {
    ++m_releases;
    if (const auto* source = std::any_cast<std::string>(&fetched.metadata)) {
        hoard_core::res_logger()->trace("file backend released {}", *source);
    }
}

} // namespace hoard_res
