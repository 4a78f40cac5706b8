#pragma once

/// @file file_backend.hpp
/// @brief Backend for loose files below an asset root

#include "backend.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace hoard_res {

class Scheduler;

/// Read a whole file; nullopt if it cannot be opened or read
[[nodiscard]] std::optional<std::vector<std::uint8_t>> read_binary_file(const std::filesystem::path& path);

/// Resolve a relative asset path below root. Rejects paths that escape root.
[[nodiscard]] std::optional<std::filesystem::path> resolve_below(
    const std::filesystem::path& root, const std::string& relative);

// =============================================================================
// FileBackend
// =============================================================================

/// Reads <root>/<path>. Async fetches run the same read on the next tick.
class FileBackend : public Backend {
public:
    FileBackend(std::filesystem::path root, Scheduler& scheduler);

    [[nodiscard]] BackendKind kind() const override { return BackendKind::File; }
    [[nodiscard]] std::string name() const override { return "file:" + m_root.string(); }
    [[nodiscard]] bool supports_sync() const override { return true; }

    [[nodiscard]] FetchResult fetch_sync(const std::string& path) override;
    void fetch_async(const std::string& path, FetchCallback on_complete) override;
    void release(const FetchedAsset& fetched) override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return m_root; }
    [[nodiscard]] std::uint64_t fetch_count() const noexcept { return m_fetches; }
    [[nodiscard]] std::uint64_t release_count() const noexcept { return m_releases; }

private:
    std::filesystem::path m_root;
    Scheduler& m_scheduler;
    std::uint64_t m_fetches = 0;
    std::uint64_t m_releases = 0;
};

} // namespace hoard_res
