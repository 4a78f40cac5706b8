#pragma once

/// @file config.hpp
/// @brief Engine settings loaded from TOML

#include "fwd.hpp"
#include <hoard/core/error.hpp>
#include <hoard/core/log.hpp>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace hoard_res {

/// Settings for a ResContext and the backends it hosts
struct ResConfig {
    std::filesystem::path asset_root = "assets";
    std::filesystem::path manifest_path;      // Empty: platform default below asset_root
    std::string pinned_bundle = "shaders";    // Empty: nothing pinned
    std::size_t preload_batch_size = 5;
    std::string log_level = "info";
    bool log_to_file = false;
    std::filesystem::path log_directory = "logs";

    ResConfig() = default;

    ResConfig& with_asset_root(const std::filesystem::path& root) {
        asset_root = root;
        return *this;
    }

    ResConfig& with_manifest_path(const std::filesystem::path& path) {
        manifest_path = path;
        return *this;
    }

    ResConfig& with_pinned_bundle(const std::string& name) {
        pinned_bundle = name;
        return *this;
    }

    ResConfig& with_batch_size(std::size_t size) {
        preload_batch_size = size;
        return *this;
    }

    ResConfig& with_log_level(const std::string& level) {
        log_level = level;
        return *this;
    }

    ResConfig& with_file_logging(const std::filesystem::path& directory) {
        log_to_file = true;
        log_directory = directory;
        return *this;
    }

    /// Check ranges and names; ValidationError on the first problem
    [[nodiscard]] hoard_core::Result<void> validate() const;

    /// Logging settings derived from the [log] section
    [[nodiscard]] hoard_core::LogConfig to_log_config() const;

    /// Parse a TOML file. Missing keys keep their defaults.
    [[nodiscard]] static hoard_core::Result<ResConfig> load(const std::filesystem::path& path);

    /// Parse a TOML document held in memory
    [[nodiscard]] static hoard_core::Result<ResConfig> from_toml_string(
        std::string_view content, std::string_view source_name = "config");
};

} // namespace hoard_res
