/// @file config.cpp
/// @brief ResConfig TOML loading

#include <hoard/res/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace hoard_res {

namespace {

hoard_core::Error config_error(hoard_core::ErrorCode code, const std::string& message) {
    return hoard_core::Error(code, message);
}

} // anonymous namespace

hoard_core::Result<void> ResConfig::validate() const {
    if (asset_root.empty()) {
        return hoard_core::Err(config_error(hoard_core::ErrorCode::ValidationError,
            "assets.root must not be empty"));
    }
    if (preload_batch_size == 0) {
        return hoard_core::Err(config_error(hoard_core::ErrorCode::ValidationError,
            "preload.batch_size must be at least 1"));
    }
    if (!hoard_core::parse_log_level(log_level)) {
        return hoard_core::Err(config_error(hoard_core::ErrorCode::ValidationError,
            "log.level is not a known level: " + log_level));
    }
    if (log_to_file && log_directory.empty()) {
        return hoard_core::Err(config_error(hoard_core::ErrorCode::ValidationError,
            "log.directory is required when log.file is enabled"));
    }
    return hoard_core::Ok();
}

hoard_core::LogConfig ResConfig::to_log_config() const {
    hoard_core::LogConfig log;
    log.console_enabled = true;
    log.file_enabled = log_to_file;
    log.log_directory = log_directory.string();
    log.level = hoard_core::parse_log_level(log_level).value_or(spdlog::level::info);
    return log;
}

hoard_core::Result<ResConfig> ResConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return hoard_core::Err<ResConfig>(config_error(hoard_core::ErrorCode::IOError,
            "Failed to open config file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml_string(buffer.str(), path.string());
}

hoard_core::Result<ResConfig> ResConfig::from_toml_string(std::string_view content, std::string_view source_name) {
    ResConfig config;

    try {
        toml::table tbl = toml::parse(content, source_name);

        if (auto assets = tbl["assets"].as_table()) {
            if (auto root = (*assets)["root"].value<std::string>()) {
                config.asset_root = *root;
            }
            if (auto manifest = (*assets)["manifest"].value<std::string>()) {
                config.manifest_path = *manifest;
            }
            if (auto pinned = (*assets)["pinned_bundle"].value<std::string>()) {
                config.pinned_bundle = *pinned;
            }
        }

        if (auto preload = tbl["preload"].as_table()) {
            if (auto batch = (*preload)["batch_size"].value<std::int64_t>()) {
                if (*batch <= 0) {
                    return hoard_core::Err<ResConfig>(config_error(hoard_core::ErrorCode::ValidationError,
                        "preload.batch_size must be at least 1"));
                }
                config.preload_batch_size = static_cast<std::size_t>(*batch);
            }
        }

        if (auto log = tbl["log"].as_table()) {
            config.log_level = (*log)["level"].value_or(config.log_level);
            config.log_to_file = (*log)["file"].value_or(config.log_to_file);
            if (auto dir = (*log)["directory"].value<std::string>()) {
                config.log_directory = *dir;
            }
        }

    } catch (const toml::parse_error& err) {
        return hoard_core::Err<ResConfig>(config_error(hoard_core::ErrorCode::ParseError,
            "TOML parse error: " + std::string(err.what())));
    }

    auto valid = config.validate();
    if (!valid) {
        return hoard_core::Err<ResConfig>(valid.error());
    }
    return config;
}

} // namespace hoard_res
