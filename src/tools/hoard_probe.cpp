/// @file hoard_probe.cpp
/// @brief Command-line probe: preload resources and print the cache state
///
/// Usage: hoard_probe [--config FILE] [--archive] [--batch N] PATH...

#include <hoard/bundle/archive_backend.hpp>
#include <hoard/res/context.hpp>
#include <hoard/core/log.hpp>

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] PATH...\n"
              << "\n"
              << "Arguments:\n"
              << "  PATH              Resource path relative to the asset root\n"
              << "\n"
              << "Options:\n"
              << "  --config FILE     TOML configuration (default: hoard.toml if present)\n"
              << "  --archive         Load through the bundle archive instead of loose files\n"
              << "  --batch N         Preload batch size (overrides the config)\n"
              << "  --help, -h        Show this help message\n"
              << "  --version, -v     Show version information\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " ui/logo.png models/hero.model\n"
              << "  " << program_name << " --archive --config game.toml ui/atlas.png\n";
}

void print_version() {
    std::cout << "hoard_probe 0.1.0\n";
}

struct Options {
    fs::path config_path;
    bool archive = false;
    std::size_t batch_size = 0;
    std::vector<std::string> paths;
};

/// Returns an exit code when the program should stop immediately
std::optional<int> parse_args(int argc, char** argv, Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        } else if (arg == "--archive") {
            options.archive = true;
        } else if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--batch" && i + 1 < argc) {
            char* end = nullptr;
            long value = std::strtol(argv[++i], &end, 10);
            if (end == nullptr || *end != '\0' || value <= 0) {
                std::cerr << "Invalid batch size: " << argv[i] << "\n";
                return 1;
            }
            options.batch_size = static_cast<std::size_t>(value);
        } else if (!arg.empty() && arg[0] != '-') {
            options.paths.push_back(arg);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (options.paths.empty()) {
        std::cerr << "Error: No resource paths given.\n\n";
        print_usage(argv[0]);
        return 1;
    }
    return std::nullopt;
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    Options options;
    if (auto exit_code = parse_args(argc, argv, options)) {
        return *exit_code;
    }

    if (options.config_path.empty() && fs::exists("hoard.toml")) {
        options.config_path = "hoard.toml";
    }

    hoard_res::ResConfig config;
    if (!options.config_path.empty()) {
        auto loaded = hoard_res::ResConfig::load(options.config_path);
        if (!loaded) {
            std::cerr << "Failed to load config: " << hoard_core::build_error_chain(loaded.error()) << "\n";
            return 1;
        }
        config = std::move(loaded).value();
    }
    if (options.batch_size > 0) {
        config.with_batch_size(options.batch_size);
    }

    hoard_core::configure_logging(config.to_log_config());
    HOARD_LOG_INFO("asset root: {}", config.asset_root.string());

    int exit_code = 0;
    {
        hoard_res::ResContext context(config);

        auto installed = context.install_file_backend();
        if (!installed) {
            HOARD_LOG_ERROR("{}", hoard_core::build_error_chain(installed.error()));
            return 1;
        }

        if (options.archive) {
            auto archive = hoard_bundle::install_archive_backend(context);
            if (!archive) {
                HOARD_LOG_ERROR("archive unavailable: {}", hoard_core::build_error_chain(archive.error()));
                return 1;
            }
        }

        auto kind = options.archive ? hoard_res::BackendKind::Archive : hoard_res::BackendKind::File;
        hoard_res::Consumer& consumer = context.allocate(kind);

        consumer.preload(options.paths, [](float progress) {
            HOARD_LOG_INFO("preload {:.0f}%", progress * 100.0f);
        });
        context.run_until_idle();

        std::cout << std::left << std::setw(48) << "resource" << std::setw(8) << "refs" << "bytes\n";
        context.cache().for_each([](const hoard_res::CacheEntry& entry) {
            std::cout << std::left << std::setw(48) << entry.key.to_string()
                      << std::setw(8) << entry.ref_count
                      << (entry.asset ? entry.asset->size() : 0) << "\n";
        });

        for (const auto& path : options.paths) {
            if (!consumer.owns(path)) {
                std::cerr << "not loaded: " << path << "\n";
                exit_code = 1;
            }
        }

        context.recycle(consumer);
    }

    hoard_core::shutdown_logging();
    return exit_code;
}
