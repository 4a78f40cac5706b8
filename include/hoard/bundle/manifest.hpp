#pragma once

/// @file manifest.hpp
/// @brief Bundle manifest: bundle dependencies and asset -> bundle mapping

#include "fwd.hpp"
#include <hoard/core/error.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace hoard_bundle {

// =============================================================================
// BundleError
// =============================================================================

/// Bundle-specific error factories
struct BundleError {
    [[nodiscard]] static hoard_core::Error unknown_bundle(const std::string& name) {
        return hoard_core::Error(hoard_core::ErrorCode::NotFound,
            "Bundle not declared in manifest: " + name);
    }

    [[nodiscard]] static hoard_core::Error unknown_asset(const std::string& path) {
        return hoard_core::Error(hoard_core::ErrorCode::NotFound,
            "Asset not mapped to any bundle: " + path);
    }

    [[nodiscard]] static hoard_core::Error open_failed(const std::string& name, const std::string& reason) {
        return hoard_core::Error(hoard_core::ErrorCode::BackendFailure,
            "Failed to open bundle '" + name + "': " + reason);
    }

    [[nodiscard]] static hoard_core::Error read_failed(const std::string& bundle, const std::string& path) {
        return hoard_core::Error(hoard_core::ErrorCode::BackendFailure,
            "Bundle '" + bundle + "' has no readable asset: " + path);
    }

    [[nodiscard]] static hoard_core::Error concurrency_conflict(const std::string& name) {
        return hoard_core::Error(hoard_core::ErrorCode::ConcurrencyConflict,
            "Bundle '" + name + "' is being loaded asynchronously; synchronous load refused");
    }

    [[nodiscard]] static hoard_core::Error missing_dependency(const std::string& bundle, const std::string& dep) {
        return hoard_core::Error(hoard_core::ErrorCode::DependencyMissing,
            "Bundle '" + bundle + "' depends on undeclared bundle '" + dep + "'");
    }
};

// =============================================================================
// DependencyCycle
// =============================================================================

/// Bundle names forming a cycle, first name repeated at the end
struct DependencyCycle {
    std::vector<std::string> cycle_path;

    /// "a -> b -> a"
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// BundleManifest
// =============================================================================

/// One declared bundle
struct BundleInfo {
    std::string name;
    std::vector<std::string> dependencies;  ///< Direct dependencies, load order
};

/// Parsed manifest.json:
///
///     {
///       "bundles": { "ui_atlas": { "dependencies": ["shaders"] }, "shaders": {} },
///       "assets":  { "ui/atlas.png": "ui_atlas" },
///       "pinned":  "shaders"
///     }
class BundleManifest {
public:
    BundleManifest() = default;

    /// Load and validate a manifest file
    [[nodiscard]] static hoard_core::Result<BundleManifest> load(const std::filesystem::path& path);

    /// Parse and validate a manifest document
    [[nodiscard]] static hoard_core::Result<BundleManifest> from_json_string(
        const std::string& json_str,
        const std::filesystem::path& source_path = "manifest.json");

    // -------------------------------------------------------------------------
    // Building
    // -------------------------------------------------------------------------

    /// Declare a bundle (replaces an earlier declaration)
    BundleManifest& add_bundle(const std::string& name, std::vector<std::string> dependencies = {});

    /// Map an asset path to its bundle
    BundleManifest& map_asset(const std::string& asset_path, const std::string& bundle);

    BundleManifest& set_pinned(const std::string& name) {
        m_pinned = name;
        return *this;
    }

    /// Every dependency and asset must name a declared bundle; no cycles
    [[nodiscard]] hoard_core::Result<void> validate() const;

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    [[nodiscard]] const BundleInfo* bundle(const std::string& name) const;

    [[nodiscard]] bool has_bundle(const std::string& name) const {
        return m_bundles.find(name) != m_bundles.end();
    }

    /// Direct dependencies of a bundle; empty for unknown bundles
    [[nodiscard]] std::vector<std::string> dependencies(const std::string& name) const;

    /// Bundle that contains an asset
    [[nodiscard]] std::optional<std::string> bundle_for(const std::string& asset_path) const;

    /// Dependencies-first order of everything a bundle needs, itself last
    [[nodiscard]] hoard_core::Result<std::vector<std::string>> load_order(const std::string& name) const;

    [[nodiscard]] const std::string& pinned() const noexcept { return m_pinned; }

    [[nodiscard]] std::vector<std::string> bundle_names() const;

    [[nodiscard]] std::size_t bundle_count() const noexcept { return m_bundles.size(); }
    [[nodiscard]] std::size_t asset_count() const noexcept { return m_assets.size(); }

private:
    hoard_core::Result<void> topological_visit(
        const std::string& name,
        std::vector<std::string>& order,
        std::set<std::string>& visited,
        std::set<std::string>& in_stack,
        std::vector<std::string>& current_path) const;

    std::map<std::string, BundleInfo> m_bundles;
    std::unordered_map<std::string, std::string> m_assets;
    std::string m_pinned;
};

// =============================================================================
// Platform Paths
// =============================================================================

/// Name of the platform bundles are built for ("Linux", "Windows", ...)
[[nodiscard]] const char* platform_name();

/// <asset_root>/bundles/<platform>/manifest.json
[[nodiscard]] std::filesystem::path default_manifest_path(const std::filesystem::path& asset_root);

} // namespace hoard_bundle
