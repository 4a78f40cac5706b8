/// @file manifest.cpp
/// @brief BundleManifest implementation

#include <hoard/bundle/manifest.hpp>
#include <hoard/res/types.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace hoard_bundle {

// =============================================================================
// DependencyCycle
// =============================================================================

std::string DependencyCycle::format() const {
    std::ostringstream oss;
    for (std::size_t i = 0; i < cycle_path.size(); ++i) {
        if (i > 0) oss << " -> ";
        oss << cycle_path[i];
    }
    return oss.str();
}

// =============================================================================
// JSON Parsing Helpers
// =============================================================================

namespace {

hoard_core::Result<std::vector<std::string>> parse_dependency_list(
    const std::string& bundle, const nlohmann::json& j) {

    std::vector<std::string> deps;
    if (!j.contains("dependencies")) {
        return hoard_core::Ok(std::move(deps));
    }

    const auto& arr = j["dependencies"];
    if (!arr.is_array()) {
        return hoard_core::Err<std::vector<std::string>>(
            hoard_core::Error(hoard_core::ErrorCode::ParseError,
                "Bundle '" + bundle + "': 'dependencies' must be an array"));
    }

    deps.reserve(arr.size());
    for (const auto& item : arr) {
        if (!item.is_string()) {
            return hoard_core::Err<std::vector<std::string>>(
                hoard_core::Error(hoard_core::ErrorCode::ParseError,
                    "Bundle '" + bundle + "': dependency names must be strings"));
        }
        deps.push_back(item.get<std::string>());
    }
    return hoard_core::Ok(std::move(deps));
}

} // anonymous namespace

// =============================================================================
// BundleManifest
// =============================================================================

hoard_core::Result<BundleManifest> BundleManifest::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return hoard_core::Err<BundleManifest>(
            hoard_core::Error(hoard_core::ErrorCode::NotFound,
                "Manifest file not found: " + path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return hoard_core::Err<BundleManifest>(
            hoard_core::Error(hoard_core::ErrorCode::IOError,
                "Failed to open manifest file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_string(buffer.str(), path);
}

hoard_core::Result<BundleManifest> BundleManifest::from_json_string(
    const std::string& json_str,
    const std::filesystem::path& source_path) {

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return hoard_core::Err<BundleManifest>(
            hoard_core::Error(hoard_core::ErrorCode::ParseError,
                "JSON parse error in " + source_path.string() + ": " + e.what()));
    }

    if (!j.is_object() || !j.contains("bundles") || !j["bundles"].is_object()) {
        return hoard_core::Err<BundleManifest>(
            hoard_core::Error(hoard_core::ErrorCode::ParseError,
                "Missing 'bundles' object in " + source_path.string()));
    }

    BundleManifest manifest;

    const auto& bundles = j["bundles"];
    for (auto it = bundles.begin(); it != bundles.end(); ++it) {
        const std::string& name = it.key();
        const auto& entry = it.value();
        if (!entry.is_object()) {
            return hoard_core::Err<BundleManifest>(
                hoard_core::Error(hoard_core::ErrorCode::ParseError,
                    "Bundle '" + name + "' must be an object"));
        }
        auto deps = parse_dependency_list(name, entry);
        if (!deps) {
            return hoard_core::Err<BundleManifest>(deps.error());
        }
        manifest.add_bundle(name, std::move(*deps));
    }

    if (j.contains("assets")) {
        if (!j["assets"].is_object()) {
            return hoard_core::Err<BundleManifest>(
                hoard_core::Error(hoard_core::ErrorCode::ParseError,
                    "'assets' must map asset paths to bundle names"));
        }
        const auto& assets = j["assets"];
        for (auto it = assets.begin(); it != assets.end(); ++it) {
            const std::string& path = it.key();
            const auto& bundle = it.value();
            if (!bundle.is_string()) {
                return hoard_core::Err<BundleManifest>(
                    hoard_core::Error(hoard_core::ErrorCode::ParseError,
                        "Asset '" + path + "' must name a bundle"));
            }
            manifest.map_asset(path, bundle.get<std::string>());
        }
    }

    if (j.contains("pinned") && j["pinned"].is_string()) {
        manifest.set_pinned(j["pinned"].get<std::string>());
    }

    auto valid = manifest.validate();
    if (!valid) {
        return hoard_core::Err<BundleManifest>(valid.error().with_context("source", source_path.string()));
    }

    return hoard_core::Ok(std::move(manifest));
}

BundleManifest& BundleManifest::add_bundle(const std::string& name, std::vector<std::string> dependencies) {
    m_bundles[name] = BundleInfo{name, std::move(dependencies)};
    return *this;
}

BundleManifest& BundleManifest::map_asset(const std::string& asset_path, const std::string& bundle) {
    m_assets[hoard_res::ResourceKey::normalize(asset_path)] = bundle;
    return *this;
}

hoard_core::Result<void> BundleManifest::validate() const {
    for (const auto& [name, info] : m_bundles) {
        for (const auto& dep : info.dependencies) {
            if (!has_bundle(dep)) {
                return hoard_core::Err(BundleError::missing_dependency(name, dep));
            }
        }
    }

    for (const auto& [path, bundle] : m_assets) {
        if (!has_bundle(bundle)) {
            return hoard_core::Err(hoard_core::Error(hoard_core::ErrorCode::ValidationError,
                "Asset '" + path + "' maps to undeclared bundle '" + bundle + "'"));
        }
    }

    if (!m_pinned.empty() && !has_bundle(m_pinned)) {
        return hoard_core::Err(BundleError::unknown_bundle(m_pinned));
    }

    std::vector<std::string> order;
    std::set<std::string> visited;
    std::set<std::string> in_stack;
    std::vector<std::string> current_path;
    for (const auto& [name, info] : m_bundles) {
        auto result = topological_visit(name, order, visited, in_stack, current_path);
        if (!result) {
            return result;
        }
    }

    return hoard_core::Ok();
}

const BundleInfo* BundleManifest::bundle(const std::string& name) const {
    auto it = m_bundles.find(name);
    return it != m_bundles.end() ? &it->second : nullptr;
}

std::vector<std::string> BundleManifest::dependencies(const std::string& name) const {
    auto it = m_bundles.find(name);
    return it != m_bundles.end() ? it->second.dependencies : std::vector<std::string>{};
}

std::optional<std::string> BundleManifest::bundle_for(const std::string& asset_path) const {
    auto it = m_assets.find(hoard_res::ResourceKey::normalize(asset_path));
    if (it == m_assets.end()) {
        return std::nullopt;
    }
    return it->second;
}

hoard_core::Result<std::vector<std::string>> BundleManifest::load_order(const std::string& name) const {
    if (!has_bundle(name)) {
        return hoard_core::Err<std::vector<std::string>>(BundleError::unknown_bundle(name));
    }

    std::vector<std::string> order;
    std::set<std::string> visited;
    std::set<std::string> in_stack;
    std::vector<std::string> current_path;

    auto result = topological_visit(name, order, visited, in_stack, current_path);
    if (!result) {
        return hoard_core::Err<std::vector<std::string>>(result.error());
    }
    return hoard_core::Ok(std::move(order));
}

std::vector<std::string> BundleManifest::bundle_names() const {
    std::vector<std::string> names;
    names.reserve(m_bundles.size());
    for (const auto& [name, info] : m_bundles) {
        names.push_back(name);
    }
    return names;
}

hoard_core::Result<void> BundleManifest::topological_visit(
    const std::string& name,
    std::vector<std::string>& order,
    std::set<std::string>& visited,
    std::set<std::string>& in_stack,
    std::vector<std::string>& current_path) const {

    if (in_stack.count(name)) {
        // Trim the path to where the cycle starts
        DependencyCycle cycle;
        auto start = std::find(current_path.begin(), current_path.end(), name);
        cycle.cycle_path.assign(start, current_path.end());
        cycle.cycle_path.push_back(name);
        return hoard_core::Err(hoard_core::Error(hoard_core::ErrorCode::ValidationError,
            "Dependency cycle: " + cycle.format()));
    }

    if (visited.count(name)) {
        return hoard_core::Ok();
    }

    auto it = m_bundles.find(name);
    if (it == m_bundles.end()) {
        return hoard_core::Err(BundleError::unknown_bundle(name));
    }

    in_stack.insert(name);
    current_path.push_back(name);

    for (const auto& dep : it->second.dependencies) {
        auto result = topological_visit(dep, order, visited, in_stack, current_path);
        if (!result) {
            return result;
        }
    }

    in_stack.erase(name);
    current_path.pop_back();
    visited.insert(name);
    order.push_back(name);

    return hoard_core::Ok();
}

// =============================================================================
// Platform Paths
// =============================================================================

const char* platform_name() {
#if defined(_WIN32)
    return "Windows";
#elif defined(__ANDROID__)
    return "Android";
#elif defined(__APPLE__)
    return "OSX";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

std::filesystem::path default_manifest_path(const std::filesystem::path& asset_root) {
    return asset_root / "bundles" / platform_name() / "manifest.json";
}

} // namespace hoard_bundle
