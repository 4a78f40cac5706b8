/// @file types.cpp
/// @brief ResourceKey and asset helpers

#include <hoard/res/types.hpp>
#include <algorithm>
#include <cctype>

namespace hoard_res {

std::optional<BackendKind> parse_backend_kind(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "file") return BackendKind::File;
    if (lower == "archive" || lower == "bundle") return BackendKind::Archive;
    if (lower == "remote") return BackendKind::Remote;
    return std::nullopt;
}

std::string ResourceKey::to_string() const {
    return std::string(backend_kind_name(kind)) + "://" + path;
}

std::string ResourceKey::normalize(std::string p) {
    for (char& c : p) {
        if (c == '\\') c = '/';
    }
    while (!p.empty() && p.back() == '/') {
        p.pop_back();
    }
    return p;
}

AssetPtr make_asset(std::string path, std::string_view contents) {
    auto asset = std::make_shared<Asset>();
    asset->path = std::move(path);
    asset->bytes.assign(contents.begin(), contents.end());
    return asset;
}

} // namespace hoard_res
