#pragma once

/// @file types.hpp
/// @brief Core types for hoard_res module

#include "fwd.hpp"
#include <hoard/core/error.hpp>
#include <hoard/core/id.hpp>
#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hoard_res {

// =============================================================================
// BackendKind
// =============================================================================

/// Storage kind a resource is fetched from
enum class BackendKind : std::uint8_t {
    File,     // Loose files below an asset root
    Archive,  // Packaged bundles with inter-bundle dependencies
    Remote,   // Remote package, async only
};

[[nodiscard]] inline const char* backend_kind_name(BackendKind kind) {
    switch (kind) {
        case BackendKind::File: return "File";
        case BackendKind::Archive: return "Archive";
        case BackendKind::Remote: return "Remote";
        default: return "Unknown";
    }
}

/// Parse a kind name (case-insensitive)
[[nodiscard]] std::optional<BackendKind> parse_backend_kind(std::string_view name);

// =============================================================================
// ResourceKey
// =============================================================================

/// Identity of a loadable resource: (backend kind, normalized path)
struct ResourceKey {
    BackendKind kind = BackendKind::File;
    std::string path;
    std::uint64_t hash = 0;

    ResourceKey() = default;

    ResourceKey(BackendKind k, std::string p)
        : kind(k)
        , path(normalize(std::move(p)))
        , hash(hoard_core::detail::hash_combine(
              hoard_core::detail::fnv1a_hash(path), static_cast<std::uint64_t>(k))) {}

    /// Textual form "Kind://path"
    [[nodiscard]] std::string to_string() const;

    bool operator==(const ResourceKey& other) const noexcept {
        return hash == other.hash && kind == other.kind && path == other.path;
    }

    bool operator!=(const ResourceKey& other) const noexcept {
        return !(*this == other);
    }

    /// Backslashes become forward slashes, trailing slashes are dropped
    [[nodiscard]] static std::string normalize(std::string p);
};

// =============================================================================
// EntryState
// =============================================================================

/// Ready entries hold a live asset. An Invalid entry has had its asset
/// released but still counts the references of its holders; Loading marks an
/// Invalid entry whose refetch is in flight.
enum class EntryState : std::uint8_t {
    Loading,
    Ready,
    Invalid,
};

[[nodiscard]] inline const char* entry_state_name(EntryState state) {
    switch (state) {
        case EntryState::Loading: return "Loading";
        case EntryState::Ready: return "Ready";
        case EntryState::Invalid: return "Invalid";
        default: return "Unknown";
    }
}

// =============================================================================
// Asset
// =============================================================================

/// Opaque loaded resource. The core never interprets the bytes.
struct Asset {
    std::string path;
    std::vector<std::uint8_t> bytes;

    [[nodiscard]] std::size_t size() const noexcept { return bytes.size(); }

    [[nodiscard]] std::string_view text() const noexcept {
        return std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }
};

using AssetPtr = std::shared_ptr<const Asset>;

/// Build an asset from raw text
[[nodiscard]] AssetPtr make_asset(std::string path, std::string_view contents);

/// A backend fetch result: the asset plus whatever the backend needs to release it
struct FetchedAsset {
    AssetPtr asset;
    std::any metadata;
};

// =============================================================================
// Callbacks and Ids
// =============================================================================

using FetchResult = hoard_core::Result<FetchedAsset>;
using FetchCallback = std::function<void(FetchResult)>;

using LoadResult = hoard_core::Result<AssetPtr>;
using LoadCallback = std::function<void(LoadResult)>;

/// Fraction of a preload that has settled, in [0, 1]
using ProgressCallback = std::function<void(float)>;

/// Identifies one load_async call until it settles
using RequestId = hoard_core::Id;

// =============================================================================
// ResError
// =============================================================================

/// Resource-specific error factories
struct ResError {
    [[nodiscard]] static hoard_core::Error not_found(const std::string& what) {
        return hoard_core::Error(hoard_core::ErrorCode::NotFound,
            "Resource not found: " + what);
    }

    [[nodiscard]] static hoard_core::Error backend_failure(const std::string& what, const std::string& reason) {
        return hoard_core::Error(hoard_core::ErrorCode::BackendFailure,
            "Backend failed to load '" + what + "': " + reason);
    }

    [[nodiscard]] static hoard_core::Error concurrency_conflict(const std::string& what) {
        return hoard_core::Error(hoard_core::ErrorCode::ConcurrencyConflict,
            "Synchronous load of '" + what + "' conflicts with an asynchronous load in flight");
    }

    [[nodiscard]] static hoard_core::Error not_supported(const std::string& backend, const std::string& operation) {
        return hoard_core::Error(hoard_core::ErrorCode::NotSupported,
            "Backend '" + backend + "' does not support " + operation);
    }

    [[nodiscard]] static hoard_core::Error no_backend(BackendKind kind) {
        return hoard_core::Error(hoard_core::ErrorCode::NotFound,
            std::string("No backend registered for kind: ") + backend_kind_name(kind));
    }

    [[nodiscard]] static hoard_core::Error abandoned() {
        return hoard_core::Error(hoard_core::ErrorCode::InvalidState,
            "Load abandoned: context shut down");
    }

    [[nodiscard]] static hoard_core::Error inactive_consumer(std::uint32_t slot) {
        return hoard_core::Error(hoard_core::ErrorCode::InvalidState,
            "Consumer in slot " + std::to_string(slot) + " is not active");
    }
};

} // namespace hoard_res

template<>
struct std::hash<hoard_res::ResourceKey> {
    std::size_t operator()(const hoard_res::ResourceKey& key) const noexcept {
        return static_cast<std::size_t>(key.hash);
    }
};
