#pragma once

/// @file graph.hpp
/// @brief Refcounted transitive load/unload of bundle dependencies

#include "source.hpp"
#include <hoard/core/error.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hoard_bundle {

// =============================================================================
// NodeState
// =============================================================================

/// Unloaded -> Loading -> Ready -> (Unloading) -> Unloaded.
/// Unloading lasts for the BundleSource::close call of a node whose count hit
/// zero. Pinned nodes never enter it.
enum class NodeState : std::uint8_t {
    Unloaded,
    Loading,
    Ready,
    Unloading,
};

[[nodiscard]] inline const char* node_state_name(NodeState state) {
    switch (state) {
        case NodeState::Unloaded: return "Unloaded";
        case NodeState::Loading: return "Loading";
        case NodeState::Ready: return "Ready";
        case NodeState::Unloading: return "Unloading";
        default: return "Unknown";
    }
}

/// An open bundle
struct BundleNode {
    std::string name;
    std::vector<std::string> dependencies;
    std::uint32_t ref_count = 0;
    bool pinned = false;
    NodeState state = NodeState::Unloaded;
    BundleHandle handle;
};

/// Counters for one graph instance
struct GraphStats {
    std::uint64_t opens = 0;
    std::uint64_t closes = 0;
    std::uint64_t conflicts = 0;
    std::uint64_t failures = 0;
    std::uint64_t abandoned = 0;
};

using DependencyProvider = std::function<std::vector<std::string>(const std::string&)>;
using GraphCallback = std::function<void(hoard_core::Result<void>)>;

// =============================================================================
// DependencyGraph
// =============================================================================

/// Every load of a bundle first loads its dependencies, and every unload
/// decrements them again, so Load/Unload pairs leave all counts unchanged.
///
/// A failed load returns every reference it had already taken.
class DependencyGraph {
public:
    /// @param dependencies Queried once per bundle, then cached
    DependencyGraph(BundleSource& source, DependencyProvider dependencies);

    DependencyGraph(const DependencyGraph&) = delete;
    DependencyGraph& operator=(const DependencyGraph&) = delete;

    // -------------------------------------------------------------------------
    // Loading
    // -------------------------------------------------------------------------

    /// Depth-first load. Fails with ConcurrencyConflict if any bundle it needs
    /// to open is being opened asynchronously.
    [[nodiscard]] hoard_core::Result<void> load_sync(const std::string& name);

    /// Dependencies load in parallel and are joined before the bundle itself.
    /// Concurrent opens of one bundle share a single source call.
    void load_async(const std::string& name, GraphCallback on_complete);

    /// Drop one reference to the bundle and, recursively, to its dependencies.
    /// Unknown bundles and bundles at zero are left alone.
    void unload(const std::string& name);

    // -------------------------------------------------------------------------
    // Pinning
    // -------------------------------------------------------------------------

    /// Designate the bundle that is never closed by unload
    void set_pinned(const std::string& name);

    [[nodiscard]] const std::string& pinned() const noexcept { return m_pinned; }

    [[nodiscard]] bool is_pinned(const std::string& name) const {
        return !m_pinned.empty() && name == m_pinned;
    }

    /// Open the pinned bundle now, leaving its own count at zero
    [[nodiscard]] hoard_core::Result<void> preload_pinned_sync();

    /// Asynchronous form of preload_pinned_sync
    void preload_pinned_async(GraphCallback on_complete);

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    /// Cached dependency list of a bundle
    const std::vector<std::string>& dependencies(const std::string& name);

    [[nodiscard]] NodeState state(const std::string& name) const;
    [[nodiscard]] std::uint32_t ref_count(const std::string& name) const;
    [[nodiscard]] const BundleNode* node(const std::string& name) const;

    [[nodiscard]] bool is_ready(const std::string& name) const {
        return m_nodes.find(name) != m_nodes.end();
    }

    [[nodiscard]] bool is_loading(const std::string& name) const {
        return m_opening.find(name) != m_opening.end();
    }

    /// Number of open bundles
    [[nodiscard]] std::size_t loaded_count() const noexcept { return m_nodes.size(); }

    [[nodiscard]] const GraphStats& stats() const noexcept { return m_stats; }

    /// Fail every async open still outstanding with reason. References the
    /// affected loads had taken are rolled back; a source completion arriving
    /// later is closed and otherwise ignored.
    void abandon_pending(const hoard_core::Error& reason);

    /// Close every open bundle, pinned included. Pending async loads are dropped
    /// without their callbacks running.
    void clear();

private:
    struct AsyncLoad;

    /// An open_async call and the loads waiting on it
    struct PendingOpen {
        std::uint64_t serial = 0;
        std::vector<GraphCallback> waiters;
    };

    hoard_core::Result<void> load_sync_impl(const std::string& name, std::vector<std::string>& path);
    hoard_core::Result<void> acquire_sync(const std::string& name);

    void load_async_impl(const std::string& name, const std::vector<std::string>& path, GraphCallback on_complete);
    void on_dependencies_joined(const std::shared_ptr<AsyncLoad>& op);
    void acquire_async(const std::shared_ptr<AsyncLoad>& op);
    void on_opened(const std::string& name, std::uint64_t serial, OpenResult result);

    BundleNode& insert_node(const std::string& name, BundleHandle handle, std::uint32_t refs);
    void rollback(const std::vector<std::string>& acquired);
    hoard_core::Error conflict(const std::string& name);

    BundleSource& m_source;
    DependencyProvider m_provider;
    std::string m_pinned;

    std::unordered_map<std::string, BundleNode> m_nodes;
    std::unordered_map<std::string, PendingOpen> m_opening;
    std::uint64_t m_next_open = 0;
    std::unordered_map<std::string, std::vector<std::string>> m_dependency_cache;
    GraphStats m_stats;
};

} // namespace hoard_bundle
