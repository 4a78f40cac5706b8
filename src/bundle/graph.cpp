/// @file graph.cpp
/// @brief DependencyGraph implementation

#include <hoard/bundle/graph.hpp>
#include <hoard/bundle/manifest.hpp>
#include <hoard/core/log.hpp>
#include <algorithm>

namespace hoard_bundle {

namespace {

hoard_core::Error cycle_error(const std::vector<std::string>& path, const std::string& name) {
    DependencyCycle cycle;
    auto start = std::find(path.begin(), path.end(), name);
    cycle.cycle_path.assign(start, path.end());
    cycle.cycle_path.push_back(name);
    return hoard_core::Error(hoard_core::ErrorCode::ValidationError, "Dependency cycle: " + cycle.format());
}

} // anonymous namespace

/// One load_async call in progress
struct DependencyGraph::AsyncLoad {
    std::string name;
    GraphCallback on_complete;
    std::vector<std::string> path;
    std::vector<std::string> acquired;
    std::size_t remaining = 0;
    std::optional<hoard_core::Error> error;
};

DependencyGraph::DependencyGraph(BundleSource& source, DependencyProvider dependencies)
    : m_source(source)
    , m_provider(std::move(dependencies)) {}

// =============================================================================
// Synchronous Loading
// =============================================================================

hoard_core::Result<void> DependencyGraph::load_sync(const std::string& name) {
    std::vector<std::string> path;
    return load_sync_impl(name, path);
}

hoard_core::Result<void> DependencyGraph::load_sync_impl(const std::string& name, std::vector<std::string>& path) {
    if (std::find(path.begin(), path.end(), name) != path.end()) {
        return hoard_core::Err(cycle_error(path, name));
    }

    // Refuse before touching any dependency
    if (is_loading(name) && !is_ready(name)) {
        return hoard_core::Err(conflict(name));
    }

    path.push_back(name);
    const std::vector<std::string> deps = dependencies(name);
    std::vector<std::string> acquired;
    acquired.reserve(deps.size());

    for (const auto& dep : deps) {
        auto result = load_sync_impl(dep, path);
        if (!result) {
            rollback(acquired);
            path.pop_back();
            return hoard_core::Err(result.error().with_context("required_by", name));
        }
        acquired.push_back(dep);
    }

    auto result = acquire_sync(name);
    if (!result) {
        rollback(acquired);
    }
    path.pop_back();
    return result;
}

hoard_core::Result<void> DependencyGraph::acquire_sync(const std::string& name) {
    if (auto it = m_nodes.find(name); it != m_nodes.end()) {
        ++it->second.ref_count;
        return hoard_core::Ok();
    }

    if (is_loading(name)) {
        return hoard_core::Err(conflict(name));
    }

    if (!m_source.supports_sync()) {
        return hoard_core::Err(hoard_core::Error(hoard_core::ErrorCode::NotSupported,
            "Bundle source cannot open '" + name + "' synchronously"));
    }

    auto opened = m_source.open_sync(name);
    if (!opened) {
        ++m_stats.failures;
        hoard_core::bundle_logger()->error("failed to open bundle {}: {}", name, opened.error().message());
        return hoard_core::Err(opened.error());
    }

    insert_node(name, std::move(opened).value(), 1);
    return hoard_core::Ok();
}

// =============================================================================
// Asynchronous Loading
// =============================================================================

void DependencyGraph::load_async(const std::string& name, GraphCallback on_complete) {
    load_async_impl(name, {}, std::move(on_complete));
}

void DependencyGraph::load_async_impl(const std::string& name,
                                      const std::vector<std::string>& path,
                                      GraphCallback on_complete) {
    if (std::find(path.begin(), path.end(), name) != path.end()) {
        on_complete(hoard_core::Err(cycle_error(path, name)));
        return;
    }

    auto op = std::make_shared<AsyncLoad>();
    op->name = name;
    op->on_complete = std::move(on_complete);
    op->path = path;
    op->path.push_back(name);

    const std::vector<std::string> deps = dependencies(name);
    if (deps.empty()) {
        acquire_async(op);
        return;
    }

    // Set before issuing so inline completions cannot join early
    op->remaining = deps.size();
    for (const auto& dep : deps) {
        load_async_impl(dep, op->path, [this, op, dep](hoard_core::Result<void> result) {
            if (result) {
                op->acquired.push_back(dep);
            } else if (!op->error) {
                op->error = result.error();
            }
            if (--op->remaining == 0) {
                on_dependencies_joined(op);
            }
        });
    }
}

void DependencyGraph::on_dependencies_joined(const std::shared_ptr<AsyncLoad>& op) {
    if (op->error) {
        rollback(op->acquired);
        op->on_complete(hoard_core::Err(op->error->with_context("required_by", op->name)));
        return;
    }
    acquire_async(op);
}

void DependencyGraph::acquire_async(const std::shared_ptr<AsyncLoad>& op) {
    GraphCallback done = [this, op](hoard_core::Result<void> result) {
        if (!result) {
            rollback(op->acquired);
        }
        op->on_complete(std::move(result));
    };

    if (auto it = m_nodes.find(op->name); it != m_nodes.end()) {
        ++it->second.ref_count;
        done(hoard_core::Ok());
        return;
    }

    if (auto it = m_opening.find(op->name); it != m_opening.end()) {
        hoard_core::bundle_logger()->trace("joining in-flight open of {}", op->name);
        it->second.waiters.push_back(std::move(done));
        return;
    }

    // Marker goes in before the source is called; it may complete inline
    std::uint64_t serial = ++m_next_open;
    PendingOpen& pending = m_opening[op->name];
    pending.serial = serial;
    pending.waiters.push_back(std::move(done));
    hoard_core::bundle_logger()->debug("opening bundle {} asynchronously", op->name);

    std::string name = op->name;
    m_source.open_async(name, [this, name, serial](OpenResult result) {
        on_opened(name, serial, std::move(result));
    });
}

void DependencyGraph::on_opened(const std::string& name, std::uint64_t serial, OpenResult result) {
    auto pending = m_opening.find(name);
    if (pending == m_opening.end() || pending->second.serial != serial) {
        // Cleared or abandoned while the open was outstanding
        hoard_core::bundle_logger()->debug("late open of {} discarded", name);
        if (result) {
            m_source.close(result.value());
        }
        return;
    }

    std::vector<GraphCallback> waiters = std::move(pending->second.waiters);
    m_opening.erase(pending);

    if (!result) {
        ++m_stats.failures;
        hoard_core::bundle_logger()->error("failed to open bundle {}: {}", name, result.error().message());
        for (auto& waiter : waiters) {
            waiter(hoard_core::Err(result.error()));
        }
        return;
    }

    auto refs = static_cast<std::uint32_t>(waiters.size());
    if (auto it = m_nodes.find(name); it != m_nodes.end()) {
        m_source.close(result.value());
        it->second.ref_count += refs;
    } else {
        insert_node(name, std::move(result).value(), refs);
    }

    for (auto& waiter : waiters) {
        waiter(hoard_core::Ok());
    }
}

// =============================================================================
// Unloading
// =============================================================================

void DependencyGraph::unload(const std::string& name) {
    auto it = m_nodes.find(name);
    if (it == m_nodes.end() || it->second.ref_count == 0) {
        hoard_core::bundle_logger()->trace("unload of {} ignored (not held)", name);
        return;
    }

    BundleNode& node = it->second;
    --node.ref_count;
    const std::vector<std::string> deps = node.dependencies;

    if (node.ref_count == 0 && !node.pinned) {
        // Stays registered as Unloading while the source closes it
        node.state = NodeState::Unloading;
        m_source.close(node.handle);
        m_nodes.erase(name);
        ++m_stats.closes;
        hoard_core::bundle_logger()->debug("closed bundle {}", name);
    }

    for (const auto& dep : deps) {
        unload(dep);
    }
}

void DependencyGraph::rollback(const std::vector<std::string>& acquired) {
    for (auto it = acquired.rbegin(); it != acquired.rend(); ++it) {
        unload(*it);
    }
}

// =============================================================================
// Pinning
// =============================================================================

void DependencyGraph::set_pinned(const std::string& name) {
    if (auto it = m_nodes.find(m_pinned); it != m_nodes.end()) {
        // The old node stays open until its count next drops to zero or clear()
        it->second.pinned = false;
    }

    m_pinned = name;
    if (auto it = m_nodes.find(m_pinned); it != m_nodes.end()) {
        it->second.pinned = true;
    }
}

hoard_core::Result<void> DependencyGraph::preload_pinned_sync() {
    if (m_pinned.empty() || is_ready(m_pinned)) {
        return hoard_core::Ok();
    }

    auto result = load_sync(m_pinned);
    if (!result) {
        return result;
    }

    // Dependencies keep the reference taken for them; the pinned node itself starts at zero
    --m_nodes.at(m_pinned).ref_count;
    hoard_core::bundle_logger()->info("pinned bundle {} preloaded", m_pinned);
    return hoard_core::Ok();
}

void DependencyGraph::preload_pinned_async(GraphCallback on_complete) {
    if (m_pinned.empty() || is_ready(m_pinned)) {
        on_complete(hoard_core::Ok());
        return;
    }

    std::string name = m_pinned;
    load_async(name, [this, name, on_complete = std::move(on_complete)](hoard_core::Result<void> result) {
        if (result) {
            if (auto it = m_nodes.find(name); it != m_nodes.end() && it->second.ref_count > 0) {
                --it->second.ref_count;
            }
            hoard_core::bundle_logger()->info("pinned bundle {} preloaded", name);
        }
        on_complete(std::move(result));
    });
}

// =============================================================================
// Queries
// =============================================================================

const std::vector<std::string>& DependencyGraph::dependencies(const std::string& name) {
    auto it = m_dependency_cache.find(name);
    if (it != m_dependency_cache.end()) {
        return it->second;
    }

    std::vector<std::string> deps;
    if (m_provider) {
        deps = m_provider(name);
    }
    return m_dependency_cache.emplace(name, std::move(deps)).first->second;
}

NodeState DependencyGraph::state(const std::string& name) const {
    if (auto it = m_nodes.find(name); it != m_nodes.end()) {
        return it->second.state;
    }
    return is_loading(name) ? NodeState::Loading : NodeState::Unloaded;
}

std::uint32_t DependencyGraph::ref_count(const std::string& name) const {
    auto it = m_nodes.find(name);
    return it != m_nodes.end() ? it->second.ref_count : 0;
}

const BundleNode* DependencyGraph::node(const std::string& name) const {
    auto it = m_nodes.find(name);
    return it != m_nodes.end() ? &it->second : nullptr;
}

void DependencyGraph::abandon_pending(const hoard_core::Error& reason) {
    std::unordered_map<std::string, PendingOpen> abandoned;
    abandoned.swap(m_opening);

    for (auto& [name, pending] : abandoned) {
        ++m_stats.abandoned;
        hoard_core::bundle_logger()->debug("abandoning open of {} ({} waiters)", name, pending.waiters.size());
        for (auto& waiter : pending.waiters) {
            waiter(hoard_core::Err(reason));
        }
    }
}

void DependencyGraph::clear() {
    for (auto& [name, node] : m_nodes) {
        m_source.close(node.handle);
        ++m_stats.closes;
    }
    if (!m_nodes.empty()) {
        hoard_core::bundle_logger()->debug("closed {} bundles on clear", m_nodes.size());
    }
    m_nodes.clear();
    m_opening.clear();
}

// =============================================================================
// Helpers
// =============================================================================

BundleNode& DependencyGraph::insert_node(const std::string& name, BundleHandle handle, std::uint32_t refs) {
    BundleNode node;
    node.name = name;
    node.dependencies = dependencies(name);
    node.ref_count = refs;
    node.pinned = is_pinned(name);
    node.state = NodeState::Ready;
    node.handle = std::move(handle);

    ++m_stats.opens;
    hoard_core::bundle_logger()->debug("opened bundle {} (refs {}{})", name, refs, node.pinned ? ", pinned" : "");

    return m_nodes.insert_or_assign(name, std::move(node)).first->second;
}

hoard_core::Error DependencyGraph::conflict(const std::string& name) {
    ++m_stats.conflicts;
    hoard_core::bundle_logger()->warn("sync load of bundle {} refused: async open in flight", name);
    return BundleError::concurrency_conflict(name);
}

} // namespace hoard_bundle
