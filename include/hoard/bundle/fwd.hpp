#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for hoard_bundle module

#include <cstdint>

namespace hoard_bundle {

struct BundleInfo;
struct DependencyCycle;
class BundleManifest;

struct BundleHandle;
class BundleSource;
class DirectoryBundleSource;

enum class NodeState : std::uint8_t;
struct BundleNode;
class DependencyGraph;

class ArchiveBackend;

} // namespace hoard_bundle
