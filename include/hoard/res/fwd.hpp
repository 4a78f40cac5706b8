#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for hoard_res module

#include <cstdint>

namespace hoard_res {

// Keys and assets
enum class BackendKind : std::uint8_t;
enum class EntryState : std::uint8_t;
struct ResourceKey;
struct Asset;
struct FetchedAsset;

// Backends
class Backend;
class BackendRegistry;
class FileBackend;

// Scheduling
class Scheduler;

// Cache and coordination
struct CacheEntry;
struct CacheStats;
class ResourceCache;
class LoadCoordinator;

// Consumers
enum class ConsumerState : std::uint8_t;
class Consumer;
class ConsumerPool;

// Facade
struct ResConfig;
class ResContext;

} // namespace hoard_res
