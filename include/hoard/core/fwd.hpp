#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for hoard_core module

#include <cstdint>

namespace hoard_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct HandleError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// ID Types
// =============================================================================

struct Id;
class IdGenerator;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace hoard_core
