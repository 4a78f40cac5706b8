#pragma once

/// @file log.hpp
/// @brief Logging utilities for hoard

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <string>
#include <memory>
#include <optional>
#include <chrono>

// =============================================================================
// Logging Macros
// =============================================================================

#define HOARD_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define HOARD_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define HOARD_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define HOARD_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define HOARD_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define HOARD_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace hoard_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Apply a configuration; loggers created afterwards use the new sinks
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Logger for hoard_core
std::shared_ptr<spdlog::logger> core_logger();

/// Logger for cache, coordinator and consumers
std::shared_ptr<spdlog::logger> res_logger();

/// Logger for bundles and the dependency graph
std::shared_ptr<spdlog::logger> bundle_logger();

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);

[[nodiscard]] spdlog::level::level_enum get_global_log_level();

/// Parse log level from string ("warn", "error", ...)
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

[[nodiscard]] const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for function/block tracing
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "hoard_core");
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define HOARD_LOG_CONCAT_IMPL(a, b) a##b
#define HOARD_LOG_CONCAT(a, b) HOARD_LOG_CONCAT_IMPL(a, b)
#define HOARD_LOG_SCOPE(name, logger) ::hoard_core::LogScope HOARD_LOG_CONCAT(_log_scope_, __LINE__)(name, logger)

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Drop every named logger and shut spdlog down
void shutdown_logging();

} // namespace hoard_core
