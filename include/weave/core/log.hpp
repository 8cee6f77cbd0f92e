#pragma once

/// @file log.hpp
/// @brief Logging utilities for weave

#include <spdlog/spdlog.h>
#include <string>
#include <map>
#include <memory>
#include <optional>
#include <chrono>

// =============================================================================
// Logging Macros
// =============================================================================

#define WEAVE_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define WEAVE_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define WEAVE_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define WEAVE_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define WEAVE_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define WEAVE_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace weave_core {

// =============================================================================
// Basic Logging (Inline)
// =============================================================================

/// @brief Initialize the default logger pattern and level
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

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

/// Configure logging system with full options. Loggers created afterwards use the
/// new sinks; existing loggers only pick up the level.
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Core module logger ("weave_core")
std::shared_ptr<spdlog::logger> core_logger();

/// Ledger, graph and cone logger ("ledger")
std::shared_ptr<spdlog::logger> ledger_logger();

/// Yield/approval logger ("governance")
std::shared_ptr<spdlog::logger> governance_logger();

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);

void set_logger_level(const std::string& name, spdlog::level::level_enum level);

spdlog::level::level_enum get_global_log_level();

/// Parse log level from string ("trace", "debug", "info", "warn", "error", "critical", "off")
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Structured Logging
// =============================================================================

/// Log a message followed by {key="value", ...}
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for function/block tracing
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "weave_core");
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

#define WEAVE_LOG_CONCAT_IMPL(a, b) a##b
#define WEAVE_LOG_CONCAT(a, b) WEAVE_LOG_CONCAT_IMPL(a, b)
#define WEAVE_LOG_SCOPE(name) ::weave_core::LogScope WEAVE_LOG_CONCAT(_log_scope_, __LINE__)(name)

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

void shutdown_logging();

} // namespace weave_core
