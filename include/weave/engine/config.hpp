#pragma once

/// @file config.hpp
/// @brief Runtime configuration: JSON file plus environment overrides
///
/// ```json
/// {
///   "logging":    { "level": "info", "console": true, "file": false, "directory": "logs" },
///   "governance": { "default_timeout_ms": 30000, "default_strategy": "all" }
/// }
/// ```
///
/// Environment variables WEAVE_LOG_LEVEL, WEAVE_APPROVAL_TIMEOUT_MS and
/// WEAVE_APPROVAL_STRATEGY override the file.

#include <weave/core/error.hpp>
#include <weave/core/log.hpp>
#include <weave/govern/strategy.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace weave {

namespace config_env {
constexpr const char* LOG_LEVEL = "WEAVE_LOG_LEVEL";
constexpr const char* APPROVAL_TIMEOUT_MS = "WEAVE_APPROVAL_TIMEOUT_MS";
constexpr const char* APPROVAL_STRATEGY = "WEAVE_APPROVAL_STRATEGY";
} // namespace config_env

/// Defaults applied when request_approval is called without explicit values
struct GovernanceSettings {
    std::optional<std::chrono::milliseconds> default_timeout;  ///< nullopt waits forever
    weave_govern::ApprovalStrategy default_strategy = weave_govern::ApprovalStrategy::All;
};

struct WeaveConfig {
    weave_core::LogConfig logging;
    GovernanceSettings governance;

    /// Parse a JSON document. Unknown keys are ignored.
    [[nodiscard]] static weave_core::Result<WeaveConfig> from_json_string(const std::string& json_str);

    /// Read and parse a JSON file
    [[nodiscard]] static weave_core::Result<WeaveConfig> load(const std::filesystem::path& path);

    /// Apply WEAVE_* environment variables
    weave_core::Result<void> apply_environment();

    /// @brief Apply overrides keyed by environment variable name
    ///
    /// Split from apply_environment so overrides can be tested without
    /// touching the process environment.
    weave_core::Result<void> apply_overrides(const std::map<std::string, std::string>& values);

    /// @brief Install the logging section process-wide (configure_logging)
    ///
    /// Weave does not call this itself; logging is global and belongs to the
    /// application.
    void apply_logging() const;
};

} // namespace weave
