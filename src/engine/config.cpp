/// @file config.cpp
/// @brief WeaveConfig parsing

#include <weave/engine/config.hpp>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace weave {

namespace {

weave_core::Error parse_error(const std::string& message) {
    return weave_core::Error(weave_core::ErrorCode::ParseError, message);
}

weave_core::Result<std::chrono::milliseconds> parse_timeout_ms(long long value) {
    if (value < 0) {
        return weave_core::Err<std::chrono::milliseconds>(
            parse_error("Approval timeout must be non-negative, got " + std::to_string(value)));
    }
    return weave_core::Ok(std::chrono::milliseconds(value));
}

weave_core::Result<void> parse_logging(const nlohmann::json& j, weave_core::LogConfig& out) {
    if (!j.is_object()) {
        return weave_core::Err(parse_error("'logging' must be an object"));
    }

    if (j.contains("level")) {
        if (!j["level"].is_string()) {
            return weave_core::Err(parse_error("'logging.level' must be a string"));
        }
        auto level = weave_core::parse_log_level(j["level"].get<std::string>());
        if (!level) {
            return weave_core::Err(parse_error("Unknown log level: " + j["level"].get<std::string>()));
        }
        out.level = *level;
    }

    for (const char* key : {"console", "file"}) {
        if (j.contains(key) && !j[key].is_boolean()) {
            return weave_core::Err(parse_error(std::string("'logging.") + key + "' must be a boolean"));
        }
    }
    if (j.contains("directory") && !j["directory"].is_string()) {
        return weave_core::Err(parse_error("'logging.directory' must be a string"));
    }
    for (const char* key : {"max_file_size", "max_files"}) {
        if (j.contains(key) && !j[key].is_number_unsigned()) {
            return weave_core::Err(parse_error(std::string("'logging.") + key + "' must be a non-negative integer"));
        }
    }

    out.console_enabled = j.value("console", out.console_enabled);
    out.file_enabled = j.value("file", out.file_enabled);
    out.log_directory = j.value("directory", out.log_directory);
    out.max_file_size = j.value("max_file_size", out.max_file_size);
    out.max_files = j.value("max_files", out.max_files);

    return weave_core::Ok();
}

weave_core::Result<void> parse_governance(const nlohmann::json& j, GovernanceSettings& out) {
    if (!j.is_object()) {
        return weave_core::Err(parse_error("'governance' must be an object"));
    }

    if (j.contains("default_timeout_ms")) {
        const auto& timeout = j["default_timeout_ms"];
        if (timeout.is_null()) {
            out.default_timeout.reset();
        } else if (timeout.is_number_integer()) {
            auto parsed = parse_timeout_ms(timeout.get<long long>());
            if (!parsed) {
                return weave_core::Err(parsed.error());
            }
            out.default_timeout = *parsed;
        } else {
            return weave_core::Err(parse_error("'governance.default_timeout_ms' must be an integer or null"));
        }
    }

    if (j.contains("default_strategy")) {
        if (!j["default_strategy"].is_string()) {
            return weave_core::Err(parse_error("'governance.default_strategy' must be a string"));
        }
        const auto name = j["default_strategy"].get<std::string>();
        auto strategy = weave_govern::parse_approval_strategy(name);
        if (!strategy) {
            return weave_core::Err(parse_error("Unknown approval strategy: " + name));
        }
        out.default_strategy = *strategy;
    }

    return weave_core::Ok();
}

} // anonymous namespace

// =============================================================================
// WeaveConfig
// =============================================================================

weave_core::Result<WeaveConfig> WeaveConfig::from_json_string(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return weave_core::Err<WeaveConfig>(parse_error(std::string("JSON parse error: ") + e.what()));
    }

    if (!j.is_object()) {
        return weave_core::Err<WeaveConfig>(parse_error("Configuration root must be an object"));
    }

    WeaveConfig config;

    if (j.contains("logging")) {
        auto result = parse_logging(j["logging"], config.logging);
        if (!result) {
            return weave_core::Err<WeaveConfig>(result.error());
        }
    }

    if (j.contains("governance")) {
        auto result = parse_governance(j["governance"], config.governance);
        if (!result) {
            return weave_core::Err<WeaveConfig>(result.error());
        }
    }

    return weave_core::Ok(std::move(config));
}

weave_core::Result<WeaveConfig> WeaveConfig::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return weave_core::Err<WeaveConfig>(
            weave_core::Error(weave_core::ErrorCode::NotFound, "Config file not found: " + path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return weave_core::Err<WeaveConfig>(
            weave_core::Error(weave_core::ErrorCode::IOError, "Failed to open config file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = from_json_string(buffer.str());
    if (!result) {
        result.error().with_context("path", path.string());
    }
    return result;
}

weave_core::Result<void> WeaveConfig::apply_environment() {
    std::map<std::string, std::string> values;
    for (const char* name : {config_env::LOG_LEVEL, config_env::APPROVAL_TIMEOUT_MS,
                             config_env::APPROVAL_STRATEGY}) {
        const char* value = std::getenv(name);
        if (value) {
            values.emplace(name, value);
        }
    }
    return apply_overrides(values);
}

weave_core::Result<void> WeaveConfig::apply_overrides(const std::map<std::string, std::string>& values) {
    if (auto it = values.find(config_env::LOG_LEVEL); it != values.end()) {
        auto level = weave_core::parse_log_level(it->second);
        if (!level) {
            return weave_core::Err(parse_error(std::string(config_env::LOG_LEVEL) + ": unknown log level '" +
                                               it->second + "'"));
        }
        logging.level = *level;
    }

    if (auto it = values.find(config_env::APPROVAL_TIMEOUT_MS); it != values.end()) {
        long long value = 0;
        std::size_t consumed = 0;
        try {
            value = std::stoll(it->second, &consumed);
        } catch (const std::logic_error&) {
            consumed = 0;
        }
        if (consumed == 0 || consumed != it->second.size()) {
            return weave_core::Err(parse_error(std::string(config_env::APPROVAL_TIMEOUT_MS) +
                                               ": not an integer '" + it->second + "'"));
        }
        auto timeout = parse_timeout_ms(value);
        if (!timeout) {
            return weave_core::Err(timeout.error());
        }
        governance.default_timeout = *timeout;
    }

    if (auto it = values.find(config_env::APPROVAL_STRATEGY); it != values.end()) {
        auto strategy = weave_govern::parse_approval_strategy(it->second);
        if (!strategy) {
            return weave_core::Err(parse_error(std::string(config_env::APPROVAL_STRATEGY) +
                                               ": unknown strategy '" + it->second + "'"));
        }
        governance.default_strategy = *strategy;
    }

    return weave_core::Ok();
}

void WeaveConfig::apply_logging() const {
    weave_core::configure_logging(logging);
}

} // namespace weave
