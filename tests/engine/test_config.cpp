// weave::WeaveConfig tests

#include <catch2/catch_test_macros.hpp>
#include <weave/engine/config.hpp>
#include <filesystem>
#include <fstream>

using namespace weave;
using weave_core::ErrorCode;
using weave_govern::ApprovalStrategy;

TEST_CASE("WeaveConfig: defaults", "[engine][config]") {
    WeaveConfig config;
    REQUIRE(config.logging.level == spdlog::level::info);
    REQUIRE(config.logging.console_enabled);
    REQUIRE_FALSE(config.governance.default_timeout.has_value());
    REQUIRE(config.governance.default_strategy == ApprovalStrategy::All);
}

TEST_CASE("WeaveConfig: JSON parsing", "[engine][config]") {
    SECTION("full document") {
        auto config = WeaveConfig::from_json_string(R"({
            "logging": { "level": "debug", "console": false, "file": true, "directory": "logs" },
            "governance": { "default_timeout_ms": 30000, "default_strategy": "majority" },
            "unrelated": { "ignored": true }
        })");
        REQUIRE(config.is_ok());
        REQUIRE(config->logging.level == spdlog::level::debug);
        REQUIRE_FALSE(config->logging.console_enabled);
        REQUIRE(config->logging.file_enabled);
        REQUIRE(config->logging.log_directory == "logs");
        REQUIRE(config->governance.default_timeout == std::chrono::milliseconds(30000));
        REQUIRE(config->governance.default_strategy == ApprovalStrategy::Majority);
    }

    SECTION("null timeout waits forever") {
        auto config = WeaveConfig::from_json_string(R"({"governance": {"default_timeout_ms": null}})");
        REQUIRE(config.is_ok());
        REQUIRE_FALSE(config->governance.default_timeout.has_value());
    }

    SECTION("malformed JSON") {
        auto config = WeaveConfig::from_json_string("{ not json");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::ParseError);
    }

    SECTION("bad values") {
        REQUIRE(WeaveConfig::from_json_string(R"({"logging": {"level": "shout"}})").is_err());
        REQUIRE(WeaveConfig::from_json_string(R"({"governance": {"default_strategy": "most"}})").is_err());
        REQUIRE(WeaveConfig::from_json_string(R"({"governance": {"default_timeout_ms": -5}})").is_err());
        REQUIRE(WeaveConfig::from_json_string(R"({"governance": {"default_timeout_ms": "soon"}})").is_err());
        REQUIRE(WeaveConfig::from_json_string("[]").is_err());
    }

    SECTION("wrongly typed logging values") {
        for (const char* doc : {
                 R"({"logging": {"console": "yes"}})",
                 R"({"logging": {"file": 1}})",
                 R"({"logging": {"directory": 7}})",
                 R"({"logging": {"max_file_size": -1}})",
                 R"({"logging": {"max_files": "five"}})",
                 R"({"logging": "verbose"})",
             }) {
            auto config = WeaveConfig::from_json_string(doc);
            REQUIRE(config.is_err());
            REQUIRE(config.error().code() == ErrorCode::ParseError);
        }
    }

    SECTION("file sink sizes") {
        auto config = WeaveConfig::from_json_string(R"({"logging": {"max_file_size": 1024, "max_files": 2}})");
        REQUIRE(config.is_ok());
        REQUIRE(config->logging.max_file_size == 1024);
        REQUIRE(config->logging.max_files == 2);
    }
}

TEST_CASE("WeaveConfig: apply logging", "[engine][config]") {
    auto previous = weave_core::get_global_log_level();

    WeaveConfig config;
    config.logging.level = spdlog::level::err;
    config.apply_logging();
    REQUIRE(weave_core::get_global_log_level() == spdlog::level::err);
    REQUIRE(weave_core::ledger_logger()->level() == spdlog::level::err);

    weave_core::LogConfig restore;
    restore.level = previous;
    weave_core::configure_logging(restore);
}

TEST_CASE("WeaveConfig: overrides", "[engine][config]") {
    WeaveConfig config;

    SECTION("valid overrides") {
        auto result = config.apply_overrides({
            {config_env::LOG_LEVEL, "warn"},
            {config_env::APPROVAL_TIMEOUT_MS, "250"},
            {config_env::APPROVAL_STRATEGY, "any"},
        });
        REQUIRE(result.is_ok());
        REQUIRE(config.logging.level == spdlog::level::warn);
        REQUIRE(config.governance.default_timeout == std::chrono::milliseconds(250));
        REQUIRE(config.governance.default_strategy == ApprovalStrategy::Any);
    }

    SECTION("malformed timeout") {
        auto result = config.apply_overrides({{config_env::APPROVAL_TIMEOUT_MS, "25x"}});
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
        REQUIRE_FALSE(config.governance.default_timeout.has_value());
    }

    SECTION("unknown strategy") {
        REQUIRE(config.apply_overrides({{config_env::APPROVAL_STRATEGY, "dictator"}}).is_err());
    }

    SECTION("empty overrides change nothing") {
        REQUIRE(config.apply_overrides({}).is_ok());
        REQUIRE(config.governance.default_strategy == ApprovalStrategy::All);
    }
}

TEST_CASE("WeaveConfig: load from file", "[engine][config]") {
    SECTION("missing file") {
        auto config = WeaveConfig::load("/nonexistent/weave.json");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::NotFound);
    }

    SECTION("round trip through disk") {
        auto path = std::filesystem::temp_directory_path() / "weave_config_test.json";
        {
            std::ofstream out(path);
            out << R"({"governance": {"default_strategy": "any", "default_timeout_ms": 10}})";
        }

        auto config = WeaveConfig::load(path);
        std::filesystem::remove(path);

        REQUIRE(config.is_ok());
        REQUIRE(config->governance.default_strategy == ApprovalStrategy::Any);
        REQUIRE(config->governance.default_timeout == std::chrono::milliseconds(10));
    }
}
