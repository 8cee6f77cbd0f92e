/// @file main.cpp
/// @brief Weave Demo
///
/// Two agents write into one ledger, a deployer blocks on a yield that a
/// reviewer thread approves, and the result is exported as JSON.
///
/// Usage: weave_demo [config.json]

#include <weave/weave.hpp>

#include <spdlog/spdlog.h>

#include <iostream>
#include <thread>

namespace {

weave::WeaveConfig load_config(int argc, char** argv) {
    weave::WeaveConfig config;
    if (argc > 1) {
        auto loaded = weave::WeaveConfig::load(argv[1]);
        if (loaded) {
            config = std::move(*loaded);
        } else {
            spdlog::warn("Using default configuration: {}", weave_core::build_error_chain(loaded.error()));
        }
    }

    auto env = config.apply_environment();
    if (!env) {
        spdlog::warn("Ignoring environment overrides: {}", env.error().message());
    }
    return config;
}

void print_stats(const weave::Weave& weave) {
    auto stats = weave.stats();
    spdlog::info("=== Weave Status ===");
    spdlog::info("Events: {}  Pending yields: {}", stats.total_events, stats.pending_yields);
    for (const auto& [kind, count] : stats.by_kind) {
        spdlog::info("  {}: {}", kind, count);
    }
    for (const auto& [source, ratio] : stats.compression_by_source) {
        spdlog::info("  cone({}) compresses the ledger by {:.0f}%", source, ratio * 100.0);
    }
    spdlog::info("Average compression: {:.0f}%", stats.average_compression * 100.0);
}

} // anonymous namespace

int main(int argc, char** argv) {
    weave_core::init_logging();

    auto config = load_config(argc, argv);
    config.apply_logging();

    weave::Weave weave(config);

    auto plan = weave.record_turn(weave::TurnKind::Thought, {{"plan", "ship v2"}}, "planner");
    if (!plan) {
        spdlog::error("Failed to record plan: {}", plan.error().message());
        return 1;
    }

    auto check = weave.record_turn(weave::TurnKind::Action, {{"run", "test suite"}}, "tester");
    if (!check) {
        spdlog::error("Failed to record check: {}", check.error().message());
        return 1;
    }

    auto gate = weave.submit_yield({{"cmd", "deploy v2"}}, "deployer", "production deploy",
                                   {"alice", "bob"}, {*plan, *check});
    if (!gate) {
        spdlog::error("Failed to submit yield: {}", gate.error().message());
        return 1;
    }

    weave.on_approved([](const weave::YieldTurn& turn) {
        spdlog::info("Yield {} approved by {} reviewer(s)", turn.id().str(), turn.approved_by().size());
    });

    std::thread reviewers([&weave, id = gate->id()] {
        while (!weave.is_pending(id)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        for (const char* who : {"alice", "bob"}) {
            auto approved = weave.approve(id, who);
            if (!approved) {
                spdlog::warn("{} could not approve: {}", who, approved.error().message());
            }
        }
    });

    auto result = weave.request_approval(*gate, std::chrono::seconds(10));
    reviewers.join();

    if (!result) {
        spdlog::error("Approval request failed: {}", result.error().message());
        return 1;
    }
    spdlog::info("Yield resolved: {}", weave_govern::approval_status_name(result->status));

    if (result->approved()) {
        auto deployed = weave.record_turn(weave::TurnKind::Action, {{"deployed", "v2"}}, "deployer", {gate->id()});
        if (!deployed) {
            spdlog::error("Failed to record deploy: {}", deployed.error().message());
            return 1;
        }
    }

    auto knot = weave.join({"planner", "tester", "deployer"});
    if (!knot) {
        spdlog::error("Join failed: {}", knot.error().message());
        return 1;
    }

    print_stats(weave);

    auto exported = weave.export_json();
    if (!exported) {
        spdlog::error("Export failed: {}", exported.error().message());
        return 1;
    }
    std::cout << exported->dump(2) << std::endl;

    weave_core::shutdown_logging();
    return 0;
}
