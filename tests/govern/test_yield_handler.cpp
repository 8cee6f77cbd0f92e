// weave_govern YieldHandler and strategy tests
//
// Approver threads only record outcomes; assertions run on the test thread.

#include <catch2/catch_test_macros.hpp>
#include <weave/govern/yield_handler.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace weave_govern;
using namespace std::chrono_literals;
using weave_core::ApprovalError;
using weave_core::ErrorCode;

namespace {

using Handler = YieldHandler<std::string>;
using Yield = YieldTurn<std::string>;

Yield make_yield(std::set<std::string> approvers, const char* id = nullptr) {
    weave_turn::TurnOptions options;
    if (id) {
        options.id = EventId(id);
    }
    return Yield::create("deploy", "deployer", "production push", std::move(approvers), options);
}

/// Poll until the request shows up in the table
bool wait_until_pending(const Handler& handler, const EventId& id) {
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!handler.is_pending(id)) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

bool approved_ok(Handler& handler, const EventId& id, const std::string& who) {
    auto result = handler.approve(id, who);
    return result.is_ok() && result.value();
}

} // anonymous namespace

// =============================================================================
// Strategy predicate
// =============================================================================

TEST_CASE("Approval strategies", "[govern][strategy]") {
    SECTION("all") {
        REQUIRE_FALSE(strategy_satisfied(ApprovalStrategy::All, 2, 3));
        REQUIRE(strategy_satisfied(ApprovalStrategy::All, 3, 3));
    }

    SECTION("any") {
        REQUIRE_FALSE(strategy_satisfied(ApprovalStrategy::Any, 0, 3));
        REQUIRE(strategy_satisfied(ApprovalStrategy::Any, 1, 3));
    }

    SECTION("majority is strictly more than half") {
        REQUIRE_FALSE(strategy_satisfied(ApprovalStrategy::Majority, 1, 3));
        REQUIRE(strategy_satisfied(ApprovalStrategy::Majority, 2, 3));
        REQUIRE_FALSE(strategy_satisfied(ApprovalStrategy::Majority, 2, 4));
        REQUIRE(strategy_satisfied(ApprovalStrategy::Majority, 3, 4));
    }

    SECTION("empty approver set satisfies every strategy") {
        REQUIRE(strategy_satisfied(ApprovalStrategy::All, 0, 0));
        REQUIRE(strategy_satisfied(ApprovalStrategy::Any, 0, 0));
        REQUIRE(strategy_satisfied(ApprovalStrategy::Majority, 0, 0));
    }

    SECTION("names") {
        REQUIRE(parse_approval_strategy("Majority") == ApprovalStrategy::Majority);
        REQUIRE_FALSE(parse_approval_strategy("most").has_value());
        REQUIRE(std::string(approval_strategy_name(ApprovalStrategy::Any)) == "any");
        REQUIRE(std::string(approval_status_name(ApprovalStatus::Timeout)) == "timeout");
    }
}

// =============================================================================
// Request lifecycle
// =============================================================================

TEST_CASE("YieldHandler: approval across threads", "[govern][handler]") {
    Handler handler;
    auto turn = make_yield({"alice", "bob"});

    bool saw_pending = false;
    bool first_ok = false;
    bool still_pending = false;
    bool second_ok = false;

    std::thread approvers([&] {
        saw_pending = wait_until_pending(handler, turn.id());
        first_ok = approved_ok(handler, turn.id(), "alice");
        still_pending = handler.is_pending(turn.id());
        second_ok = approved_ok(handler, turn.id(), "bob");
    });

    auto result = handler.request_approval(turn, 5s);
    approvers.join();

    REQUIRE(saw_pending);
    REQUIRE(first_ok);
    REQUIRE(still_pending);
    REQUIRE(second_ok);

    REQUIRE(result.is_ok());
    REQUIRE(result->status == ApprovalStatus::Approved);
    REQUIRE(result->approved());
    REQUIRE(result->turn.approved_by() == std::set<std::string>{"alice", "bob"});
    REQUIRE_FALSE(handler.is_pending(turn.id()));
    REQUIRE(handler.pending_count() == 0);
}

TEST_CASE("YieldHandler: strategies resolve at the right count", "[govern][handler]") {
    Handler handler;

    SECTION("any resolves on the first approval") {
        auto turn = make_yield({"a", "b", "c"});
        bool ok = false;
        std::thread approver([&] {
            ok = wait_until_pending(handler, turn.id()) && approved_ok(handler, turn.id(), "b");
        });
        auto result = handler.request_approval(turn, 5s, ApprovalStrategy::Any);
        approver.join();

        REQUIRE(ok);
        REQUIRE(result->status == ApprovalStatus::Approved);
        REQUIRE(result->turn.approved_by() == std::set<std::string>{"b"});
    }

    SECTION("majority needs two of three") {
        auto turn = make_yield({"a", "b", "c"});
        bool ok = false;
        bool pending_after_one = false;
        std::thread approver([&] {
            ok = wait_until_pending(handler, turn.id()) && approved_ok(handler, turn.id(), "a");
            pending_after_one = handler.is_pending(turn.id());
            ok = ok && approved_ok(handler, turn.id(), "c");
        });
        auto result = handler.request_approval(turn, 5s, ApprovalStrategy::Majority);
        approver.join();

        REQUIRE(ok);
        REQUIRE(pending_after_one);
        REQUIRE(result->status == ApprovalStatus::Approved);
        REQUIRE(result->turn.approved_by().size() == 2);
    }

    SECTION("already satisfied resolves without waiting") {
        auto turn = make_yield({"a"}).approve("a").value();
        auto result = handler.request_approval(turn, 1ms);
        REQUIRE(result->status == ApprovalStatus::Approved);
    }

    SECTION("no required approvers resolves immediately") {
        auto result = handler.request_approval(make_yield({}));
        REQUIRE(result->status == ApprovalStatus::Approved);
        REQUIRE(handler.pending_count() == 0);
    }
}

TEST_CASE("YieldHandler: rejection and timeout", "[govern][handler]") {
    Handler handler;

    SECTION("reject wins over partial approval") {
        auto turn = make_yield({"a", "b", "c"});
        bool approved = false;
        bool vetoed = false;
        std::thread vetoer([&] {
            approved = wait_until_pending(handler, turn.id()) && approved_ok(handler, turn.id(), "a");
            vetoed = handler.reject(turn.id(), "b", "too risky");
        });
        auto result = handler.request_approval(turn, 5s, ApprovalStrategy::Majority);
        vetoer.join();

        REQUIRE(approved);
        REQUIRE(vetoed);
        REQUIRE(result->status == ApprovalStatus::Rejected);
        REQUIRE(result->rejected_by == "b");
        REQUIRE(result->reason == "too risky");
        REQUIRE(result->turn.approved_by() == std::set<std::string>{"a"});
    }

    SECTION("timeout within a bounded margin") {
        auto turn = make_yield({"a"});
        auto start = std::chrono::steady_clock::now();
        auto result = handler.request_approval(turn, 20ms);
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(result->status == ApprovalStatus::Timeout);
        REQUIRE(elapsed >= 20ms);
        REQUIRE(elapsed < 2s);
        REQUIRE_FALSE(handler.is_pending(turn.id()));
    }

    SECTION("late approve and reject are no-ops") {
        auto turn = make_yield({"a"});
        auto result = handler.request_approval(turn, 5ms);
        REQUIRE(result->status == ApprovalStatus::Timeout);

        auto late = handler.approve(turn.id(), "a");
        REQUIRE(late.is_ok());
        REQUIRE_FALSE(late.value());
        REQUIRE_FALSE(handler.reject(turn.id(), "a", "late"));
    }

    SECTION("unknown ids") {
        REQUIRE_FALSE(handler.approve(EventId("ghost"), "a").value());
        REQUIRE_FALSE(handler.reject(EventId("ghost"), "a"));
        REQUIRE_FALSE(handler.is_pending(EventId("ghost")));
    }
}

TEST_CASE("YieldHandler: errors leave the request untouched", "[govern][handler]") {
    Handler handler;
    auto turn = make_yield({"alice"}, "gate-1");

    bool saw_pending = false;
    std::optional<weave_core::Error> invalid_error;
    std::optional<weave_core::Error> duplicate_error;
    std::size_t pending_size = 0;
    bool approvals_empty = false;
    bool vetoed = false;

    std::thread other([&] {
        saw_pending = wait_until_pending(handler, turn.id());

        auto invalid = handler.approve(turn.id(), "mallory");
        if (invalid.is_err()) {
            invalid_error = invalid.error();
        }

        auto duplicate = handler.request_approval(turn, 1ms);
        if (duplicate.is_err()) {
            duplicate_error = duplicate.error();
        }

        auto pending = handler.list_pending();
        pending_size = pending.size();
        approvals_empty = !pending.empty() && pending.front().approved_by().empty();

        vetoed = handler.reject(turn.id(), "alice", "changed my mind");
    });

    auto result = handler.request_approval(turn, 5s);
    other.join();

    REQUIRE(saw_pending);

    REQUIRE(invalid_error.has_value());
    REQUIRE(invalid_error->code() == ErrorCode::InvalidArgument);
    REQUIRE(invalid_error->as<ApprovalError>()->kind == ApprovalError::Kind::InvalidApprover);

    REQUIRE(duplicate_error.has_value());
    REQUIRE(duplicate_error->as<ApprovalError>()->kind == ApprovalError::Kind::AlreadyPending);

    REQUIRE(pending_size == 1);
    REQUIRE(approvals_empty);
    REQUIRE(vetoed);

    REQUIRE(result->status == ApprovalStatus::Rejected);
    REQUIRE(result->turn.approved_by().empty());
}

// =============================================================================
// Callbacks
// =============================================================================

TEST_CASE("YieldHandler: callbacks", "[govern][callbacks]") {
    Handler handler;
    std::atomic<int> approved{0};
    std::atomic<int> rejected{0};
    std::atomic<int> timed_out{0};
    std::string rejector;

    handler.on_approved([&](const Yield&) { ++approved; });
    handler.on_rejected([&](const Yield&, const std::string& who, const std::string&) {
        rejector = who;
        ++rejected;
    });
    handler.on_timeout([&](const Yield&) { ++timed_out; });

    SECTION("each resolution fires exactly one callback kind") {
        (void)handler.request_approval(make_yield({}));
        (void)handler.request_approval(make_yield({"a"}), 5ms);

        auto turn = make_yield({"a"});
        bool vetoed = false;
        std::thread vetoer([&] {
            vetoed = wait_until_pending(handler, turn.id()) && handler.reject(turn.id(), "a", "no");
        });
        (void)handler.request_approval(turn, 5s);
        vetoer.join();

        REQUIRE(vetoed);
        REQUIRE(approved.load() == 1);
        REQUIRE(timed_out.load() == 1);
        REQUIRE(rejected.load() == 1);
        REQUIRE(rejector == "a");
    }

    SECTION("throwing callbacks are isolated") {
        handler.on_approved([](const Yield&) { throw std::runtime_error("boom"); });
        handler.on_approved([](const Yield&) { throw 42; });
        handler.on_approved([&](const Yield&) { ++approved; });

        auto result = handler.request_approval(make_yield({}));
        REQUIRE(result.is_ok());
        REQUIRE(result->status == ApprovalStatus::Approved);
        REQUIRE(approved.load() == 2);
    }
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_CASE("YieldHandler: approval racing the request", "[govern][handler][concurrency]") {
    Handler handler;

    int approved = 0;
    int approver_hits = 0;
    for (int i = 0; i < 500; ++i) {
        auto turn = make_yield({"a"});
        std::atomic<bool> done{false};
        bool hit = false;

        std::thread approver([&] {
            while (!done.load()) {
                auto result = handler.approve(turn.id(), "a");
                if (result.is_ok() && result.value()) {
                    hit = true;
                    return;
                }
                std::this_thread::yield();
            }
        });

        auto result = handler.request_approval(turn, 5s);
        done.store(true);
        approver.join();

        if (result.is_ok() && result->status == ApprovalStatus::Approved) {
            ++approved;
        }
        if (hit) {
            ++approver_hits;
        }
    }

    REQUIRE(approved == 500);
    REQUIRE(approver_hits == 500);
    REQUIRE(handler.pending_count() == 0);
}

TEST_CASE("YieldHandler: simultaneous approvers lose no approval", "[govern][handler][concurrency]") {
    Handler handler;

    std::set<std::string> approvers;
    for (int i = 0; i < 16; ++i) {
        approvers.insert("approver-" + std::to_string(i));
    }
    auto turn = make_yield(approvers);

    std::vector<int> ok(approvers.size(), 0);
    std::vector<std::thread> threads;
    std::size_t slot = 0;
    for (const auto& who : approvers) {
        threads.emplace_back([&handler, &turn, who, &result = ok[slot]] {
            result = wait_until_pending(handler, turn.id()) && approved_ok(handler, turn.id(), who) ? 1 : 0;
        });
        ++slot;
    }

    auto result = handler.request_approval(turn, 10s);
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(std::count(ok.begin(), ok.end(), 1) == static_cast<std::ptrdiff_t>(approvers.size()));
    REQUIRE(result.is_ok());
    REQUIRE(result->status == ApprovalStatus::Approved);
    REQUIRE(result->turn.approved_by() == approvers);
}
