// weave_ledger Ledger tests

#include <catch2/catch_test_macros.hpp>
#include <weave/ledger/ledger.hpp>
#include <algorithm>
#include <string>
#include <vector>

using namespace weave_ledger;
using weave_core::ErrorCode;
using weave_core::GraphError;
using weave_core::LedgerError;
using weave_turn::TurnKind;
using weave_turn::TurnOptions;

namespace {

using StringLedger = Ledger<std::string>;

Event<std::string> make(const char* id, const char* source, double ts = 0.0) {
    return Event<std::string>(EventId(id), id, ts, source);
}

std::vector<std::string> ids_of(const std::vector<Record<std::string>>& records) {
    std::vector<std::string> out;
    for (const auto& record : records) {
        out.push_back(record_id(record).str());
    }
    return out;
}

std::size_t index_of(const std::vector<std::string>& order, const std::string& id) {
    return static_cast<std::size_t>(std::find(order.begin(), order.end(), id) - order.begin());
}

} // anonymous namespace

// =============================================================================
// Append
// =============================================================================

TEST_CASE("Ledger: append", "[ledger][append]") {
    StringLedger ledger;

    SECTION("returns the event id") {
        auto id = ledger.append(make("e1", "a"));
        REQUIRE(id.is_ok());
        REQUIRE(*id == EventId("e1"));
        REQUIRE(ledger.size() == 1);
        REQUIRE(ledger.contains(EventId("e1")));
        REQUIRE(ledger.position(EventId("e1")) == 0u);
    }

    SECTION("generated ids") {
        auto id = ledger.append(Event<std::string>::create("payload", "a"));
        REQUIRE(id.is_ok());
        REQUIRE_FALSE(id->empty());
        REQUIRE(ledger.find(*id) != nullptr);
    }

    SECTION("duplicate id is rejected without effect") {
        REQUIRE(ledger.append(make("e1", "a")).is_ok());
        auto dup = ledger.append(make("e1", "b"));
        REQUIRE(dup.is_err());
        REQUIRE(dup.error().code() == ErrorCode::AlreadyExists);
        REQUIRE(dup.error().is<LedgerError>());
        REQUIRE(ledger.size() == 1);
        REQUIRE(ledger.sources() == std::vector<std::string>{"a"});
    }

    SECTION("cycle is rejected without effect") {
        REQUIRE(ledger.append(make("b", "x"), {EventId("a")}).is_ok());
        const auto generation = ledger.graph().generation();

        auto result = ledger.append(make("a", "x"), {EventId("b")});
        REQUIRE(result.is_err());
        REQUIRE(result.error().is<GraphError>());
        REQUIRE(result.error().get_context("source") != nullptr);
        REQUIRE(ledger.size() == 1);
        REQUIRE_FALSE(ledger.contains(EventId("a")));
        REQUIRE(ledger.graph().generation() == generation);
    }

    SECTION("self dependency is rejected") {
        auto result = ledger.append(make("s", "x"), {EventId("s")});
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::CycleDetected);
        REQUIRE(ledger.empty());
    }

    SECTION("turns and yields are records") {
        auto turn = weave_turn::Turn<std::string>::create(TurnKind::Action, "run", "agent");
        auto yield = weave_turn::YieldTurn<std::string>::create("ship", "agent", "release", {"lead"});

        REQUIRE(ledger.append(turn).is_ok());
        REQUIRE(ledger.append(yield, {turn.id()}).is_ok());

        const auto* stored = turn_of(*ledger.find(yield.id()));
        REQUIRE(stored != nullptr);
        REQUIRE(stored->kind() == TurnKind::Yield);
        REQUIRE(stored->gate()->reason == "release");
    }
}

// =============================================================================
// Lookup
// =============================================================================

TEST_CASE("Ledger: lookup", "[ledger][lookup]") {
    StringLedger ledger;
    REQUIRE(ledger.append(make("a1", "alice")).is_ok());
    REQUIRE(ledger.append(make("b1", "bob")).is_ok());
    REQUIRE(ledger.append(make("a2", "alice"), {EventId("a1"), EventId("b1"), EventId("a1")}).is_ok());

    REQUIRE(ledger.sources() == std::vector<std::string>{"alice", "bob"});
    REQUIRE(ids_of(ledger.events_from("alice")) == std::vector<std::string>{"a1", "a2"});
    REQUIRE(ledger.events_from("nobody").empty());
    REQUIRE(record_id(*ledger.latest("alice")) == EventId("a2"));
    REQUIRE(ledger.latest("nobody") == nullptr);

    SECTION("declared dependencies keep order without duplicates") {
        REQUIRE(ledger.dependencies(EventId("a2")) == std::vector<EventId>{EventId("a1"), EventId("b1")});
        REQUIRE(ledger.parent(EventId("a2")) == EventId("a1"));
        REQUIRE_FALSE(ledger.parent(EventId("a1")).has_value());
    }

    SECTION("dependency map covers recorded events") {
        auto deps = ledger.dependency_map();
        REQUIRE(deps.size() == 3);
        REQUIRE(deps.at(EventId("b1")).empty());
        REQUIRE(deps.at(EventId("a2")).size() == 2);
    }

    SECTION("concurrency delegates to the graph") {
        REQUIRE(ledger.are_concurrent(EventId("a1"), EventId("b1")));
        REQUIRE_FALSE(ledger.are_concurrent(EventId("a1"), EventId("a2")));
    }
}

// =============================================================================
// Linearization
// =============================================================================

TEST_CASE("Ledger: linearize", "[ledger][order]") {
    StringLedger ledger;

    SECTION("respects dependencies over observation order") {
        REQUIRE(ledger.append(make("late", "x"), {EventId("early")}).is_ok());
        REQUIRE(ledger.append(make("early", "y")).is_ok());

        auto order = ledger.linearize();
        REQUIRE(order.is_ok());
        REQUIRE(ids_of(*order) == std::vector<std::string>{"early", "late"});
    }

    SECTION("placeholders are omitted") {
        REQUIRE(ledger.append(make("child", "x"), {EventId("missing")}).is_ok());
        auto order = ledger.linearize();
        REQUIRE(order.is_ok());
        REQUIRE(ids_of(*order) == std::vector<std::string>{"child"});
        REQUIRE(ledger.graph().contains(EventId("missing")));
        REQUIRE_FALSE(ledger.contains(EventId("missing")));
    }

    SECTION("concurrent events keep observation order") {
        REQUIRE(ledger.append(make("p", "x")).is_ok());
        REQUIRE(ledger.append(make("q", "y")).is_ok());
        REQUIRE(ledger.append(make("r", "z")).is_ok());
        auto order = ledger.linearize();
        REQUIRE(ids_of(*order) == std::vector<std::string>{"p", "q", "r"});
    }

    SECTION("subset") {
        REQUIRE(ledger.append(make("a", "x")).is_ok());
        REQUIRE(ledger.append(make("b", "x"), {EventId("a")}).is_ok());
        REQUIRE(ledger.append(make("c", "x"), {EventId("b")}).is_ok());

        auto order = ledger.linearize_subset({EventId("c"), EventId("a")});
        REQUIRE(order.is_ok());
        REQUIRE(ids_of(*order) == std::vector<std::string>{"a", "c"});
    }
}

TEST_CASE("Ledger: project", "[ledger][order]") {
    StringLedger ledger;
    REQUIRE(ledger.append(make("shared", "root")).is_ok());
    REQUIRE(ledger.append(make("a1", "alice"), {EventId("shared")}).is_ok());
    REQUIRE(ledger.append(make("b1", "bob"), {EventId("shared")}).is_ok());
    REQUIRE(ledger.append(make("b2", "bob"), {EventId("b1")}).is_ok());

    auto alice = ledger.project("alice");
    REQUIRE(alice.is_ok());
    REQUIRE(ids_of(*alice) == std::vector<std::string>{"shared", "a1"});

    auto bob = ledger.project("bob");
    REQUIRE(ids_of(*bob) == std::vector<std::string>{"shared", "b1", "b2"});

    auto nobody = ledger.project("nobody");
    REQUIRE(nobody.is_ok());
    REQUIRE(nobody->empty());
}

// =============================================================================
// Join
// =============================================================================

TEST_CASE("Ledger: join", "[ledger][knot]") {
    StringLedger ledger;
    REQUIRE(ledger.append(make("a1", "alice", 10.0)).is_ok());
    REQUIRE(ledger.append(make("a2", "alice", 12.0), {EventId("a1")}).is_ok());
    REQUIRE(ledger.append(make("b1", "bob", 11.0)).is_ok());

    auto knot = ledger.join({"alice", "bob", "nobody"});
    REQUIRE(knot.is_ok());

    const Event<std::string>& event = event_of(*ledger.find(*knot));

    SECTION("knot shape") {
        REQUIRE(event.is_knot());
        REQUIRE(event.source() == k_knot_source);
        REQUIRE(event.content().empty());
        REQUIRE(event.timestamp() == 12.0);
        REQUIRE(knot->str().rfind(k_knot_prefix, 0) == 0);
        REQUIRE(ledger.graph().get_dependencies(*knot) == weave_graph::IdSet{EventId("a2"), EventId("b1")});
    }

    SECTION("pre-barrier events precede everything after the knot") {
        REQUIRE(ledger.append(make("after", "carol"), {*knot}).is_ok());
        for (const char* before : {"a1", "a2", "b1"}) {
            REQUIRE(ledger.graph().precedes(EventId(before), *knot));
            REQUIRE(ledger.graph().precedes(EventId(before), EventId("after")));
        }
    }

    SECTION("joining the same tips again is idempotent") {
        const auto size = ledger.size();
        auto again = ledger.join({"bob", "alice"});
        REQUIRE(again.is_ok());
        REQUIRE(*again == *knot);
        REQUIRE(ledger.size() == size);
    }

    SECTION("new tips produce a new knot") {
        REQUIRE(ledger.append(make("b2", "bob", 13.0), {EventId("b1")}).is_ok());
        auto next = ledger.join({"alice", "bob"});
        REQUIRE(next.is_ok());
        REQUIRE(*next != *knot);
    }

    SECTION("empty join still records a barrier") {
        auto empty = ledger.join({"nobody"});
        REQUIRE(empty.is_ok());
        REQUIRE(ledger.graph().get_dependencies(*empty).empty());
        REQUIRE(event_of(*ledger.find(*empty)).timestamp() > 0.0);
    }
}

TEST_CASE("Ledger: join covers unchained events of a source", "[ledger][knot]") {
    StringLedger ledger;
    REQUIRE(ledger.append(make("a1", "alice", 1.0)).is_ok());
    REQUIRE(ledger.append(make("a2", "alice", 2.0)).is_ok());
    REQUIRE(ledger.append(make("a3", "alice", 3.0), {EventId("a2")}).is_ok());
    REQUIRE(ledger.append(make("b1", "bob", 4.0), {EventId("a1")}).is_ok());

    SECTION("frontier keeps every undominated own event") {
        REQUIRE(ledger.frontier("alice") == std::vector<EventId>{EventId("a1"), EventId("a3")});
        REQUIRE(ledger.frontier("bob") == std::vector<EventId>{EventId("b1")});
        REQUIRE(ledger.frontier("nobody").empty());
    }

    SECTION("every prior event precedes the knot and its dependents") {
        auto knot = ledger.join({"alice"});
        REQUIRE(knot.is_ok());
        REQUIRE(ledger.append(make("after", "carol"), {*knot}).is_ok());

        for (const char* before : {"a1", "a2", "a3"}) {
            REQUIRE(ledger.graph().precedes(EventId(before), *knot));
            REQUIRE(ledger.graph().precedes(EventId(before), EventId("after")));
            REQUIRE_FALSE(ledger.are_concurrent(EventId(before), *knot));
        }
        REQUIRE(event_of(*ledger.find(*knot)).timestamp() == 3.0);
    }

    SECTION("knot depends on the frontier of every source") {
        auto knot = ledger.join({"alice", "bob"});
        REQUIRE(knot.is_ok());
        REQUIRE(ledger.graph().get_dependencies(*knot) ==
                weave_graph::IdSet{EventId("a1"), EventId("a3"), EventId("b1")});
        REQUIRE(ledger.dependencies(*knot).size() == 3);
    }
}

TEST_CASE("Ledger: parent skips placeholders", "[ledger][lookup]") {
    StringLedger ledger;
    REQUIRE(ledger.append(make("root", "a")).is_ok());
    REQUIRE(ledger.append(make("child", "a"), {EventId("unseen"), EventId("root")}).is_ok());
    REQUIRE(ledger.append(make("orphan", "a"), {EventId("missing")}).is_ok());

    REQUIRE(ledger.parent(EventId("child")) == EventId("root"));
    REQUIRE_FALSE(ledger.parent(EventId("orphan")).has_value());
    REQUIRE(ledger.dependencies(EventId("child")).front() == EventId("unseen"));
}

TEST_CASE("Ledger: copies share record payloads", "[ledger]") {
    StringLedger ledger;
    REQUIRE(ledger.append(make("e1", "a")).is_ok());

    StringLedger copy = ledger;
    REQUIRE(copy.find(EventId("e1")) == ledger.find(EventId("e1")));

    REQUIRE(ledger.append(make("e2", "a"), {EventId("e1")}).is_ok());
    REQUIRE(copy.size() == 1);
    REQUIRE_FALSE(copy.contains(EventId("e2")));
    REQUIRE(copy.graph().node_count() == 1);
}
