// tests/test_state_merge.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/context/context_engine.h"
#include "modules/context/state_schema.h"
#include "core/types/errors.h"
#include "test_helpers.h"

using namespace researchflow;
using researchflow::testing::make_state;

TEST_CASE("Initial state holds every field at its identity", "[state]") {
    const auto& schema = StateSchema::instance();
    Context state = make_state("What is AAPL trading at?");

    for (const auto& f : schema.fields()) {
        REQUIRE(state.contains(f.name));
    }
    REQUIRE(state[fields::USER_QUERY] == "What is AAPL trading at?");
    REQUIRE(state[fields::RUN_ID] == "run-test");
    REQUIRE(state[fields::IS_QUERY_VALID] == true);
    REQUIRE(state[fields::EXECUTED_AGENTS].empty());
    REQUIRE(state[fields::AGENT_ERRORS].is_object());
    REQUIRE(state[fields::REPORT] == "");
    REQUIRE(state[fields::SNAPSHOT].is_null());
}

TEST_CASE("Merge policies", "[state]") {
    ContextEngine engine;
    Context state = make_state();

    SECTION("overwrite replaces the whole value") {
        engine.merge(state, {{fields::TICKERS, {"AAPL"}}});
        engine.merge(state, {{fields::TICKERS, {"MSFT", "NVDA"}}});
        REQUIRE(state[fields::TICKERS] == Value({"MSFT", "NVDA"}));
    }

    SECTION("append concatenates in order") {
        engine.merge(state, {{fields::ERRORS, {"a"}}});
        engine.merge(state, {{fields::ERRORS, {"b", "c"}}});
        REQUIRE(state[fields::ERRORS] == Value({"a", "b", "c"}));
    }

    SECTION("union merges keys, later write wins per key") {
        engine.merge(state, {{fields::AGENT_ERRORS, {{"market_data", "first"}}}});
        engine.merge(state, {{fields::AGENT_ERRORS, {{"sentiment", "x"}, {"market_data", "second"}}}});
        REQUIRE(state[fields::AGENT_ERRORS].size() == 2);
        REQUIRE(state[fields::AGENT_ERRORS]["market_data"] == "second");
    }

    SECTION("fields absent from the update are untouched") {
        engine.merge(state, {{fields::INTENT, "comparison"}});
        REQUIRE(state[fields::USER_QUERY] == "AAPL price");
        REQUIRE(state[fields::TICKERS].empty());
    }
}

TEST_CASE("Set-once fields", "[state]") {
    ContextEngine engine;
    Context state = make_state();

    SECTION("written once from identity") {
        Value history = Value::array({{{"role", "user"}, {"content", "hi"}}});
        engine.merge(state, {{fields::CONVERSATION_HISTORY, history}});
        REQUIRE(state[fields::CONVERSATION_HISTORY] == history);
    }

    SECTION("rewriting the same value is accepted") {
        engine.merge(state, {{fields::RUN_ID, "run-test"}});
        REQUIRE(state[fields::RUN_ID] == "run-test");
    }

    SECTION("changing a written value fails and leaves the state intact") {
        Context before = state;
        REQUIRE_THROWS_AS(engine.merge(state, {{fields::ERRORS, {"x"}}, {fields::RUN_ID, "run-other"}}),
                          StateMergeError);
        REQUIRE(state == before);
    }
}

TEST_CASE("Schema violations are rejected", "[state]") {
    ContextEngine engine;
    Context state = make_state();

    REQUIRE_THROWS_AS(engine.merge(state, {{"no_such_field", 1}}), StateMergeError);
    REQUIRE_THROWS_AS(engine.merge(state, {{fields::ERRORS, "not a list"}}), StateMergeError);
    REQUIRE_THROWS_AS(engine.merge(state, {{fields::AGENT_METRICS, Value::array()}}), StateMergeError);
    REQUIRE_THROWS_AS(StateSchema::instance().policy_of("bogus"), StateMergeError);
}

TEST_CASE("Empty update is the merge identity", "[state]") {
    ContextEngine engine;
    Context state = make_state();
    engine.merge(state, {{fields::ERRORS, {"a"}}});
    Context before = state;

    engine.merge(state, PartialUpdate::object());
    engine.merge(state, PartialUpdate());
    REQUIRE(state == before);
}

TEST_CASE("Merge is associative for accumulators", "[state]") {
    ContextEngine engine;
    const Context base = make_state();
    const PartialUpdate a = {{fields::ERRORS, {"a"}}, {fields::AGENT_METRICS, {{"x", 1}}}};
    const PartialUpdate b = {{fields::ERRORS, {"b"}}, {fields::AGENT_METRICS, {{"y", 2}}}};
    const PartialUpdate c = {{fields::ERRORS, {"c"}}, {fields::AGENT_METRICS, {{"x", 3}}}};

    Context left = engine.merged(engine.merged(engine.merged(base, a), b), c);

    // (b then c) folded into one update first
    PartialUpdate bc = {{fields::ERRORS, {"b", "c"}}, {fields::AGENT_METRICS, {{"y", 2}, {"x", 3}}}};
    Context right = engine.merged(engine.merged(base, a), bc);

    REQUIRE(left == right);
    REQUIRE(left[fields::AGENT_METRICS]["x"] == 3);
}

TEST_CASE("One generation merges in canonical node order", "[state]") {
    ContextEngine engine;

    auto merge_in = [&](std::vector<BranchUpdate> updates) {
        Context state = make_state();
        engine.merge_generation(state, std::move(updates));
        return state;
    };

    BranchUpdate market{NodeId::MARKET_DATA, {{fields::EXECUTED_AGENTS, {"market_data"}}, {fields::REPORT, "m"}}};
    BranchUpdate sentiment{NodeId::SENTIMENT, {{fields::EXECUTED_AGENTS, {"sentiment"}}}};
    BranchUpdate rag{NodeId::RAG_RETRIEVAL, {{fields::EXECUTED_AGENTS, {"rag_retrieval"}}, {fields::REPORT, "r"}}};

    Context forward = merge_in({market, sentiment, rag});
    Context reversed = merge_in({rag, sentiment, market});

    REQUIRE(forward == reversed);
    REQUIRE(forward[fields::EXECUTED_AGENTS] == Value({"market_data", "sentiment", "rag_retrieval"}));
    // overwrite written twice in one generation: the later node in canonical order wins
    REQUIRE(forward[fields::REPORT] == "r");
}
