// tests/test_report_node.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "nodes/postprocess_nodes.h"
#include "core/research_graph.h"
#include "modules/context/context_engine.h"
#include "modules/executor/node_executor.h"
#include "test_helpers.h"

using namespace researchflow;
using namespace researchflow::testing;
using Catch::Matchers::ContainsSubstring;
using namespace std::chrono_literals;

namespace {

// State as it looks after the barrier for a single-ticker price query.
Context aggregated_state(const std::string& ticker = "AAPL") {
    Context state = make_state(ticker + " price");
    FakeMarketData data;
    ContextEngine().merge(state, {
        {fields::INTENT, "price_query"},
        {fields::TICKERS, Value::array({ticker})},
        {fields::EXECUTED_AGENTS, Value::array({"validation", "intent", "market_data", "forward_looking"})},
        {fields::MARKET_DATA, Value::array({data.fetch_quote(ticker)})},
        {fields::PEER_VALUATION, Value::array({data.fetch_peer_valuation(ticker)})},
        {fields::ANALYST_CONSENSUS, Value::array({data.fetch_consensus(ticker)})}
    });
    return state;
}

} // namespace

TEST_CASE("Reflection loop stops once the threshold is met", "[nodes][report]") {
    TestRuntime rt;
    auto runtime = rt.runtime();
    auto synth = std::make_shared<ScriptedSynthesizer>();
    synth->scores = {0.60, 0.90};
    ReportNode node(synth, 3, 0.85);

    auto update = node.execute(aggregated_state(), runtime);

    REQUIRE(synth->synthesize_calls == 1);
    REQUIRE(synth->refine_calls == 1);
    REQUIRE(synth->evaluate_calls == 2);
    REQUIRE(update[fields::REPORT] == "# Report for AAPL price [brief_market]\n(refined)");
    const auto& meta = update[fields::REPORT_METADATA];
    REQUIRE(meta["reflection_iterations"] == 2);
    REQUIRE(meta["report_template"] == "brief_market");
    REQUIRE(meta["intent"] == "price_query");
    REQUIRE(meta["data_sources"]["market_data"] == true);
    REQUIRE(meta["data_sources"]["sentiment"] == false);
    REQUIRE(meta["executed_agents"].size() == 4);
}

TEST_CASE("Reflection loop honours the iteration limit", "[nodes][report]") {
    TestRuntime rt;
    auto runtime = rt.runtime();
    auto synth = std::make_shared<ScriptedSynthesizer>();
    synth->scores = {0.10};
    ReportNode node(synth, 3, 0.85);

    auto update = node.execute(aggregated_state(), runtime);

    REQUIRE(synth->refine_calls == 2);
    REQUIRE(synth->evaluate_calls == 3);
    REQUIRE(update[fields::REPORT_METADATA]["reflection_iterations"] == 3);
    REQUIRE_THAT(update[fields::REPORT].get<std::string>(), ContainsSubstring("(refined)\n(refined)"));
}

TEST_CASE("First draft above the threshold is not refined", "[nodes][report]") {
    TestRuntime rt;
    auto runtime = rt.runtime();
    auto synth = std::make_shared<ScriptedSynthesizer>();
    ReportNode node(synth, 3, 0.85);

    auto update = node.execute(aggregated_state(), runtime);

    REQUIRE(synth->refine_calls == 0);
    REQUIRE(update[fields::REPORT_METADATA]["reflection_iterations"] == 1);
}

TEST_CASE("Evaluation failure accepts the current draft", "[nodes][report]") {
    TestRuntime rt;
    auto runtime = rt.runtime();
    auto synth = std::make_shared<ScriptedSynthesizer>();
    synth->evaluate_fails = true;
    ReportNode node(synth, 3, 0.85);

    auto update = node.execute(aggregated_state(), runtime);

    REQUIRE(update[fields::REPORT] == "# Report for AAPL price [brief_market]");
    REQUIRE(synth->refine_calls == 0);
    REQUIRE(update[fields::REPORT_METADATA]["reflection_iterations"] == 1);
}

TEST_CASE("Synthesis failure fails the report node", "[nodes][report]") {
    TestRuntime rt;
    auto runtime = rt.runtime();
    auto synth = std::make_shared<ScriptedSynthesizer>();
    synth->synthesize_fails = true;
    ReportNode node(synth, 3, 0.85);

    REQUIRE_THROWS_AS(node.execute(aggregated_state(), runtime), AuthenticationError);
}

TEST_CASE("Synthesis is retried by the envelope alone", "[nodes][report][retry]") {
    RecordingSleep sleep;
    BudgetController budget;
    budget.set_sleep_function(sleep.fn());
    auto synth = std::make_shared<ScriptedSynthesizer>();
    ReportNode node(synth, 3, 0.85);
    NodeExecutor executor(RetryPolicy{3, 10ms});

    SECTION("a synthesizer that always times out is called max_attempts times") {
        synth->synthesize_timeouts = -1;
        NodeResult r = executor.run(node, aggregated_state(), budget);

        REQUIRE_FALSE(r.success);
        REQUIRE(r.attempts == 3);
        REQUIRE(synth->synthesize_calls == 3);
        REQUIRE(*sleep.delays == std::vector<std::chrono::milliseconds>{10ms, 20ms});
    }

    SECTION("one timeout costs one extra node attempt") {
        synth->synthesize_timeouts = 1;
        NodeResult r = executor.run(node, aggregated_state(), budget);

        REQUIRE(r.success);
        REQUIRE(r.attempts == 2);
        REQUIRE(synth->synthesize_calls == 2);
        REQUIRE(r.update[fields::REPORT] == "# Report for AAPL price [brief_market]");
    }
}

TEST_CASE("An empty report trips the report postcondition", "[nodes][report]") {
    Context state = aggregated_state();
    REQUIRE(require_report(state).has_value());
    REQUIRE(*require_report(state) == "Report synthesis produced no report");

    ContextEngine().merge(state, {{fields::AGENT_ERRORS, {{"report", "authentication failed: bad api key"}}}});
    REQUIRE(*require_report(state) == "Report synthesis produced no report: authentication failed: bad api key");

    ContextEngine().merge(state, {{fields::REPORT, "# Done"}});
    REQUIRE_FALSE(require_report(state).has_value());
}

TEST_CASE("Snapshot rating", "[nodes][snapshot]") {
    FakeMarketData data;
    const Value quotes = Value::array({data.fetch_quote("AAPL")});
    const Value sentiment = Value::array({data.fetch_sentiment("AAPL")});
    const Value consensus = Value::array({data.fetch_consensus("AAPL")});

    SECTION("strong consensus, upside and positive news") {
        auto snap = build_snapshot({"AAPL"}, quotes, sentiment, consensus);
        REQUIRE(snap["ticker"] == "AAPL");
        REQUIRE(snap["current_price"] == 100.0);
        // strong_buy +2, 30% upside +1, positive news +1
        REQUIRE(snap["investment_rating"] == "strong_buy");
        REQUIRE(snap["key_highlights"].size() == 2);
        REQUIRE(snap["risk_warnings"].size() == 1);
    }

    SECTION("price data alone stays neutral") {
        auto snap = build_snapshot({"AAPL"}, quotes, Value::array(), Value::array());
        REQUIRE(snap["investment_rating"] == "hold");
        REQUIRE(snap["rating_explanation"] == "Only price data is available, so the rating stays neutral.");
    }

    SECTION("bearish inputs") {
        Value bearish = consensus;
        bearish[0]["recommendation"] = "sell";
        bearish[0]["upside_potential"] = -12.0;
        Value gloomy = sentiment;
        gloomy[0]["overall_sentiment"] = "negative";
        auto snap = build_snapshot({"AAPL"}, quotes, gloomy, bearish);
        REQUIRE(snap["investment_rating"] == "sell");
        REQUIRE(snap["risk_warnings"].size() == 2);
    }

    SECTION("no quote for the first ticker") {
        REQUIRE(build_snapshot({"MSFT", "AAPL"}, quotes, sentiment, consensus).is_null());
        REQUIRE(build_snapshot({}, quotes, sentiment, consensus).is_null());
    }
}

TEST_CASE("Report request reflects which sources have data", "[nodes][report]") {
    ReportRequest request = make_report_request(aggregated_state());
    REQUIRE(request.query == "AAPL price");
    REQUIRE(request.intent == Intent::PRICE_QUERY);
    REQUIRE(request.template_name == "brief_market");
    REQUIRE(request.data["data_sources"]["analyst_consensus"] == true);
    REQUIRE(request.data["data_sources"]["context"] == false);
    REQUIRE(request.data[fields::SENTIMENT_ANALYSIS].empty());
}

TEST_CASE("VisualizationNode", "[nodes][visualization]") {
    TestRuntime rt;
    auto runtime = rt.runtime();
    auto market = std::make_shared<FakeMarketData>();
    VisualizationNode node(market);

    SECTION("chart data per ticker") {
        auto update = node.execute(aggregated_state(), runtime);
        REQUIRE(update[fields::VISUALIZATION_DATA].size() == 1);
        const auto& chart = update[fields::VISUALIZATION_DATA][0];
        REQUIRE(chart["ticker"] == "AAPL");
        REQUIRE(chart["price_history"].size() == 2);
        REQUIRE(chart["price_history"][0]["date"] == "2024-01-02");
        REQUIRE(chart["week_52_high"] == 120.0);
        REQUIRE(chart["current_position_pct"] == 50.0);
        REQUIRE(chart["peer_comparison"].size() == 2);
        REQUIRE(chart["peer_comparison"][1]["ticker"] == "Technology Avg");
        REQUIRE(chart["average_volume"] == 15);
    }

    SECTION("tickers without history are skipped") {
        market->unknown = {"AAPL"};
        auto update = node.execute(aggregated_state(), runtime);
        REQUIRE(update[fields::VISUALIZATION_DATA].empty());
        REQUIRE_FALSE(update.contains(fields::ERRORS));
    }

    SECTION("nothing to chart without tickers") {
        auto update = node.execute(make_state("macro outlook"), runtime);
        REQUIRE(update.empty());
    }
}

TEST_CASE("QualityCheckNode", "[nodes][quality]") {
    TestRuntime rt;
    auto runtime = rt.runtime();
    auto synth = std::make_shared<ScriptedSynthesizer>();
    QualityCheckNode node(synth, 0.85);
    Context state = aggregated_state();
    state[fields::REPORT] = "# Report";

    SECTION("score above the threshold passes") {
        auto update = node.execute(state, runtime);
        REQUIRE(update[fields::QUALITY_SCORE] == 0.9);
        REQUIRE(update[fields::IS_QUALITY_PASSED] == true);
    }

    SECTION("score below the threshold fails") {
        synth->scores = {0.5};
        auto update = node.execute(state, runtime);
        REQUIRE(update[fields::IS_QUALITY_PASSED] == false);
    }

    SECTION("evaluation failure passes the report unchecked") {
        synth->evaluate_fails = true;
        auto update = node.execute(state, runtime);
        REQUIRE(update[fields::QUALITY_SCORE].is_null());
        REQUIRE(update[fields::IS_QUALITY_PASSED] == true);
    }

    SECTION("no report scores zero") {
        auto update = node.execute(aggregated_state(), runtime);
        REQUIRE(update[fields::QUALITY_SCORE] == 0.0);
        REQUIRE(update[fields::IS_QUALITY_PASSED] == false);
        REQUIRE(synth->evaluate_calls == 0);
    }
}

TEST_CASE("MemorySaverNode", "[nodes][memory]") {
    TestRuntime rt;
    auto runtime = rt.runtime();
    Context state = aggregated_state();
    state[fields::REPORT] = "# Report";

    SECTION("saves the exchange to the session") {
        auto store = std::make_shared<InMemoryConversationStore>();
        MemorySaverNode node(store);
        auto update = node.execute(state, runtime);
        REQUIRE(update.empty());

        auto history = store->load("session-test", 10);
        REQUIRE(history.size() == 2);
        REQUIRE(history[0]["role"] == "user");
        REQUIRE(history[0]["content"] == "AAPL price");
        REQUIRE(history[1]["role"] == "assistant");
        REQUIRE(history[1]["content"] == "# Report");
    }

    SECTION("store failure is swallowed") {
        MemorySaverNode node(std::make_shared<FailingConversationStore>());
        auto update = node.execute(state, runtime);
        REQUIRE(update.empty());
    }

    SECTION("nothing saved without a report") {
        auto store = std::make_shared<InMemoryConversationStore>();
        MemorySaverNode node(store);
        auto update = node.execute(aggregated_state(), runtime);
        REQUIRE(update.empty());
        REQUIRE(store->load("session-test", 10).empty());
    }
}
