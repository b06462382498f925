// tests/test_scheduler.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/scheduler/topo_scheduler.h"
#include "modules/system/system_nodes.h"
#include "modules/trace/execution_trace.h"
#include "test_helpers.h"
#include <atomic>
#include <functional>
#include <algorithm>
#include <optional>

using namespace researchflow;
using namespace std::chrono_literals;
using researchflow::testing::RecordingSleep;
using researchflow::testing::make_state;

namespace {

class LambdaNode : public Node {
public:
    using Body = std::function<PartialUpdate(const Context&, NodeRuntime&)>;

    LambdaNode(NodeId id, Body body) : Node(id), body_(std::move(body)) {}

    PartialUpdate execute(const Context& state, NodeRuntime& runtime) override {
        ++calls;
        return body_(state, runtime);
    }

    std::atomic<int> calls{0};

private:
    Body body_;
};

PartialUpdate nothing(const Context&, NodeRuntime&) { return PartialUpdate::object(); }

// validation -> intent -> {market_data, sentiment, rag_retrieval} -> aggregator -> report
struct MiniGraph {
    std::set<NodeId> dispatch{NodeId::MARKET_DATA, NodeId::SENTIMENT, NodeId::RAG_RETRIEVAL};
    bool market_times_out = false;
    std::function<void()> on_market; // runs inside the market branch
    LambdaNode* validation = nullptr;
    LambdaNode* market = nullptr;
    LambdaNode* sentiment = nullptr;
    LambdaNode* rag = nullptr;
    LambdaNode* report = nullptr;
    RecordingSleep sleep;
    std::unique_ptr<TopoScheduler> graph;

    explicit MiniGraph(bool parallel = true, ExecutionBudget budget = {}) {
        TopoScheduler::Config config;
        config.budget = budget;
        config.retry = RetryPolicy{2, 1ms};
        config.parallel_branches = parallel;
        config.sleep = sleep.fn();
        graph = std::make_unique<TopoScheduler>(std::move(config));

        validation = add(NodeId::VALIDATION, nothing);
        add(NodeId::INTENT, [](const Context&, NodeRuntime&) -> PartialUpdate {
            return {{fields::TICKERS, Value::array({"AAPL"})}};
        });
        market = add(NodeId::MARKET_DATA, [this](const Context& s, NodeRuntime&) -> PartialUpdate {
            if (on_market) on_market();
            if (market_times_out) throw TimeoutError("quote service");
            return {{fields::MARKET_DATA, Value::array({{{"ticker", s[fields::TICKERS][0]}}})}};
        });
        sentiment = add(NodeId::SENTIMENT, [](const Context&, NodeRuntime&) -> PartialUpdate {
            return {{fields::SENTIMENT_ANALYSIS, Value::array({{{"ticker", "AAPL"}}})}};
        });
        rag = add(NodeId::RAG_RETRIEVAL, [](const Context&, NodeRuntime&) -> PartialUpdate {
            return {{fields::RETRIEVED_CONTEXT, Value::array()}};
        });
        graph->register_node(create_aggregator_node());
        report = add(NodeId::REPORT, [](const Context& s, NodeRuntime&) -> PartialUpdate {
            return {{fields::REPORT, "report with " + std::to_string(s[fields::MARKET_DATA].size()) + " quotes"}};
        });

        graph->add_edge(NodeId::VALIDATION, NodeId::INTENT);
        graph->add_conditional_edge(NodeId::INTENT, [this](const Context&) { return dispatch; },
                                    {NodeId::MARKET_DATA, NodeId::SENTIMENT, NodeId::RAG_RETRIEVAL},
                                    NodeId::AGGREGATOR);
        graph->add_edge(NodeId::MARKET_DATA, NodeId::AGGREGATOR);
        graph->add_edge(NodeId::SENTIMENT, NodeId::AGGREGATOR);
        graph->add_edge(NodeId::RAG_RETRIEVAL, NodeId::AGGREGATOR);
        graph->add_edge(NodeId::AGGREGATOR, NodeId::REPORT);
        graph->set_entry(NodeId::VALIDATION);
        graph->set_exit(NodeId::REPORT);
    }

    LambdaNode* add(NodeId id, LambdaNode::Body body) {
        auto node = std::make_unique<LambdaNode>(id, std::move(body));
        LambdaNode* raw = node.get();
        graph->register_node(std::move(node));
        return raw;
    }

    ExecutionResult run(std::stop_token stop = {}) {
        return graph->execute(make_state(), std::move(stop));
    }
};

std::vector<std::string> executed(const ExecutionResult& r) {
    return r.final_state[fields::EXECUTED_AGENTS].get<std::vector<std::string>>();
}

} // namespace

TEST_CASE("Fan-out joins at the barrier before the next node", "[scheduler]") {
    MiniGraph g;
    auto result = g.run();

    REQUIRE(result.success);
    REQUIRE(result.final_state[fields::REPORT] == "report with 1 quotes");
    REQUIRE(result.final_state[fields::SENTIMENT_ANALYSIS].size() == 1);
    // branches merge in canonical order whatever their completion order
    REQUIRE(executed(result) == std::vector<std::string>{
        "validation", "intent", "market_data", "sentiment", "rag_retrieval", "aggregator", "report"});
    REQUIRE(result.traces.size() == 7);
}

TEST_CASE("Sequential branches give the same state as concurrent ones", "[scheduler]") {
    MiniGraph parallel(true);
    MiniGraph sequential(false);
    auto a = parallel.run();
    auto b = sequential.run();

    REQUIRE(a.success);
    REQUIRE(b.success);
    Context sa = a.final_state;
    Context sb = b.final_state;
    // timings differ run to run
    sa.erase(fields::AGENT_METRICS);
    sb.erase(fields::AGENT_METRICS);
    REQUIRE(sa == sb);
}

TEST_CASE("Only the routed branches run", "[scheduler]") {
    MiniGraph g;
    g.dispatch = {NodeId::SENTIMENT};
    auto result = g.run();

    REQUIRE(result.success);
    REQUIRE(g.market->calls == 0);
    REQUIRE(g.rag->calls == 0);
    REQUIRE(g.sentiment->calls == 1);
    REQUIRE(result.final_state[fields::REPORT] == "report with 0 quotes");

    SECTION("an empty dispatch goes straight to the barrier") {
        MiniGraph empty;
        empty.dispatch = {};
        auto r = empty.run();
        REQUIRE(r.success);
        REQUIRE(executed(r) == std::vector<std::string>{"validation", "intent", "aggregator", "report"});
    }
}

TEST_CASE("A failed branch is recorded and the run continues", "[scheduler]") {
    MiniGraph g;
    g.market_times_out = true;
    auto result = g.run();

    REQUIRE(result.success);
    const auto& state = result.final_state;
    REQUIRE(state[fields::AGENT_ERRORS].contains("market_data"));
    REQUIRE(state[fields::SENTIMENT_ANALYSIS].size() == 1);
    REQUIRE(state[fields::AGENT_METRICS]["market_data"]["attempts"] == 2);
    REQUIRE(g.sleep.delays->size() == 1);
    REQUIRE(state[fields::REPORT] == "report with 0 quotes");

    auto traces = g.graph->get_last_traces();
    auto failed = std::find_if(traces.begin(), traces.end(),
                               [](const TraceRecord& t) { return t.node == NodeId::MARKET_DATA; });
    REQUIRE(failed != traces.end());
    REQUIRE(failed->status == "failed");
    REQUIRE(failed->error_class == std::optional<std::string>("transient"));
    REQUIRE(failed->generation == 2);
}

TEST_CASE("A failing postcondition ends the run", "[scheduler]") {
    MiniGraph g;
    g.graph->add_postcondition(NodeId::VALIDATION, [](const Context&) -> std::optional<std::string> {
        return std::string("validation left the state unusable");
    });

    auto result = g.run();

    REQUIRE_FALSE(result.success);
    REQUIRE(result.message == "validation left the state unusable");
    REQUIRE(g.market->calls == 0);
    REQUIRE(g.report->calls == 0);
}

TEST_CASE("A router returning an undeclared node fails the run", "[scheduler]") {
    MiniGraph g;
    g.dispatch = {NodeId::FORWARD_LOOKING};
    auto result = g.run();

    REQUIRE_FALSE(result.success);
    REQUIRE(result.message.find("undeclared") != std::string::npos);
    REQUIRE(g.report->calls == 0);
}

TEST_CASE("Node budget bounds the run", "[scheduler][budget]") {
    MiniGraph g(true, ExecutionBudget{3, 0ms});
    auto result = g.run();

    REQUIRE_FALSE(result.success);
    REQUIRE(result.message.find("budget") != std::string::npos);
    REQUIRE(g.report->calls == 0);
}

TEST_CASE("Stopping the run from outside", "[scheduler][cancel]") {
    SECTION("before it starts") {
        MiniGraph g;
        std::stop_source source;
        source.request_stop();
        auto result = g.run(source.get_token());

        REQUIRE_FALSE(result.success);
        REQUIRE(result.message.find("cancelled") != std::string::npos);
        REQUIRE(g.validation->calls == 0);
    }

    SECTION("while a branch is running") {
        MiniGraph g(false);
        std::stop_source source;
        g.on_market = [&source] { source.request_stop(); };
        auto result = g.run(source.get_token());

        REQUIRE_FALSE(result.success);
        REQUIRE(result.message.find("branch execution") != std::string::npos);
        REQUIRE(g.report->calls == 0);
        // the branch's own output is still merged before the run ends
        REQUIRE(result.final_state[fields::MARKET_DATA].size() == 1);
    }
}

TEST_CASE("Topology errors are reported by build_dag", "[scheduler][graph]") {
    SECTION("missing entry") {
        TopoScheduler graph;
        graph.register_node(std::make_unique<LambdaNode>(NodeId::VALIDATION, nothing));
        graph.set_exit(NodeId::VALIDATION);
        REQUIRE_THROWS_AS(graph.build_dag(), GraphError);
    }

    SECTION("edge to an unregistered node") {
        TopoScheduler graph;
        graph.register_node(std::make_unique<LambdaNode>(NodeId::VALIDATION, nothing));
        graph.add_edge(NodeId::VALIDATION, NodeId::INTENT);
        graph.set_entry(NodeId::VALIDATION);
        graph.set_exit(NodeId::VALIDATION);
        REQUIRE_THROWS_AS(graph.build_dag(), GraphError);
    }

    SECTION("cycle") {
        TopoScheduler graph;
        graph.register_node(std::make_unique<LambdaNode>(NodeId::VALIDATION, nothing));
        graph.register_node(std::make_unique<LambdaNode>(NodeId::INTENT, nothing));
        graph.register_node(std::make_unique<LambdaNode>(NodeId::REPORT, nothing));
        graph.add_edge(NodeId::VALIDATION, NodeId::INTENT);
        graph.add_edge(NodeId::INTENT, NodeId::VALIDATION);
        graph.set_entry(NodeId::VALIDATION);
        graph.set_exit(NodeId::REPORT);
        REQUIRE_THROWS_AS(graph.build_dag(), GraphError);
    }

    SECTION("branch that skips the barrier") {
        TopoScheduler graph;
        graph.register_node(std::make_unique<LambdaNode>(NodeId::INTENT, nothing));
        graph.register_node(std::make_unique<LambdaNode>(NodeId::MARKET_DATA, nothing));
        graph.register_node(create_aggregator_node());
        graph.register_node(std::make_unique<LambdaNode>(NodeId::REPORT, nothing));
        graph.add_conditional_edge(NodeId::INTENT, [](const Context&) { return std::set<NodeId>{}; },
                                   {NodeId::MARKET_DATA}, NodeId::AGGREGATOR);
        graph.add_edge(NodeId::MARKET_DATA, NodeId::REPORT);
        graph.add_edge(NodeId::AGGREGATOR, NodeId::REPORT);
        graph.set_entry(NodeId::INTENT);
        graph.set_exit(NodeId::REPORT);
        REQUIRE_THROWS_AS(graph.build_dag(), GraphError);
    }

    SECTION("duplicate registration and second outgoing edge") {
        TopoScheduler graph;
        graph.register_node(std::make_unique<LambdaNode>(NodeId::VALIDATION, nothing));
        REQUIRE_THROWS_AS(graph.register_node(std::make_unique<LambdaNode>(NodeId::VALIDATION, nothing)),
                          GraphError);
        graph.add_edge(NodeId::VALIDATION, NodeId::INTENT);
        REQUIRE_THROWS_AS(graph.add_edge(NodeId::VALIDATION, NodeId::REPORT), GraphError);
    }
}
