// tests/test_node_executor.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/executor/error_classifier.h"
#include "modules/executor/node_executor.h"
#include "modules/executor/retry_policy.h"
#include "modules/trace/execution_trace.h"
#include "test_helpers.h"
#include <atomic>
#include <functional>
#include <thread>

using namespace researchflow;
using namespace std::chrono_literals;
using researchflow::testing::RecordingSleep;
using researchflow::testing::make_state;

namespace {

// Node whose behaviour is a lambda; counts calls.
class ScriptedNode : public Node {
public:
    using Body = std::function<PartialUpdate(int call, NodeRuntime&)>;

    ScriptedNode(NodeId id, Body body) : Node(id), body_(std::move(body)) {}

    PartialUpdate execute(const Context&, NodeRuntime& runtime) override {
        return body_(++calls, runtime);
    }

    int calls = 0;

private:
    Body body_;
};

} // namespace

TEST_CASE("Errors are classified by type, status and message", "[executor][classifier]") {
    REQUIRE(classify_error(TimeoutError("quote")) == ErrorClass::TRANSIENT);
    REQUIRE(classify_error(ConnectionError("reset by peer")) == ErrorClass::TRANSIENT);
    REQUIRE(classify_error(RateLimitError("slow down")) == ErrorClass::TRANSIENT);
    REQUIRE(classify_error(UnavailableError("maintenance", 502)) == ErrorClass::TRANSIENT);
    REQUIRE(classify_error(ServiceError("upstream", 503)) == ErrorClass::TRANSIENT);
    REQUIRE(classify_error(std::runtime_error("request timed out")) == ErrorClass::TRANSIENT);
    REQUIRE(classify_error(std::runtime_error("Temporary failure in name resolution")) == ErrorClass::TRANSIENT);

    REQUIRE(classify_error(std::runtime_error("division by zero")) == ErrorClass::PERMANENT);
    REQUIRE(classify_error(AuthenticationError("bad key")) == ErrorClass::PERMANENT);
    REQUIRE(classify_error(PermissionDeniedError("no access")) == ErrorClass::PERMANENT);
    REQUIRE(classify_error(CancelledError()) == ErrorClass::PERMANENT);
    REQUIRE(classify_error(ServiceError("teapot", 418)) == ErrorClass::PERMANENT);
}

TEST_CASE("Permanent types win over transient keywords", "[executor][classifier]") {
    REQUIRE(classify_error(InvalidInputError("connection string is malformed")) == ErrorClass::PERMANENT);
    REQUIRE(classify_error(ResponseShapeError("timeout field missing")) == ErrorClass::PERMANENT);
    REQUIRE(classify_error(std::exception_ptr{}) == ErrorClass::PERMANENT);
    REQUIRE(classify_error(std::make_exception_ptr(TimeoutError("x"))) == ErrorClass::TRANSIENT);
    REQUIRE(has_transient_keyword("HTTP 503 Service Unavailable"));
    REQUIRE_FALSE(has_transient_keyword("not found"));
}

TEST_CASE("Backoff doubles per attempt", "[executor][retry]") {
    RetryPolicy policy{4, 100ms};
    REQUIRE(policy.backoff_delay(0) == 100ms);
    REQUIRE(policy.backoff_delay(1) == 200ms);
    REQUIRE(policy.backoff_delay(2) == 400ms);
}

TEST_CASE("Transient failures are retried up to the attempt limit", "[executor][retry]") {
    RecordingSleep sleep;
    BudgetController budget;
    budget.set_sleep_function(sleep.fn());
    NodeExecutor executor(RetryPolicy{3, 10ms});

    ScriptedNode node(NodeId::MARKET_DATA, [](int, NodeRuntime&) -> PartialUpdate {
        throw TimeoutError("market data service");
    });

    NodeResult r = executor.run(node, make_state(), budget);

    REQUIRE_FALSE(r.success);
    REQUIRE(node.calls == 3);
    REQUIRE(r.attempts == 3);
    REQUIRE(r.error_class == ErrorClass::TRANSIENT);
    REQUIRE(*sleep.delays == std::vector<std::chrono::milliseconds>{10ms, 20ms});

    const auto& update = r.update;
    REQUIRE(update[fields::EXECUTED_AGENTS] == Value::array({"market_data"}));
    REQUIRE(update[fields::AGENT_ERRORS]["market_data"] == "timeout: market data service");
    REQUIRE(update[fields::ERRORS][0] == "market_data agent error: timeout: market data service");
    REQUIRE(update[fields::AGENT_METRICS]["market_data"]["attempts"] == 3);
    REQUIRE(update[fields::AGENT_METRICS]["market_data"]["success"] == false);
    REQUIRE(update[fields::AGENT_METRICS]["market_data"]["error_class"] == "transient");
    REQUIRE_FALSE(update.contains(fields::MARKET_DATA));
}

TEST_CASE("A transient failure followed by success", "[executor][retry]") {
    RecordingSleep sleep;
    BudgetController budget;
    budget.set_sleep_function(sleep.fn());
    NodeExecutor executor(RetryPolicy{3, 5ms});

    ScriptedNode node(NodeId::SENTIMENT, [](int call, NodeRuntime& rt) -> PartialUpdate {
        rt.trace.add_step("call " + std::to_string(call));
        if (call == 1) throw RateLimitError("news api");
        return {{fields::SENTIMENT_ANALYSIS, Value::array({{{"ticker", "AAPL"}}})}};
    });

    NodeResult r = executor.run(node, make_state(), budget);

    REQUIRE(r.success);
    REQUIRE(r.attempts == 2);
    REQUIRE(sleep.delays->size() == 1);
    REQUIRE(r.update[fields::SENTIMENT_ANALYSIS].size() == 1);
    REQUIRE(r.update[fields::AGENT_METRICS]["sentiment"]["success"] == true);
    REQUIRE_FALSE(r.update.contains(fields::AGENT_ERRORS));
    // only the successful attempt's steps survive
    REQUIRE(r.update[fields::REASONING_CHAINS]["sentiment"] == Value::array({"call 2"}));
}

TEST_CASE("Permanent failures run once", "[executor][retry]") {
    RecordingSleep sleep;
    BudgetController budget;
    budget.set_sleep_function(sleep.fn());
    NodeExecutor executor(RetryPolicy{5, 10ms});

    ScriptedNode node(NodeId::REPORT, [](int, NodeRuntime&) -> PartialUpdate {
        throw AuthenticationError("invalid api key");
    });

    NodeResult r = executor.run(node, make_state(), budget);

    REQUIRE_FALSE(r.success);
    REQUIRE(node.calls == 1);
    REQUIRE(r.attempts == 1);
    REQUIRE(r.error_class == ErrorClass::PERMANENT);
    REQUIRE(sleep.delays->empty());
    REQUIRE(r.update[fields::REASONING_CHAINS]["report"].back() == "ERROR: authentication failed: invalid api key");
}

TEST_CASE("An update outside the schema fails the node", "[executor]") {
    BudgetController budget;
    NodeExecutor executor(RetryPolicy{3, 10ms});

    ScriptedNode node(NodeId::INTENT, [](int, NodeRuntime&) -> PartialUpdate {
        return {{"made_up_field", true}};
    });

    NodeResult r = executor.run(node, make_state(), budget);

    REQUIRE_FALSE(r.success);
    REQUIRE(node.calls == 1);
    REQUIRE(r.update[fields::AGENT_ERRORS].contains("intent"));
    REQUIRE_FALSE(r.update.contains("made_up_field"));
}

TEST_CASE("Cancellation during backoff stops retrying", "[executor][cancel]") {
    BudgetController budget;
    int sleeps = 0;
    budget.set_sleep_function([&](std::chrono::milliseconds, std::stop_token) {
        ++sleeps;
        budget.cancel("user pressed stop");
        return false;
    });
    NodeExecutor executor(RetryPolicy{3, 10ms});

    ScriptedNode node(NodeId::FORWARD_LOOKING, [](int, NodeRuntime&) -> PartialUpdate {
        throw TimeoutError("consensus");
    });

    NodeResult r = executor.run(node, make_state(), budget);

    REQUIRE_FALSE(r.success);
    REQUIRE(node.calls == 1);
    REQUIRE(sleeps == 1);
    REQUIRE(budget.stop_requested());
    REQUIRE(budget.stop_reason() == "user pressed stop");
    REQUIRE(r.error_message.find("cancelled") != std::string::npos);
}

TEST_CASE("Node budget stops the run once used up", "[budget]") {
    BudgetController budget(ExecutionBudget{2, 0ms});
    REQUIRE(budget.try_consume_node());
    REQUIRE(budget.try_consume_node());
    REQUIRE_FALSE(budget.try_consume_node());
    REQUIRE(budget.stop_requested());
    REQUIRE(budget.nodes_used() == 2);
}

TEST_CASE("External stop token cancels the run", "[budget][cancel]") {
    std::stop_source source;
    BudgetController budget(ExecutionBudget{}, source.get_token());
    REQUIRE_FALSE(budget.exceeded());
    source.request_stop();
    REQUIRE(budget.exceeded());
    REQUIRE(budget.stop_reason() == "run cancelled by caller");
}

TEST_CASE("Caller stop racing controller teardown", "[budget][cancel]") {
    std::stop_source source;
    std::atomic<bool> done{false};

    std::thread stopper([&] {
        while (!done.load()) std::this_thread::yield();
        source.request_stop();
    });
    for (int i = 0; i < 200; ++i) {
        BudgetController budget(ExecutionBudget{}, source.get_token());
        if (i == 100) done = true;
        REQUIRE(budget.nodes_used() == 0);
    }
    stopper.join();

    // a controller built after the stop sees it at once
    BudgetController late(ExecutionBudget{}, source.get_token());
    REQUIRE(late.stop_requested());
    REQUIRE(late.stop_reason() == "run cancelled by caller");
}
