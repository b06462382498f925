// modules/executor/node_executor.cpp
#include "modules/executor/node_executor.h"
#include "modules/executor/error_classifier.h"
#include "modules/trace/execution_trace.h"
#include "common/utils/logging.h"
#include <chrono>

namespace researchflow {

NodeExecutor::NodeExecutor(RetryPolicy policy, const StateSchema& schema)
    : policy_(policy), schema_(schema) {}

NodeResult NodeExecutor::run(Node& node, const Context& snapshot, BudgetController& budget) const {
    const std::string name = node.name();
    NodeResult result;
    result.node = node.id;
    result.started_at = std::chrono::system_clock::now();
    const auto start = std::chrono::steady_clock::now();

    ExecutionTrace trace;
    NodeRuntime runtime{trace, budget, policy_};
    PartialUpdate update = PartialUpdate::object();

    logging::get()->info("[{}] started", name);
    try {
        update = retry_call(policy_, budget, [&]() {
            trace.clear();
            PartialUpdate out = node.execute(snapshot, runtime);
            if (out.is_null()) out = PartialUpdate::object();
            schema_.validate_update(out);
            return out;
        }, &result.attempts, name);
        result.success = true;
    } catch (const std::exception& e) {
        result.error_class = classify_error(e);
        result.error_message = e.what();
    } catch (...) {
        result.error_class = ErrorClass::PERMANENT;
        result.error_message = "unknown non-standard exception";
    }
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (result.success) {
        logging::get()->info("[{}] completed in {} ms ({} attempt(s))",
                             name, result.elapsed.count(), result.attempts);
    } else {
        update = PartialUpdate::object();
        trace.add_step("ERROR: " + result.error_message);
        logging::get()->error("[{}] failed after {} attempt(s) [{}]: {}", name, result.attempts,
                              to_string(*result.error_class), result.error_message);
    }

    attach_bookkeeping(update, name, result, trace);
    result.update = std::move(update);
    return result;
}

void NodeExecutor::attach_bookkeeping(PartialUpdate& update, const std::string& name,
                                      const NodeResult& result, const ExecutionTrace& trace) {
    Value& executed = update[fields::EXECUTED_AGENTS];
    if (!executed.is_array()) executed = Value::array();
    executed.push_back(name);

    Value metrics = {
        {"elapsed_ms", result.elapsed.count()},
        {"attempts", result.attempts},
        {"success", result.success}
    };
    if (result.error_class) metrics["error_class"] = to_string(*result.error_class);
    Value& metrics_map = update[fields::AGENT_METRICS];
    if (!metrics_map.is_object()) metrics_map = Value::object();
    metrics_map[name] = std::move(metrics);

    if (!trace.empty()) {
        Value& chains = update[fields::REASONING_CHAINS];
        if (!chains.is_object()) chains = Value::object();
        chains[name] = trace.to_json();
    }

    if (!result.success) {
        Value& errors = update[fields::ERRORS];
        if (!errors.is_array()) errors = Value::array();
        errors.push_back(name + " agent error: " + result.error_message);

        Value& agent_errors = update[fields::AGENT_ERRORS];
        if (!agent_errors.is_object()) agent_errors = Value::object();
        agent_errors[name] = result.error_message;
    }
}

} // namespace researchflow
