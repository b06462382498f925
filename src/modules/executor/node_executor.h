// modules/executor/node_executor.h
#ifndef RESEARCHFLOW_MODULES_EXECUTOR_NODE_EXECUTOR_H
#define RESEARCHFLOW_MODULES_EXECUTOR_NODE_EXECUTOR_H

#include "core/types/context.h"
#include "core/types/node.h"
#include "modules/budget/budget_controller.h"
#include "modules/context/state_schema.h"
#include "modules/executor/retry_policy.h"
#include <string>

namespace researchflow {

// The execution envelope. Runs a node's business function against a state
// snapshot with retry/backoff and turns every outcome into a partial update
// plus bookkeeping:
//   executed_agents   += [name]
//   agent_metrics     |= {name: {elapsed_ms, attempts, success[, error_class]}}
//   reasoning_chains  |= {name: [steps...]}           (when steps were recorded)
// and on failure, instead of the node's own output:
//   errors            += ["<name> agent error: <message>"]
//   agent_errors      |= {name: <message>}
// run() never throws.
class NodeExecutor {
public:
    explicit NodeExecutor(RetryPolicy policy = {}, const StateSchema& schema = StateSchema::instance());

    NodeResult run(Node& node, const Context& snapshot, BudgetController& budget) const;

    const RetryPolicy& retry_policy() const { return policy_; }

private:
    RetryPolicy policy_;
    const StateSchema& schema_;

    static void attach_bookkeeping(PartialUpdate& update, const std::string& name,
                                   const NodeResult& result, const ExecutionTrace& trace);
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_EXECUTOR_NODE_EXECUTOR_H
