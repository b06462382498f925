// modules/scheduler/execution_session.h
#ifndef RESEARCHFLOW_MODULES_SCHEDULER_EXECUTION_SESSION_H
#define RESEARCHFLOW_MODULES_SCHEDULER_EXECUTION_SESSION_H

#include "core/types/context.h"
#include "core/types/node.h"
#include "core/types/budget.h"
#include "modules/context/context_engine.h"
#include "modules/budget/budget_controller.h"
#include "modules/trace/trace_exporter.h"
#include "modules/executor/node_executor.h"
#include <stop_token>
#include <string>
#include <vector>

namespace researchflow {

// ExecutionSession 封装了单次执行的所有状态：预算、取消信号、Trace 和执行封装
class ExecutionSession {
public:
    struct Options {
        ExecutionBudget budget;
        RetryPolicy retry;
        bool parallel_branches = true;
        BudgetController::SleepFunction sleep; // empty = real sleep
    };

    ExecutionSession(const Options& options, std::string run_id, std::stop_token stop = {});

    // Runs one node through the envelope and records its trace.
    NodeResult execute_node(Node& node, const Context& snapshot, int generation);

    // Runs every node against the same snapshot, concurrently unless disabled.
    // All branches are joined before this returns; results keep input order.
    std::vector<NodeResult> dispatch_branches(const std::vector<Node*>& nodes,
                                              const Context& snapshot, int generation);

    BudgetController& get_budget_controller() { return budget_controller_; }
    const TraceExporter& get_trace_exporter() const { return trace_exporter_; }
    const ContextEngine& get_context_engine() const { return context_engine_; }
    const std::string& run_id() const { return run_id_; }

private:
    std::string run_id_;
    bool parallel_branches_;
    ContextEngine context_engine_;
    BudgetController budget_controller_;
    TraceExporter trace_exporter_;
    NodeExecutor node_executor_;
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_SCHEDULER_EXECUTION_SESSION_H
