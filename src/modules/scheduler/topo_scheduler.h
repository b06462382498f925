// modules/scheduler/topo_scheduler.h
#ifndef RESEARCHFLOW_MODULES_SCHEDULER_TOPO_SCHEDULER_H
#define RESEARCHFLOW_MODULES_SCHEDULER_TOPO_SCHEDULER_H

#include "core/types/context.h"
#include "core/types/node.h"
#include "core/types/budget.h"
#include "modules/scheduler/execution_session.h"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

namespace researchflow {

using RouterFn = std::function<std::set<NodeId>(const Context&)>;

// Returns an error message when the merged state after a node is unusable.
using Postcondition = std::function<std::optional<std::string>(const Context&)>;

// A -> router -> {B1..Bn} -> barrier
struct ConditionalEdge {
    NodeId source;
    RouterFn router;
    std::set<NodeId> targets; // every node the router may return
    NodeId barrier;
};

// Drives one run along a sequential chain of nodes with at most one
// fan-out/fan-in section per conditional edge. The node registry and
// topology are built once; every execute() call gets its own session.
class TopoScheduler {
public:
    struct Config {
        ExecutionBudget budget;
        RetryPolicy retry;
        bool parallel_branches = true;
        BudgetController::SleepFunction sleep; // tests inject this
    };

    explicit TopoScheduler() : TopoScheduler(Config{}) {}
    explicit TopoScheduler(Config config);

    void register_node(std::unique_ptr<Node> node);
    void add_edge(NodeId from, NodeId to);
    void add_conditional_edge(NodeId source, RouterFn router, std::set<NodeId> targets, NodeId barrier);
    void add_postcondition(NodeId node, Postcondition check);
    void set_entry(NodeId entry) { entry_ = entry; }
    void set_exit(NodeId exit) { exit_ = exit; }

    // Validates the topology. Throws GraphError.
    void build_dag();

    // Never throws for run failures; they come back as success=false.
    ExecutionResult execute(Context initial_state, std::stop_token stop = {});

    std::vector<TraceRecord> get_last_traces() const;

    bool has_node(NodeId id) const { return nodes_.count(id) > 0; }
    const Config& config() const { return config_; }

private:
    Config config_;
    std::map<NodeId, std::unique_ptr<Node>> nodes_;
    std::map<NodeId, NodeId> next_;
    std::map<NodeId, ConditionalEdge> conditional_;
    std::map<NodeId, std::vector<Postcondition>> postconditions_;
    std::optional<NodeId> entry_;
    std::optional<NodeId> exit_;
    bool built_ = false;

    mutable std::mutex traces_mutex_;
    std::vector<TraceRecord> last_traces_;

    Node& node_at(NodeId id) const;
    std::optional<std::string> check_postconditions(NodeId id, const Context& state) const;
    ExecutionResult finish(ExecutionSession& session, bool success, std::string message, Context state);
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_SCHEDULER_TOPO_SCHEDULER_H
