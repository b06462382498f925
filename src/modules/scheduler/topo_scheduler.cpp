// modules/scheduler/topo_scheduler.cpp
#include "modules/scheduler/topo_scheduler.h"
#include "modules/context/state_schema.h"
#include "core/types/errors.h"
#include "common/utils/logging.h"
#include <algorithm>

namespace researchflow {

TopoScheduler::TopoScheduler(Config config)
    : config_(std::move(config)) {}

void TopoScheduler::register_node(std::unique_ptr<Node> node) {
    if (!node) {
        throw GraphError("Cannot register a null node");
    }
    NodeId id = node->id;
    if (nodes_.count(id)) {
        throw GraphError("Node registered twice: " + node_name(id));
    }
    nodes_[id] = std::move(node);
    built_ = false;
}

void TopoScheduler::add_edge(NodeId from, NodeId to) {
    if (next_.count(from) || conditional_.count(from)) {
        throw GraphError("Node already has an outgoing edge: " + node_name(from));
    }
    next_[from] = to;
    built_ = false;
}

void TopoScheduler::add_conditional_edge(NodeId source, RouterFn router, std::set<NodeId> targets, NodeId barrier) {
    if (next_.count(source) || conditional_.count(source)) {
        throw GraphError("Node already has an outgoing edge: " + node_name(source));
    }
    if (!router) {
        throw GraphError("Conditional edge from " + node_name(source) + " has no router");
    }
    conditional_[source] = ConditionalEdge{source, std::move(router), std::move(targets), barrier};
    built_ = false;
}

void TopoScheduler::add_postcondition(NodeId node, Postcondition check) {
    postconditions_[node].push_back(std::move(check));
}

void TopoScheduler::build_dag() {
    if (!entry_ || !exit_) {
        throw GraphError("Graph needs an entry and an exit node");
    }
    auto require = [this](NodeId id, const std::string& role) {
        if (!nodes_.count(id)) {
            throw GraphError(role + " node not registered: " + node_name(id));
        }
    };
    require(*entry_, "Entry");
    require(*exit_, "Exit");
    for (const auto& [from, to] : next_) {
        require(from, "Edge source");
        require(to, "Edge target");
    }
    if (next_.count(*exit_) || conditional_.count(*exit_)) {
        throw GraphError("Exit node must not have outgoing edges: " + node_name(*exit_));
    }

    std::set<NodeId> branch_nodes;
    for (const auto& [source, edge] : conditional_) {
        require(source, "Conditional source");
        require(edge.barrier, "Barrier");
        for (NodeId target : edge.targets) {
            require(target, "Router target");
            auto it = next_.find(target);
            if (it == next_.end() || it->second != edge.barrier) {
                throw GraphError("Branch " + node_name(target) + " must lead to barrier " + node_name(edge.barrier));
            }
            if (!branch_nodes.insert(target).second) {
                throw GraphError("Node is a target of more than one conditional edge: " + node_name(target));
            }
        }
    }

    // Walk the main chain from the entry: no cycles, must end at the exit.
    std::set<NodeId> visited;
    NodeId current = *entry_;
    while (true) {
        if (!visited.insert(current).second) {
            throw GraphError("Cycle detected at node: " + node_name(current));
        }
        if (branch_nodes.count(current)) {
            throw GraphError("Branch node on the main chain: " + node_name(current));
        }
        if (current == *exit_) break;
        if (auto c = conditional_.find(current); c != conditional_.end()) {
            current = c->second.barrier;
        } else if (auto n = next_.find(current); n != next_.end()) {
            current = n->second;
        } else {
            throw GraphError("Chain ends at " + node_name(current) + " before reaching the exit");
        }
    }

    for (const auto& [id, node] : nodes_) {
        if (!visited.count(id) && !branch_nodes.count(id)) {
            throw GraphError("Node not reachable from the entry: " + node_name(id));
        }
    }

    built_ = true;
    logging::get()->debug("Graph built: {} nodes, {} conditional edge(s)", nodes_.size(), conditional_.size());
}

Node& TopoScheduler::node_at(NodeId id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw GraphError("Node not registered: " + node_name(id));
    }
    return *it->second;
}

std::optional<std::string> TopoScheduler::check_postconditions(NodeId id, const Context& state) const {
    auto it = postconditions_.find(id);
    if (it == postconditions_.end()) return std::nullopt;
    for (const auto& check : it->second) {
        if (auto err = check(state)) return err;
    }
    return std::nullopt;
}

ExecutionResult TopoScheduler::finish(ExecutionSession& session, bool success, std::string message, Context state) {
    ExecutionResult result;
    result.success = success;
    result.message = std::move(message);
    result.final_state = std::move(state);
    result.traces = session.get_trace_exporter().get_traces();
    {
        std::lock_guard<std::mutex> lock(traces_mutex_);
        last_traces_ = result.traces;
    }
    if (success) {
        logging::get()->info("Run {} finished: {}", session.run_id(), result.message);
    } else {
        logging::get()->error("Run {} failed: {}", session.run_id(), result.message);
    }
    return result;
}

ExecutionResult TopoScheduler::execute(Context initial_state, std::stop_token stop) {
    if (!built_) {
        build_dag();
    }

    Context state = std::move(initial_state);
    ExecutionSession::Options options{config_.budget, config_.retry, config_.parallel_branches, config_.sleep};
    ExecutionSession session(options, StateView(state).run_id(), std::move(stop));
    BudgetController& budget = session.get_budget_controller();
    const ContextEngine& merger = session.get_context_engine();

    auto stopped = [&budget]() {
        return budget.exceeded();
    };

    NodeId current = *entry_;
    int generation = 0;
    while (true) {
        if (stopped() || !budget.try_consume_node()) {
            return finish(session, false, "Run stopped before " + node_name(current) + ": " + budget.stop_reason(), std::move(state));
        }

        NodeResult r = session.execute_node(node_at(current), state, generation);
        try {
            merger.merge(state, r.update);
        } catch (const StateMergeError& e) {
            return finish(session, false, "State merge failed after " + node_name(current) + ": " + e.what(), std::move(state));
        }
        if (stopped()) {
            return finish(session, false, "Run stopped during " + node_name(current) + ": " + budget.stop_reason(), std::move(state));
        }
        if (auto err = check_postconditions(current, state)) {
            return finish(session, false, *err, std::move(state));
        }
        if (current == *exit_) break;

        ++generation;
        auto cond = conditional_.find(current);
        if (cond == conditional_.end()) {
            current = next_.at(current);
            continue;
        }

        // Fan out against the post-merge snapshot, fan in at the barrier.
        const ConditionalEdge& edge = cond->second;
        std::set<NodeId> selected = edge.router(state);
        std::vector<Node*> branches;
        for (NodeId id : selected) {
            if (!edge.targets.count(id)) {
                return finish(session, false, "Router selected undeclared branch: " + node_name(id), std::move(state));
            }
            if (!budget.try_consume_node()) {
                return finish(session, false, "Run stopped before branch " + node_name(id) + ": " + budget.stop_reason(), std::move(state));
            }
            branches.push_back(&node_at(id));
        }

        if (!branches.empty()) {
            const Context snapshot = state;
            std::vector<NodeResult> results = session.dispatch_branches(branches, snapshot, generation);
            std::vector<BranchUpdate> updates;
            updates.reserve(results.size());
            for (auto& br : results) {
                updates.push_back(BranchUpdate{br.node, std::move(br.update)});
            }
            try {
                merger.merge_generation(state, std::move(updates));
            } catch (const StateMergeError& e) {
                return finish(session, false, std::string("Branch merge failed: ") + e.what(), std::move(state));
            }
            if (stopped()) {
                return finish(session, false, "Run stopped during branch execution: " + budget.stop_reason(), std::move(state));
            }
            ++generation;
        }
        current = edge.barrier;
    }

    return finish(session, true, "Completed " + std::to_string(budget.nodes_used()) + " node executions", std::move(state));
}

std::vector<TraceRecord> TopoScheduler::get_last_traces() const {
    std::lock_guard<std::mutex> lock(traces_mutex_);
    return last_traces_;
}

} // namespace researchflow
