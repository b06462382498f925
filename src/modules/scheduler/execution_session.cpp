// modules/scheduler/execution_session.cpp
#include "modules/scheduler/execution_session.h"
#include "common/utils/logging.h"
#include <future>
#include <system_error>

namespace researchflow {

ExecutionSession::ExecutionSession(const Options& options, std::string run_id, std::stop_token stop)
    : run_id_(std::move(run_id)),
      parallel_branches_(options.parallel_branches),
      context_engine_(),
      budget_controller_(options.budget, std::move(stop)),
      trace_exporter_(run_id_),
      node_executor_(options.retry) {
    if (options.sleep) {
        budget_controller_.set_sleep_function(options.sleep);
    }
}

NodeResult ExecutionSession::execute_node(Node& node, const Context& snapshot, int generation) {
    NodeResult result = node_executor_.run(node, snapshot, budget_controller_);
    trace_exporter_.on_node_end(result, generation);
    return result;
}

std::vector<NodeResult> ExecutionSession::dispatch_branches(const std::vector<Node*>& nodes,
                                                            const Context& snapshot, int generation) {
    std::vector<NodeResult> results;
    results.reserve(nodes.size());

    if (!parallel_branches_ || nodes.size() < 2) {
        for (Node* node : nodes) {
            results.push_back(execute_node(*node, snapshot, generation));
        }
        return results;
    }

    // Each branch reads the shared snapshot through a const reference and
    // returns its own update; nothing is written until all are joined.
    std::vector<std::future<NodeResult>> futures;
    futures.reserve(nodes.size());
    std::vector<Node*> inline_nodes;
    for (Node* node : nodes) {
        try {
            futures.push_back(std::async(std::launch::async, [this, node, &snapshot, generation]() {
                return execute_node(*node, snapshot, generation);
            }));
        } catch (const std::system_error& e) {
            logging::get()->warn("Could not start branch {} on its own thread ({}); running inline",
                                 node->name(), e.what());
            inline_nodes.push_back(node);
        }
    }

    for (auto& f : futures) {
        results.push_back(f.get());
    }
    for (Node* node : inline_nodes) {
        results.push_back(execute_node(*node, snapshot, generation));
    }
    return results;
}

} // namespace researchflow
