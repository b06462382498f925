// modules/system/system_nodes.h
#ifndef RESEARCHFLOW_MODULES_SYSTEM_SYSTEM_NODES_H
#define RESEARCHFLOW_MODULES_SYSTEM_SYSTEM_NODES_H

#include "core/types/node.h"
#include <memory>

namespace researchflow {

// Fan-in rendezvous for the specialist branches. Has no business logic; the
// scheduler only reaches it once every dispatched branch has been merged.
class AggregatorNode : public Node {
public:
    AggregatorNode() : Node(NodeId::AGGREGATOR) {}

    [[nodiscard]] PartialUpdate execute(const Context& state, NodeRuntime& runtime) override;
};

std::unique_ptr<Node> create_aggregator_node();

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_SYSTEM_SYSTEM_NODES_H
