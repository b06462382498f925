// modules/system/system_nodes.cpp
#include "modules/system/system_nodes.h"
#include "modules/context/state_schema.h"
#include "modules/trace/execution_trace.h"
#include "common/utils/logging.h"
#include <array>

namespace researchflow {

PartialUpdate AggregatorNode::execute(const Context& state, NodeRuntime& runtime) {
    static constexpr std::array<const char*, 5> kBranchOutputs = {
        fields::MARKET_DATA, fields::PEER_VALUATION, fields::SENTIMENT_ANALYSIS,
        fields::ANALYST_CONSENSUS, fields::RETRIEVED_CONTEXT
    };

    StateView view(state);
    std::string populated;
    for (const char* field : kBranchOutputs) {
        if (view.has_entries(field)) {
            if (!populated.empty()) populated += ", ";
            populated += field;
        }
    }
    if (populated.empty()) populated = "none";
    runtime.trace.add_step("Branches joined; populated: " + populated);
    logging::get()->info("Aggregator: branch outputs populated: {}", populated);
    return PartialUpdate::object();
}

std::unique_ptr<Node> create_aggregator_node() {
    return std::make_unique<AggregatorNode>();
}

} // namespace researchflow
