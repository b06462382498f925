// modules/router/router.cpp
#include "modules/router/router.h"
#include "modules/context/state_schema.h"
#include "common/utils/logging.h"
#include <string>

namespace researchflow {

std::set<NodeId> Router::route(const Context& state) const {
    StateView view(state);
    std::set<NodeId> dispatch;

    if (!view.is_query_valid()) {
        logging::get()->debug("Router: query invalid, nothing dispatched");
        return dispatch;
    }

    const bool has_tickers = !view.tickers().empty();
    const DispatchFlags flags = view.dispatch_flags();

    if (flags.context || !has_tickers) {
        dispatch.insert(NodeId::RAG_RETRIEVAL);
    }
    if (flags.market_data && has_tickers) {
        // forward_looking only needs market data to have been requested
        dispatch.insert(NodeId::MARKET_DATA);
        dispatch.insert(NodeId::FORWARD_LOOKING);
    }
    if (flags.sentiment && has_tickers) {
        dispatch.insert(NodeId::SENTIMENT);
    }
    if (has_tickers && !flags.market_data && !flags.sentiment) {
        dispatch.insert(NodeId::MARKET_DATA);
        dispatch.insert(NodeId::SENTIMENT);
        dispatch.insert(NodeId::FORWARD_LOOKING);
    }

    if (logging::get()->should_log(spdlog::level::debug)) {
        std::string names;
        for (NodeId id : dispatch) {
            if (!names.empty()) names += ", ";
            names += node_name(id);
        }
        logging::get()->debug("Router: dispatching [{}]", names);
    }
    return dispatch;
}

const std::set<NodeId>& Router::targets() {
    static const std::set<NodeId> all = {
        NodeId::MARKET_DATA, NodeId::SENTIMENT, NodeId::FORWARD_LOOKING, NodeId::RAG_RETRIEVAL
    };
    return all;
}

} // namespace researchflow
