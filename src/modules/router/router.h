// modules/router/router.h
#ifndef RESEARCHFLOW_MODULES_ROUTER_ROUTER_H
#define RESEARCHFLOW_MODULES_ROUTER_ROUTER_H

#include "core/types/context.h"
#include "core/types/node.h"
#include <set>

namespace researchflow {

// Decides which specialists fan out after intent classification.
// Pure: reads only fields computed before it runs.
//
// Priority order:
//   1. invalid query                                   -> {}
//   2. context flag, or no identifiers                  += rag_retrieval
//   3. market flag and identifiers                      += market_data, forward_looking
//   4. sentiment flag and identifiers                   += sentiment
//   5. identifiers but neither market nor sentiment flag
//                                                       += market_data, sentiment, forward_looking
// The result is a set, so no node is dispatched twice.
class Router {
public:
    std::set<NodeId> route(const Context& state) const;

    // Every node route() may return.
    static const std::set<NodeId>& targets();
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_ROUTER_ROUTER_H
