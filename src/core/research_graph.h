// core/research_graph.h
#ifndef RESEARCHFLOW_CORE_RESEARCH_GRAPH_H
#define RESEARCHFLOW_CORE_RESEARCH_GRAPH_H

#include "modules/scheduler/topo_scheduler.h"
#include "services/research_services.h"
#include <memory>
#include <optional>
#include <string>

namespace researchflow {

// validation -> query_optimization -> memory_loader -> intent
//   -> router -> {market_data, sentiment, forward_looking, rag_retrieval}
//   -> aggregator -> visualization -> report -> quality_check -> memory_saver
//
// Throws std::invalid_argument when a service is missing and GraphError when
// the topology does not validate.
std::unique_ptr<TopoScheduler> build_research_graph(const ResearchServices& services,
                                                    const NodeOptions& options,
                                                    TopoScheduler::Config config);

// Run-fatal check after the report node: no report text at all.
std::optional<std::string> require_report(const Context& state);

} // namespace researchflow

#endif // RESEARCHFLOW_CORE_RESEARCH_GRAPH_H
