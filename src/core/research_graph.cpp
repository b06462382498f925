// core/research_graph.cpp
#include "core/research_graph.h"
#include "modules/context/state_schema.h"
#include "modules/router/router.h"
#include "modules/system/system_nodes.h"
#include "nodes/postprocess_nodes.h"
#include "nodes/preprocess_nodes.h"
#include "nodes/specialist_nodes.h"

namespace researchflow {

std::optional<std::string> require_report(const Context& state) {
    const Value& report = StateView(state).field(fields::REPORT);
    if (report.is_string() && !report.get<std::string>().empty()) {
        return std::nullopt;
    }
    std::string cause = "Report synthesis produced no report";
    const Value& errors = StateView(state).field(fields::AGENT_ERRORS);
    if (errors.is_object() && errors.contains(node_name(NodeId::REPORT))) {
        const Value& message = errors.at(node_name(NodeId::REPORT));
        cause += ": " + (message.is_string() ? message.get<std::string>() : message.dump());
    }
    return cause;
}

std::unique_ptr<TopoScheduler> build_research_graph(const ResearchServices& services,
                                                    const NodeOptions& options,
                                                    TopoScheduler::Config config) {
    auto graph = std::make_unique<TopoScheduler>(std::move(config));

    // 前处理
    graph->register_node(std::make_unique<ValidationNode>(services.validator));
    graph->register_node(std::make_unique<QueryOptimizationNode>(services.optimizer));
    graph->register_node(std::make_unique<MemoryLoaderNode>(services.conversations, options.history_limit));
    graph->register_node(std::make_unique<IntentNode>(services.ticker_extractor, services.classifier));

    // 并行分支
    graph->register_node(std::make_unique<MarketDataNode>(services.market));
    graph->register_node(std::make_unique<SentimentNode>(services.sentiment));
    graph->register_node(std::make_unique<ForwardLookingNode>(services.consensus));
    graph->register_node(std::make_unique<RagRetrievalNode>(services.documents, options.rag_top_k));
    graph->register_node(create_aggregator_node());

    // 后处理
    graph->register_node(std::make_unique<VisualizationNode>(services.market));
    graph->register_node(std::make_unique<ReportNode>(services.reports, options.report_max_iterations,
                                                      options.quality_threshold));
    graph->register_node(std::make_unique<QualityCheckNode>(services.reports, options.quality_threshold));
    graph->register_node(std::make_unique<MemorySaverNode>(services.conversations));

    graph->add_edge(NodeId::VALIDATION, NodeId::QUERY_OPTIMIZATION);
    graph->add_edge(NodeId::QUERY_OPTIMIZATION, NodeId::MEMORY_LOADER);
    graph->add_edge(NodeId::MEMORY_LOADER, NodeId::INTENT);

    Router router;
    graph->add_conditional_edge(NodeId::INTENT,
                                [router](const Context& state) { return router.route(state); },
                                Router::targets(), NodeId::AGGREGATOR);
    for (NodeId branch : Router::targets()) {
        graph->add_edge(branch, NodeId::AGGREGATOR);
    }

    graph->add_edge(NodeId::AGGREGATOR, NodeId::VISUALIZATION);
    graph->add_edge(NodeId::VISUALIZATION, NodeId::REPORT);
    graph->add_edge(NodeId::REPORT, NodeId::QUALITY_CHECK);
    graph->add_edge(NodeId::QUALITY_CHECK, NodeId::MEMORY_SAVER);
    graph->add_postcondition(NodeId::REPORT, require_report);

    graph->set_entry(NodeId::VALIDATION);
    graph->set_exit(NodeId::MEMORY_SAVER);
    graph->build_dag();
    return graph;
}

} // namespace researchflow
