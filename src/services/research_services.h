// services/research_services.h
#ifndef RESEARCHFLOW_SERVICES_RESEARCH_SERVICES_H
#define RESEARCHFLOW_SERVICES_RESEARCH_SERVICES_H

#include "services/conversation_store.h"
#include "services/data_provider.h"
#include "services/query_services.h"
#include "services/report_synthesizer.h"
#include "services/ticker_extractor.h"
#include <memory>

namespace researchflow {

// Collaborators the workflow nodes call. All are shared so one provider object
// may implement several roles (ToolDataProvider does).
struct ResearchServices {
    std::shared_ptr<QueryValidator> validator;
    std::shared_ptr<QueryOptimizer> optimizer;
    std::shared_ptr<IntentClassifier> classifier;
    std::shared_ptr<TickerExtractor> ticker_extractor;

    std::shared_ptr<MarketDataProvider> market;
    std::shared_ptr<SentimentProvider> sentiment;
    std::shared_ptr<ConsensusProvider> consensus;
    std::shared_ptr<DocumentRetriever> documents;

    std::shared_ptr<ReportSynthesizer> reports;
    std::shared_ptr<ConversationStore> conversations;
};

struct NodeOptions {
    int history_limit = 10;
    int rag_top_k = 5;
    int report_max_iterations = 3;
    double quality_threshold = 0.85;
};

} // namespace researchflow

#endif // RESEARCHFLOW_SERVICES_RESEARCH_SERVICES_H
