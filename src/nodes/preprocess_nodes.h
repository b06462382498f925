// nodes/preprocess_nodes.h
#ifndef RESEARCHFLOW_NODES_PREPROCESS_NODES_H
#define RESEARCHFLOW_NODES_PREPROCESS_NODES_H

#include "core/types/node.h"
#include "services/conversation_store.h"
#include "services/query_services.h"
#include "services/ticker_extractor.h"
#include <memory>

namespace researchflow {

// Writes is_query_valid / validation_reason. An empty query is invalid
// without asking the validator; a validator failure leaves the query valid.
class ValidationNode : public Node {
public:
    explicit ValidationNode(std::shared_ptr<QueryValidator> validator);

    [[nodiscard]] PartialUpdate execute(const Context& state, NodeRuntime& runtime) override;

private:
    std::shared_ptr<QueryValidator> validator_;
};

// Writes final_query. Invalid queries and optimizer failures pass the user
// query through unchanged.
class QueryOptimizationNode : public Node {
public:
    explicit QueryOptimizationNode(std::shared_ptr<QueryOptimizer> optimizer);

    [[nodiscard]] PartialUpdate execute(const Context& state, NodeRuntime& runtime) override;

private:
    std::shared_ptr<QueryOptimizer> optimizer_;
};

// Writes conversation_history, only when the session has messages.
class MemoryLoaderNode : public Node {
public:
    MemoryLoaderNode(std::shared_ptr<ConversationStore> store, int limit);

    [[nodiscard]] PartialUpdate execute(const Context& state, NodeRuntime& runtime) override;

private:
    std::shared_ptr<ConversationStore> store_;
    int limit_;
};

// Writes intent, tickers and the three dispatch flags the router reads.
class IntentNode : public Node {
public:
    IntentNode(std::shared_ptr<TickerExtractor> extractor, std::shared_ptr<IntentClassifier> classifier);

    [[nodiscard]] PartialUpdate execute(const Context& state, NodeRuntime& runtime) override;

private:
    std::shared_ptr<TickerExtractor> extractor_;
    std::shared_ptr<IntentClassifier> classifier_;
};

} // namespace researchflow

#endif // RESEARCHFLOW_NODES_PREPROCESS_NODES_H
