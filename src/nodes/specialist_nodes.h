// nodes/specialist_nodes.h
#ifndef RESEARCHFLOW_NODES_SPECIALIST_NODES_H
#define RESEARCHFLOW_NODES_SPECIALIST_NODES_H

#include "core/types/node.h"
#include "services/data_provider.h"
#include <memory>

namespace researchflow {

// The router's fan-out targets. Each fetches per identifier with its own
// retry; one identifier failing is reported in `errors` and the node's
// reasoning chain while the remaining identifiers still complete.

// market_data += quote, peer_valuation += peer multiples, per ticker.
class MarketDataNode : public Node {
public:
    explicit MarketDataNode(std::shared_ptr<MarketDataProvider> provider);

    [[nodiscard]] PartialUpdate execute(const Context& state, NodeRuntime& runtime) override;

private:
    std::shared_ptr<MarketDataProvider> provider_;
};

class SentimentNode : public Node {
public:
    explicit SentimentNode(std::shared_ptr<SentimentProvider> provider);

    [[nodiscard]] PartialUpdate execute(const Context& state, NodeRuntime& runtime) override;

private:
    std::shared_ptr<SentimentProvider> provider_;
};

// Analyst consensus and price targets.
class ForwardLookingNode : public Node {
public:
    explicit ForwardLookingNode(std::shared_ptr<ConsensusProvider> provider);

    [[nodiscard]] PartialUpdate execute(const Context& state, NodeRuntime& runtime) override;

private:
    std::shared_ptr<ConsensusProvider> provider_;
};

// One search over the document store, filtered to the first identifier when
// there is one. A failed search fails the node.
class RagRetrievalNode : public Node {
public:
    RagRetrievalNode(std::shared_ptr<DocumentRetriever> retriever, int top_k);

    [[nodiscard]] PartialUpdate execute(const Context& state, NodeRuntime& runtime) override;

private:
    std::shared_ptr<DocumentRetriever> retriever_;
    int top_k_;
};

} // namespace researchflow

#endif // RESEARCHFLOW_NODES_SPECIALIST_NODES_H
