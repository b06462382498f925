// nodes/postprocess_nodes.h
#ifndef RESEARCHFLOW_NODES_POSTPROCESS_NODES_H
#define RESEARCHFLOW_NODES_POSTPROCESS_NODES_H

#include "core/types/node.h"
#include "services/conversation_store.h"
#include "services/data_provider.h"
#include "services/report_synthesizer.h"
#include <memory>
#include <string>
#include <vector>

namespace researchflow {

// Chart data per ticker: price history, 52-week range from market_data and a
// peer comparison series from peer_valuation. Runs after the barrier.
class VisualizationNode : public Node {
public:
    explicit VisualizationNode(std::shared_ptr<MarketDataProvider> provider);

    [[nodiscard]] PartialUpdate execute(const Context& state, NodeRuntime& runtime) override;

private:
    std::shared_ptr<MarketDataProvider> provider_;
};

// Generate -> evaluate -> refine until the score reaches the threshold or the
// iteration limit. Writes report, snapshot and report_metadata.
class ReportNode : public Node {
public:
    ReportNode(std::shared_ptr<ReportSynthesizer> synthesizer, int max_iterations, double quality_threshold);

    [[nodiscard]] PartialUpdate execute(const Context& state, NodeRuntime& runtime) override;

private:
    std::shared_ptr<ReportSynthesizer> synthesizer_;
    int max_iterations_;
    double quality_threshold_;
};

// Writes quality_score and is_quality_passed for the final report.
class QualityCheckNode : public Node {
public:
    QualityCheckNode(std::shared_ptr<ReportSynthesizer> synthesizer, double quality_threshold);

    [[nodiscard]] PartialUpdate execute(const Context& state, NodeRuntime& runtime) override;

private:
    std::shared_ptr<ReportSynthesizer> synthesizer_;
    double quality_threshold_;
};

// Appends the user query and the report to the session. Never fails the run.
class MemorySaverNode : public Node {
public:
    explicit MemorySaverNode(std::shared_ptr<ConversationStore> store);

    [[nodiscard]] PartialUpdate execute(const Context& state, NodeRuntime& runtime) override;

private:
    std::shared_ptr<ConversationStore> store_;
};

// {market_data, sentiment, analyst_consensus, peer_valuation, context} -> has data
Value data_source_availability(const Context& state);

// Cuts what a synthesizer may read from the merged state.
ReportRequest make_report_request(const Context& state);

// Investor snapshot for the first ticker, or null when it has no market data.
// The rating comes from analyst consensus, upside and news sentiment:
// strong_buy, buy, hold, sell or strong_sell.
Value build_snapshot(const std::vector<std::string>& tickers, const Value& market_data,
                     const Value& sentiment, const Value& consensus);

} // namespace researchflow

#endif // RESEARCHFLOW_NODES_POSTPROCESS_NODES_H
