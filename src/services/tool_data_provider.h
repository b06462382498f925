// services/tool_data_provider.h
#ifndef RESEARCHFLOW_SERVICES_TOOL_DATA_PROVIDER_H
#define RESEARCHFLOW_SERVICES_TOOL_DATA_PROVIDER_H

#include "services/data_provider.h"
#include "common/tools/registry.h"

namespace researchflow {

// Implements every data provider over the named tools of a ToolRegistry and
// normalizes the raw tool payloads.
class ToolDataProvider : public MarketDataProvider,
                         public SentimentProvider,
                         public ConsensusProvider,
                         public DocumentRetriever {
public:
    explicit ToolDataProvider(const ToolRegistry& registry) : registry_(registry) {}

    nlohmann::json fetch_quote(const std::string& ticker) override;
    nlohmann::json fetch_peer_valuation(const std::string& ticker) override;
    nlohmann::json fetch_price_history(const std::string& ticker) override;
    nlohmann::json fetch_sentiment(const std::string& ticker) override;
    nlohmann::json fetch_consensus(const std::string& ticker) override;
    nlohmann::json retrieve(const std::string& query,
                            const std::optional<std::string>& ticker,
                            int top_k) override;

    // 52-week range metrics added to a quote in place. Needs current_price,
    // year_high and year_low with high > low; otherwise leaves nulls.
    static void add_range_metrics(nlohmann::json& quote);

private:
    const ToolRegistry& registry_;

    nlohmann::json call_object(const std::string& tool, const std::string& ticker);
};

} // namespace researchflow

#endif // RESEARCHFLOW_SERVICES_TOOL_DATA_PROVIDER_H
