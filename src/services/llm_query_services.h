// services/llm_query_services.h
#ifndef RESEARCHFLOW_SERVICES_LLM_QUERY_SERVICES_H
#define RESEARCHFLOW_SERVICES_LLM_QUERY_SERVICES_H

#include "services/query_services.h"
#include "common/llm/llm_client.h"
#include <memory>

namespace researchflow {

// Query services backed by a completion model. Malformed model output
// surfaces as ResponseShapeError so callers can apply their fallbacks.

class LlmQueryValidator : public QueryValidator {
public:
    explicit LlmQueryValidator(std::shared_ptr<LlmClient> llm) : llm_(std::move(llm)) {}
    ValidationResult validate(const std::string& query, std::stop_token stop = {}) override;

private:
    std::shared_ptr<LlmClient> llm_;
};

class LlmQueryOptimizer : public QueryOptimizer {
public:
    explicit LlmQueryOptimizer(std::shared_ptr<LlmClient> llm) : llm_(std::move(llm)) {}
    std::string optimize(const std::string& query, const Value& history, std::stop_token stop = {}) override;

private:
    std::shared_ptr<LlmClient> llm_;
};

class LlmIntentClassifier : public IntentClassifier {
public:
    explicit LlmIntentClassifier(std::shared_ptr<LlmClient> llm) : llm_(std::move(llm)) {}
    Classification classify(const std::string& query, const std::vector<std::string>& tickers,
                            std::stop_token stop = {}) override;

private:
    std::shared_ptr<LlmClient> llm_;
};

} // namespace researchflow

#endif // RESEARCHFLOW_SERVICES_LLM_QUERY_SERVICES_H
