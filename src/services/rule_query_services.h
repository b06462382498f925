// services/rule_query_services.h
#ifndef RESEARCHFLOW_SERVICES_RULE_QUERY_SERVICES_H
#define RESEARCHFLOW_SERVICES_RULE_QUERY_SERVICES_H

#include "services/query_services.h"
#include <cstddef>

namespace researchflow {

// Keyword-based services used when no model is configured.

class RuleQueryValidator : public QueryValidator {
public:
    explicit RuleQueryValidator(std::size_t max_length = 2000) : max_length_(max_length) {}
    ValidationResult validate(const std::string& query, std::stop_token stop = {}) override;

private:
    std::size_t max_length_;
};

// Whitespace cleanup only.
class RuleQueryOptimizer : public QueryOptimizer {
public:
    std::string optimize(const std::string& query, const Value& history, std::stop_token stop = {}) override;
};

class RuleIntentClassifier : public IntentClassifier {
public:
    Classification classify(const std::string& query, const std::vector<std::string>& tickers,
                            std::stop_token stop = {}) override;
};

} // namespace researchflow

#endif // RESEARCHFLOW_SERVICES_RULE_QUERY_SERVICES_H
