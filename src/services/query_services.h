// services/query_services.h
#ifndef RESEARCHFLOW_SERVICES_QUERY_SERVICES_H
#define RESEARCHFLOW_SERVICES_QUERY_SERVICES_H

#include "core/types/context.h"
#include "core/types/intent.h"
#include <stop_token>
#include <string>
#include <vector>

namespace researchflow {

struct ValidationResult {
    bool valid = true;
    std::string reason;
};

struct Classification {
    Intent intent = Intent::GENERAL_RESEARCH;
    DispatchFlags flags;
    std::vector<std::string> tickers;
    std::string reasoning;
};

class QueryValidator {
public:
    virtual ~QueryValidator() = default;
    virtual ValidationResult validate(const std::string& query, std::stop_token stop = {}) = 0;
};

class QueryOptimizer {
public:
    virtual ~QueryOptimizer() = default;
    // `history` is the conversation_history array, oldest first.
    virtual std::string optimize(const std::string& query, const Value& history, std::stop_token stop = {}) = 0;
};

class IntentClassifier {
public:
    virtual ~IntentClassifier() = default;
    // `tickers` were already extracted deterministically; an implementation
    // may return a refined list.
    virtual Classification classify(const std::string& query, const std::vector<std::string>& tickers,
                                    std::stop_token stop = {}) = 0;
};

// Flags each intent asks for.
DispatchFlags flags_for_intent(Intent intent);

// What the intent node uses when classification fails: everything when
// identifiers exist, document retrieval alone otherwise.
Classification fallback_classification(const std::vector<std::string>& tickers);

} // namespace researchflow

#endif // RESEARCHFLOW_SERVICES_QUERY_SERVICES_H
