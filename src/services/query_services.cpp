// services/query_services.cpp
#include "services/query_services.h"

namespace researchflow {

DispatchFlags flags_for_intent(Intent intent) {
    switch (intent) {
        case Intent::PRICE_QUERY:          return {true, false, false};
        case Intent::FUNDAMENTAL_ANALYSIS: return {true, false, true};
        case Intent::SENTIMENT_ANALYSIS:   return {true, true, false};
        case Intent::GENERAL_RESEARCH:     return {true, true, true};
        case Intent::COMPARISON:           return {true, false, true};
    }
    return {true, true, true};
}

Classification fallback_classification(const std::vector<std::string>& tickers) {
    Classification c;
    c.intent = Intent::GENERAL_RESEARCH;
    c.tickers = tickers;
    if (tickers.empty()) {
        c.flags = {false, false, true};
    } else {
        c.flags = {true, true, true};
    }
    c.reasoning = "fallback";
    return c;
}

} // namespace researchflow
