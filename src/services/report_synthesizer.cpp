// services/report_synthesizer.cpp
#include "services/report_synthesizer.h"

namespace researchflow {

std::string select_report_template(Intent intent) {
    switch (intent) {
        case Intent::PRICE_QUERY: return "brief_market";
        case Intent::SENTIMENT_ANALYSIS: return "sentiment_focused";
        case Intent::COMPARISON: return "peer_comparison";
        case Intent::FUNDAMENTAL_ANALYSIS:
        case Intent::GENERAL_RESEARCH:
            return "comprehensive";
    }
    return "comprehensive";
}

} // namespace researchflow
