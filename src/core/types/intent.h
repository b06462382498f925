#ifndef RESEARCHFLOW_TYPES_INTENT_H
#define RESEARCHFLOW_TYPES_INTENT_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace researchflow {

enum class Intent : uint8_t {
    PRICE_QUERY,
    FUNDAMENTAL_ANALYSIS,
    SENTIMENT_ANALYSIS,
    GENERAL_RESEARCH,
    COMPARISON
};

inline std::string to_string(Intent intent) {
    switch (intent) {
        case Intent::PRICE_QUERY: return "price_query";
        case Intent::FUNDAMENTAL_ANALYSIS: return "fundamental_analysis";
        case Intent::SENTIMENT_ANALYSIS: return "sentiment_analysis";
        case Intent::GENERAL_RESEARCH: return "general_research";
        case Intent::COMPARISON: return "comparison";
    }
    return "general_research";
}

inline std::optional<Intent> intent_from_string(std::string_view s) {
    if (s == "price_query") return Intent::PRICE_QUERY;
    if (s == "fundamental_analysis") return Intent::FUNDAMENTAL_ANALYSIS;
    if (s == "sentiment_analysis") return Intent::SENTIMENT_ANALYSIS;
    if (s == "general_research") return Intent::GENERAL_RESEARCH;
    if (s == "comparison") return Intent::COMPARISON;
    return std::nullopt;
}

// Which specialists the intent classifier asks for.
struct DispatchFlags {
    bool market_data = false;
    bool sentiment = false;
    bool context = false;

    bool operator==(const DispatchFlags&) const = default;
};

} // namespace researchflow

#endif // RESEARCHFLOW_TYPES_INTENT_H
