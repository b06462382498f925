// services/rule_query_services.cpp
#include "services/rule_query_services.h"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <sstream>

namespace researchflow {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains_any(const std::string& haystack, std::initializer_list<const char*> needles) {
    return std::any_of(needles.begin(), needles.end(),
                       [&haystack](const char* n) { return haystack.find(n) != std::string::npos; });
}

} // namespace

ValidationResult RuleQueryValidator::validate(const std::string& query, std::stop_token) {
    auto first = std::find_if_not(query.begin(), query.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    if (first == query.end()) {
        return {false, "Query is empty"};
    }
    if (query.size() > max_length_) {
        return {false, "Query is longer than " + std::to_string(max_length_) + " characters"};
    }
    bool has_alpha = std::any_of(query.begin(), query.end(),
                                 [](unsigned char c) { return std::isalpha(c) || c >= 0x80; });
    if (!has_alpha) {
        return {false, "Query contains no words"};
    }
    return {true, ""};
}

std::string RuleQueryOptimizer::optimize(const std::string& query, const Value& /*history*/, std::stop_token) {
    std::istringstream in(query);
    std::string word, out;
    while (in >> word) {
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

Classification RuleIntentClassifier::classify(const std::string& query, const std::vector<std::string>& tickers,
                                              std::stop_token) {
    const std::string q = to_lower(query);
    Intent intent = Intent::GENERAL_RESEARCH;

    if (tickers.size() > 1 || contains_any(q, {"compare", " vs ", " vs.", "versus", "peer"})) {
        intent = Intent::COMPARISON;
    } else if (contains_any(q, {"sentiment", "news", "opinion", "feel about", "buzz"})) {
        intent = Intent::SENTIMENT_ANALYSIS;
    } else if (contains_any(q, {"p/e", "valuation", "fundamental", "earnings", "revenue", "margin", "balance sheet"})) {
        intent = Intent::FUNDAMENTAL_ANALYSIS;
    } else if (contains_any(q, {"price", "quote", "trading at", "how much is", "stock value"})) {
        intent = Intent::PRICE_QUERY;
    }

    Classification c;
    c.intent = intent;
    c.flags = flags_for_intent(intent);
    if (tickers.empty()) {
        // nothing to fetch per identifier; semantic search instead
        c.flags.context = true;
    }
    c.tickers = tickers;
    c.reasoning = "keyword rules";
    return c;
}

} // namespace researchflow
