// services/ticker_extractor.cpp
#include "services/ticker_extractor.h"
#include <algorithm>
#include <cctype>
#include <regex>

namespace researchflow {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// whole-word, case-insensitive
bool contains_phrase(const std::string& lower_text, const std::string& phrase) {
    std::size_t pos = 0;
    while ((pos = lower_text.find(phrase, pos)) != std::string::npos) {
        bool left_ok = pos == 0 || !is_word_char(lower_text[pos - 1]);
        std::size_t end = pos + phrase.size();
        bool right_ok = end >= lower_text.size() || !is_word_char(lower_text[end]);
        if (left_ok && right_ok) return true;
        ++pos;
    }
    return false;
}

} // namespace

TickerExtractor::TickerExtractor()
    : TickerExtractor(
          {"AAPL", "MSFT", "GOOGL", "AMZN", "TSLA", "META", "NVDA",
           "JPM", "V", "WMT", "JNJ", "PG", "MA", "UNH", "HD", "DIS"},
          {{"apple", "AAPL"}, {"microsoft", "MSFT"}, {"google", "GOOGL"}, {"alphabet", "GOOGL"},
           {"amazon", "AMZN"}, {"tesla", "TSLA"}, {"meta", "META"}, {"facebook", "META"},
           {"nvidia", "NVDA"}, {"jpmorgan", "JPM"}, {"jp morgan", "JPM"}, {"visa", "V"},
           {"walmart", "WMT"}, {"johnson & johnson", "JNJ"}, {"j&j", "JNJ"},
           {"procter & gamble", "PG"}, {"procter and gamble", "PG"}, {"mastercard", "MA"},
           {"unitedhealth", "UNH"}, {"home depot", "HD"}, {"disney", "DIS"}}) {}

TickerExtractor::TickerExtractor(std::set<std::string> known_tickers, std::map<std::string, std::string> aliases)
    : known_(std::move(known_tickers)) {
    for (const auto& [name, ticker] : aliases) {
        add_alias(name, ticker);
    }
}

void TickerExtractor::add_alias(const std::string& name, const std::string& ticker) {
    aliases_[to_lower(name)] = ticker;
}

std::vector<std::string> TickerExtractor::extract(const std::string& text) const {
    static const std::regex kTickerPattern(R"(\b([A-Z]{1,5})\b)");
    std::set<std::string> found;

    for (auto it = std::sregex_iterator(text.begin(), text.end(), kTickerPattern);
         it != std::sregex_iterator(); ++it) {
        std::string token = (*it)[1].str();
        if (known_.count(token)) found.insert(token);
    }

    const std::string lower = to_lower(text);
    for (const auto& [name, ticker] : aliases_) {
        if (contains_phrase(lower, name)) found.insert(ticker);
    }
    return {found.begin(), found.end()};
}

} // namespace researchflow
