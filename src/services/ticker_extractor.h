// services/ticker_extractor.h
#ifndef RESEARCHFLOW_SERVICES_TICKER_EXTRACTOR_H
#define RESEARCHFLOW_SERVICES_TICKER_EXTRACTOR_H

#include <map>
#include <set>
#include <string>
#include <vector>

namespace researchflow {

// Finds stock identifiers in free text: upper-case 1-5 letter tokens that are
// known tickers, plus company names from an alias table. Result is sorted
// and free of duplicates.
class TickerExtractor {
public:
    TickerExtractor();
    TickerExtractor(std::set<std::string> known_tickers, std::map<std::string, std::string> aliases);

    std::vector<std::string> extract(const std::string& text) const;

    void add_alias(const std::string& name, const std::string& ticker);

private:
    std::set<std::string> known_;
    std::map<std::string, std::string> aliases_; // lower-case name -> ticker
};

} // namespace researchflow

#endif // RESEARCHFLOW_SERVICES_TICKER_EXTRACTOR_H
