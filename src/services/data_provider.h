// services/data_provider.h
#ifndef RESEARCHFLOW_SERVICES_DATA_PROVIDER_H
#define RESEARCHFLOW_SERVICES_DATA_PROVIDER_H

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace researchflow {

// Per-identifier data sources the specialist nodes fetch from.
// Each call may throw (ServiceError family); a null result means "no data".

class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;
    // {ticker, current_price, change_percent, volume, market_cap, pe_ratio,
    //  year_high, year_low, week_52_position, distance_from_high,
    //  distance_from_low, trend_signal}
    virtual nlohmann::json fetch_quote(const std::string& ticker) = 0;
    // {ticker, sector, industry, pe_ratio, price_to_book, price_to_sales,
    //  sector_avg_pe, ..., pe_premium_discount, ..., peer_count}
    virtual nlohmann::json fetch_peer_valuation(const std::string& ticker) = 0;
    // {ticker, data: [{date, close, volume}], summary: {highest, lowest, average_volume}}
    virtual nlohmann::json fetch_price_history(const std::string& ticker) = 0;
};

class SentimentProvider {
public:
    virtual ~SentimentProvider() = default;
    // {ticker, overall_sentiment, confidence, key_themes, summary, news_count}
    virtual nlohmann::json fetch_sentiment(const std::string& ticker) = 0;
};

class ConsensusProvider {
public:
    virtual ~ConsensusProvider() = default;
    // {ticker, target_price_mean/high/low, current_price, upside_potential,
    //  recommendation, num_analysts}
    virtual nlohmann::json fetch_consensus(const std::string& ticker) = 0;
};

class DocumentRetriever {
public:
    virtual ~DocumentRetriever() = default;
    // Array of {text, ticker, source, title, score}.
    virtual nlohmann::json retrieve(const std::string& query,
                                    const std::optional<std::string>& ticker,
                                    int top_k) = 0;
};

} // namespace researchflow

#endif // RESEARCHFLOW_SERVICES_DATA_PROVIDER_H
