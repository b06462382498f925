// services/tool_data_provider.cpp
#include "services/tool_data_provider.h"
#include "core/types/errors.h"
#include <cmath>

namespace researchflow {

namespace {

double round_to(double v, int digits) {
    double f = std::pow(10.0, digits);
    return std::round(v * f) / f;
}

nlohmann::json number_or_null(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return nullptr;
    return *it;
}

} // namespace

nlohmann::json ToolDataProvider::call_object(const std::string& tool, const std::string& ticker) {
    nlohmann::json raw = registry_.call_tool(tool, {{"ticker", ticker}});
    if (raw.is_null()) return nullptr;
    if (!raw.is_object()) {
        throw ResponseShapeError(tool + " returned " + std::string(raw.type_name()) + " for " + ticker);
    }
    if (raw.empty()) return nullptr;
    return raw;
}

void ToolDataProvider::add_range_metrics(nlohmann::json& quote) {
    quote["week_52_position"] = nullptr;
    quote["distance_from_high"] = nullptr;
    quote["distance_from_low"] = nullptr;
    quote["trend_signal"] = nullptr;

    auto price = number_or_null(quote, "current_price");
    auto high = number_or_null(quote, "year_high");
    auto low = number_or_null(quote, "year_low");
    if (price.is_null() || high.is_null() || low.is_null()) return;

    double p = price.get<double>(), h = high.get<double>(), l = low.get<double>();
    if (!(h > l) || l <= 0.0 || p <= 0.0) return;

    double position = (p - l) / (h - l) * 100.0;
    quote["week_52_position"] = round_to(position, 1);
    quote["distance_from_high"] = round_to((p - h) / h * 100.0, 1);
    quote["distance_from_low"] = round_to((p - l) / l * 100.0, 1);
    if (position >= 80.0) {
        quote["trend_signal"] = "near_high";
    } else if (position <= 20.0) {
        quote["trend_signal"] = "near_low";
    } else {
        quote["trend_signal"] = "mid_range";
    }
}

nlohmann::json ToolDataProvider::fetch_quote(const std::string& ticker) {
    nlohmann::json raw = call_object("get_stock_price", ticker);
    if (raw.is_null()) return nullptr;
    if (!raw.contains("current_price")) {
        throw ResponseShapeError("quote for " + ticker + " has no current_price");
    }

    nlohmann::json quote;
    quote["ticker"] = raw.value("ticker", ticker);
    quote["current_price"] = number_or_null(raw, "current_price");
    auto change = number_or_null(raw, "change_percent");
    quote["change_percent"] = change.is_null() ? change : nlohmann::json(round_to(change.get<double>(), 2));
    quote["volume"] = number_or_null(raw, "volume");
    quote["market_cap"] = number_or_null(raw, "market_cap");
    quote["pe_ratio"] = number_or_null(raw, "pe_ratio");
    quote["year_high"] = number_or_null(raw, "52_week_high");
    quote["year_low"] = number_or_null(raw, "52_week_low");
    add_range_metrics(quote);
    return quote;
}

nlohmann::json ToolDataProvider::fetch_peer_valuation(const std::string& ticker) {
    nlohmann::json raw = call_object("get_peer_comparison", ticker);
    if (raw.is_null()) return nullptr;

    nlohmann::json peer;
    peer["ticker"] = raw.value("ticker", ticker);
    peer["sector"] = raw.value("sector", "");
    peer["industry"] = raw.value("industry", "");
    for (const char* key : {"pe_ratio", "price_to_book", "price_to_sales",
                            "sector_avg_pe", "sector_avg_pb", "sector_avg_ps",
                            "pe_premium_discount", "pb_premium_discount", "ps_premium_discount"}) {
        peer[key] = number_or_null(raw, key);
    }
    peer["peer_count"] = raw.value("peer_count", 0);
    peer["peers"] = raw.value("peers", nlohmann::json::array());
    return peer;
}

nlohmann::json ToolDataProvider::fetch_price_history(const std::string& ticker) {
    nlohmann::json raw = call_object("get_price_history", ticker);
    if (raw.is_null()) return nullptr;
    auto data = raw.find("data");
    if (data == raw.end() || !data->is_array()) {
        throw ResponseShapeError("price history for " + ticker + " has no data array");
    }
    nlohmann::json history;
    history["ticker"] = ticker;
    history["data"] = *data;
    history["summary"] = raw.value("summary", nlohmann::json::object());
    return history;
}

nlohmann::json ToolDataProvider::fetch_sentiment(const std::string& ticker) {
    nlohmann::json raw = call_object("get_sentiment", ticker);
    if (raw.is_null()) return nullptr;

    std::string overall = raw.value("overall_sentiment", raw.value("sentiment", "neutral"));
    if (overall != "positive" && overall != "negative" && overall != "neutral") {
        throw ResponseShapeError("unknown sentiment '" + overall + "' for " + ticker);
    }
    nlohmann::json s;
    s["ticker"] = ticker;
    s["overall_sentiment"] = overall;
    s["confidence"] = raw.value("confidence", 0.0);
    s["key_themes"] = raw.value("key_themes", nlohmann::json::array());
    s["summary"] = raw.value("summary", "");
    s["news_count"] = raw.value("news_count", 0);
    return s;
}

nlohmann::json ToolDataProvider::fetch_consensus(const std::string& ticker) {
    nlohmann::json raw = call_object("get_analyst_consensus", ticker);
    if (raw.is_null()) return nullptr;

    nlohmann::json c;
    c["ticker"] = ticker;
    c["target_price_mean"] = number_or_null(raw, "target_price_mean");
    c["target_price_high"] = number_or_null(raw, "target_price_high");
    c["target_price_low"] = number_or_null(raw, "target_price_low");
    c["current_price"] = number_or_null(raw, "current_price");
    c["recommendation"] = raw.value("recommendation", "");
    c["num_analysts"] = raw.value("num_analysts", 0);

    c["upside_potential"] = number_or_null(raw, "upside_potential");
    if (c["upside_potential"].is_null() && c["target_price_mean"].is_number() && c["current_price"].is_number()) {
        double target = c["target_price_mean"].get<double>();
        double price = c["current_price"].get<double>();
        if (price > 0.0) {
            c["upside_potential"] = round_to((target - price) / price * 100.0, 1);
        }
    }
    return c;
}

nlohmann::json ToolDataProvider::retrieve(const std::string& query,
                                          const std::optional<std::string>& ticker,
                                          int top_k) {
    nlohmann::json args = {{"query", query}, {"top_k", top_k}};
    if (ticker) args["ticker"] = *ticker;
    nlohmann::json raw = registry_.call_tool("search_documents", args);
    if (raw.is_null()) return nlohmann::json::array();
    if (!raw.is_array()) {
        throw ResponseShapeError("search_documents returned " + std::string(raw.type_name()));
    }
    return raw;
}

} // namespace researchflow
