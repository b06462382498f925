// common/tools/fixture_tools.h
#ifndef RESEARCHFLOW_COMMON_TOOLS_FIXTURE_TOOLS_H
#define RESEARCHFLOW_COMMON_TOOLS_FIXTURE_TOOLS_H

#include "common/tools/registry.h"
#include <nlohmann/json.hpp>
#include <string>

namespace researchflow {

// Registers the market data tools over a JSON fixture document:
//
//   get_stock_price       {ticker}              <- quotes.<TICKER>
//   get_peer_comparison   {ticker}              <- peers.<TICKER>
//   get_price_history     {ticker}              <- price_history.<TICKER>
//   get_analyst_consensus {ticker}              <- consensus.<TICKER>
//   get_sentiment         {ticker}              <- sentiment.<TICKER>
//   search_documents      {query, ticker?, top_k} <- documents[]
//
// A missing entry returns null. An entry of the form
//   {"error": {"kind": "timeout", "message": "...", "fail_times": 2}, "data": {...}}
// raises the matching error; with fail_times it raises that many times and
// then returns "data". Kinds: timeout, connection, rate_limit, unavailable,
// auth, permission, invalid, shape.
void register_fixture_tools(ToolRegistry& registry, nlohmann::json fixtures);

// Throws ConfigError when the file cannot be read or is not valid JSON.
nlohmann::json load_fixture_file(const std::string& path);

} // namespace researchflow

#endif // RESEARCHFLOW_COMMON_TOOLS_FIXTURE_TOOLS_H
