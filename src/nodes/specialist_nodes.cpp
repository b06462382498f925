// nodes/specialist_nodes.cpp
#include "nodes/specialist_nodes.h"
#include "nodes/fetch_helpers.h"
#include "modules/context/state_schema.h"
#include <optional>
#include <stdexcept>

namespace researchflow {

namespace {

// Adds `errors` to the update only when something failed.
PartialUpdate with_errors(PartialUpdate update, const Value& errors) {
    if (!errors.empty()) update[fields::ERRORS] = errors;
    return update;
}

} // namespace

// ————————————————————————
// MarketDataNode
// ————————————————————————

MarketDataNode::MarketDataNode(std::shared_ptr<MarketDataProvider> provider)
    : Node(NodeId::MARKET_DATA), provider_(std::move(provider)) {
    if (!provider_) throw std::invalid_argument("MarketDataNode requires a market data provider");
}

PartialUpdate MarketDataNode::execute(const Context& state, NodeRuntime& runtime) {
    const auto tickers = StateView(state).tickers();
    Value quotes = Value::array();
    Value peers = Value::array();
    Value errors = Value::array();

    for (const auto& ticker : tickers) {
        Value quote = fetch_for_ticker(runtime, name(), "quote", ticker,
                                       [this](const std::string& t) { return provider_->fetch_quote(t); }, errors);
        if (!quote.is_null()) {
            runtime.trace.add_step("Quote for " + ticker + ": " + quote["current_price"].dump());
            quotes.push_back(std::move(quote));
        }

        Value peer = fetch_for_ticker(runtime, name(), "peer valuation", ticker,
                                      [this](const std::string& t) { return provider_->fetch_peer_valuation(t); }, errors);
        if (!peer.is_null()) {
            runtime.trace.add_step("Peer valuation for " + ticker + " against " +
                                   peer.value("peer_count", Value(0)).dump() + " peers");
            peers.push_back(std::move(peer));
        }
    }

    logging::get()->info("Market data: {}/{} quotes, {} peer valuations", quotes.size(), tickers.size(), peers.size());
    return with_errors({{fields::MARKET_DATA, quotes}, {fields::PEER_VALUATION, peers}}, errors);
}

// ————————————————————————
// SentimentNode
// ————————————————————————

SentimentNode::SentimentNode(std::shared_ptr<SentimentProvider> provider)
    : Node(NodeId::SENTIMENT), provider_(std::move(provider)) {
    if (!provider_) throw std::invalid_argument("SentimentNode requires a sentiment provider");
}

PartialUpdate SentimentNode::execute(const Context& state, NodeRuntime& runtime) {
    const auto tickers = StateView(state).tickers();
    Value results = Value::array();
    Value errors = Value::array();

    for (const auto& ticker : tickers) {
        Value s = fetch_for_ticker(runtime, name(), "sentiment", ticker,
                                   [this](const std::string& t) { return provider_->fetch_sentiment(t); }, errors);
        if (s.is_null()) continue;
        runtime.trace.add_step("Sentiment for " + ticker + ": " + s.value("overall_sentiment", "neutral"));
        results.push_back(std::move(s));
    }

    logging::get()->info("Sentiment: {}/{} tickers analysed", results.size(), tickers.size());
    return with_errors({{fields::SENTIMENT_ANALYSIS, results}}, errors);
}

// ————————————————————————
// ForwardLookingNode
// ————————————————————————

ForwardLookingNode::ForwardLookingNode(std::shared_ptr<ConsensusProvider> provider)
    : Node(NodeId::FORWARD_LOOKING), provider_(std::move(provider)) {
    if (!provider_) throw std::invalid_argument("ForwardLookingNode requires a consensus provider");
}

PartialUpdate ForwardLookingNode::execute(const Context& state, NodeRuntime& runtime) {
    const auto tickers = StateView(state).tickers();
    Value results = Value::array();
    Value errors = Value::array();

    for (const auto& ticker : tickers) {
        Value c = fetch_for_ticker(runtime, name(), "analyst consensus", ticker,
                                   [this](const std::string& t) { return provider_->fetch_consensus(t); }, errors);
        if (c.is_null()) continue;
        runtime.trace.add_step("Consensus for " + ticker + ": " + c.value("recommendation", "n/a") +
                               ", upside " + c["upside_potential"].dump());
        results.push_back(std::move(c));
    }

    logging::get()->info("Forward looking: {}/{} consensus records", results.size(), tickers.size());
    return with_errors({{fields::ANALYST_CONSENSUS, results}}, errors);
}

// ————————————————————————
// RagRetrievalNode
// ————————————————————————

RagRetrievalNode::RagRetrievalNode(std::shared_ptr<DocumentRetriever> retriever, int top_k)
    : Node(NodeId::RAG_RETRIEVAL), retriever_(std::move(retriever)), top_k_(top_k) {
    if (!retriever_) throw std::invalid_argument("RagRetrievalNode requires a document retriever");
}

PartialUpdate RagRetrievalNode::execute(const Context& state, NodeRuntime& runtime) {
    StateView view(state);
    const std::string query = view.effective_query();
    if (query.empty()) {
        logging::get()->warn("No query specified, skipping RAG retrieval");
        return {{fields::RETRIEVED_CONTEXT, Value::array()}};
    }

    const auto tickers = view.tickers();
    std::optional<std::string> ticker;
    if (!tickers.empty()) ticker = tickers.front();
    runtime.trace.add_step(ticker ? "Searching documents for " + *ticker
                                  : std::string("Searching all documents"));

    // transient failures are retried by the envelope
    Value hits = retriever_->retrieve(query, ticker, top_k_);

    Value retrieved = Value::array();
    for (const auto& hit : hits) {
        if (!hit.is_object()) continue;
        retrieved.push_back({
            {"text", hit.value("text", "")},
            {"source", hit.value("source", "unknown")},
            {"ticker", hit.value("ticker", ticker.value_or("N/A"))},
            {"title", hit.value("title", "")},
            {"similarity", hit.value("score", hit.value("similarity", 0.0))}
        });
    }

    logging::get()->info("Retrieved {} context documents", retrieved.size());
    runtime.trace.add_step("Retrieved " + std::to_string(retrieved.size()) + " documents");
    return {{fields::RETRIEVED_CONTEXT, retrieved}};
}

} // namespace researchflow
