// nodes/preprocess_nodes.cpp
#include "nodes/preprocess_nodes.h"
#include "modules/context/state_schema.h"
#include "modules/executor/retry_policy.h"
#include "modules/trace/execution_trace.h"
#include "common/utils/logging.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace researchflow {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out.empty() ? "none" : out;
}

} // namespace

// ————————————————————————
// ValidationNode
// ————————————————————————

ValidationNode::ValidationNode(std::shared_ptr<QueryValidator> validator)
    : Node(NodeId::VALIDATION), validator_(std::move(validator)) {
    if (!validator_) {
        throw std::invalid_argument("ValidationNode requires a query validator");
    }
}

PartialUpdate ValidationNode::execute(const Context& state, NodeRuntime& runtime) {
    StateView view(state);
    const std::string query = view.user_query();

    if (is_blank(query)) {
        runtime.trace.add_step("Empty query rejected");
        return {{fields::IS_QUERY_VALID, false}, {fields::VALIDATION_REASON, "Empty query"}};
    }

    ValidationResult result;
    try {
        result = retry_call(runtime.retry, runtime.budget,
                            [&] { return validator_->validate(query, runtime.budget.token()); }, nullptr, "query validation");
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        // fail open: the router still has its fallback rules
        logging::get()->warn("Validation service failed, treating query as valid: {}", e.what());
        runtime.trace.add_step(std::string("Validation unavailable, query accepted: ") + e.what());
        return {{fields::IS_QUERY_VALID, true},
                {fields::VALIDATION_REASON, std::string("validation unavailable: ") + e.what()}};
    }

    logging::get()->info("Input validation result: {}", result.valid ? "VALID" : "INVALID");
    runtime.trace.add_step(std::string("Query judged ") + (result.valid ? "valid" : "invalid") +
                           (result.reason.empty() ? "" : ": " + result.reason));
    return {{fields::IS_QUERY_VALID, result.valid}, {fields::VALIDATION_REASON, result.reason}};
}

// ————————————————————————
// QueryOptimizationNode
// ————————————————————————

QueryOptimizationNode::QueryOptimizationNode(std::shared_ptr<QueryOptimizer> optimizer)
    : Node(NodeId::QUERY_OPTIMIZATION), optimizer_(std::move(optimizer)) {
    if (!optimizer_) {
        throw std::invalid_argument("QueryOptimizationNode requires a query optimizer");
    }
}

PartialUpdate QueryOptimizationNode::execute(const Context& state, NodeRuntime& runtime) {
    StateView view(state);
    const std::string query = view.user_query();

    if (!view.is_query_valid()) {
        logging::get()->info("Query is invalid, skipping optimization");
        runtime.trace.add_step("Skipped: query is invalid");
        return {{fields::FINAL_QUERY, query}};
    }

    std::string optimized;
    try {
        optimized = retry_call(runtime.retry, runtime.budget,
                               [&] { return optimizer_->optimize(query, view.field(fields::CONVERSATION_HISTORY), runtime.budget.token()); },
                               nullptr, "query optimization");
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        logging::get()->error("Query optimization failed, using original query: {}", e.what());
        runtime.trace.add_step(std::string("Optimization failed, original query kept: ") + e.what());
        return {{fields::FINAL_QUERY, query}};
    }

    if (is_blank(optimized)) {
        runtime.trace.add_step("Optimizer returned nothing, original query kept");
        return {{fields::FINAL_QUERY, query}};
    }

    logging::get()->info("Query optimized: '{}' -> '{}'", query, optimized);
    runtime.trace.add_step("Query refined to: " + optimized);
    return {{fields::FINAL_QUERY, optimized}};
}

// ————————————————————————
// MemoryLoaderNode
// ————————————————————————

MemoryLoaderNode::MemoryLoaderNode(std::shared_ptr<ConversationStore> store, int limit)
    : Node(NodeId::MEMORY_LOADER), store_(std::move(store)), limit_(limit) {
    if (!store_) {
        throw std::invalid_argument("MemoryLoaderNode requires a conversation store");
    }
}

PartialUpdate MemoryLoaderNode::execute(const Context& state, NodeRuntime& runtime) {
    StateView view(state);
    const std::string session_id = view.session_id();

    Value messages;
    try {
        messages = retry_call(runtime.retry, runtime.budget,
                              [&] { return store_->load(session_id, limit_); }, nullptr, "history load");
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        logging::get()->warn("Failed to load conversation history: {}", e.what());
        runtime.trace.add_step(std::string("History unavailable: ") + e.what());
        return PartialUpdate::object();
    }

    const std::size_t count = messages.is_array() ? messages.size() : 0;
    logging::get()->info("Loaded {} historical messages for session {}", count, session_id);
    runtime.trace.add_step("Loaded " + std::to_string(count) + " historical messages");
    if (count == 0) {
        return PartialUpdate::object();
    }
    return {{fields::CONVERSATION_HISTORY, messages}};
}

// ————————————————————————
// IntentNode
// ————————————————————————

IntentNode::IntentNode(std::shared_ptr<TickerExtractor> extractor, std::shared_ptr<IntentClassifier> classifier)
    : Node(NodeId::INTENT), extractor_(std::move(extractor)), classifier_(std::move(classifier)) {
    if (!extractor_ || !classifier_) {
        throw std::invalid_argument("IntentNode requires a ticker extractor and an intent classifier");
    }
}

PartialUpdate IntentNode::execute(const Context& state, NodeRuntime& runtime) {
    StateView view(state);
    const std::string query = view.effective_query();

    // 用户原始问题与优化后的问题都参与代码识别
    std::string text = view.user_query();
    if (query != text) text += "\n" + query;
    std::vector<std::string> tickers = extractor_->extract(text);
    runtime.trace.add_step("Identifiers extracted: " + join(tickers));

    Classification c;
    if (!view.is_query_valid()) {
        c.tickers = tickers;
        c.reasoning = "query invalid, nothing to classify";
        runtime.trace.add_step("Skipped classification: query is invalid");
    } else {
        try {
            c = retry_call(runtime.retry, runtime.budget,
                           [&] { return classifier_->classify(query, tickers, runtime.budget.token()); }, nullptr, "intent classification");
            if (c.tickers.empty()) c.tickers = tickers;
        } catch (const CancelledError&) {
            throw;
        } catch (const std::exception& e) {
            logging::get()->warn("Intent classification failed, using fallback dispatch: {}", e.what());
            runtime.trace.add_step(std::string("Classification failed, fallback used: ") + e.what());
            c = fallback_classification(tickers);
        }
    }

    logging::get()->info("Intent: {}, tickers: [{}], flags: market={} sentiment={} context={}",
                         to_string(c.intent), join(c.tickers),
                         c.flags.market_data, c.flags.sentiment, c.flags.context);
    runtime.trace.add_step("Intent " + to_string(c.intent) +
                           (c.reasoning.empty() ? "" : " (" + c.reasoning + ")"));

    return {
        {fields::INTENT, to_string(c.intent)},
        {fields::TICKERS, c.tickers},
        {fields::SHOULD_FETCH_MARKET_DATA, c.flags.market_data},
        {fields::SHOULD_ANALYZE_SENTIMENT, c.flags.sentiment},
        {fields::SHOULD_RETRIEVE_CONTEXT, c.flags.context}
    };
}

} // namespace researchflow
