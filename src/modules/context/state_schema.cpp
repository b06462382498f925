// modules/context/state_schema.cpp
#include "modules/context/state_schema.h"
#include "core/types/errors.h"
#include <algorithm>

namespace researchflow {

const char* to_string(MergePolicy policy) {
    switch (policy) {
        case MergePolicy::SET_ONCE: return "set_once";
        case MergePolicy::OVERWRITE: return "overwrite";
        case MergePolicy::APPEND: return "append";
        case MergePolicy::UNION: return "union";
    }
    return "unknown";
}

StateSchema::StateSchema() {
    const Value empty_list = Value::array();
    const Value empty_map = Value::object();

    fields_ = {
        {fields::RUN_ID, MergePolicy::SET_ONCE, ""},
        {fields::SESSION_ID, MergePolicy::SET_ONCE, ""},
        {fields::USER_QUERY, MergePolicy::SET_ONCE, ""},
        {fields::TIMESTAMP, MergePolicy::SET_ONCE, ""},
        {fields::CONVERSATION_HISTORY, MergePolicy::SET_ONCE, empty_list},

        {fields::IS_QUERY_VALID, MergePolicy::OVERWRITE, true},
        {fields::VALIDATION_REASON, MergePolicy::OVERWRITE, ""},
        {fields::FINAL_QUERY, MergePolicy::OVERWRITE, ""},
        {fields::INTENT, MergePolicy::OVERWRITE, to_string(Intent::GENERAL_RESEARCH)},
        {fields::TICKERS, MergePolicy::OVERWRITE, empty_list},
        {fields::SHOULD_FETCH_MARKET_DATA, MergePolicy::OVERWRITE, false},
        {fields::SHOULD_ANALYZE_SENTIMENT, MergePolicy::OVERWRITE, false},
        {fields::SHOULD_RETRIEVE_CONTEXT, MergePolicy::OVERWRITE, false},

        {fields::EXECUTED_AGENTS, MergePolicy::APPEND, empty_list},
        {fields::ERRORS, MergePolicy::APPEND, empty_list},
        {fields::MARKET_DATA, MergePolicy::APPEND, empty_list},
        {fields::PEER_VALUATION, MergePolicy::APPEND, empty_list},
        {fields::SENTIMENT_ANALYSIS, MergePolicy::APPEND, empty_list},
        {fields::ANALYST_CONSENSUS, MergePolicy::APPEND, empty_list},
        {fields::RETRIEVED_CONTEXT, MergePolicy::APPEND, empty_list},
        {fields::VISUALIZATION_DATA, MergePolicy::APPEND, empty_list},

        {fields::AGENT_ERRORS, MergePolicy::UNION, empty_map},
        {fields::AGENT_METRICS, MergePolicy::UNION, empty_map},
        {fields::REASONING_CHAINS, MergePolicy::UNION, empty_map},

        {fields::REPORT, MergePolicy::OVERWRITE, ""},
        {fields::SNAPSHOT, MergePolicy::OVERWRITE, nullptr},
        {fields::REPORT_METADATA, MergePolicy::OVERWRITE, nullptr},
        {fields::QUALITY_SCORE, MergePolicy::OVERWRITE, nullptr},
        {fields::IS_QUALITY_PASSED, MergePolicy::OVERWRITE, nullptr},
    };
}

const StateSchema& StateSchema::instance() {
    static const StateSchema schema;
    return schema;
}

const FieldSpec* StateSchema::find(std::string_view name) const {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [name](const FieldSpec& f) { return f.name == name; });
    return it == fields_.end() ? nullptr : &*it;
}

MergePolicy StateSchema::policy_of(std::string_view name) const {
    const FieldSpec* spec = find(name);
    if (!spec) {
        throw StateMergeError("Unknown state field: " + std::string(name));
    }
    return spec->policy;
}

Context StateSchema::make_initial_state(const std::string& run_id,
                                        const std::string& session_id,
                                        const std::string& user_query,
                                        const std::string& timestamp) const {
    Context state = Context::object();
    for (const auto& f : fields_) {
        state[f.name] = f.identity;
    }
    state[fields::RUN_ID] = run_id;
    state[fields::SESSION_ID] = session_id;
    state[fields::USER_QUERY] = user_query;
    state[fields::TIMESTAMP] = timestamp;
    return state;
}

void StateSchema::validate_update(const PartialUpdate& update) const {
    if (update.is_null()) return;
    if (!update.is_object()) {
        throw StateMergeError("Partial update must be an object, got: " + std::string(update.type_name()));
    }
    for (auto it = update.begin(); it != update.end(); ++it) {
        const FieldSpec* spec = find(it.key());
        if (!spec) {
            throw StateMergeError("Unknown state field in update: " + it.key());
        }
        if (spec->policy == MergePolicy::APPEND && !it.value().is_array()) {
            throw StateMergeError("Field '" + it.key() + "' is append-list, update must be an array");
        }
        if (spec->policy == MergePolicy::UNION && !it.value().is_object()) {
            throw StateMergeError("Field '" + it.key() + "' is union-map, update must be an object");
        }
    }
}

// --- StateView ---

std::string StateView::string_or(const char* key, const std::string& fallback) const {
    auto it = state_.find(key);
    if (it == state_.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

bool StateView::bool_or(const char* key, bool fallback) const {
    auto it = state_.find(key);
    if (it == state_.end() || !it->is_boolean()) return fallback;
    return it->get<bool>();
}

std::string StateView::effective_query() const {
    std::string refined = string_or(fields::FINAL_QUERY, "");
    return refined.empty() ? user_query() : refined;
}

Intent StateView::intent() const {
    return intent_from_string(string_or(fields::INTENT, "")).value_or(Intent::GENERAL_RESEARCH);
}

std::vector<std::string> StateView::tickers() const {
    std::vector<std::string> out;
    auto it = state_.find(fields::TICKERS);
    if (it == state_.end() || !it->is_array()) return out;
    for (const auto& t : *it) {
        if (t.is_string()) out.push_back(t.get<std::string>());
    }
    return out;
}

DispatchFlags StateView::dispatch_flags() const {
    DispatchFlags flags;
    flags.market_data = bool_or(fields::SHOULD_FETCH_MARKET_DATA, false);
    flags.sentiment = bool_or(fields::SHOULD_ANALYZE_SENTIMENT, false);
    flags.context = bool_or(fields::SHOULD_RETRIEVE_CONTEXT, false);
    return flags;
}

const Value& StateView::field(std::string_view name) const {
    static const Value null_value;
    auto it = state_.find(std::string(name));
    return it == state_.end() ? null_value : *it;
}

bool StateView::has_entries(std::string_view name) const {
    const Value& v = field(name);
    return (v.is_array() || v.is_object()) && !v.empty();
}

bool StateView::node_failed(std::string_view node) const {
    const Value& errors = field(fields::AGENT_ERRORS);
    return errors.is_object() && errors.contains(std::string(node));
}

} // namespace researchflow
