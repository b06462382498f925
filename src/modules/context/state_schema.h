// modules/context/state_schema.h
#ifndef RESEARCHFLOW_MODULES_CONTEXT_STATE_SCHEMA_H
#define RESEARCHFLOW_MODULES_CONTEXT_STATE_SCHEMA_H

#include "core/types/context.h"
#include "core/types/intent.h"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace researchflow {

// 合并策略
enum class MergePolicy : uint8_t {
    SET_ONCE,  // identity fields: written while still at identity, never changed after
    OVERWRITE, // last writer wins for the whole field
    APPEND,    // concatenate arrays
    UNION      // shallow object merge, later write wins per key
};

const char* to_string(MergePolicy policy);

namespace fields {
// identity
inline constexpr const char* RUN_ID = "run_id";
inline constexpr const char* SESSION_ID = "session_id";
inline constexpr const char* USER_QUERY = "user_query";
inline constexpr const char* TIMESTAMP = "timestamp";
inline constexpr const char* CONVERSATION_HISTORY = "conversation_history";
// routing
inline constexpr const char* IS_QUERY_VALID = "is_query_valid";
inline constexpr const char* VALIDATION_REASON = "validation_reason";
inline constexpr const char* FINAL_QUERY = "final_query";
inline constexpr const char* INTENT = "intent";
inline constexpr const char* TICKERS = "tickers";
inline constexpr const char* SHOULD_FETCH_MARKET_DATA = "should_fetch_market_data";
inline constexpr const char* SHOULD_ANALYZE_SENTIMENT = "should_analyze_sentiment";
inline constexpr const char* SHOULD_RETRIEVE_CONTEXT = "should_retrieve_context";
// accumulators
inline constexpr const char* EXECUTED_AGENTS = "executed_agents";
inline constexpr const char* ERRORS = "errors";
inline constexpr const char* MARKET_DATA = "market_data";
inline constexpr const char* PEER_VALUATION = "peer_valuation";
inline constexpr const char* SENTIMENT_ANALYSIS = "sentiment_analysis";
inline constexpr const char* ANALYST_CONSENSUS = "analyst_consensus";
inline constexpr const char* RETRIEVED_CONTEXT = "retrieved_context";
inline constexpr const char* VISUALIZATION_DATA = "visualization_data";
inline constexpr const char* AGENT_ERRORS = "agent_errors";
inline constexpr const char* AGENT_METRICS = "agent_metrics";
inline constexpr const char* REASONING_CHAINS = "reasoning_chains";
// terminal
inline constexpr const char* REPORT = "report";
inline constexpr const char* SNAPSHOT = "snapshot";
inline constexpr const char* REPORT_METADATA = "report_metadata";
inline constexpr const char* QUALITY_SCORE = "quality_score";
inline constexpr const char* IS_QUALITY_PASSED = "is_quality_passed";
} // namespace fields

struct FieldSpec {
    std::string name;
    MergePolicy policy;
    Value identity; // merge identity; every run starts with this value
};

class StateSchema {
public:
    static const StateSchema& instance();

    const std::vector<FieldSpec>& fields() const { return fields_; }

    // nullptr for unknown fields
    const FieldSpec* find(std::string_view name) const;

    // Throws StateMergeError on unknown field.
    MergePolicy policy_of(std::string_view name) const;

    Context make_initial_state(const std::string& run_id,
                               const std::string& session_id,
                               const std::string& user_query,
                               const std::string& timestamp) const;

    // Throws StateMergeError if the update names an unknown field or
    // an accumulator field has the wrong JSON shape.
    void validate_update(const PartialUpdate& update) const;

private:
    StateSchema();
    std::vector<FieldSpec> fields_;
};

// Typed read access to a state snapshot.
class StateView {
public:
    explicit StateView(const Context& state) : state_(state) {}

    std::string run_id() const { return string_or(fields::RUN_ID, ""); }
    std::string session_id() const { return string_or(fields::SESSION_ID, ""); }
    std::string user_query() const { return string_or(fields::USER_QUERY, ""); }
    // Refined query when the optimizer produced one, else the user query.
    std::string effective_query() const;

    bool is_query_valid() const { return bool_or(fields::IS_QUERY_VALID, true); }
    Intent intent() const;
    std::vector<std::string> tickers() const;
    DispatchFlags dispatch_flags() const;

    const Value& field(std::string_view name) const;
    bool has_entries(std::string_view name) const;
    bool node_failed(std::string_view node) const;

private:
    std::string string_or(const char* key, const std::string& fallback) const;
    bool bool_or(const char* key, bool fallback) const;

    const Context& state_;
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_CONTEXT_STATE_SCHEMA_H
