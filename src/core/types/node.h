#ifndef RESEARCHFLOW_TYPES_NODE_H
#define RESEARCHFLOW_TYPES_NODE_H

#include "context.h"
#include "errors.h"
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace researchflow {

// Closed set of workflow nodes. Declaration order is the canonical order
// used when merging one barrier generation.
enum class NodeId : uint8_t {
    VALIDATION,
    QUERY_OPTIMIZATION,
    MEMORY_LOADER,
    INTENT,
    MARKET_DATA,
    SENTIMENT,
    FORWARD_LOOKING,
    RAG_RETRIEVAL,
    AGGREGATOR,
    VISUALIZATION,
    REPORT,
    QUALITY_CHECK,
    MEMORY_SAVER
};

inline constexpr std::size_t kNodeCount = 13;

inline constexpr std::array<std::string_view, kNodeCount> kNodeNames = {
    "validation",
    "query_optimization",
    "memory_loader",
    "intent",
    "market_data",
    "sentiment",
    "forward_looking",
    "rag_retrieval",
    "aggregator",
    "visualization",
    "report",
    "quality_check",
    "memory_saver"
};

inline std::string node_name(NodeId id) {
    return std::string(kNodeNames[static_cast<std::size_t>(id)]);
}

inline std::optional<NodeId> node_from_name(std::string_view name) {
    for (std::size_t i = 0; i < kNodeCount; ++i) {
        if (kNodeNames[i] == name) return static_cast<NodeId>(i);
    }
    return std::nullopt;
}

class ExecutionTrace;   // modules/trace/execution_trace.h
class BudgetController; // modules/budget/budget_controller.h
struct RetryPolicy;     // modules/executor/retry_policy.h

// Per-call services handed to a node's business function.
struct NodeRuntime {
    ExecutionTrace& trace;
    BudgetController& budget;
    const RetryPolicy& retry;
};

// Base Node
struct Node {
    NodeId id;

    explicit Node(NodeId id) : id(id) {}
    virtual ~Node() = default;

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    std::string name() const { return node_name(id); }

    // Reads an immutable snapshot, returns only the fields it produced.
    [[nodiscard]] virtual PartialUpdate execute(const Context& state, NodeRuntime& runtime) = 0;
};

// What the execution envelope reports for one node execution.
struct NodeResult {
    NodeId node;
    PartialUpdate update = PartialUpdate::object();
    bool success = false;
    std::chrono::milliseconds elapsed{0};
    int attempts = 0;
    std::optional<ErrorClass> error_class;
    std::string error_message;
    std::chrono::system_clock::time_point started_at;
};

} // namespace researchflow

#endif // RESEARCHFLOW_TYPES_NODE_H
