// modules/trace/execution_trace.h
#ifndef RESEARCHFLOW_MODULES_TRACE_EXECUTION_TRACE_H
#define RESEARCHFLOW_MODULES_TRACE_EXECUTION_TRACE_H

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace researchflow {

// Reasoning steps one node records during one call. Owned by the envelope,
// never shared between nodes.
class ExecutionTrace {
public:
    void add_step(std::string step) { steps_.push_back(std::move(step)); }
    const std::vector<std::string>& steps() const { return steps_; }
    bool empty() const { return steps_.empty(); }
    void clear() { steps_.clear(); }

    nlohmann::json to_json() const { return nlohmann::json(steps_); }

private:
    std::vector<std::string> steps_;
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_TRACE_EXECUTION_TRACE_H
