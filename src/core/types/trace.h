#ifndef RESEARCHFLOW_TYPES_TRACE_H
#define RESEARCHFLOW_TYPES_TRACE_H

#include "node.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace researchflow {

struct TraceRecord {
    std::string run_id;
    NodeId node;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::string status; // "success", "failed"
    int attempts = 0;
    std::optional<std::string> error_class;
    std::optional<std::string> error_message;
    nlohmann::json state_delta; // fields the node's update touched
    int generation = 0;         // barrier generation the node ran in
};

} // namespace researchflow

#endif // RESEARCHFLOW_TYPES_TRACE_H
