// modules/trace/trace_exporter.h
#ifndef RESEARCHFLOW_MODULES_TRACE_TRACE_EXPORTER_H
#define RESEARCHFLOW_MODULES_TRACE_TRACE_EXPORTER_H

#include "core/types/node.h"
#include "core/types/trace.h"
#include <nlohmann/json.hpp>
#include <mutex>
#include <string>
#include <vector>

namespace researchflow {

// Collects one TraceRecord per node execution. Branches report concurrently.
class TraceExporter {
public:
    explicit TraceExporter(std::string run_id = "") : run_id_(std::move(run_id)) {}

    void on_node_end(const NodeResult& result, int generation);

    std::vector<TraceRecord> get_traces() const;
    void clear_traces();

    static nlohmann::json to_json(const TraceRecord& record);
    static nlohmann::json to_json(const std::vector<TraceRecord>& records);

private:
    std::string run_id_;
    mutable std::mutex mutex_;
    std::vector<TraceRecord> traces_;
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_TRACE_TRACE_EXPORTER_H
