// modules/trace/trace_exporter.cpp
#include "modules/trace/trace_exporter.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace researchflow {

namespace {

std::string format_time(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

} // namespace

void TraceExporter::on_node_end(const NodeResult& result, int generation) {
    TraceRecord record;
    record.run_id = run_id_;
    record.node = result.node;
    record.start_time = result.started_at;
    record.end_time = result.started_at + result.elapsed;
    record.status = result.success ? "success" : "failed";
    record.attempts = result.attempts;
    if (result.error_class) record.error_class = to_string(*result.error_class);
    if (!result.success) record.error_message = result.error_message;
    record.state_delta = result.update;
    record.generation = generation;

    std::lock_guard<std::mutex> lock(mutex_);
    traces_.push_back(std::move(record));
}

std::vector<TraceRecord> TraceExporter::get_traces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return traces_;
}

void TraceExporter::clear_traces() {
    std::lock_guard<std::mutex> lock(mutex_);
    traces_.clear();
}

nlohmann::json TraceExporter::to_json(const TraceRecord& r) {
    nlohmann::json j;
    j["run_id"] = r.run_id;
    j["node"] = node_name(r.node);
    j["start_time"] = format_time(r.start_time);
    j["end_time"] = format_time(r.end_time);
    j["elapsed_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(r.end_time - r.start_time).count();
    j["status"] = r.status;
    j["attempts"] = r.attempts;
    j["generation"] = r.generation;
    j["error_class"] = r.error_class ? nlohmann::json(*r.error_class) : nlohmann::json(nullptr);
    j["error_message"] = r.error_message ? nlohmann::json(*r.error_message) : nlohmann::json(nullptr);
    nlohmann::json changed = nlohmann::json::array();
    if (r.state_delta.is_object()) {
        for (auto it = r.state_delta.begin(); it != r.state_delta.end(); ++it) changed.push_back(it.key());
    }
    j["changed_fields"] = changed;
    j["state_delta"] = r.state_delta;
    return j;
}

nlohmann::json TraceExporter::to_json(const std::vector<TraceRecord>& records) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : records) arr.push_back(to_json(r));
    return arr;
}

} // namespace researchflow
