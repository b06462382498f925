// core/config.cpp
#include "core/config.h"
#include "common/utils/logging.h"
#include "common/utils/yaml_json.h"
#include <algorithm>
#include <filesystem>
#include <thread>

namespace researchflow {

namespace {

namespace fs = std::filesystem;

const nlohmann::json& section(const nlohmann::json& doc, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!doc.is_object() || !doc.contains(name)) return empty;
    const auto& s = doc.at(name);
    if (!s.is_object()) {
        logging::get()->warn("config: section '{}' is not a mapping, using defaults", name);
        return empty;
    }
    return s;
}

void read_int(const nlohmann::json& s, const char* section_name, const char* key, int& out) {
    if (!s.contains(key)) return;
    if (s[key].is_number_integer()) {
        out = s[key].get<int>();
    } else {
        logging::get()->warn("config: {}.{} must be an integer, keeping {}", section_name, key, out);
    }
}

void read_double(const nlohmann::json& s, const char* section_name, const char* key, double& out) {
    if (!s.contains(key)) return;
    if (s[key].is_number()) {
        out = s[key].get<double>();
    } else {
        logging::get()->warn("config: {}.{} must be a number, keeping {}", section_name, key, out);
    }
}

void read_bool(const nlohmann::json& s, const char* section_name, const char* key, bool& out) {
    if (!s.contains(key)) return;
    if (s[key].is_boolean()) {
        out = s[key].get<bool>();
    } else {
        logging::get()->warn("config: {}.{} must be true or false, keeping {}", section_name, key, out);
    }
}

void read_string(const nlohmann::json& s, const char* section_name, const char* key, std::string& out) {
    if (!s.contains(key) || s[key].is_null()) return;
    if (s[key].is_string()) {
        out = s[key].get<std::string>();
    } else {
        logging::get()->warn("config: {}.{} must be a string, keeping '{}'", section_name, key, out);
    }
}

std::string resolve(const std::string& path, const std::string& base_dir) {
    if (path.empty()) return path;
    fs::path p(path);
    if (p.is_absolute()) return path;
    return (fs::path(base_dir) / p).lexically_normal().string();
}

} // namespace

ResearchConfig ResearchConfig::from_json(const nlohmann::json& doc, const std::string& base_dir) {
    ResearchConfig config;
    config.llm.n_threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));

    const auto& retry = section(doc, "retry");
    read_int(retry, "retry", "max_attempts", config.retry.max_attempts);
    int base_delay_ms = static_cast<int>(config.retry.base_delay.count());
    read_int(retry, "retry", "base_delay_ms", base_delay_ms);
    config.retry.base_delay = std::chrono::milliseconds(std::max(0, base_delay_ms));
    if (config.retry.max_attempts < 1) {
        logging::get()->warn("config: retry.max_attempts {} raised to 1", config.retry.max_attempts);
        config.retry.max_attempts = 1;
    }

    const auto& run = section(doc, "run");
    int timeout_ms = static_cast<int>(config.budget.timeout.count());
    read_int(run, "run", "timeout_ms", timeout_ms);
    config.budget.timeout = std::chrono::milliseconds(std::max(0, timeout_ms));
    read_int(run, "run", "max_node_executions", config.budget.max_node_executions);
    read_bool(run, "run", "parallel_branches", config.parallel_branches);

    const auto& report = section(doc, "report");
    read_int(report, "report", "max_iterations", config.nodes.report_max_iterations);
    read_double(report, "report", "quality_threshold", config.nodes.quality_threshold);

    const auto& history = section(doc, "history");
    read_int(history, "history", "limit", config.nodes.history_limit);
    read_string(history, "history", "store_path", config.history_store_path);
    config.history_store_path = resolve(config.history_store_path, base_dir);

    const auto& data = section(doc, "data");
    read_string(data, "data", "fixtures_path", config.fixtures_path);
    config.fixtures_path = resolve(config.fixtures_path, base_dir);
    read_int(data, "data", "rag_top_k", config.nodes.rag_top_k);

    const auto& llm = section(doc, "llm");
    read_string(llm, "llm", "model_path", config.llm.model_path);
    config.llm.model_path = resolve(config.llm.model_path, base_dir);
    read_int(llm, "llm", "n_ctx", config.llm.n_ctx);
    int threads = config.llm.n_threads;
    read_int(llm, "llm", "n_threads", threads);
    if (threads > 0) config.llm.n_threads = threads;
    double temperature = config.llm.temperature;
    read_double(llm, "llm", "temperature", temperature);
    config.llm.temperature = static_cast<float>(temperature);
    double min_p = config.llm.min_p;
    read_double(llm, "llm", "min_p", min_p);
    config.llm.min_p = static_cast<float>(min_p);
    read_int(llm, "llm", "n_predict", config.llm.n_predict);

    const auto& log_cfg = section(doc, "logging");
    read_string(log_cfg, "logging", "level", config.log_level);

    return config;
}

ResearchConfig ResearchConfig::from_file(const std::string& path) {
    nlohmann::json doc = load_yaml_file(path);
    fs::path dir = fs::path(path).parent_path();
    if (dir.empty()) dir = ".";
    return from_json(doc, dir.string());
}

} // namespace researchflow
