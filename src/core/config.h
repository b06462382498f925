// core/config.h
#ifndef RESEARCHFLOW_CORE_CONFIG_H
#define RESEARCHFLOW_CORE_CONFIG_H

#include "common/llm/llama_adapter.h"
#include "core/types/budget.h"
#include "modules/executor/retry_policy.h"
#include "services/research_services.h"
#include <nlohmann/json.hpp>
#include <string>

namespace researchflow {

// Everything read from research.yaml. Missing keys keep their defaults;
// unknown keys are ignored; a key of the wrong type keeps its default and
// logs a warning.
struct ResearchConfig {
    RetryPolicy retry;            // retry.max_attempts, retry.base_delay_ms
    ExecutionBudget budget{-1, std::chrono::milliseconds(120000)}; // run.timeout_ms, run.max_node_executions
    bool parallel_branches = true; // run.parallel_branches
    NodeOptions nodes;            // report.*, history.limit, data.rag_top_k

    std::string history_store_path; // history.store_path; empty = in memory
    std::string fixtures_path;      // data.fixtures_path

    // llm.model_path; empty = rule/template services, no model
    LlamaAdapter::Config llm;

    std::string log_level = "info"; // logging.level

    // Relative paths are resolved against the config file's directory.
    static ResearchConfig from_file(const std::string& path);
    static ResearchConfig from_json(const nlohmann::json& doc, const std::string& base_dir = ".");
};

} // namespace researchflow

#endif // RESEARCHFLOW_CORE_CONFIG_H
