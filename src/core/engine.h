// core/engine.h
#ifndef RESEARCHFLOW_CORE_ENGINE_H
#define RESEARCHFLOW_CORE_ENGINE_H

#include "core/config.h"
#include "core/types/intent.h"
#include "modules/scheduler/topo_scheduler.h" // ← 直接依赖 TopoScheduler
#include "common/llm/llm_client.h"
#include "common/tools/registry.h"
#include "services/research_services.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace researchflow {

struct ResearchRequest {
    std::optional<std::string> session_id; // generated when absent
    std::string query;
};

struct ResearchResponse {
    std::string session_id;
    std::string run_id;
    std::string report;
    std::vector<std::string> tickers;
    std::vector<std::string> executed_agents;
    nlohmann::json agent_errors = nlohmann::json::object(); // node -> message
    std::vector<std::string> errors;
    std::string intent;
    DispatchFlags flags;

    // data present and the producing node did not fail
    bool market_data_available = false;
    bool sentiment_available = false;
    bool analyst_consensus_available = false;
    int context_retrieved = 0;

    nlohmann::json visualization_data = nlohmann::json::array();
    nlohmann::json snapshot;
    nlohmann::json report_metadata;
    std::optional<double> quality_score;
    bool is_quality_passed = false;

    nlohmann::json to_json() const;
};

struct ResearchResult {
    bool success = false;
    std::string message;
    ResearchResponse response; // on failure: identity and errors only, no report
};

class ResearchEngine {
public:
    // Loads research.yaml, configures logging and wires fixture data tools,
    // the model (when llm.model_path is set) and the conversation store.
    // Throws ConfigError on a broken config or data file.
    static std::unique_ptr<ResearchEngine> from_config(const std::string& config_path);

    // `sleep` replaces the real backoff sleep (tests).
    ResearchEngine(ResearchServices services, ResearchConfig config,
                   BudgetController::SleepFunction sleep = {});

    // One run of the graph. Never throws for run failures.
    ResearchResult run(const ResearchRequest& request, std::stop_token stop = {});

    std::vector<TraceRecord> last_traces() const { return graph_->get_last_traces(); }
    const ResearchConfig& config() const { return config_; }

    // Keeps collaborators the services depend on alive as long as the engine.
    void hold(std::shared_ptr<ToolRegistry> registry, std::shared_ptr<LlmClient> llm);

private:
    ResearchConfig config_;
    std::shared_ptr<ToolRegistry> registry_;
    std::shared_ptr<LlmClient> llm_;
    ResearchServices services_;
    std::unique_ptr<TopoScheduler> graph_;
};

// Builds the response fields from a terminal state.
ResearchResponse make_response(const Context& final_state);

} // namespace researchflow

#endif // RESEARCHFLOW_CORE_ENGINE_H
