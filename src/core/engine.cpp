// core/engine.cpp
#include "core/engine.h"
#include "core/research_graph.h"
#include "modules/context/state_schema.h"
#include "core/types/errors.h"
#include "common/llm/llama_adapter.h"
#include "common/tools/fixture_tools.h"
#include "common/utils/logging.h"
#include "services/llm_query_services.h"
#include "services/llm_report_synthesizer.h"
#include "services/rule_query_services.h"
#include "services/template_report_synthesizer.h"
#include "services/tool_data_provider.h"
#include <spdlog/fmt/fmt.h>
#include <random>

namespace researchflow {

namespace {

std::string random_id(const char* prefix) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    return fmt::format("{}-{:016x}", prefix, rng());
}

std::vector<std::string> string_list(const Value& v) {
    std::vector<std::string> out;
    if (!v.is_array()) return out;
    for (const auto& item : v) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace

nlohmann::json ResearchResponse::to_json() const {
    nlohmann::json j;
    j["session_id"] = session_id;
    j["run_id"] = run_id;
    j["report"] = report;
    j["tickers"] = tickers;
    j["executed_agents"] = executed_agents;
    j["agent_errors"] = agent_errors;
    j["errors"] = errors;
    j["intent"] = intent;
    j["dispatch_flags"] = {
        {"market_data", flags.market_data},
        {"sentiment", flags.sentiment},
        {"context", flags.context}
    };
    j["market_data_available"] = market_data_available;
    j["sentiment_available"] = sentiment_available;
    j["analyst_consensus_available"] = analyst_consensus_available;
    j["context_retrieved"] = context_retrieved;
    j["visualization_data"] = visualization_data;
    j["snapshot"] = snapshot;
    j["report_metadata"] = report_metadata;
    j["quality_score"] = quality_score ? nlohmann::json(*quality_score) : nlohmann::json();
    j["is_quality_passed"] = is_quality_passed;
    return j;
}

ResearchResponse make_response(const Context& final_state) {
    StateView view(final_state);
    ResearchResponse r;
    r.session_id = view.session_id();
    r.run_id = view.run_id();
    const Value& report = view.field(fields::REPORT);
    r.report = report.is_string() ? report.get<std::string>() : "";
    r.tickers = view.tickers();
    r.executed_agents = string_list(view.field(fields::EXECUTED_AGENTS));
    const Value& agent_errors = view.field(fields::AGENT_ERRORS);
    if (agent_errors.is_object()) r.agent_errors = agent_errors;
    r.errors = string_list(view.field(fields::ERRORS));
    r.intent = to_string(view.intent());
    r.flags = view.dispatch_flags();

    r.market_data_available = view.has_entries(fields::MARKET_DATA) && !view.node_failed(node_name(NodeId::MARKET_DATA));
    r.sentiment_available = view.has_entries(fields::SENTIMENT_ANALYSIS) && !view.node_failed(node_name(NodeId::SENTIMENT));
    r.analyst_consensus_available = view.has_entries(fields::ANALYST_CONSENSUS) &&
                                    !view.node_failed(node_name(NodeId::FORWARD_LOOKING));
    const Value& context = view.field(fields::RETRIEVED_CONTEXT);
    r.context_retrieved = context.is_array() ? static_cast<int>(context.size()) : 0;

    const Value& charts = view.field(fields::VISUALIZATION_DATA);
    if (charts.is_array()) r.visualization_data = charts;
    r.snapshot = view.field(fields::SNAPSHOT);
    r.report_metadata = view.field(fields::REPORT_METADATA);
    const Value& score = view.field(fields::QUALITY_SCORE);
    if (score.is_number()) r.quality_score = score.get<double>();
    const Value& passed = view.field(fields::IS_QUALITY_PASSED);
    r.is_quality_passed = passed.is_boolean() && passed.get<bool>();
    return r;
}

ResearchEngine::ResearchEngine(ResearchServices services, ResearchConfig config,
                               BudgetController::SleepFunction sleep)
    : config_(std::move(config)), services_(std::move(services)) {
    TopoScheduler::Config graph_config;
    graph_config.budget = config_.budget;
    graph_config.retry = config_.retry;
    graph_config.parallel_branches = config_.parallel_branches;
    graph_config.sleep = std::move(sleep);
    graph_ = build_research_graph(services_, config_.nodes, std::move(graph_config));
}

void ResearchEngine::hold(std::shared_ptr<ToolRegistry> registry, std::shared_ptr<LlmClient> llm) {
    registry_ = std::move(registry);
    llm_ = std::move(llm);
}

std::unique_ptr<ResearchEngine> ResearchEngine::from_config(const std::string& config_path) {
    ResearchConfig config = ResearchConfig::from_file(config_path);
    logging::init_logging(config.log_level);

    auto registry = std::make_shared<ToolRegistry>();
    if (!config.fixtures_path.empty()) {
        register_fixture_tools(*registry, load_fixture_file(config.fixtures_path));
        logging::get()->info("Data tools loaded from {}", config.fixtures_path);
    } else {
        logging::get()->warn("No data.fixtures_path configured; specialist data tools are unavailable");
    }
    auto provider = std::make_shared<ToolDataProvider>(*registry);

    ResearchServices services;
    services.ticker_extractor = std::make_shared<TickerExtractor>();
    services.market = provider;
    services.sentiment = provider;
    services.consensus = provider;
    services.documents = provider;

    std::shared_ptr<LlmClient> llm;
    if (!config.llm.model_path.empty()) {
        try {
            llm = std::make_shared<LlamaAdapter>(config.llm);
        } catch (const std::exception& e) {
            throw ConfigError("Cannot load model " + config.llm.model_path + ": " + e.what());
        }
        services.validator = std::make_shared<LlmQueryValidator>(llm);
        services.optimizer = std::make_shared<LlmQueryOptimizer>(llm);
        services.classifier = std::make_shared<LlmIntentClassifier>(llm);
        services.reports = std::make_shared<LlmReportSynthesizer>(llm);
    } else {
        logging::get()->info("No model configured, using rule-based query services and template reports");
        services.validator = std::make_shared<RuleQueryValidator>();
        services.optimizer = std::make_shared<RuleQueryOptimizer>();
        services.classifier = std::make_shared<RuleIntentClassifier>();
        services.reports = std::make_shared<TemplateReportSynthesizer>();
    }

    if (config.history_store_path.empty()) {
        services.conversations = std::make_shared<InMemoryConversationStore>();
    } else {
        services.conversations = std::make_shared<JsonFileConversationStore>(config.history_store_path);
    }

    auto engine = std::make_unique<ResearchEngine>(std::move(services), std::move(config));
    engine->hold(std::move(registry), std::move(llm));
    return engine;
}

ResearchResult ResearchEngine::run(const ResearchRequest& request, std::stop_token stop) {
    const std::string run_id = random_id("run");
    // an empty id is treated as no id
    const std::string session_id = request.session_id && !request.session_id->empty()
        ? *request.session_id
        : random_id("session");

    Context state = StateSchema::instance().make_initial_state(run_id, session_id, request.query, utc_timestamp());
    logging::get()->info("Run {} started for session {}: {}", run_id, session_id, request.query);

    ExecutionResult executed = graph_->execute(std::move(state), std::move(stop));

    ResearchResult result;
    result.success = executed.success;
    result.message = executed.message;
    result.response = make_response(executed.final_state);
    if (!executed.success) {
        // 失败时不返回部分报告
        result.response.report.clear();
        result.response.snapshot = nullptr;
        result.response.report_metadata = nullptr;
        result.response.errors.push_back(executed.message);
    }
    return result;
}

} // namespace researchflow
