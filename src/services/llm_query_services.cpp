// services/llm_query_services.cpp
#include "services/llm_query_services.h"
#include "services/prompts.h"
#include "core/types/errors.h"
#include "common/utils/template_renderer.h"
#include "common/utils/logging.h"
#include <algorithm>
#include <cctype>

namespace researchflow {

namespace {

// Models answer "true", true, "yes" or 1 interchangeably.
bool parse_bool(const nlohmann::json& v, bool fallback) {
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number()) return v.get<double>() != 0.0;
    if (v.is_string()) {
        std::string s = v.get<std::string>();
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s == "true" || s == "1" || s == "yes";
    }
    return fallback;
}

} // namespace

ValidationResult LlmQueryValidator::validate(const std::string& query, std::stop_token stop) {
    std::string prompt = InjaTemplateRenderer::render(prompts::kValidation, {{"query", query}});
    nlohmann::json out = parse_json_response(llm_->complete(prompt, stop));
    if (!out.contains("is_valid")) {
        throw ResponseShapeError("validation response lacks is_valid");
    }
    return {parse_bool(out["is_valid"], true), out.value("reason", "")};
}

std::string LlmQueryOptimizer::optimize(const std::string& query, const Value& history, std::stop_token stop) {
    nlohmann::json data = {
        {"query", query},
        {"history", history.is_array() ? history : Value::array()}
    };
    std::string prompt = InjaTemplateRenderer::render(prompts::kOptimization, data);
    nlohmann::json out = parse_json_response(llm_->complete(prompt, stop));
    auto it = out.find("optimized_query");
    if (it == out.end() || !it->is_string()) {
        throw ResponseShapeError("optimization response lacks optimized_query");
    }
    return it->get<std::string>();
}

Classification LlmIntentClassifier::classify(const std::string& query, const std::vector<std::string>& tickers,
                                             std::stop_token stop) {
    std::string prompt = InjaTemplateRenderer::render(prompts::kIntent, {{"query", query}, {"tickers", tickers}});
    nlohmann::json out = parse_json_response(llm_->complete(prompt, stop));

    std::string intent_name = out.value("intent", "general_research");
    auto intent = intent_from_string(intent_name);
    if (!intent) {
        throw ResponseShapeError("unknown intent '" + intent_name + "'");
    }

    Classification c;
    c.intent = *intent;
    c.flags.market_data = parse_bool(out.value("fetch_market_data", nlohmann::json()), false);
    c.flags.sentiment = parse_bool(out.value("analyze_sentiment", nlohmann::json()), false);
    c.flags.context = parse_bool(out.value("retrieve_context", nlohmann::json()), false);
    c.tickers = tickers;
    c.reasoning = out.value("reasoning", "");

    if (!c.flags.market_data && !c.flags.sentiment && !c.flags.context) {
        logging::get()->warn("Intent classifier enabled no specialists for '{}' ({})", query, intent_name);
    }
    return c;
}

} // namespace researchflow
