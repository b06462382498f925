// services/llm_report_synthesizer.cpp
#include "services/llm_report_synthesizer.h"
#include "services/prompts.h"
#include "core/types/errors.h"
#include "common/utils/template_renderer.h"
#include <algorithm>

namespace researchflow {

namespace {

Value prompt_data(const ReportRequest& request) {
    Value data = request.data;
    data["query"] = request.query;
    data["tickers"] = request.tickers;
    data["template"] = request.template_name;
    data["intent"] = to_string(request.intent);
    return data;
}

} // namespace

std::string LlmReportSynthesizer::synthesize(const ReportRequest& request, std::stop_token stop) {
    return llm_->complete(InjaTemplateRenderer::render(prompts::kSynthesis, prompt_data(request)), stop);
}

std::string LlmReportSynthesizer::refine(const ReportRequest& request, const std::string& report,
                                         const QualityEvaluation& feedback, std::stop_token stop) {
    Value data = prompt_data(request);
    data["report"] = report;
    data["gaps"] = feedback.gaps;
    return llm_->complete(InjaTemplateRenderer::render(prompts::kRefinement, data), stop);
}

QualityEvaluation LlmReportSynthesizer::evaluate(const ReportRequest& request, const std::string& report,
                                                std::stop_token stop) {
    Value data = prompt_data(request);
    data["report"] = report;
    Value out = parse_json_response(llm_->complete(InjaTemplateRenderer::render(prompts::kEvaluation, data), stop));

    auto score = out.find("overall_score");
    if (score == out.end() || !score->is_number()) {
        throw ResponseShapeError("evaluation response lacks a numeric overall_score");
    }
    QualityEvaluation eval;
    eval.score = std::clamp(score->get<double>() / 10.0, 0.0, 1.0);
    if (auto gaps = out.find("gaps"); gaps != out.end() && gaps->is_array()) {
        for (const auto& g : *gaps) {
            if (g.is_string()) eval.gaps.push_back(g.get<std::string>());
        }
    }
    eval.summary = out.value("summary", "");
    return eval;
}

} // namespace researchflow
