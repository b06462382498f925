// services/llm_report_synthesizer.h
#ifndef RESEARCHFLOW_SERVICES_LLM_REPORT_SYNTHESIZER_H
#define RESEARCHFLOW_SERVICES_LLM_REPORT_SYNTHESIZER_H

#include "services/report_synthesizer.h"
#include "common/llm/llm_client.h"
#include <memory>

namespace researchflow {

class LlmReportSynthesizer : public ReportSynthesizer {
public:
    explicit LlmReportSynthesizer(std::shared_ptr<LlmClient> llm) : llm_(std::move(llm)) {}

    std::string synthesize(const ReportRequest& request, std::stop_token stop = {}) override;
    std::string refine(const ReportRequest& request, const std::string& report,
                       const QualityEvaluation& feedback, std::stop_token stop = {}) override;
    // overall_score (0-10) from the model, divided by 10.
    QualityEvaluation evaluate(const ReportRequest& request, const std::string& report,
                               std::stop_token stop = {}) override;

private:
    std::shared_ptr<LlmClient> llm_;
};

} // namespace researchflow

#endif // RESEARCHFLOW_SERVICES_LLM_REPORT_SYNTHESIZER_H
