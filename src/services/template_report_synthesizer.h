// services/template_report_synthesizer.h
#ifndef RESEARCHFLOW_SERVICES_TEMPLATE_REPORT_SYNTHESIZER_H
#define RESEARCHFLOW_SERVICES_TEMPLATE_REPORT_SYNTHESIZER_H

#include "services/report_synthesizer.h"

namespace researchflow {

// Deterministic reports from inja templates; no model required.
// evaluate() scores how many of the available data sources the report covers.
class TemplateReportSynthesizer : public ReportSynthesizer {
public:
    std::string synthesize(const ReportRequest& request, std::stop_token stop = {}) override;
    std::string refine(const ReportRequest& request, const std::string& report,
                       const QualityEvaluation& feedback, std::stop_token stop = {}) override;
    QualityEvaluation evaluate(const ReportRequest& request, const std::string& report,
                               std::stop_token stop = {}) override;
};

} // namespace researchflow

#endif // RESEARCHFLOW_SERVICES_TEMPLATE_REPORT_SYNTHESIZER_H
