// services/report_synthesizer.h
#ifndef RESEARCHFLOW_SERVICES_REPORT_SYNTHESIZER_H
#define RESEARCHFLOW_SERVICES_REPORT_SYNTHESIZER_H

#include "core/types/context.h"
#include "core/types/intent.h"
#include <stop_token>
#include <string>
#include <vector>

namespace researchflow {

// Everything a synthesizer may read, cut from the merged state after the barrier.
struct ReportRequest {
    std::string query;
    Intent intent = Intent::GENERAL_RESEARCH;
    std::string template_name;
    std::vector<std::string> tickers;
    // market_data, peer_valuation, sentiment_analysis, analyst_consensus,
    // retrieved_context, data_sources
    Value data = Value::object();
};

struct QualityEvaluation {
    double score = 0.0; // normalized to [0, 1]
    std::vector<std::string> gaps;
    std::string summary;
};

// `stop` is the run's cancellation signal; remote implementations hand it
// to their backend.
class ReportSynthesizer {
public:
    virtual ~ReportSynthesizer() = default;

    virtual std::string synthesize(const ReportRequest& request, std::stop_token stop = {}) = 0;
    virtual std::string refine(const ReportRequest& request, const std::string& report,
                               const QualityEvaluation& feedback, std::stop_token stop = {}) = 0;
    virtual QualityEvaluation evaluate(const ReportRequest& request, const std::string& report,
                                       std::stop_token stop = {}) = 0;
};

// brief_market, sentiment_focused, peer_comparison or comprehensive.
std::string select_report_template(Intent intent);

} // namespace researchflow

#endif // RESEARCHFLOW_SERVICES_REPORT_SYNTHESIZER_H
