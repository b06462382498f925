// services/template_report_synthesizer.cpp
#include "services/template_report_synthesizer.h"
#include "common/utils/template_renderer.h"
#include <algorithm>
#include <array>
#include <initializer_list>
#include <string>
#include <utility>

namespace researchflow {

namespace {

constexpr const char* kHeader = R"(# Investment Research Report

**Query:** {{ query }}
{% if length(tickers) > 0 %}
**Tickers:** {{ join(tickers, ", ") }}
{% endif %}

)";

constexpr const char* kMarketSection = R"({% if data_sources.market_data %}
## Market Data

{% for m in market_data %}
- **{{ m.ticker }}**: ${{ fixed(m.current_price, 2) }} ({{ fixed(m.change_percent, 2) }}%), market cap {{ billions(m.market_cap) }}, P/E {{ fixed(m.pe_ratio, 2) }}
{% if m.trend_signal %}
  - 52-week range {{ fixed(m.year_low, 2) }} to {{ fixed(m.year_high, 2) }}, at {{ fixed(m.week_52_position, 1) }}% of range ({{ m.trend_signal }})
{% endif %}
{% endfor %}

{% endif %}
)";

constexpr const char* kPeerSection = R"({% if data_sources.peer_valuation %}
## Peer Valuation

{% for p in peer_valuation %}
- **{{ p.ticker }}** ({{ p.sector }}): P/E {{ fixed(p.pe_ratio, 2) }} vs sector {{ fixed(p.sector_avg_pe, 2) }} ({{ signed_pct(p.pe_premium_discount) }}), {{ p.peer_count }} peers
{% endfor %}

{% endif %}
)";

constexpr const char* kSentimentSection = R"({% if data_sources.sentiment %}
## Sentiment Analysis

{% for s in sentiment_analysis %}
- **{{ s.ticker }}**: {{ s.overall_sentiment }} ({{ fixed(s.confidence, 2) }} confidence, {{ s.news_count }} articles)
{% if s.summary %}
  - {{ s.summary }}
{% endif %}
{% endfor %}

{% endif %}
)";

constexpr const char* kConsensusSection = R"({% if data_sources.analyst_consensus %}
## Analyst Consensus

{% for a in analyst_consensus %}
- **{{ a.ticker }}**: target ${{ fixed(a.target_price_mean, 2) }} ({{ signed_pct(a.upside_potential) }}), {{ a.recommendation }} from {{ a.num_analysts }} analysts
{% endfor %}

{% endif %}
)";

constexpr const char* kContextSection = R"({% if data_sources.context %}
## Research Context

{% for d in retrieved_context %}
- [{{ d.source }}] {{ d.title }}: {{ d.text }}
{% endfor %}

{% endif %}
)";

constexpr const char* kFooter = R"(## Data Availability

{% for name, ok in data_sources %}
- {{ name }}: {% if ok %}available{% else %}unavailable{% endif %}

{% endfor %}
{% if not any_data %}

No data sources were used for this report.
{% endif %}
)";

struct SectionRule {
    const char* source;  // key in data_sources
    const char* heading; // what must appear in the report
};

constexpr std::array<SectionRule, 5> kSections = {{
    {"market_data", "## Market Data"},
    {"peer_valuation", "## Peer Valuation"},
    {"sentiment", "## Sentiment Analysis"},
    {"analyst_consensus", "## Analyst Consensus"},
    {"context", "## Research Context"},
}};

std::string body_for(const std::string& template_name) {
    if (template_name == "brief_market") {
        return std::string(kMarketSection) + kConsensusSection;
    }
    if (template_name == "sentiment_focused") {
        return std::string(kSentimentSection) + kMarketSection + kConsensusSection;
    }
    if (template_name == "peer_comparison") {
        return std::string(kMarketSection) + kPeerSection + kConsensusSection + kContextSection;
    }
    return std::string(kMarketSection) + kPeerSection + kSentimentSection + kConsensusSection + kContextSection;
}

Value render_data(const ReportRequest& request) {
    Value data = request.data;
    data["query"] = request.query;
    data["tickers"] = request.tickers;
    if (!data.contains("data_sources") || !data["data_sources"].is_object()) {
        data["data_sources"] = Value::object();
    }
    Value& sources = data["data_sources"];
    for (const auto& rule : kSections) {
        if (!sources.contains(rule.source)) sources[rule.source] = false;
    }
    bool any = false;
    for (const auto& [name, ok] : sources.items()) {
        any = any || (ok.is_boolean() && ok.get<bool>());
    }
    data["any_data"] = any;

    // templates address these keys directly; inja rejects missing ones
    const std::pair<const char*, std::initializer_list<const char*>> shapes[] = {
        {"market_data", {"ticker", "current_price", "change_percent", "market_cap", "pe_ratio",
                         "year_low", "year_high", "week_52_position", "trend_signal"}},
        {"peer_valuation", {"ticker", "sector", "pe_ratio", "sector_avg_pe", "pe_premium_discount", "peer_count"}},
        {"sentiment_analysis", {"ticker", "overall_sentiment", "confidence", "news_count", "summary"}},
        {"analyst_consensus", {"ticker", "target_price_mean", "upside_potential", "recommendation", "num_analysts"}},
        {"retrieved_context", {"source", "title", "text"}},
    };
    for (const auto& [list, keys] : shapes) {
        Value& items = data[list];
        if (!items.is_array()) items = Value::array();
        for (auto& item : items) {
            if (!item.is_object()) continue;
            for (const char* key : keys) {
                if (!item.contains(key)) item[key] = nullptr;
            }
        }
    }
    return data;
}

} // namespace

std::string TemplateReportSynthesizer::synthesize(const ReportRequest& request, std::stop_token) {
    std::string tmpl = std::string(kHeader) + body_for(request.template_name) + kFooter;
    return InjaTemplateRenderer::render(tmpl, render_data(request));
}

std::string TemplateReportSynthesizer::refine(const ReportRequest& request, const std::string& report,
                                              const QualityEvaluation& feedback, std::stop_token) {
    // Sections the chosen template left out but the data supports.
    std::string missing;
    const Value data = render_data(request);
    for (const auto& rule : kSections) {
        bool available = data["data_sources"].value(rule.source, false);
        if (available && report.find(rule.heading) == std::string::npos) {
            missing += rule.source;
            missing += ' ';
        }
    }
    if (missing.empty() && feedback.gaps.empty()) return report;

    std::string extra;
    if (missing.find("peer_valuation") != std::string::npos) extra += kPeerSection;
    if (missing.find("sentiment") != std::string::npos) extra += kSentimentSection;
    if (missing.find("context") != std::string::npos) extra += kContextSection;
    if (missing.find("market_data") != std::string::npos) extra += kMarketSection;
    if (missing.find("analyst_consensus") != std::string::npos) extra += kConsensusSection;

    std::string addition = extra.empty() ? "" : InjaTemplateRenderer::render(extra, data);
    return report + "\n" + addition;
}

QualityEvaluation TemplateReportSynthesizer::evaluate(const ReportRequest& request, const std::string& report,
                                                     std::stop_token) {
    QualityEvaluation eval;
    const Value data = render_data(request);
    int available = 0;
    int covered = 0;
    for (const auto& rule : kSections) {
        if (!data["data_sources"].value(rule.source, false)) continue;
        ++available;
        if (report.find(rule.heading) != std::string::npos) {
            ++covered;
        } else {
            eval.gaps.push_back(std::string("report does not cover available ") + rule.source);
        }
    }
    for (const auto& t : request.tickers) {
        if (report.find(t) == std::string::npos) {
            eval.gaps.push_back("ticker " + t + " is not discussed");
        }
    }
    double coverage = available == 0 ? 1.0 : static_cast<double>(covered) / available;
    eval.score = std::max(0.0, coverage - 0.1 * static_cast<double>(eval.gaps.size() - (available - covered)));
    eval.summary = std::to_string(covered) + "/" + std::to_string(available) + " available sources covered";
    return eval;
}

} // namespace researchflow
