// services/prompts.h
#ifndef RESEARCHFLOW_SERVICES_PROMPTS_H
#define RESEARCHFLOW_SERVICES_PROMPTS_H

namespace researchflow::prompts {

// Rendered with InjaTemplateRenderer. Every prompt asks for a single JSON
// object except the synthesis/refinement ones, which return markdown.

inline constexpr const char* kValidation = R"(You screen questions sent to an investment research assistant.
Decide whether the question below is a meaningful investment or financial-markets question.

Question: "{{ query }}"

Respond with JSON only:
{"is_valid": true|false, "reason": "<one sentence>"})";

inline constexpr const char* kOptimization = R"(Rewrite the user's investment question so it is explicit and self-contained.
Resolve pronouns using the conversation so far. Keep ticker symbols and company names unchanged.
{% if length(history) > 0 %}
Conversation so far:
{% for m in history %}
- {{ m.role }}: {{ m.content }}
{% endfor %}
{% endif %}
Question: "{{ query }}"

Respond with JSON only:
{"optimized_query": "<rewritten question>"})";

inline constexpr const char* kIntent = R"(Classify this investment research query.

Intents and the data each needs:
1. price_query: current price only (market_data)
2. fundamental_analysis: metrics, valuation, ratios (market_data, context)
3. sentiment_analysis: news and market mood (market_data, sentiment)
4. general_research: broad analysis (market_data, sentiment, context)
5. comparison: several stocks side by side (market_data, context)

Only enable what the query needs. With no tickers, enable context.

Query: "{{ query }}"
Tickers found: {% if length(tickers) > 0 %}{{ join(tickers, ", ") }}{% else %}None{% endif %}

Respond with JSON only:
{"intent": "<price_query|fundamental_analysis|sentiment_analysis|general_research|comparison>",
 "fetch_market_data": true|false, "analyze_sentiment": true|false, "retrieve_context": true|false,
 "reasoning": "<short>"})";

inline constexpr const char* kSynthesis = R"(You are an investment research analyst. Write a {{ template }} report in markdown answering:
"{{ query }}"

Tickers: {% if length(tickers) > 0 %}{{ join(tickers, ", ") }}{% else %}none{% endif %}

{% if data_sources.market_data %}
## Market data
{% for m in market_data %}
- {{ m.ticker }}: price {{ fixed(m.current_price, 2) }}, change {{ fixed(m.change_percent, 2) }}%, P/E {{ fixed(m.pe_ratio, 2) }}, 52-week position {{ fixed(m.week_52_position, 1) }}% ({{ m.trend_signal }})
{% endfor %}
{% endif %}
{% if data_sources.peer_valuation %}
## Peer valuation
{% for p in peer_valuation %}
- {{ p.ticker }} ({{ p.sector }}): P/E {{ fixed(p.pe_ratio, 2) }} vs sector {{ fixed(p.sector_avg_pe, 2) }}
{% endfor %}
{% endif %}
{% if data_sources.sentiment %}
## Sentiment
{% for s in sentiment_analysis %}
- {{ s.ticker }}: {{ s.overall_sentiment }} ({{ fixed(s.confidence, 2) }}) {{ s.summary }}
{% endfor %}
{% endif %}
{% if data_sources.analyst_consensus %}
## Analyst consensus
{% for a in analyst_consensus %}
- {{ a.ticker }}: target {{ fixed(a.target_price_mean, 2) }}, upside {{ signed_pct(a.upside_potential) }}, {{ a.recommendation }} ({{ a.num_analysts }} analysts)
{% endfor %}
{% endif %}
{% if data_sources.context %}
## Documents
{% for d in retrieved_context %}
- [{{ d.source }}] {{ d.text }}
{% endfor %}
{% endif %}

Use only the data above. Say plainly which data was unavailable. End with a short risk section.)";

inline constexpr const char* kRefinement = R"(Improve the investment report below. Address every gap listed; keep everything that is correct.

Question: "{{ query }}"
Gaps:
{% for g in gaps %}
- {{ g }}
{% endfor %}

Report:
{{ report }}

Return the full improved report in markdown.)";

inline constexpr const char* kEvaluation = R"(Rate this investment research report on completeness, accuracy against the question, consistency and actionability.

Question: "{{ query }}"
Available data: {{ data_sources }}

Report:
{{ report }}

Respond with JSON only:
{"overall_score": <0-10>, "gaps": ["<missing or weak point>", ...], "summary": "<one sentence>"})";

} // namespace researchflow::prompts

#endif // RESEARCHFLOW_SERVICES_PROMPTS_H
