// nodes/postprocess_nodes.cpp
#include "nodes/postprocess_nodes.h"
#include "nodes/fetch_helpers.h"
#include "modules/context/state_schema.h"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace researchflow {

namespace {

const Value* find_by_ticker(const Value& list, const std::string& ticker) {
    if (!list.is_array()) return nullptr;
    for (const auto& item : list) {
        if (item.is_object() && item.value("ticker", "") == ticker) return &item;
    }
    return nullptr;
}

double number_or(const Value& obj, const char* key, double fallback) {
    auto it = obj.find(key);
    return (it != obj.end() && it->is_number()) ? it->get<double>() : fallback;
}

bool has_number(const Value& obj, const char* key) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_number();
}

int recommendation_score(std::string rec) {
    std::transform(rec.begin(), rec.end(), rec.begin(), [](unsigned char c) {
        return c == ' ' || c == '-' ? '_' : static_cast<char>(std::tolower(c));
    });
    if (rec == "strong_buy") return 2;
    if (rec == "buy" || rec == "outperform" || rec == "overweight") return 1;
    if (rec == "sell" || rec == "underperform" || rec == "underweight") return -1;
    if (rec == "strong_sell") return -2;
    return 0;
}

const char* rating_for(int score) {
    if (score >= 4) return "strong_buy";
    if (score >= 2) return "buy";
    if (score <= -4) return "strong_sell";
    if (score <= -2) return "sell";
    return "hold";
}

// peer_comparison series: the ticker itself, then its sector average
Value peer_comparison_series(const std::string& ticker, const Value& peer_valuation) {
    Value series = Value::array();
    const Value* peer = find_by_ticker(peer_valuation, ticker);
    if (!peer) return series;

    series.push_back({
        {"ticker", ticker},
        {"name", ticker},
        {"pe_ratio", peer->value("pe_ratio", Value())},
        {"pb_ratio", peer->value("price_to_book", Value())},
        {"ps_ratio", peer->value("price_to_sales", Value())},
        {"is_main", true}
    });

    std::string sector = peer->value("sector", "");
    if (sector.empty()) sector = "Sector";
    series.push_back({
        {"ticker", sector.substr(0, 10) + " Avg"},
        {"name", sector + " Average"},
        {"pe_ratio", peer->value("sector_avg_pe", Value())},
        {"pb_ratio", peer->value("sector_avg_pb", Value())},
        {"ps_ratio", peer->value("sector_avg_ps", Value())},
        {"is_main", false}
    });
    return series;
}

} // namespace

Value data_source_availability(const Context& state) {
    StateView view(state);
    return {
        {"market_data", view.has_entries(fields::MARKET_DATA)},
        {"sentiment", view.has_entries(fields::SENTIMENT_ANALYSIS)},
        {"analyst_consensus", view.has_entries(fields::ANALYST_CONSENSUS)},
        {"peer_valuation", view.has_entries(fields::PEER_VALUATION)},
        {"context", view.has_entries(fields::RETRIEVED_CONTEXT)}
    };
}

ReportRequest make_report_request(const Context& state) {
    StateView view(state);
    ReportRequest request;
    request.query = view.user_query();
    request.intent = view.intent();
    request.template_name = select_report_template(request.intent);
    request.tickers = view.tickers();
    for (const char* key : {fields::MARKET_DATA, fields::PEER_VALUATION, fields::SENTIMENT_ANALYSIS,
                            fields::ANALYST_CONSENSUS, fields::RETRIEVED_CONTEXT}) {
        const Value& v = view.field(key);
        request.data[key] = v.is_array() ? v : Value::array();
    }
    request.data["data_sources"] = data_source_availability(state);
    return request;
}

Value build_snapshot(const std::vector<std::string>& tickers, const Value& market_data,
                     const Value& sentiment, const Value& consensus) {
    if (tickers.empty()) return nullptr;
    const std::string& ticker = tickers.front();
    const Value* quote = find_by_ticker(market_data, ticker);
    if (!quote) return nullptr;

    const Value* mood = find_by_ticker(sentiment, ticker);
    const Value* view = find_by_ticker(consensus, ticker);

    int score = 0;
    std::vector<std::string> reasons;
    Value highlights = Value::array();
    Value risks = Value::array();

    if (view) {
        std::string rec = view->value("recommendation", "");
        int rec_score = recommendation_score(rec);
        score += rec_score;
        if (!rec.empty()) reasons.push_back("analysts rate it " + rec);

        if (has_number(*view, "upside_potential")) {
            double upside = view->at("upside_potential").get<double>();
            if (upside >= 15.0) {
                score += 1;
                highlights.push_back(fmt::format("Analysts see {:.1f}% upside to a mean target of ${:.2f}",
                                                 upside, number_or(*view, "target_price_mean", 0.0)));
            } else if (upside < 0.0) {
                score -= 1;
                risks.push_back(fmt::format("Price is {:.1f}% above the mean analyst target", -upside));
            }
        }
    }

    if (mood) {
        std::string overall = mood->value("overall_sentiment", "neutral");
        double confidence = number_or(*mood, "confidence", 0.0);
        if (overall == "positive") {
            score += 1;
            highlights.push_back(fmt::format("Recent news sentiment is positive ({:.0f}% confidence)", confidence * 100.0));
        } else if (overall == "negative") {
            score -= 1;
            risks.push_back(fmt::format("Recent news sentiment is negative ({:.0f}% confidence)", confidence * 100.0));
        }
        reasons.push_back("news sentiment is " + overall);
    }

    auto trend_it = quote->find("trend_signal");
    const std::string trend = (trend_it != quote->end() && trend_it->is_string()) ? trend_it->get<std::string>() : "";
    if (trend == "near_high") {
        risks.push_back("Trading near its 52-week high, leaving less room before resistance");
    } else if (trend == "near_low") {
        highlights.push_back("Trading near its 52-week low");
        risks.push_back("Price momentum has been weak over the past year");
    }

    if (has_number(*quote, "pe_ratio")) {
        double pe = quote->at("pe_ratio").get<double>();
        if (pe > 35.0) {
            risks.push_back(fmt::format("Valuation is demanding at {:.1f}x earnings", pe));
        } else if (pe > 0.0 && pe < 15.0) {
            highlights.push_back(fmt::format("Modest valuation at {:.1f}x earnings", pe));
        }
    }
    if (has_number(*quote, "change_percent")) {
        double change = quote->at("change_percent").get<double>();
        if (change >= 2.0) highlights.push_back(fmt::format("Up {:.2f}% in the latest session", change));
        if (change <= -2.0) risks.push_back(fmt::format("Down {:.2f}% in the latest session", -change));
    }
    if (risks.empty()) {
        risks.push_back("Equity prices can fall with the broader market");
    }

    const char* rating = rating_for(score);
    std::string explanation;
    if (reasons.empty()) {
        explanation = "Only price data is available, so the rating stays neutral.";
    } else {
        explanation = "Rated " + std::string(rating) + " because ";
        for (std::size_t i = 0; i < reasons.size(); ++i) {
            if (i > 0) explanation += i + 1 == reasons.size() ? " and " : ", ";
            explanation += reasons[i];
        }
        explanation += ".";
    }

    return {
        {"ticker", ticker},
        {"current_price", quote->value("current_price", Value())},
        {"price_change_pct", quote->value("change_percent", Value())},
        {"market_cap", quote->value("market_cap", Value())},
        {"pe_ratio", quote->value("pe_ratio", Value())},
        {"investment_rating", rating},
        {"rating_explanation", explanation},
        {"key_highlights", highlights},
        {"risk_warnings", risks}
    };
}

// ————————————————————————
// VisualizationNode
// ————————————————————————

VisualizationNode::VisualizationNode(std::shared_ptr<MarketDataProvider> provider)
    : Node(NodeId::VISUALIZATION), provider_(std::move(provider)) {
    if (!provider_) throw std::invalid_argument("VisualizationNode requires a market data provider");
}

PartialUpdate VisualizationNode::execute(const Context& state, NodeRuntime& runtime) {
    StateView view(state);
    const auto tickers = view.tickers();
    if (tickers.empty()) {
        logging::get()->warn("No tickers to generate visualization data for");
        return PartialUpdate::object();
    }

    const Value& market_data = view.field(fields::MARKET_DATA);
    const Value& peer_valuation = view.field(fields::PEER_VALUATION);
    Value charts = Value::array();
    Value errors = Value::array();

    for (const auto& ticker : tickers) {
        Value history = fetch_for_ticker(runtime, name(), "price history", ticker,
                                         [this](const std::string& t) { return provider_->fetch_price_history(t); }, errors);
        if (history.is_null()) {
            logging::get()->warn("No historical data available for {}", ticker);
            continue;
        }

        Value points = Value::array();
        for (const auto& p : history["data"]) {
            if (p.is_object() && p.contains("date")) points.push_back(p);
        }
        std::sort(points.begin(), points.end(), [](const Value& a, const Value& b) {
            return a["date"].dump() < b["date"].dump();
        });

        Value chart = {
            {"ticker", ticker},
            {"price_history", points},
            {"week_52_high", nullptr},
            {"week_52_low", nullptr},
            {"current_price", nullptr},
            {"current_position_pct", nullptr},
            {"peer_comparison", peer_comparison_series(ticker, peer_valuation)}
        };
        if (const Value* quote = find_by_ticker(market_data, ticker)) {
            chart["current_price"] = quote->value("current_price", Value());
            chart["week_52_high"] = quote->value("year_high", Value());
            chart["week_52_low"] = quote->value("year_low", Value());
            chart["current_position_pct"] = quote->value("week_52_position", Value());
        }
        const Value& summary = history["summary"];
        chart["period_high"] = summary.is_object() ? summary.value("highest", Value()) : Value();
        chart["period_low"] = summary.is_object() ? summary.value("lowest", Value()) : Value();
        chart["average_volume"] = summary.is_object() ? summary.value("average_volume", Value()) : Value();

        runtime.trace.add_step(fmt::format("Chart data for {}: {} price points, {} peers",
                                           ticker, points.size(), chart["peer_comparison"].size()));
        charts.push_back(std::move(chart));
    }

    PartialUpdate update = {{fields::VISUALIZATION_DATA, charts}};
    if (!errors.empty()) update[fields::ERRORS] = errors;
    return update;
}

// ————————————————————————
// ReportNode
// ————————————————————————

ReportNode::ReportNode(std::shared_ptr<ReportSynthesizer> synthesizer, int max_iterations, double quality_threshold)
    : Node(NodeId::REPORT), synthesizer_(std::move(synthesizer)),
      max_iterations_(std::max(1, max_iterations)), quality_threshold_(quality_threshold) {
    if (!synthesizer_) throw std::invalid_argument("ReportNode requires a report synthesizer");
}

PartialUpdate ReportNode::execute(const Context& state, NodeRuntime& runtime) {
    StateView view(state);
    const ReportRequest request = make_report_request(state);
    const Value& data_sources = request.data["data_sources"];

    logging::get()->info("Generating report for intent {} with template {}", to_string(request.intent), request.template_name);
    runtime.trace.add_step("Starting report generation for intent " + to_string(request.intent) +
                           ", template " + request.template_name);

    // 反思循环: 生成 -> 评估 -> 改写
    std::string report;
    int iterations = 0;
    for (int iteration = 1; iteration <= max_iterations_; ++iteration) {
        if (iteration == 1) {
            // a failed first draft fails the node; the envelope retries it and the
            // report postcondition ends the run
            report = synthesizer_->synthesize(request, runtime.budget.token());
            iterations = 1;
            runtime.trace.add_step("Iteration 1: report drafted");
        }

        QualityEvaluation evaluation;
        try {
            evaluation = retry_call(runtime.retry, runtime.budget,
                                    [&] { return synthesizer_->evaluate(request, report, runtime.budget.token()); }, nullptr, "report evaluation");
        } catch (const CancelledError&) {
            throw;
        } catch (const std::exception& e) {
            logging::get()->warn("Report evaluation failed, accepting current report: {}", e.what());
            runtime.trace.add_step(fmt::format("Iteration {}: evaluation failed, report accepted", iteration));
            break;
        }

        logging::get()->info("Quality score {:.2f} (threshold {:.2f})", evaluation.score, quality_threshold_);
        runtime.trace.add_step(fmt::format("Iteration {}: quality score = {:.2f}, feedback: {}", iteration,
                                           evaluation.score, evaluation.summary.empty() ? "N/A" : evaluation.summary));
        if (evaluation.score >= quality_threshold_) {
            runtime.trace.add_step(fmt::format("Quality threshold met ({:.2f} >= {:.2f}), report accepted",
                                               evaluation.score, quality_threshold_));
            break;
        }
        if (iteration == max_iterations_) {
            logging::get()->warn("Max iterations reached, using report with quality {:.2f}", evaluation.score);
            runtime.trace.add_step(fmt::format("Max iterations reached, accepting report with quality {:.2f}",
                                               evaluation.score));
            break;
        }

        std::string refined;
        try {
            refined = retry_call(runtime.retry, runtime.budget,
                                 [&] { return synthesizer_->refine(request, report, evaluation, runtime.budget.token()); }, nullptr, "report refinement");
        } catch (const CancelledError&) {
            throw;
        } catch (const std::exception& e) {
            logging::get()->warn("Report refinement failed, keeping previous draft: {}", e.what());
            runtime.trace.add_step(fmt::format("Iteration {}: refinement failed, previous draft kept", iteration + 1));
            break;
        }
        if (!refined.empty()) report = std::move(refined);
        iterations = iteration + 1;
        runtime.trace.add_step(fmt::format("Iteration {}: report refined", iterations));
    }

    Value snapshot = build_snapshot(request.tickers, request.data[fields::MARKET_DATA],
                                    request.data[fields::SENTIMENT_ANALYSIS], request.data[fields::ANALYST_CONSENSUS]);
    if (snapshot.is_null()) {
        logging::get()->warn("Insufficient data to generate snapshot");
    }

    Value metadata = {
        {"executed_agents", view.field(fields::EXECUTED_AGENTS)},
        {"data_sources", data_sources},
        {"intent", to_string(request.intent)},
        {"tickers", request.tickers},
        {"report_template", request.template_name},
        {"reflection_iterations", iterations}
    };

    return {
        {fields::REPORT, report},
        {fields::SNAPSHOT, snapshot},
        {fields::REPORT_METADATA, metadata}
    };
}

// ————————————————————————
// QualityCheckNode
// ————————————————————————

QualityCheckNode::QualityCheckNode(std::shared_ptr<ReportSynthesizer> synthesizer, double quality_threshold)
    : Node(NodeId::QUALITY_CHECK), synthesizer_(std::move(synthesizer)), quality_threshold_(quality_threshold) {
    if (!synthesizer_) throw std::invalid_argument("QualityCheckNode requires a report synthesizer");
}

PartialUpdate QualityCheckNode::execute(const Context& state, NodeRuntime& runtime) {
    StateView view(state);
    const Value& report = view.field(fields::REPORT);
    if (!report.is_string() || report.get<std::string>().empty()) {
        logging::get()->warn("No report to quality check");
        runtime.trace.add_step("No report generated");
        return {{fields::QUALITY_SCORE, 0.0}, {fields::IS_QUALITY_PASSED, false}};
    }

    const ReportRequest request = make_report_request(state);
    try {
        QualityEvaluation evaluation = retry_call(runtime.retry, runtime.budget,
            [&] { return synthesizer_->evaluate(request, report.get<std::string>(), runtime.budget.token()); }, nullptr, "quality check");
        const bool passed = evaluation.score >= quality_threshold_;
        logging::get()->info("Report quality check: {} ({:.2f})", passed ? "PASS" : "FAIL", evaluation.score);
        runtime.trace.add_step(fmt::format("Final quality {:.2f}: {}", evaluation.score, passed ? "passed" : "below threshold"));
        return {{fields::QUALITY_SCORE, evaluation.score}, {fields::IS_QUALITY_PASSED, passed}};
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        logging::get()->warn("Quality check failed, report passed unchecked: {}", e.what());
        runtime.trace.add_step(std::string("Evaluation unavailable, report passed: ") + e.what());
        return {{fields::QUALITY_SCORE, nullptr}, {fields::IS_QUALITY_PASSED, true}};
    }
}

// ————————————————————————
// MemorySaverNode
// ————————————————————————

MemorySaverNode::MemorySaverNode(std::shared_ptr<ConversationStore> store)
    : Node(NodeId::MEMORY_SAVER), store_(std::move(store)) {
    if (!store_) throw std::invalid_argument("MemorySaverNode requires a conversation store");
}

PartialUpdate MemorySaverNode::execute(const Context& state, NodeRuntime& runtime) {
    StateView view(state);
    const Value& report = view.field(fields::REPORT);
    if (!report.is_string() || report.get<std::string>().empty()) {
        logging::get()->warn("No report to save");
        return PartialUpdate::object();
    }

    const std::string session_id = view.session_id();
    try {
        retry_call(runtime.retry, runtime.budget,
                   [&] { store_->save(session_id, "user", view.user_query()); }, nullptr, "save user message");
        retry_call(runtime.retry, runtime.budget,
                   [&] { store_->save(session_id, "assistant", report.get<std::string>()); }, nullptr, "save report");
        logging::get()->info("Saved conversation to session {}", session_id);
        runtime.trace.add_step("Saved query and report to session " + session_id);
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        logging::get()->error("Failed to save conversation: {}", e.what());
        runtime.trace.add_step(std::string("Save failed: ") + e.what());
    }
    return PartialUpdate::object();
}

} // namespace researchflow
