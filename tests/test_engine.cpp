// tests/test_engine.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "core/engine.h"
#include "modules/trace/trace_exporter.h"
#include "services/template_report_synthesizer.h"
#include "test_helpers.h"
#include <algorithm>

using namespace researchflow;
using namespace researchflow::testing;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

namespace {

// Engine over fakes; every collaborator stays reachable for assertions.
struct Fixture {
    std::shared_ptr<FakeValidator> validator = std::make_shared<FakeValidator>();
    std::shared_ptr<FakeOptimizer> optimizer = std::make_shared<FakeOptimizer>();
    std::shared_ptr<FakeClassifier> classifier = std::make_shared<FakeClassifier>();
    std::shared_ptr<FakeMarketData> data = std::make_shared<FakeMarketData>();
    std::shared_ptr<ScriptedSynthesizer> synth = std::make_shared<ScriptedSynthesizer>();
    std::shared_ptr<InMemoryConversationStore> store = std::make_shared<InMemoryConversationStore>();
    RecordingSleep sleep;

    ResearchServices services(std::shared_ptr<ReportSynthesizer> reports = nullptr) const {
        ResearchServices s;
        s.validator = validator;
        s.optimizer = optimizer;
        s.classifier = classifier;
        s.ticker_extractor = std::make_shared<TickerExtractor>();
        s.market = data;
        s.sentiment = data;
        s.consensus = data;
        s.documents = data;
        s.reports = reports ? reports : synth;
        s.conversations = store;
        return s;
    }

    std::unique_ptr<ResearchEngine> engine(std::shared_ptr<ReportSynthesizer> reports = nullptr) const {
        ResearchConfig config;
        config.retry = RetryPolicy{3, 10ms};
        return std::make_unique<ResearchEngine>(services(std::move(reports)), config, sleep.fn());
    }
};

bool ran(const ResearchResponse& r, const std::string& node) {
    return std::find(r.executed_agents.begin(), r.executed_agents.end(), node) != r.executed_agents.end();
}

} // namespace

TEST_CASE("Price query runs market data and forward looking only", "[engine]") {
    Fixture f;
    auto result = f.engine()->run({std::string("session-1"), "AAPL price"});
    const auto& r = result.response;

    REQUIRE(result.success);
    REQUIRE(r.session_id == "session-1");
    REQUIRE(r.run_id.rfind("run-", 0) == 0);
    REQUIRE(r.tickers == std::vector<std::string>{"AAPL"});
    REQUIRE(r.intent == "price_query");
    REQUIRE(r.flags == DispatchFlags{true, false, false});

    REQUIRE(ran(r, "market_data"));
    REQUIRE(ran(r, "forward_looking"));
    REQUIRE_FALSE(ran(r, "sentiment"));
    REQUIRE_FALSE(ran(r, "rag_retrieval"));
    REQUIRE(r.executed_agents.front() == "validation");
    REQUIRE(r.executed_agents.back() == "memory_saver");

    REQUIRE(r.market_data_available);
    REQUIRE(r.analyst_consensus_available);
    REQUIRE_FALSE(r.sentiment_available);
    REQUIRE(r.context_retrieved == 0);
    REQUIRE(r.agent_errors.empty());

    REQUIRE(r.report == "# Report for AAPL price [brief_market]");
    REQUIRE(r.snapshot["ticker"] == "AAPL");
    REQUIRE(r.visualization_data.size() == 1);
    REQUIRE(r.quality_score == 0.9);
    REQUIRE(r.is_quality_passed);
    REQUIRE(f.store->load("session-1", 10).size() == 2);
}

TEST_CASE("Partial identifier failure keeps data available", "[engine]") {
    Fixture f;
    f.data->quote_timeouts["MSFT"] = -1;
    auto result = f.engine()->run({std::nullopt, "AAPL vs MSFT"});
    const auto& r = result.response;

    REQUIRE(result.success);
    REQUIRE(r.session_id.rfind("session-", 0) == 0);
    REQUIRE(r.tickers == std::vector<std::string>{"AAPL", "MSFT"});
    REQUIRE(r.market_data_available);
    REQUIRE_FALSE(r.agent_errors.contains("market_data"));
    auto msft_error = std::find_if(r.errors.begin(), r.errors.end(), [](const std::string& e) {
        return e.find("market_data error for MSFT") == 0;
    });
    REQUIRE(msft_error != r.errors.end());
    // two backoff sleeps for the MSFT quote
    REQUIRE(f.sleep.delays->size() == 2);
}

TEST_CASE("An empty session id gets a fresh session", "[engine]") {
    Fixture f;
    auto result = f.engine()->run({std::string(""), "AAPL price"});

    REQUIRE(result.success);
    REQUIRE(result.response.session_id.rfind("session-", 0) == 0);
    REQUIRE(f.store->load("", 10).empty());
    REQUIRE(f.store->load(result.response.session_id, 10).size() == 2);
}

TEST_CASE("Validation failure fails open", "[engine]") {
    Fixture f;
    f.validator->fail = true;
    auto result = f.engine()->run({std::nullopt, "AAPL price"});

    REQUIRE(result.success);
    REQUIRE(ran(result.response, "market_data"));
    REQUIRE_FALSE(result.response.report.empty());
}

TEST_CASE("Classifier failure dispatches every specialist", "[engine]") {
    Fixture f;
    f.classifier->fail = true;
    auto result = f.engine()->run({std::nullopt, "AAPL price"});
    const auto& r = result.response;

    REQUIRE(result.success);
    REQUIRE(r.intent == "general_research");
    for (const char* node : {"market_data", "sentiment", "forward_looking", "rag_retrieval"}) {
        REQUIRE(ran(r, node));
    }
    REQUIRE(r.context_retrieved == 1);
    REQUIRE(r.sentiment_available);
}

TEST_CASE("Invalid query still renders a report without data", "[engine]") {
    Fixture f;
    f.validator->valid = false;
    auto result = f.engine(std::make_shared<TemplateReportSynthesizer>())->run({std::nullopt, "tell me a joke"});
    const auto& r = result.response;

    REQUIRE(result.success);
    REQUIRE(f.classifier->calls == 0);
    REQUIRE(f.optimizer->calls == 0);
    for (const char* node : {"market_data", "sentiment", "forward_looking", "rag_retrieval"}) {
        REQUIRE_FALSE(ran(r, node));
    }
    REQUIRE(ran(r, "aggregator"));
    REQUIRE_THAT(r.report, ContainsSubstring("No data sources were used for this report."));
    REQUIRE_FALSE(r.market_data_available);
    REQUIRE(r.snapshot.is_null());
}

TEST_CASE("Report synthesis failure fails the whole run", "[engine]") {
    Fixture f;
    f.synth->synthesize_fails = true;
    auto result = f.engine()->run({std::string("session-x"), "AAPL price"});
    const auto& r = result.response;

    REQUIRE_FALSE(result.success);
    REQUIRE_THAT(result.message, ContainsSubstring("Report synthesis produced no report"));
    REQUIRE_THAT(result.message, ContainsSubstring("authentication failed"));
    REQUIRE(r.report.empty());
    REQUIRE(r.snapshot.is_null());
    REQUIRE(r.agent_errors.contains("report"));
    REQUIRE(r.errors.back() == result.message);
    REQUIRE_FALSE(ran(r, "quality_check"));
    REQUIRE(f.store->load("session-x", 10).empty());
}

TEST_CASE("Empty report text fails the whole run", "[engine]") {
    Fixture f;
    f.synth->return_empty = true;
    auto result = f.engine()->run({std::nullopt, "AAPL price"});

    REQUIRE_FALSE(result.success);
    REQUIRE(result.message == "Report synthesis produced no report");
}

TEST_CASE("Document retrieval failure is recorded per node", "[engine]") {
    Fixture f;
    f.classifier->flags = {true, false, true};
    f.data->documents_fail = true;
    auto result = f.engine()->run({std::nullopt, "AAPL fundamentals"});
    const auto& r = result.response;

    REQUIRE(result.success);
    REQUIRE(r.agent_errors.contains("rag_retrieval"));
    REQUIRE(r.context_retrieved == 0);
    REQUIRE(r.market_data_available);
    // permanent: no backoff
    REQUIRE(f.data->retrieve_calls == 1);
}

TEST_CASE("Cancelled run returns no report", "[engine][cancel]") {
    Fixture f;
    std::stop_source source;
    source.request_stop();
    auto result = f.engine()->run({std::nullopt, "AAPL price"}, source.get_token());

    REQUIRE_FALSE(result.success);
    REQUIRE_THAT(result.message, ContainsSubstring("cancelled"));
    REQUIRE(result.response.report.empty());
    REQUIRE(f.validator->calls == 0);
}

TEST_CASE("Conversation accumulates across runs of one session", "[engine]") {
    Fixture f;
    auto engine = f.engine();
    REQUIRE(engine->run({std::string("chat"), "AAPL price"}).success);
    REQUIRE(engine->run({std::string("chat"), "and MSFT?"}).success);

    auto history = f.store->load("chat", 10);
    REQUIRE(history.size() == 4);
    REQUIRE(history[2]["content"] == "and MSFT?");

    auto traces = engine->last_traces();
    REQUIRE_FALSE(traces.empty());
    REQUIRE(traces.front().node == NodeId::VALIDATION);
}

TEST_CASE("Response serializes to JSON", "[engine]") {
    Fixture f;
    auto result = f.engine()->run({std::string("s"), "AAPL price"});
    auto j = result.response.to_json();

    REQUIRE(j["session_id"] == "s");
    REQUIRE(j["dispatch_flags"]["market_data"] == true);
    REQUIRE(j["market_data_available"] == true);
    REQUIRE(j["quality_score"] == 0.9);
    REQUIRE(j["report_metadata"]["reflection_iterations"] == 1);
}

TEST_CASE("Traces export with run id and changed fields", "[engine][trace]") {
    Fixture f;
    auto engine = f.engine();
    auto result = engine->run({std::string("s"), "AAPL price"});
    auto exported = TraceExporter::to_json(engine->last_traces());

    REQUIRE(exported.size() == engine->last_traces().size());
    const auto& first = exported[0];
    REQUIRE(first["node"] == "validation");
    REQUIRE(first["run_id"] == result.response.run_id);
    REQUIRE(first["status"] == "success");
    REQUIRE(first["generation"] == 0);
    REQUIRE(first["error_class"].is_null());
    REQUIRE(first["end_time"].get<std::string>().back() == 'Z');

    auto changed = first["changed_fields"];
    REQUIRE(std::find(changed.begin(), changed.end(), "is_query_valid") != changed.end());
}
