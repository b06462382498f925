// common/tools/fixture_tools.cpp
#include "common/tools/fixture_tools.h"
#include "core/types/errors.h"
#include "common/utils/logging.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <unordered_map>

namespace researchflow {

namespace {

[[noreturn]] void raise_fixture_error(const nlohmann::json& err, const std::string& where) {
    std::string kind = err.value("kind", "unavailable");
    std::string message = err.value("message", where);
    if (kind == "timeout") throw TimeoutError(message);
    if (kind == "connection") throw ConnectionError(message);
    if (kind == "rate_limit") throw RateLimitError(message);
    if (kind == "unavailable") throw UnavailableError(message, err.value("status", 503));
    if (kind == "auth") throw AuthenticationError(message);
    if (kind == "permission") throw PermissionDeniedError(message);
    if (kind == "invalid") throw InvalidInputError(message);
    if (kind == "shape") throw ResponseShapeError(message);
    throw ServiceError(message);
}

std::vector<std::string> words_of(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) words.push_back(std::move(current));
    return words;
}

// Shared by all registered tools; counts simulated failures.
class FixtureStore {
public:
    explicit FixtureStore(nlohmann::json fixtures) : fixtures_(std::move(fixtures)) {}

    nlohmann::json lookup(const std::string& section, const nlohmann::json& args) {
        std::string ticker = args.value("ticker", "");
        if (ticker.empty()) {
            throw InvalidInputError(section + ": missing 'ticker' argument");
        }
        auto sec = fixtures_.find(section);
        if (sec == fixtures_.end() || !sec->is_object()) return nullptr;
        auto entry = sec->find(ticker);
        if (entry == sec->end()) return nullptr;
        return resolve(*entry, section + "/" + ticker);
    }

    nlohmann::json search(const nlohmann::json& args) {
        const std::string query = args.value("query", "");
        const std::string ticker = args.value("ticker", "");
        const int top_k = std::max(1, args.value("top_k", 5));

        auto docs = fixtures_.find("documents");
        nlohmann::json results = nlohmann::json::array();
        if (docs == fixtures_.end() || !docs->is_array()) return results;

        auto terms = words_of(query);
        std::set<std::string> query_terms(terms.begin(), terms.end());

        std::vector<std::pair<double, nlohmann::json>> scored;
        for (const auto& raw : *docs) {
            nlohmann::json doc = resolve(raw, "documents");
            if (!doc.is_object()) continue;
            if (!ticker.empty() && doc.value("ticker", "") != ticker) continue;

            auto doc_words = words_of(doc.value("title", "") + " " + doc.value("text", ""));
            std::set<std::string> doc_terms(doc_words.begin(), doc_words.end());
            std::size_t hits = 0;
            for (const auto& t : query_terms) hits += doc_terms.count(t);
            double score = query_terms.empty() ? 0.0 : static_cast<double>(hits) / query_terms.size();
            // a ticker filter already narrows the set; keep zero-score hits then
            if (hits == 0 && ticker.empty()) continue;
            doc["score"] = score;
            scored.emplace_back(score, std::move(doc));
        }
        std::stable_sort(scored.begin(), scored.end(),
                         [](const auto& a, const auto& b) { return a.first > b.first; });
        for (std::size_t i = 0; i < scored.size() && static_cast<int>(i) < top_k; ++i) {
            results.push_back(std::move(scored[i].second));
        }
        return results;
    }

private:
    nlohmann::json fixtures_;
    std::mutex mutex_;
    std::unordered_map<std::string, int> failures_;

    nlohmann::json resolve(const nlohmann::json& entry, const std::string& key) {
        if (!entry.is_object() || !entry.contains("error")) return entry;
        const auto& err = entry["error"];
        if (err.contains("fail_times")) {
            int limit = err["fail_times"].get<int>();
            std::lock_guard<std::mutex> lock(mutex_);
            int& seen = failures_[key];
            if (seen >= limit) {
                return entry.value("data", nlohmann::json());
            }
            ++seen;
        }
        raise_fixture_error(err, key);
    }
};

} // namespace

void register_fixture_tools(ToolRegistry& registry, nlohmann::json fixtures) {
    auto store = std::make_shared<FixtureStore>(std::move(fixtures));

    const std::pair<const char*, const char*> lookups[] = {
        {"get_stock_price", "quotes"},
        {"get_peer_comparison", "peers"},
        {"get_price_history", "price_history"},
        {"get_analyst_consensus", "consensus"},
        {"get_sentiment", "sentiment"},
    };
    for (const auto& [tool, section] : lookups) {
        std::string sec = section;
        registry.register_tool(tool, [store, sec](const nlohmann::json& args) {
            return store->lookup(sec, args);
        });
    }
    registry.register_tool("search_documents", [store](const nlohmann::json& args) {
        return store->search(args);
    });
}

nlohmann::json load_fixture_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open fixture file: " + path);
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Invalid JSON in fixture file '" + path + "': " + e.what());
    }
}

} // namespace researchflow
