// services/conversation_store.cpp
#include "services/conversation_store.h"
#include "core/types/errors.h"
#include "common/utils/logging.h"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace researchflow {

std::string utc_timestamp() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

namespace {

nlohmann::json make_message(const std::string& role, const std::string& content) {
    return {{"role", role}, {"content", content}, {"timestamp", utc_timestamp()}};
}

nlohmann::json last_n(const nlohmann::json& messages, int limit) {
    nlohmann::json out = nlohmann::json::array();
    if (!messages.is_array() || limit <= 0) return out;
    std::size_t n = messages.size();
    std::size_t start = n > static_cast<std::size_t>(limit) ? n - limit : 0;
    for (std::size_t i = start; i < n; ++i) out.push_back(messages[i]);
    return out;
}

} // namespace

// --- InMemoryConversationStore ---

nlohmann::json InMemoryConversationStore::tail(const nlohmann::json& messages, int limit) {
    return last_n(messages, limit);
}

nlohmann::json InMemoryConversationStore::load(const std::string& session_id, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return nlohmann::json::array();
    return tail(it->second, limit);
}

void InMemoryConversationStore::save(const std::string& session_id, const std::string& role, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, created] = sessions_.try_emplace(session_id, nlohmann::json::array());
    if (created) {
        logging::get()->debug("Created conversation session {}", session_id);
    }
    it->second.push_back(make_message(role, content));
}

// --- JsonFileConversationStore ---

JsonFileConversationStore::JsonFileConversationStore(std::string path)
    : path_(std::move(path)), doc_(nlohmann::json::object()) {
    std::ifstream in(path_);
    if (!in) {
        logging::get()->info("Conversation store {} does not exist yet", path_);
        return;
    }
    try {
        doc_ = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Conversation store '" + path_ + "' is not valid JSON: " + e.what());
    }
    if (!doc_.is_object()) {
        throw ConfigError("Conversation store '" + path_ + "' must hold a JSON object");
    }
}

nlohmann::json JsonFileConversationStore::load(const std::string& session_id, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = doc_.find(session_id);
    if (it == doc_.end() || !it->is_object()) return nlohmann::json::array();
    return last_n(it->value("messages", nlohmann::json::array()), limit);
}

void JsonFileConversationStore::save(const std::string& session_id, const std::string& role, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    // committed only once the file holds it
    nlohmann::json updated = doc_;
    nlohmann::json& session = updated[session_id];
    if (!session.is_object()) {
        logging::get()->info("Session {} not found, creating it", session_id);
        session = {{"messages", nlohmann::json::array()}, {"created_at", utc_timestamp()}};
    }
    session["messages"].push_back(make_message(role, content));
    session["updated_at"] = utc_timestamp();
    flush(updated);
    doc_ = std::move(updated);
}

void JsonFileConversationStore::flush(const nlohmann::json& doc) const {
    namespace fs = std::filesystem;
    fs::path target(path_);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
    }
    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot write conversation store: " + tmp.string());
        }
        out << doc.dump(2);
        if (!out) {
            throw std::runtime_error("Failed writing conversation store: " + tmp.string());
        }
    }
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        throw std::runtime_error("Cannot replace conversation store " + path_ + ": " + ec.message());
    }
}

} // namespace researchflow
