// services/conversation_store.h
#ifndef RESEARCHFLOW_SERVICES_CONVERSATION_STORE_H
#define RESEARCHFLOW_SERVICES_CONVERSATION_STORE_H

#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <string>

namespace researchflow {

// Session message history. Messages are {role, content, timestamp}.
class ConversationStore {
public:
    virtual ~ConversationStore() = default;

    // The last `limit` messages, oldest first. Unknown session: empty array.
    virtual nlohmann::json load(const std::string& session_id, int limit) = 0;

    // Appends a message; an unknown session is created.
    virtual void save(const std::string& session_id, const std::string& role, const std::string& content) = 0;
};

class InMemoryConversationStore : public ConversationStore {
public:
    nlohmann::json load(const std::string& session_id, int limit) override;
    void save(const std::string& session_id, const std::string& role, const std::string& content) override;

protected:
    std::mutex mutex_;
    std::map<std::string, nlohmann::json> sessions_; // session id -> messages array

    static nlohmann::json tail(const nlohmann::json& messages, int limit);
};

// Whole store kept in one JSON file, rewritten on every save:
//   {"<session id>": {"messages": [...], "created_at": "...", "updated_at": "..."}}
class JsonFileConversationStore : public ConversationStore {
public:
    // Reads the file if it exists. Throws ConfigError if it is not valid JSON.
    explicit JsonFileConversationStore(std::string path);

    nlohmann::json load(const std::string& session_id, int limit) override;
    // Throws std::runtime_error when the file cannot be written.
    void save(const std::string& session_id, const std::string& role, const std::string& content) override;

private:
    std::string path_;
    std::mutex mutex_;
    nlohmann::json doc_;

    void flush(const nlohmann::json& doc) const;
};

// ISO-8601 UTC, second precision.
std::string utc_timestamp();

} // namespace researchflow

#endif // RESEARCHFLOW_SERVICES_CONVERSATION_STORE_H
