// common/llm/llm_client.h
#ifndef RESEARCHFLOW_COMMON_LLM_LLM_CLIENT_H
#define RESEARCHFLOW_COMMON_LLM_LLM_CLIENT_H

#include <nlohmann/json.hpp>
#include <stop_token>
#include <string>

namespace researchflow {

// Text completion backend used by the LLM-backed services.
class LlmClient {
public:
    virtual ~LlmClient() = default;

    // Throws ServiceError subclasses on backend failure and CancelledError
    // when `stop` is requested mid-generation.
    virtual std::string complete(const std::string& prompt, std::stop_token stop = {}) = 0;
};

// First JSON object in a completion, code fences stripped.
// Throws ResponseShapeError when there is none.
nlohmann::json parse_json_response(const std::string& text);

} // namespace researchflow

#endif // RESEARCHFLOW_COMMON_LLM_LLM_CLIENT_H
