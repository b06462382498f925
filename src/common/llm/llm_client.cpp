// common/llm/llm_client.cpp
#include "common/llm/llm_client.h"
#include "core/types/errors.h"

namespace researchflow {

nlohmann::json parse_json_response(const std::string& text) {
    std::string body = text;
    // models like to wrap JSON in ``` fences
    if (auto fence = body.find("```"); fence != std::string::npos) {
        auto start = body.find('\n', fence);
        auto close = body.find("```", fence + 3);
        if (start != std::string::npos && close != std::string::npos && close > start) {
            body = body.substr(start + 1, close - start - 1);
        }
    }
    auto open = body.find('{');
    auto close = body.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        throw ResponseShapeError("LLM response contains no JSON object");
    }
    try {
        return nlohmann::json::parse(body.substr(open, close - open + 1));
    } catch (const nlohmann::json::parse_error& e) {
        throw ResponseShapeError(std::string("LLM response is not valid JSON: ") + e.what());
    }
}

} // namespace researchflow
