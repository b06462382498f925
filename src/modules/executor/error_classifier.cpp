// modules/executor/error_classifier.cpp
#include "modules/executor/error_classifier.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <typeinfo>
#include <variant>

namespace researchflow {

namespace {

constexpr std::array<std::string_view, 9> kTransientKeywords = {
    "timeout", "timed out", "rate limit", "429", "502", "503",
    "connection", "temporary", "unavailable"
};

bool is_permanent_type(const std::exception& e) {
    return dynamic_cast<const InvalidInputError*>(&e) != nullptr
        || dynamic_cast<const AuthenticationError*>(&e) != nullptr
        || dynamic_cast<const PermissionDeniedError*>(&e) != nullptr
        || dynamic_cast<const ResponseShapeError*>(&e) != nullptr
        || dynamic_cast<const CancelledError*>(&e) != nullptr
        || dynamic_cast<const StateMergeError*>(&e) != nullptr
        || dynamic_cast<const std::invalid_argument*>(&e) != nullptr
        || dynamic_cast<const std::out_of_range*>(&e) != nullptr
        || dynamic_cast<const std::bad_cast*>(&e) != nullptr
        || dynamic_cast<const std::bad_variant_access*>(&e) != nullptr
        || dynamic_cast<const nlohmann::json::type_error*>(&e) != nullptr
        || dynamic_cast<const nlohmann::json::parse_error*>(&e) != nullptr
        || dynamic_cast<const nlohmann::json::out_of_range*>(&e) != nullptr;
}

bool is_transient_status(int status) {
    return status == 429 || status == 502 || status == 503;
}

} // namespace

bool has_transient_keyword(std::string_view message) {
    std::string lower(message);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::any_of(kTransientKeywords.begin(), kTransientKeywords.end(),
                       [&lower](std::string_view kw) { return lower.find(kw) != std::string::npos; });
}

ErrorClass classify_error(const std::exception& e) {
    if (is_permanent_type(e)) {
        return ErrorClass::PERMANENT;
    }
    if (const auto* se = dynamic_cast<const ServiceError*>(&e)) {
        if (se->status() && is_transient_status(*se->status())) {
            return ErrorClass::TRANSIENT;
        }
    }
    if (has_transient_keyword(e.what())) {
        return ErrorClass::TRANSIENT;
    }
    return ErrorClass::PERMANENT;
}

ErrorClass classify_error(std::exception_ptr eptr) {
    if (!eptr) return ErrorClass::PERMANENT;
    try {
        std::rethrow_exception(eptr);
    } catch (const std::exception& e) {
        return classify_error(e);
    } catch (...) {
        return ErrorClass::PERMANENT;
    }
}

} // namespace researchflow
