// common/utils/logging.h
#ifndef RESEARCHFLOW_COMMON_UTILS_LOGGING_H
#define RESEARCHFLOW_COMMON_UTILS_LOGGING_H

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace researchflow::logging {

inline constexpr const char* kLoggerName = "researchflow";

// Configures the shared "researchflow" logger. Safe to call more than once;
// the last level wins. Unknown level names fall back to info.
void init_logging(const std::string& level = "info");

// The shared logger; created with defaults on first use.
std::shared_ptr<spdlog::logger> get();

} // namespace researchflow::logging

#endif // RESEARCHFLOW_COMMON_UTILS_LOGGING_H
