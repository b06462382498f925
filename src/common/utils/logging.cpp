// common/utils/logging.cpp
#include "common/utils/logging.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace researchflow::logging {

namespace {

std::shared_ptr<spdlog::logger> create_logger() {
    auto existing = spdlog::get(kLoggerName);
    if (existing) return existing;
    auto logger = spdlog::stderr_color_mt(kLoggerName);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v");
    logger->set_level(spdlog::level::info);
    return logger;
}

std::once_flag g_logger_once;
std::shared_ptr<spdlog::logger> g_logger;

} // namespace

std::shared_ptr<spdlog::logger> get() {
    std::call_once(g_logger_once, [] { g_logger = create_logger(); });
    return g_logger;
}

void init_logging(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str returns off for unknown names
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }
    get()->set_level(parsed);
    get()->flush_on(spdlog::level::warn);
}

} // namespace researchflow::logging
