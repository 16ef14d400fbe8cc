#include "swiftdrop/log.hpp"

#include "swiftdrop/env.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace swiftdrop::log {

namespace {

constexpr const char* kLoggerName = "swiftdrop";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v";

spdlog::level::level_enum ParseLevel(std::string_view raw, spdlog::level::level_enum fallback) {
    if (raw.empty()) {
        return fallback;
    }
    spdlog::level::level_enum level = spdlog::level::from_str(std::string(raw));
    // from_str maps unknown names to "off"; only accept an explicit "off".
    if (level == spdlog::level::off && raw != "off") {
        return fallback;
    }
    return level;
}

std::shared_ptr<spdlog::logger> Create() {
    auto existing = spdlog::get(kLoggerName);
    if (existing) {
        return existing;
    }
    auto logger = spdlog::stderr_color_mt(kLoggerName);
    logger->set_pattern(kPattern);
    logger->set_level(ParseLevel(swiftdrop::env::Get("SWIFTDROP_LOG_LEVEL"), spdlog::level::warn));
    logger->flush_on(spdlog::level::err);
    return logger;
}

}  // namespace

std::shared_ptr<spdlog::logger> Get() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> logger;
    std::call_once(once, [] { logger = Create(); });
    return logger;
}

void SetLevel(std::string_view level) {
    Get()->set_level(ParseLevel(level, Get()->level()));
}

}  // namespace swiftdrop::log
