#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace swiftdrop::log {

// Shared "swiftdrop" logger. Level comes from SWIFTDROP_LOG_LEVEL on first use.
std::shared_ptr<spdlog::logger> Get();

void SetLevel(std::string_view level);

}  // namespace swiftdrop::log
