#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace swiftdrop::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);
std::uint64_t GetUnsigned(std::string_view name, std::uint64_t default_value);
std::chrono::milliseconds GetMillis(std::string_view name, std::chrono::milliseconds default_value);

}  // namespace swiftdrop::env
