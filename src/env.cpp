#include "swiftdrop/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace swiftdrop::env {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

}  // namespace

std::string Get(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return {};
    }
    return std::string(value);
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::string value = Get(name);
    if (value.empty()) {
        return default_value;
    }
    value = ToLower(value);
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::uint64_t GetUnsigned(std::string_view name, std::uint64_t default_value) {
    std::string raw = Get(name);
    if (raw.empty() || raw.front() == '-') {
        return default_value;
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(raw));
    } catch (const std::exception&) {
        return default_value;
    }
}

std::chrono::milliseconds GetMillis(std::string_view name, std::chrono::milliseconds default_value) {
    std::uint64_t fallback = static_cast<std::uint64_t>(default_value.count());
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(GetUnsigned(name, fallback)));
}

}  // namespace swiftdrop::env
