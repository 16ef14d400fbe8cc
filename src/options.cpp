#include "swiftdrop/options.hpp"

#include "swiftdrop/env.hpp"
#include "swiftdrop/errors.hpp"

#include <algorithm>
#include <string>

namespace swiftdrop {

namespace {

constexpr std::size_t kMaxParallelism = 64;

}  // namespace

std::chrono::milliseconds RetryPolicy::DelayAfter(std::uint32_t attempt) const {
    if (attempt == 0) {
        return std::chrono::milliseconds(0);
    }
    std::chrono::milliseconds delay = base_delay;
    for (std::uint32_t i = 1; i < attempt && delay < max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_delay);
}

void RetryPolicy::Validate() const {
    if (attempts == 0) {
        throw ValidationError("retry_attempts must be at least 1");
    }
    if (base_delay.count() < 0 || max_delay.count() < 0) {
        throw ValidationError("retry delays must not be negative");
    }
    if (base_delay > max_delay) {
        throw ValidationError("retry_base_delay exceeds retry_max_delay");
    }
}

void SendOptions::Validate() const {
    if (chunk_size > constants::kChunkMax) {
        throw ValidationError("chunk_size exceeds " + std::to_string(constants::kChunkMax));
    }
    if (ice_server.empty()) {
        throw ValidationError("ice_server must not be empty");
    }
    if (parallelism == 0 || parallelism > kMaxParallelism) {
        throw ValidationError("parallelism must be 1.." + std::to_string(kMaxParallelism));
    }
    if (compression_level < 0 || compression_level > 9) {
        throw ValidationError("compression_level must be 0..9");
    }
    if (low_speed_threshold_mbps <= 0 || high_speed_threshold_mbps <= low_speed_threshold_mbps) {
        throw ValidationError("probe thresholds must satisfy 0 < low < high");
    }
    retry.Validate();
    if (timeout.count() <= 0) {
        throw ValidationError("timeout must be positive");
    }
    if (sub_range_threshold == 0) {
        throw ValidationError("sub_range_threshold must be positive");
    }
}

void SendOptions::ApplyEnvironment() {
    chunk_size = static_cast<std::size_t>(env::GetUnsigned("SWIFTDROP_CHUNK_SIZE", chunk_size));
    parallelism = static_cast<std::size_t>(env::GetUnsigned("SWIFTDROP_PARALLELISM", parallelism));
    retry.attempts = static_cast<std::uint32_t>(env::GetUnsigned("SWIFTDROP_RETRY_ATTEMPTS", retry.attempts));
    compression_level = static_cast<int>(
        env::GetUnsigned("SWIFTDROP_COMPRESSION_LEVEL", static_cast<std::uint64_t>(compression_level)));
    if (env::IsEnabled("SWIFTDROP_NO_ENCRYPT")) {
        encrypt = false;
    }
    std::string ice = env::Get("SWIFTDROP_ICE_SERVER");
    if (!ice.empty()) {
        ice_server = ice;
    }
}

void ReceiveOptions::Validate() const {
    if (max_size == 0) {
        throw ValidationError("max_size must be positive");
    }
    if (chunk_timeout.count() <= 0 || handshake_timeout.count() <= 0) {
        throw ValidationError("timeouts must be positive");
    }
    if (sub_range_threshold == 0) {
        throw ValidationError("sub_range_threshold must be positive");
    }
    if (!auto_accept && !on_offer) {
        throw ValidationError("auto_accept is off but no on_offer callback was given");
    }
}

void ReceiveOptions::ApplyEnvironment() {
    max_size = env::GetUnsigned("SWIFTDROP_MAX_SIZE", max_size);
    chunk_timeout = env::GetMillis("SWIFTDROP_CHUNK_TIMEOUT_MS", chunk_timeout);
    high_performance = env::IsEnabled("SWIFTDROP_HIGH_PERFORMANCE", high_performance);
    std::string ice = env::Get("SWIFTDROP_ICE_SERVER");
    if (!ice.empty()) {
        ice_server = ice;
    }
}

}  // namespace swiftdrop
