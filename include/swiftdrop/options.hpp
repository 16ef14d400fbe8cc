#pragma once

#include "swiftdrop/cancel.hpp"
#include "swiftdrop/constants.hpp"
#include "swiftdrop/protocol.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace swiftdrop {

using ProgressCallback = std::function<void(int percent)>;
using CompleteCallback = std::function<void(const protocol::FileMetadata& file, std::vector<std::uint8_t> data)>;
using OfferCallback = std::function<bool(const protocol::FileMetadata& file)>;

struct RetryPolicy {
    std::uint32_t attempts = constants::kDefaultRetryAttempts;
    std::chrono::milliseconds base_delay = constants::kDefaultRetryBaseDelay;
    std::chrono::milliseconds max_delay = constants::kDefaultRetryMaxDelay;

    // base_delay * 2^(attempt-1), capped at max_delay. attempt is 1-based.
    std::chrono::milliseconds DelayAfter(std::uint32_t attempt) const;
    void Validate() const;
};

struct SendOptions {
    std::size_t chunk_size = 0;  // 0 picks a tier from the file size
    bool encrypt = true;
    std::string ice_server = std::string(constants::kDefaultIceServer);
    std::size_t parallelism = constants::kDefaultParallelism;
    bool streaming = true;
    int compression_level = 0;
    bool adaptive_chunking = true;
    double high_speed_threshold_mbps = constants::kProbeHighSpeedMBps;
    double low_speed_threshold_mbps = constants::kProbeLowSpeedMBps;
    RetryPolicy retry;
    std::size_t low_water_mark = constants::kDefaultLowWaterMark;
    std::chrono::milliseconds timeout = constants::kDefaultSendTimeout;
    std::size_t sub_range_threshold = constants::kSubRangeThreshold;
    std::string session_id;  // generated when empty
    ProgressCallback on_progress;
    CancellationToken cancel;

    void Validate() const;
    // SWIFTDROP_CHUNK_SIZE, _PARALLELISM, _RETRY_ATTEMPTS, _COMPRESSION_LEVEL,
    // _NO_ENCRYPT, _ICE_SERVER override the fields above when set.
    void ApplyEnvironment();
};

struct ReceiveOptions {
    bool auto_accept = true;
    std::uint64_t max_size = constants::kDefaultMaxSize;
    std::chrono::milliseconds chunk_timeout = constants::kDefaultChunkTimeout;
    std::chrono::milliseconds handshake_timeout = constants::kDefaultHandshakeTimeout;
    std::size_t sub_range_threshold = constants::kSubRangeThreshold;
    std::string ice_server = std::string(constants::kDefaultIceServer);
    bool high_performance = false;  // advertise 128 MiB chunks with h=1
    ProgressCallback on_progress;
    CompleteCallback on_complete;
    OfferCallback on_offer;
    CancellationToken cancel;

    void Validate() const;
    // SWIFTDROP_MAX_SIZE, _CHUNK_TIMEOUT_MS, _ICE_SERVER, _HIGH_PERFORMANCE.
    void ApplyEnvironment();
};

}  // namespace swiftdrop
