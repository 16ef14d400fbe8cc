#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include "swiftdrop/env.hpp"

namespace swiftdrop::constants {

inline constexpr std::uint64_t kKiB = 1024ull;
inline constexpr std::uint64_t kMiB = 1024ull * kKiB;
inline constexpr std::uint64_t kGiB = 1024ull * kMiB;

// Chunk size tiers.
inline constexpr std::uint64_t kTierHugeThreshold = 10ull * kGiB;
inline constexpr std::uint64_t kTierLargeThreshold = 1ull * kGiB;
inline constexpr std::uint64_t kTierMediumThreshold = 100ull * kMiB;
inline constexpr std::size_t kChunkHuge = 128u * 1024u * 1024u;
inline constexpr std::size_t kChunkLarge = 64u * 1024u * 1024u;
inline constexpr std::size_t kChunkMedium = 16u * 1024u * 1024u;
inline constexpr std::size_t kChunkSmall = 4u * 1024u * 1024u;
inline constexpr std::size_t kChunkMax = kChunkHuge;
inline constexpr std::size_t kChunkMin = 1u * 1024u * 1024u;
inline constexpr std::uint64_t kHighPerformanceThreshold = 1ull * kGiB;

// Throughput probe.
inline constexpr std::size_t kProbeSampleSize = 1u * 1024u * 1024u;
inline constexpr double kProbeHighSpeedMBps = 50.0;
inline constexpr double kProbeLowSpeedMBps = 5.0;
inline constexpr std::chrono::milliseconds kProbeTimeout{3000};

// Cipher envelope.
inline constexpr std::size_t kAeadNonceLen = 12;
inline constexpr std::size_t kAeadTagLen = 16;
inline constexpr std::size_t kAesKeyLen = 32;
inline constexpr std::size_t kSubRangeThreshold = 16u * 1024u * 1024u;
inline constexpr std::string_view kSegmentAadLabel = "swiftdrop.segment.v1";

// Asymmetric layer.
inline constexpr int kRsaModulusBits = 1024;
inline constexpr int kRsaMinModulusBits = 1024;
inline constexpr int kRsaMaxModulusBits = 8192;

inline int RsaModulusBits() {
    std::string raw = swiftdrop::env::Get("SWIFTDROP_RSA_BITS");
    if (raw.empty()) {
        return kRsaModulusBits;
    }
    try {
        long parsed = std::stol(raw);
        if (parsed < kRsaMinModulusBits || parsed > kRsaMaxModulusBits) {
            return kRsaModulusBits;
        }
        return static_cast<int>(parsed);
    } catch (const std::exception&) {
        return kRsaModulusBits;
    }
}

// Session key.
inline constexpr std::chrono::minutes kSessionKeyTtl{30};

// Dual-buffer frame.
inline constexpr std::size_t kPackLengthPrefix = 2;
inline constexpr std::size_t kPackMaxHead = std::numeric_limits<std::uint16_t>::max();

// Wire protocol.
inline constexpr std::array<std::uint8_t, 4> kFrameMagic = {'S', 'W', 'D', '1'};
inline constexpr std::uint8_t kFrameVersion = 1;
inline constexpr std::size_t kFrameHeaderLen = 4 + 1 + 1 + 1 + 1 + 8 + 8 + 8;
inline constexpr std::uint8_t kFrameTypeMetadata = 0x01;
inline constexpr std::uint8_t kFrameTypeChunk = 0x02;
inline constexpr std::uint8_t kFrameTypeProbe = 0x03;
inline constexpr std::uint8_t kFrameTypeCancel = 0x04;
inline constexpr std::uint8_t kFrameFlagLast = 0x01;
inline constexpr std::uint8_t kFrameFlagCompressed = 0x02;
inline constexpr std::uint8_t kFrameFlagEncrypted = 0x04;
inline constexpr std::uint8_t kFrameFlagHighPerformance = 0x08;
inline constexpr std::size_t kFrameOverhead = kPackLengthPrefix + kFrameHeaderLen;

// Rendezvous code.
inline constexpr std::uint64_t kCodeDefaultChunkSize = 64ull * kMiB;
inline constexpr std::uint64_t kCodeHighPerformanceChunk = 16ull * kMiB;
inline constexpr std::uint64_t kCodeHighPerformanceAdvertised = 128ull * kMiB;
inline constexpr std::string_view kDefaultIceServer = "stun:stun.l.google.com:19302";

// Send defaults.
inline constexpr std::size_t kDefaultParallelism = 6;
inline constexpr std::uint32_t kDefaultRetryAttempts = 3;
inline constexpr std::chrono::milliseconds kDefaultRetryBaseDelay{200};
inline constexpr std::chrono::milliseconds kDefaultRetryMaxDelay{5000};
inline constexpr std::size_t kDefaultLowWaterMark = 16u * 1024u * 1024u;
inline constexpr std::chrono::milliseconds kDefaultSendTimeout{30000};

// Receive defaults.
inline constexpr std::uint64_t kDefaultMaxSize = 20ull * kGiB;
inline constexpr std::chrono::milliseconds kDefaultChunkTimeout{10000};
inline constexpr std::chrono::milliseconds kDefaultHandshakeTimeout{30000};

inline constexpr std::string_view kEngineVersion = "1.0.0";

}  // namespace swiftdrop::constants
