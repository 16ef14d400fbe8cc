#pragma once

#include "swiftdrop/chunk.hpp"
#include "swiftdrop/constants.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace swiftdrop::protocol {

using Bytes = std::vector<std::uint8_t>;

enum class FrameType : std::uint8_t {
    Metadata = constants::kFrameTypeMetadata,
    Chunk = constants::kFrameTypeChunk,
    Probe = constants::kFrameTypeProbe,
    Cancel = constants::kFrameTypeCancel
};

const char* FrameTypeName(FrameType type);

// Fixed 32-byte header, multi-byte fields big-endian:
//   magic "SWD1" | version | type | flags | reserved | sequence u64 | offset u64 | plain_length u64
struct FrameHeader {
    FrameType type = FrameType::Chunk;
    std::uint8_t flags = 0;
    std::uint64_t sequence = 0;
    std::uint64_t offset = 0;
    std::uint64_t plain_length = 0;

    bool Has(std::uint8_t flag) const noexcept { return (flags & flag) != 0; }
};

Bytes EncodeHeader(const FrameHeader& header);
FrameHeader DecodeHeader(chunk::ByteView bytes);

// A channel message: Pack(header, payload). Payload views point into the
// decoded message buffer.
struct Frame {
    FrameHeader header;
    chunk::ByteView payload;
};

Bytes EncodeFrame(const FrameHeader& header, chunk::ByteView payload);
Frame DecodeFrame(chunk::ByteView message);

struct FileMetadata {
    std::string name;
    std::uint64_t size = 0;
    std::string content_type;
    std::string transfer_id;
};

struct MetadataMessage {
    FileMetadata file;
    Bytes wrapped_key;  // empty when encryption is off
    std::uint64_t chunk_size = 0;
    std::uint64_t chunk_count = 0;
    std::uint64_t sub_range_threshold = 0;  // 0 when absent; the receiver then uses its own
    std::uint8_t flags = 0;  // Encrypted / Compressed / HighPerformance
    std::string session_key_id;
    std::string engine_version;
};

Bytes EncodeMetadata(const MetadataMessage& message);
MetadataMessage DecodeMetadata(const Frame& frame);

Bytes EncodeProbe(std::size_t sample_size);
Bytes EncodeCancel(const std::string& reason);
std::string DecodeCancelReason(const Frame& frame);

}  // namespace swiftdrop::protocol
