#include "swiftdrop/protocol.hpp"

#include "swiftdrop/base64.hpp"
#include "swiftdrop/errors.hpp"
#include "swiftdrop/metadata.hpp"

#include <algorithm>
#include <string>

namespace swiftdrop::protocol {

namespace {

void WriteU64Be(std::uint8_t* out, std::uint64_t value) {
    for (int i = 7; i >= 0; --i) {
        out[i] = static_cast<std::uint8_t>(value & 0xFF);
        value >>= 8;
    }
}

std::uint64_t ReadU64Be(const std::uint8_t* in) {
    std::uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | in[i];
    }
    return value;
}

std::uint64_t ParseU64(const metadata::MetadataMap& meta, const char* key) {
    std::string raw = metadata::GetValue(meta, key);
    if (raw.empty() || !std::all_of(raw.begin(), raw.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        throw FormatError(std::string("Metadata field '") + key + "' is not a number");
    }
    try {
        return std::stoull(raw);
    } catch (const std::exception&) {
        throw FormatError(std::string("Metadata field '") + key + "' out of range");
    }
}

}  // namespace

const char* FrameTypeName(FrameType type) {
    switch (type) {
        case FrameType::Metadata:
            return "metadata";
        case FrameType::Chunk:
            return "chunk";
        case FrameType::Probe:
            return "probe";
        case FrameType::Cancel:
            return "cancel";
    }
    return "unknown";
}

Bytes EncodeHeader(const FrameHeader& header) {
    Bytes out(constants::kFrameHeaderLen, 0);
    std::copy(constants::kFrameMagic.begin(), constants::kFrameMagic.end(), out.begin());
    out[4] = constants::kFrameVersion;
    out[5] = static_cast<std::uint8_t>(header.type);
    out[6] = header.flags;
    out[7] = 0;
    WriteU64Be(out.data() + 8, header.sequence);
    WriteU64Be(out.data() + 16, header.offset);
    WriteU64Be(out.data() + 24, header.plain_length);
    return out;
}

FrameHeader DecodeHeader(chunk::ByteView bytes) {
    if (bytes.size != constants::kFrameHeaderLen) {
        throw FormatError("Frame header has wrong length: " + std::to_string(bytes.size));
    }
    if (!std::equal(constants::kFrameMagic.begin(), constants::kFrameMagic.end(), bytes.data)) {
        throw FormatError("Frame magic mismatch");
    }
    if (bytes.data[4] != constants::kFrameVersion) {
        throw FormatError("Unsupported frame version " + std::to_string(bytes.data[4]));
    }
    std::uint8_t type = bytes.data[5];
    if (type < constants::kFrameTypeMetadata || type > constants::kFrameTypeCancel) {
        throw FormatError("Unknown frame type " + std::to_string(type));
    }
    FrameHeader header;
    header.type = static_cast<FrameType>(type);
    header.flags = bytes.data[6];
    header.sequence = ReadU64Be(bytes.data + 8);
    header.offset = ReadU64Be(bytes.data + 16);
    header.plain_length = ReadU64Be(bytes.data + 24);
    return header;
}

Bytes EncodeFrame(const FrameHeader& header, chunk::ByteView payload) {
    Bytes head = EncodeHeader(header);
    return chunk::Pack(head, payload);
}

Frame DecodeFrame(chunk::ByteView message) {
    chunk::Unpacked parts = chunk::Unpack(message);
    Frame frame;
    frame.header = DecodeHeader(parts.head);
    frame.payload = parts.body;
    return frame;
}

Bytes EncodeMetadata(const MetadataMessage& message) {
    metadata::Fields fields;
    fields.emplace_back("name", message.file.name);
    fields.emplace_back("size", std::to_string(message.file.size));
    fields.emplace_back("type", message.file.content_type);
    fields.emplace_back("id", message.file.transfer_id);
    fields.emplace_back("key", base64::Encode(message.wrapped_key));
    fields.emplace_back("chunk", std::to_string(message.chunk_size));
    fields.emplace_back("count", std::to_string(message.chunk_count));
    if (message.sub_range_threshold != 0) {
        fields.emplace_back("seg", std::to_string(message.sub_range_threshold));
    }
    fields.emplace_back("skid", message.session_key_id);
    fields.emplace_back("ver", message.engine_version.empty() ? std::string(constants::kEngineVersion)
                                                              : message.engine_version);
    std::string json = metadata::Build(fields);

    FrameHeader header;
    header.type = FrameType::Metadata;
    header.flags = message.flags;
    header.plain_length = message.file.size;
    Bytes payload(json.begin(), json.end());
    return EncodeFrame(header, payload);
}

MetadataMessage DecodeMetadata(const Frame& frame) {
    if (frame.header.type != FrameType::Metadata) {
        throw FormatError("Expected a metadata frame");
    }
    std::string json(reinterpret_cast<const char*>(frame.payload.data), frame.payload.size);
    metadata::MetadataMap meta = metadata::Parse(json);

    MetadataMessage message;
    message.file.name = metadata::GetValue(meta, "name");
    message.file.size = ParseU64(meta, "size");
    message.file.content_type = metadata::GetValue(meta, "type");
    message.file.transfer_id = metadata::GetValue(meta, "id");
    message.chunk_size = ParseU64(meta, "chunk");
    message.chunk_count = ParseU64(meta, "count");
    if (metadata::Has(meta, "seg")) {
        message.sub_range_threshold = ParseU64(meta, "seg");
        if (message.sub_range_threshold == 0) {
            throw FormatError("Metadata declares a zero sub-range threshold");
        }
    }
    message.session_key_id = metadata::GetValue(meta, "skid");
    message.engine_version = metadata::GetValue(meta, "ver");
    message.flags = frame.header.flags;

    bool ok = false;
    message.wrapped_key = base64::Decode(metadata::GetValue(meta, "key"), &ok);
    if (!ok) {
        throw FormatError("Wrapped key is not valid base64");
    }
    if (message.file.size != frame.header.plain_length) {
        throw FormatError("Metadata size disagrees with frame header");
    }
    return message;
}

Bytes EncodeProbe(std::size_t sample_size) {
    FrameHeader header;
    header.type = FrameType::Probe;
    header.plain_length = sample_size;
    Bytes sample(sample_size, 0);
    return EncodeFrame(header, sample);
}

Bytes EncodeCancel(const std::string& reason) {
    FrameHeader header;
    header.type = FrameType::Cancel;
    header.plain_length = reason.size();
    Bytes payload(reason.begin(), reason.end());
    return EncodeFrame(header, payload);
}

std::string DecodeCancelReason(const Frame& frame) {
    return std::string(reinterpret_cast<const char*>(frame.payload.data), frame.payload.size);
}

}  // namespace swiftdrop::protocol
