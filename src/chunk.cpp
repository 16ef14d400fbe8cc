#include "swiftdrop/chunk.hpp"

#include "swiftdrop/constants.hpp"
#include "swiftdrop/errors.hpp"

#include <algorithm>
#include <cstring>
#include <string>

namespace swiftdrop::chunk {

std::size_t OptimalChunkSize(std::uint64_t file_size) {
    if (file_size > constants::kTierHugeThreshold) {
        return constants::kChunkHuge;
    }
    if (file_size > constants::kTierLargeThreshold) {
        return constants::kChunkLarge;
    }
    if (file_size > constants::kTierMediumThreshold) {
        return constants::kChunkMedium;
    }
    return constants::kChunkSmall;
}

bool ShouldUseHighPerformanceMode(std::uint64_t file_size) {
    return file_size > constants::kHighPerformanceThreshold;
}

std::size_t ChunkCount(std::uint64_t total_size, std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw ValidationError("Chunk size must be positive");
    }
    return static_cast<std::size_t>((total_size + chunk_size - 1) / chunk_size);
}

ChunkSequence::ChunkSequence(ByteView data, std::size_t chunk_size)
    : data_(data), chunk_size_(chunk_size), count_(ChunkCount(data.size, chunk_size)) {}

ChunkView ChunkSequence::operator[](std::size_t index) const {
    if (index >= count_) {
        throw ValidationError("Chunk index out of range: " + std::to_string(index));
    }
    ChunkView view;
    view.index = index;
    view.offset = static_cast<std::uint64_t>(index) * chunk_size_;
    std::size_t start = index * chunk_size_;
    std::size_t len = std::min(chunk_size_, data_.size - start);
    view.bytes = ByteView(data_.data + start, len);
    view.last = index + 1 == count_;
    return view;
}

ChunkSequence Split(ByteView data, std::size_t chunk_size) {
    return ChunkSequence(data, chunk_size);
}

Bytes Pack(ByteView head, ByteView body) {
    if (head.size > constants::kPackMaxHead) {
        throw ValidationError("Frame head exceeds 65535 bytes");
    }
    Bytes out(constants::kPackLengthPrefix + head.size + body.size);
    std::uint16_t len = static_cast<std::uint16_t>(head.size);
    out[0] = static_cast<std::uint8_t>(len & 0xFF);
    out[1] = static_cast<std::uint8_t>((len >> 8) & 0xFF);
    if (head.size > 0) {
        std::memcpy(out.data() + constants::kPackLengthPrefix, head.data, head.size);
    }
    if (body.size > 0) {
        std::memcpy(out.data() + constants::kPackLengthPrefix + head.size, body.data, body.size);
    }
    return out;
}

Unpacked Unpack(ByteView combined) {
    if (combined.size < constants::kPackLengthPrefix) {
        throw FormatError("Malformed frame (missing length prefix)");
    }
    std::size_t len = static_cast<std::size_t>(combined.data[0])
                      | (static_cast<std::size_t>(combined.data[1]) << 8);
    if (len > combined.size - constants::kPackLengthPrefix) {
        throw FormatError("Malformed frame (declared length " + std::to_string(len) + " exceeds buffer)");
    }
    Unpacked out;
    const std::uint8_t* head = combined.data + constants::kPackLengthPrefix;
    out.head = ByteView(head, len);
    out.body = ByteView(head + len, combined.size - constants::kPackLengthPrefix - len);
    return out;
}

}  // namespace swiftdrop::chunk
