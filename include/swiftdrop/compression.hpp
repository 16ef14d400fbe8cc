#pragma once

#include "swiftdrop/chunk.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace swiftdrop::compression {

using Bytes = std::vector<std::uint8_t>;

inline constexpr int kMinLevel = 1;
inline constexpr int kMaxLevel = 9;

// zlib stream at the given level (1..9).
Bytes Deflate(chunk::ByteView input, int level);

// expected_size is the plaintext length carried in the frame header; output
// of any other length is a FormatError.
Bytes Inflate(chunk::ByteView input, std::size_t expected_size);

}  // namespace swiftdrop::compression
