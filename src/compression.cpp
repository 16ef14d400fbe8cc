#include "swiftdrop/compression.hpp"

#include "swiftdrop/errors.hpp"

#include <limits>
#include <string>

#include <zlib.h>

namespace swiftdrop::compression {

namespace {

void CheckLength(std::size_t size) {
    if (size > std::numeric_limits<uInt>::max()) {
        throw ValidationError("Input too large for a single zlib stream");
    }
}

}  // namespace

Bytes Deflate(chunk::ByteView input, int level) {
    if (level < kMinLevel || level > kMaxLevel) {
        throw ValidationError("Compression level must be 1..9, got " + std::to_string(level));
    }
    CheckLength(input.size);
    z_stream zs{};
    if (deflateInit(&zs, level) != Z_OK) {
        throw Error(ErrorKind::Validation, "zlib deflateInit failed");
    }
    Bytes out(deflateBound(&zs, static_cast<uLong>(input.size)));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data));
    zs.avail_in = static_cast<uInt>(input.size);
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());
    int rc = deflate(&zs, Z_FINISH);
    std::size_t produced = out.size() - zs.avail_out;
    deflateEnd(&zs);
    if (rc != Z_STREAM_END) {
        throw Error(ErrorKind::Validation, "zlib deflate failed (" + std::to_string(rc) + ")");
    }
    out.resize(produced);
    return out;
}

Bytes Inflate(chunk::ByteView input, std::size_t expected_size) {
    CheckLength(input.size);
    CheckLength(expected_size + 1);
    // One spare byte so an oversized stream is caught rather than truncated.
    Bytes out(expected_size + 1);
    z_stream zs{};
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data));
    zs.avail_in = static_cast<uInt>(input.size);
    if (inflateInit(&zs) != Z_OK) {
        throw FormatError("zlib inflateInit failed");
    }
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());
    int rc = inflate(&zs, Z_FINISH);
    std::size_t produced = out.size() - zs.avail_out;
    inflateEnd(&zs);
    if (rc != Z_STREAM_END || produced != expected_size || zs.avail_in != 0) {
        throw FormatError("Compressed chunk does not inflate to " + std::to_string(expected_size) + " bytes");
    }
    out.resize(produced);
    return out;
}

}  // namespace swiftdrop::compression
