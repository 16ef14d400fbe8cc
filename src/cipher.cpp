#include "swiftdrop/cipher.hpp"

#include "swiftdrop/crypto.hpp"
#include "swiftdrop/crypto_utils.hpp"
#include "swiftdrop/errors.hpp"

#include <limits>

namespace swiftdrop::cipher {

namespace {

using crypto::detail::AppendBytes;

void WriteU32Be(std::uint8_t* out, std::uint32_t value) {
    out[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
    out[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
    out[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
    out[3] = static_cast<std::uint8_t>(value & 0xFF);
}

Bytes SegmentNonce(const Bytes& base, std::uint32_t index) {
    Bytes nonce = base;
    std::uint8_t counter[4];
    WriteU32Be(counter, index);
    for (std::size_t i = 0; i < 4; ++i) {
        nonce[constants::kAeadNonceLen - 4 + i] ^= counter[i];
    }
    return nonce;
}

Bytes SegmentAad(const Bytes& aad, std::uint32_t index, bool final_segment) {
    Bytes out(constants::kSegmentAadLabel.begin(), constants::kSegmentAadLabel.end());
    AppendBytes(out, aad);
    std::uint8_t tail[5];
    WriteU32Be(tail, index);
    tail[4] = final_segment ? 1 : 0;
    AppendBytes(out, tail, sizeof(tail));
    return out;
}

std::size_t CheckedThreshold(const Options& options) {
    if (options.sub_range_threshold == 0) {
        throw ValidationError("Cipher sub-range threshold must be positive");
    }
    return options.sub_range_threshold;
}

}  // namespace

std::size_t EnvelopeSize(std::size_t plaintext_size, const Options& options) {
    std::size_t threshold = CheckedThreshold(options);
    std::size_t segments = plaintext_size <= threshold ? 1 : (plaintext_size + threshold - 1) / threshold;
    return constants::kAeadNonceLen + plaintext_size + segments * constants::kAeadTagLen;
}

Bytes Encrypt(const keys::SymmetricKey& key, chunk::ByteView plaintext, const Bytes& aad, const Options& options) {
    std::size_t threshold = CheckedThreshold(options);
    Bytes iv = crypto::RandomBytes(constants::kAeadNonceLen);
    Bytes out;
    out.reserve(EnvelopeSize(plaintext.size, options));
    AppendBytes(out, iv);

    if (plaintext.size <= threshold) {
        AppendBytes(out, crypto::AesGcmEncryptWithIv(key.raw(), iv, plaintext.data, plaintext.size, aad));
        return out;
    }

    std::size_t segments = (plaintext.size + threshold - 1) / threshold;
    if (segments > std::numeric_limits<std::uint32_t>::max()) {
        throw ValidationError("Plaintext has too many sub-ranges");
    }
    for (std::size_t i = 0; i < segments; ++i) {
        std::size_t start = i * threshold;
        std::size_t len = std::min(threshold, plaintext.size - start);
        auto index = static_cast<std::uint32_t>(i);
        bool final_segment = i + 1 == segments;
        AppendBytes(out, crypto::AesGcmEncryptWithIv(key.raw(), SegmentNonce(iv, index), plaintext.data + start, len,
                                                     SegmentAad(aad, index, final_segment)));
    }
    return out;
}

Bytes Decrypt(const keys::SymmetricKey& key, chunk::ByteView envelope, const Bytes& aad, const Options& options) {
    std::size_t threshold = CheckedThreshold(options);
    if (envelope.size < constants::kAeadNonceLen + constants::kAeadTagLen) {
        throw CryptoError("Envelope truncated");
    }
    Bytes iv(envelope.data, envelope.data + constants::kAeadNonceLen);
    const std::uint8_t* body = envelope.data + constants::kAeadNonceLen;
    std::size_t body_len = envelope.size - constants::kAeadNonceLen;
    std::size_t segment_len = threshold + constants::kAeadTagLen;

    if (body_len <= segment_len) {
        return crypto::AesGcmDecryptWithIv(key.raw(), iv, body, body_len, aad);
    }

    std::size_t segments = (body_len + segment_len - 1) / segment_len;
    std::size_t tail = body_len - (segments - 1) * segment_len;
    if (tail <= constants::kAeadTagLen) {
        throw CryptoError("Envelope truncated (short final segment)");
    }
    if (segments > std::numeric_limits<std::uint32_t>::max()) {
        throw CryptoError("Envelope has too many sub-ranges");
    }
    Bytes plaintext;
    plaintext.reserve(body_len - segments * constants::kAeadTagLen);
    for (std::size_t i = 0; i < segments; ++i) {
        std::size_t len = i + 1 == segments ? tail : segment_len;
        auto index = static_cast<std::uint32_t>(i);
        bool final_segment = i + 1 == segments;
        AppendBytes(plaintext, crypto::AesGcmDecryptWithIv(key.raw(), SegmentNonce(iv, index), body + i * segment_len,
                                                           len, SegmentAad(aad, index, final_segment)));
    }
    return plaintext;
}

Bytes WrapTransferKey(const keys::SymmetricKey& transfer_key, EVP_PKEY* recipient_public_key) {
    return keys::Wrap(transfer_key, recipient_public_key);
}

keys::SymmetricKey UnwrapTransferKey(const Bytes& wrapped, EVP_PKEY* own_private_key) {
    return keys::Unwrap(wrapped, own_private_key);
}

}  // namespace swiftdrop::cipher
