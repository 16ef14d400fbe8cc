#pragma once

#include "swiftdrop/chunk.hpp"
#include "swiftdrop/constants.hpp"
#include "swiftdrop/keys.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace swiftdrop::cipher {

using Bytes = std::vector<std::uint8_t>;

struct Options {
    // Inputs above this size are sealed as independent sub-ranges. Both peers
    // must agree on the value.
    std::size_t sub_range_threshold = constants::kSubRangeThreshold;
};

// Envelope: IV(12) || body.
//   plaintext <= threshold: body = GCM(key, IV, plaintext, aad) || tag
//   otherwise: body = seg_0 || seg_1 || ... where seg_i = ciphertext_i || tag_i,
//   each sealed under IV with i XORed into its last four bytes and with the
//   segment index and final flag authenticated.
Bytes Encrypt(const keys::SymmetricKey& key,
              chunk::ByteView plaintext,
              const Bytes& aad = {},
              const Options& options = {});

Bytes Decrypt(const keys::SymmetricKey& key,
              chunk::ByteView envelope,
              const Bytes& aad = {},
              const Options& options = {});

std::size_t EnvelopeSize(std::size_t plaintext_size, const Options& options = {});

Bytes WrapTransferKey(const keys::SymmetricKey& transfer_key, EVP_PKEY* recipient_public_key);
keys::SymmetricKey UnwrapTransferKey(const Bytes& wrapped, EVP_PKEY* own_private_key);

}  // namespace swiftdrop::cipher
