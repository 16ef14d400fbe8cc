#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include <openssl/evp.h>

namespace swiftdrop::crypto {

using Bytes = std::vector<std::uint8_t>;

// Shared handle to an OpenSSL key; the deleter calls EVP_PKEY_free.
using PKey = std::shared_ptr<EVP_PKEY>;

Bytes RandomBytes(std::size_t size);
void Cleanse(Bytes& data) noexcept;

// AES-256-GCM with a caller-supplied IV. Output is ciphertext || tag.
Bytes AesGcmEncryptWithIv(const Bytes& key,
                          const Bytes& iv,
                          const std::uint8_t* plaintext,
                          std::size_t plaintext_len,
                          const Bytes& aad);
// Input is ciphertext || tag.
Bytes AesGcmDecryptWithIv(const Bytes& key,
                          const Bytes& iv,
                          const std::uint8_t* blob,
                          std::size_t blob_len,
                          const Bytes& aad);

// RSA-OAEP with SHA-256 for both the digest and MGF1.
PKey GenerateRsaKey(int modulus_bits);
Bytes RsaOaepEncrypt(EVP_PKEY* public_key, const Bytes& plaintext);
Bytes RsaOaepDecrypt(EVP_PKEY* private_key, const Bytes& ciphertext);

// Public keys travel as DER SubjectPublicKeyInfo.
Bytes ExportPublicKeyDer(EVP_PKEY* key);
PKey ImportPublicKeyDer(const Bytes& der);

bool IsRsaKey(EVP_PKEY* key);

}  // namespace swiftdrop::crypto
