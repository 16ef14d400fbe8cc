#include "swiftdrop/crypto.hpp"

#include "swiftdrop/constants.hpp"
#include "swiftdrop/crypto_utils.hpp"
#include "swiftdrop/errors.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <algorithm>
#include <limits>

namespace swiftdrop::crypto {

namespace {

using detail::UniqueCipherCtx;
using detail::UniquePKEYCtx;

// EVP update calls take an int length; feed large buffers in bounded pieces.
constexpr std::size_t kMaxUpdate = 1u << 30;

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw CryptoError(message);
    }
}

void CheckAesParams(const Bytes& key, const Bytes& iv) {
    if (key.size() != constants::kAesKeyLen) {
        throw CryptoError("AES-GCM expects 32-byte key");
    }
    if (iv.size() != constants::kAeadNonceLen) {
        throw CryptoError("AES-GCM expects 12-byte IV");
    }
}

PKey Share(EVP_PKEY* raw) {
    return PKey(raw, detail::EVPPKEYDeleter{});
}

UniquePKEYCtx OaepContext(EVP_PKEY* key, bool encrypt) {
    if (!key) {
        throw CryptoError("RSA-OAEP key is missing");
    }
    if (!IsRsaKey(key)) {
        throw CryptoError("RSA-OAEP requires an RSA key");
    }
    UniquePKEYCtx ctx(EVP_PKEY_CTX_new(key, nullptr));
    Ensure(ctx != nullptr, "RSA-OAEP context allocation failed");
    if (encrypt) {
        Ensure(EVP_PKEY_encrypt_init(ctx.get()) == 1, "RSA-OAEP encrypt init failed");
    } else {
        Ensure(EVP_PKEY_decrypt_init(ctx.get()) == 1, "RSA-OAEP decrypt init failed");
    }
    Ensure(EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_OAEP_PADDING) == 1,
           "RSA-OAEP set padding failed");
    Ensure(EVP_PKEY_CTX_set_rsa_oaep_md(ctx.get(), EVP_sha256()) == 1, "RSA-OAEP set digest failed");
    Ensure(EVP_PKEY_CTX_set_rsa_mgf1_md(ctx.get(), EVP_sha256()) == 1, "RSA-OAEP set mgf1 failed");
    return ctx;
}

}  // namespace

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    Ensure(RAND_bytes(out.data(), static_cast<int>(out.size())) == 1, "RAND_bytes failed");
    return out;
}

void Cleanse(Bytes& data) noexcept {
    if (!data.empty()) {
        OPENSSL_cleanse(data.data(), data.size());
    }
    data.clear();
    data.shrink_to_fit();
}

Bytes AesGcmEncryptWithIv(const Bytes& key,
                          const Bytes& iv,
                          const std::uint8_t* plaintext,
                          std::size_t plaintext_len,
                          const Bytes& aad) {
    CheckAesParams(key, iv);
    Bytes out(plaintext_len + constants::kAeadTagLen);

    UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    Ensure(ctx != nullptr, "AES-GCM context allocation failed");
    int out_len = 0;
    std::size_t total_len = 0;

    Ensure(EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1,
           "AES-GCM init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) == 1,
           "AES-GCM set iv length failed");
    Ensure(EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) == 1,
           "AES-GCM set key failed");
    if (!aad.empty()) {
        Ensure(EVP_EncryptUpdate(ctx.get(), nullptr, &out_len, aad.data(), static_cast<int>(aad.size())) == 1,
               "AES-GCM aad failed");
    }
    std::size_t offset = 0;
    while (offset < plaintext_len) {
        std::size_t piece = std::min(kMaxUpdate, plaintext_len - offset);
        Ensure(EVP_EncryptUpdate(ctx.get(), out.data() + total_len, &out_len, plaintext + offset,
                                 static_cast<int>(piece)) == 1,
               "AES-GCM encrypt failed");
        total_len += static_cast<std::size_t>(out_len);
        offset += piece;
    }
    Ensure(EVP_EncryptFinal_ex(ctx.get(), out.data() + total_len, &out_len) == 1, "AES-GCM final failed");
    total_len += static_cast<std::size_t>(out_len);
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(constants::kAeadTagLen),
                               out.data() + total_len) == 1,
           "AES-GCM get tag failed");
    out.resize(total_len + constants::kAeadTagLen);
    return out;
}

Bytes AesGcmDecryptWithIv(const Bytes& key,
                          const Bytes& iv,
                          const std::uint8_t* blob,
                          std::size_t blob_len,
                          const Bytes& aad) {
    CheckAesParams(key, iv);
    if (blob_len < constants::kAeadTagLen) {
        throw CryptoError("AES-GCM blob too short");
    }
    std::size_t cipher_len = blob_len - constants::kAeadTagLen;
    Bytes tag(blob + cipher_len, blob + blob_len);
    Bytes plaintext(cipher_len);

    UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    Ensure(ctx != nullptr, "AES-GCM context allocation failed");
    int out_len = 0;
    std::size_t total_len = 0;

    Ensure(EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1,
           "AES-GCM init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) == 1,
           "AES-GCM set iv length failed");
    Ensure(EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) == 1,
           "AES-GCM set key failed");
    if (!aad.empty()) {
        Ensure(EVP_DecryptUpdate(ctx.get(), nullptr, &out_len, aad.data(), static_cast<int>(aad.size())) == 1,
               "AES-GCM aad failed");
    }
    std::size_t offset = 0;
    while (offset < cipher_len) {
        std::size_t piece = std::min(kMaxUpdate, cipher_len - offset);
        Ensure(EVP_DecryptUpdate(ctx.get(), plaintext.data() + total_len, &out_len, blob + offset,
                                 static_cast<int>(piece)) == 1,
               "AES-GCM decrypt failed");
        total_len += static_cast<std::size_t>(out_len);
        offset += piece;
    }
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) == 1,
           "AES-GCM set tag failed");
    Ensure(EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total_len, &out_len) == 1, "AES-GCM auth failed");
    total_len += static_cast<std::size_t>(out_len);
    plaintext.resize(total_len);
    return plaintext;
}

PKey GenerateRsaKey(int modulus_bits) {
    UniquePKEYCtx ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    Ensure(ctx != nullptr, "Failed to initialize RSA keygen");
    Ensure(EVP_PKEY_keygen_init(ctx.get()) == 1, "Failed to init RSA keygen");
    Ensure(EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), modulus_bits) == 1, "Failed to set RSA modulus length");
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1 || !raw) {
        throw CryptoError("Failed to generate RSA key");
    }
    return Share(raw);
}

Bytes RsaOaepEncrypt(EVP_PKEY* public_key, const Bytes& plaintext) {
    UniquePKEYCtx ctx = OaepContext(public_key, true);
    std::size_t out_len = 0;
    Ensure(EVP_PKEY_encrypt(ctx.get(), nullptr, &out_len, plaintext.data(), plaintext.size()) == 1,
           "RSA-OAEP size query failed");
    Bytes out(out_len);
    Ensure(EVP_PKEY_encrypt(ctx.get(), out.data(), &out_len, plaintext.data(), plaintext.size()) == 1,
           "RSA-OAEP encrypt failed");
    out.resize(out_len);
    return out;
}

Bytes RsaOaepDecrypt(EVP_PKEY* private_key, const Bytes& ciphertext) {
    if (ciphertext.empty()) {
        throw CryptoError("RSA-OAEP ciphertext is empty");
    }
    UniquePKEYCtx ctx = OaepContext(private_key, false);
    std::size_t out_len = 0;
    Ensure(EVP_PKEY_decrypt(ctx.get(), nullptr, &out_len, ciphertext.data(), ciphertext.size()) == 1,
           "RSA-OAEP size query failed");
    Bytes out(out_len);
    Ensure(EVP_PKEY_decrypt(ctx.get(), out.data(), &out_len, ciphertext.data(), ciphertext.size()) == 1,
           "RSA-OAEP decrypt failed");
    out.resize(out_len);
    return out;
}

Bytes ExportPublicKeyDer(EVP_PKEY* key) {
    Ensure(key != nullptr, "Cannot export a missing public key");
    int len = i2d_PUBKEY(key, nullptr);
    Ensure(len > 0, "Failed to size public key");
    Bytes out(static_cast<std::size_t>(len));
    unsigned char* ptr = out.data();
    Ensure(i2d_PUBKEY(key, &ptr) == len, "Failed to export public key");
    return out;
}

PKey ImportPublicKeyDer(const Bytes& der) {
    if (der.empty()) {
        throw CryptoError("Empty public key data");
    }
    if (der.size() > static_cast<std::size_t>(std::numeric_limits<long>::max())) {
        throw CryptoError("Public key data too large");
    }
    const unsigned char* ptr = der.data();
    EVP_PKEY* raw = d2i_PUBKEY(nullptr, &ptr, static_cast<long>(der.size()));
    if (!raw) {
        throw CryptoError("Unsupported public key format");
    }
    PKey key = Share(raw);
    if (!IsRsaKey(key.get())) {
        throw CryptoError("Public key is not an RSA key");
    }
    return key;
}

bool IsRsaKey(EVP_PKEY* key) {
    return key != nullptr && EVP_PKEY_base_id(key) == EVP_PKEY_RSA;
}

}  // namespace swiftdrop::crypto
