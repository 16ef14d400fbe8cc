#pragma once

#include "swiftdrop/crypto.hpp"
#include "swiftdrop/rendezvous_store.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace swiftdrop::keys {

using Bytes = crypto::Bytes;
using Clock = std::function<std::chrono::system_clock::time_point()>;

// 256-bit AES-GCM key. Key bytes are wiped on destruction.
class SymmetricKey {
public:
    SymmetricKey() = default;
    explicit SymmetricKey(Bytes raw);
    ~SymmetricKey();

    SymmetricKey(const SymmetricKey&) = delete;
    SymmetricKey& operator=(const SymmetricKey&) = delete;
    SymmetricKey(SymmetricKey&& other) noexcept;
    SymmetricKey& operator=(SymmetricKey&& other) noexcept;

    const Bytes& raw() const noexcept { return raw_; }
    bool empty() const noexcept { return raw_.empty(); }
    void Discard() noexcept;

private:
    Bytes raw_;
};

using SymmetricKeyPtr = std::shared_ptr<const SymmetricKey>;

struct KeyPair {
    crypto::PKey public_key;
    crypto::PKey private_key;
};

KeyPair GenerateAsymmetricKeyPair();
KeyPair GenerateAsymmetricKeyPair(int modulus_bits);
SymmetricKey GenerateSymmetricKey();

// RSA-OAEP-SHA256 over the raw 32 key bytes.
Bytes Wrap(const SymmetricKey& key, EVP_PKEY* recipient_public_key);
SymmetricKey Unwrap(const Bytes& wrapped, EVP_PKEY* own_private_key);

// base64(DER SubjectPublicKeyInfo), the "p" field of a rendezvous code.
std::string ExportPublicKey(EVP_PKEY* public_key);
crypto::PKey ImportPublicKey(const std::string& encoded);

// Exported key bytes -> imported key handle. Entries are never evicted.
class KeyCache {
public:
    SymmetricKeyPtr Import(const std::string& exported);
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, SymmetricKeyPtr> entries_;
};

struct SessionKey {
    SymmetricKeyPtr key;
    std::chrono::system_clock::time_point created;
    std::string id;
};

using SessionKeyPtr = std::shared_ptr<const SessionKey>;

class SessionKeyStore {
public:
    SessionKeyStore(RendezvousStore& store, KeyCache& cache, Clock clock = {});

    // Generates and publishes a new key. The previous SessionKey object is
    // left untouched for holders that still reference it.
    SessionKeyPtr Rotate();

    // Returns the published key unless it is missing, older than ttl, or its
    // record cannot be read, in which case it rotates.
    SessionKeyPtr EnsureFresh(std::chrono::milliseconds ttl);

    SessionKeyPtr Current() const;

private:
    SessionKeyPtr RotateLocked();
    std::chrono::system_clock::time_point Now() const;

    RendezvousStore& store_;
    KeyCache& cache_;
    Clock clock_;
    mutable std::mutex mutex_;
    SessionKeyPtr current_;
};

}  // namespace swiftdrop::keys
