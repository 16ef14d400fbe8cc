#include "swiftdrop/keys.hpp"

#include "swiftdrop/base64.hpp"
#include "swiftdrop/constants.hpp"
#include "swiftdrop/errors.hpp"
#include "swiftdrop/log.hpp"

#include <string>
#include <utility>

namespace swiftdrop::keys {

namespace {

std::int64_t ToMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

bool ParseTimestamp(const std::string& raw, std::int64_t& out) {
    if (raw.empty()) {
        return false;
    }
    try {
        std::size_t consumed = 0;
        long long value = std::stoll(raw, &consumed);
        if (consumed != raw.size() || value < 0) {
            return false;
        }
        out = static_cast<std::int64_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

}  // namespace

SymmetricKey::SymmetricKey(Bytes raw) : raw_(std::move(raw)) {
    if (raw_.size() != constants::kAesKeyLen) {
        crypto::Cleanse(raw_);
        throw CryptoError("AES-GCM key must be 32 bytes");
    }
}

SymmetricKey::~SymmetricKey() {
    Discard();
}

SymmetricKey::SymmetricKey(SymmetricKey&& other) noexcept : raw_(std::move(other.raw_)) {
    other.raw_.clear();
}

SymmetricKey& SymmetricKey::operator=(SymmetricKey&& other) noexcept {
    if (this != &other) {
        Discard();
        raw_ = std::move(other.raw_);
        other.raw_.clear();
    }
    return *this;
}

void SymmetricKey::Discard() noexcept {
    crypto::Cleanse(raw_);
}

KeyPair GenerateAsymmetricKeyPair() {
    return GenerateAsymmetricKeyPair(constants::RsaModulusBits());
}

KeyPair GenerateAsymmetricKeyPair(int modulus_bits) {
    if (modulus_bits < constants::kRsaMinModulusBits || modulus_bits > constants::kRsaMaxModulusBits) {
        throw ValidationError("RSA modulus length out of range: " + std::to_string(modulus_bits));
    }
    crypto::PKey private_key = crypto::GenerateRsaKey(modulus_bits);
    // Round-trip through SPKI so the public half owns no private material.
    KeyPair pair;
    pair.public_key = crypto::ImportPublicKeyDer(crypto::ExportPublicKeyDer(private_key.get()));
    pair.private_key = std::move(private_key);
    return pair;
}

SymmetricKey GenerateSymmetricKey() {
    return SymmetricKey(crypto::RandomBytes(constants::kAesKeyLen));
}

Bytes Wrap(const SymmetricKey& key, EVP_PKEY* recipient_public_key) {
    if (key.empty()) {
        throw CryptoError("Cannot wrap an empty key");
    }
    return crypto::RsaOaepEncrypt(recipient_public_key, key.raw());
}

SymmetricKey Unwrap(const Bytes& wrapped, EVP_PKEY* own_private_key) {
    return SymmetricKey(crypto::RsaOaepDecrypt(own_private_key, wrapped));
}

std::string ExportPublicKey(EVP_PKEY* public_key) {
    return base64::Encode(crypto::ExportPublicKeyDer(public_key));
}

crypto::PKey ImportPublicKey(const std::string& encoded) {
    bool ok = false;
    Bytes der = base64::Decode(encoded, &ok);
    if (!ok || der.empty()) {
        throw CryptoError("Public key is not valid base64");
    }
    return crypto::ImportPublicKeyDer(der);
}

SymmetricKeyPtr KeyCache::Import(const std::string& exported) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(exported);
    if (it != entries_.end()) {
        return it->second;
    }
    bool ok = false;
    Bytes raw = base64::Decode(exported, &ok);
    if (!ok) {
        throw CryptoError("Session key is not valid base64");
    }
    auto key = std::make_shared<const SymmetricKey>(std::move(raw));
    entries_.emplace(exported, key);
    return key;
}

std::size_t KeyCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

SessionKeyStore::SessionKeyStore(RendezvousStore& store, KeyCache& cache, Clock clock)
    : store_(store), cache_(cache), clock_(std::move(clock)) {}

std::chrono::system_clock::time_point SessionKeyStore::Now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

SessionKeyPtr SessionKeyStore::Rotate() {
    std::lock_guard<std::mutex> lock(mutex_);
    return RotateLocked();
}

SessionKeyPtr SessionKeyStore::RotateLocked() {
    SymmetricKey fresh = GenerateSymmetricKey();
    auto created = Now();
    SessionKeyRecord record;
    record.key = base64::Encode(fresh.raw());
    record.timestamp = std::to_string(ToMillis(created));
    store_.Publish(record);

    auto next = std::make_shared<SessionKey>();
    next->key = cache_.Import(record.key);
    next->created = created;
    next->id = record.timestamp;
    current_ = next;
    log::Get()->info("session key rotated (id {})", next->id);
    return current_;
}

SessionKeyPtr SessionKeyStore::EnsureFresh(std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<SessionKeyRecord> record;
    try {
        record = store_.Fetch();
    } catch (const std::exception& ex) {
        log::Get()->warn("session key fetch failed, rotating: {}", ex.what());
        return RotateLocked();
    }
    if (!record || record->key.empty()) {
        return RotateLocked();
    }
    std::int64_t stamp = 0;
    if (!ParseTimestamp(record->timestamp, stamp)) {
        log::Get()->warn("session key timestamp unreadable, rotating");
        return RotateLocked();
    }
    std::int64_t age = ToMillis(Now()) - stamp;
    if (age < 0 || age > ttl.count()) {
        log::Get()->debug("session key age {} ms outside ttl {} ms", age, ttl.count());
        return RotateLocked();
    }
    if (current_ && current_->id == record->timestamp) {
        SymmetricKeyPtr cached;
        try {
            cached = cache_.Import(record->key);
        } catch (const CryptoError& ex) {
            log::Get()->warn("published session key unreadable, rotating: {}", ex.what());
            return RotateLocked();
        }
        if (cached == current_->key) {
            return current_;
        }
    }
    auto adopted = std::make_shared<SessionKey>();
    try {
        adopted->key = cache_.Import(record->key);
    } catch (const CryptoError& ex) {
        log::Get()->warn("published session key unreadable, rotating: {}", ex.what());
        return RotateLocked();
    }
    adopted->created = std::chrono::system_clock::time_point(std::chrono::milliseconds(stamp));
    adopted->id = record->timestamp;
    current_ = adopted;
    return current_;
}

SessionKeyPtr SessionKeyStore::Current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

}  // namespace swiftdrop::keys
