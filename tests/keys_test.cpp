#include <gtest/gtest.h>

#include "swiftdrop/base64.hpp"
#include "swiftdrop/errors.hpp"
#include "swiftdrop/keys.hpp"
#include "swiftdrop/loopback.hpp"

#include <chrono>
#include <memory>

using namespace swiftdrop;

namespace {

class SessionKeyStoreTest : public ::testing::Test {
protected:
    SessionKeyStoreTest()
        : now_(std::chrono::system_clock::time_point(std::chrono::hours(24 * 365 * 50))),
          keys_(store_, cache_, [this] { return now_; }) {}

    std::chrono::system_clock::time_point now_;
    loopback::MemoryRendezvousStore store_;
    keys::KeyCache cache_;
    keys::SessionKeyStore keys_;
};

constexpr std::chrono::minutes kTtl{30};

}  // namespace

TEST(KeysTest, SymmetricKeyIs256Bits) {
    keys::SymmetricKey key = keys::GenerateSymmetricKey();
    EXPECT_EQ(key.raw().size(), 32u);
    EXPECT_THROW(keys::SymmetricKey{keys::Bytes(16)}, CryptoError);
}

TEST(KeysTest, DiscardWipesKey) {
    keys::SymmetricKey key = keys::GenerateSymmetricKey();
    key.Discard();
    EXPECT_TRUE(key.empty());
}

TEST(KeysTest, WrapUnwrapRoundTrip) {
    keys::KeyPair pair = keys::GenerateAsymmetricKeyPair();
    keys::SymmetricKey key = keys::GenerateSymmetricKey();
    keys::Bytes wrapped = keys::Wrap(key, pair.public_key.get());
    EXPECT_EQ(wrapped.size(), 128u);
    EXPECT_EQ(keys::Unwrap(wrapped, pair.private_key.get()).raw(), key.raw());

    wrapped[10] ^= 0x80;
    EXPECT_THROW(keys::Unwrap(wrapped, pair.private_key.get()), CryptoError);
}

TEST(KeysTest, WrapRequiresKey) {
    keys::KeyPair pair = keys::GenerateAsymmetricKeyPair();
    keys::SymmetricKey empty;
    EXPECT_THROW(keys::Wrap(empty, pair.public_key.get()), CryptoError);
}

TEST(KeysTest, PublicKeyExportImport) {
    keys::KeyPair pair = keys::GenerateAsymmetricKeyPair();
    std::string exported = keys::ExportPublicKey(pair.public_key.get());
    crypto::PKey imported = keys::ImportPublicKey(exported);
    EXPECT_EQ(keys::ExportPublicKey(imported.get()), exported);

    keys::SymmetricKey key = keys::GenerateSymmetricKey();
    keys::Bytes wrapped = keys::Wrap(key, imported.get());
    EXPECT_EQ(keys::Unwrap(wrapped, pair.private_key.get()).raw(), key.raw());
}

TEST(KeysTest, ImportRejectsGarbage) {
    EXPECT_THROW(keys::ImportPublicKey("not base64 at all!"), CryptoError);
    EXPECT_THROW(keys::ImportPublicKey(base64::Encode({1, 2, 3, 4, 5})), CryptoError);
}

TEST(KeysTest, ModulusOutOfRange) {
    EXPECT_THROW(keys::GenerateAsymmetricKeyPair(512), ValidationError);
}

TEST(KeyCacheTest, ImportIsCached) {
    keys::KeyCache cache;
    keys::SymmetricKey key = keys::GenerateSymmetricKey();
    std::string exported = base64::Encode(key.raw());
    keys::SymmetricKeyPtr first = cache.Import(exported);
    keys::SymmetricKeyPtr second = cache.Import(exported);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->raw(), key.raw());
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_THROW(cache.Import("%%%"), CryptoError);
}

TEST_F(SessionKeyStoreTest, RotateTwiceGivesDistinctKeys) {
    keys::SessionKeyPtr first = keys_.Rotate();
    keys::SessionKeyPtr second = keys_.Rotate();
    ASSERT_TRUE(first && second);
    EXPECT_NE(first->key->raw(), second->key->raw());
    EXPECT_EQ(keys_.Current(), second);
    // Holders of the old key still see it intact.
    EXPECT_EQ(first->key->raw().size(), 32u);
}

TEST_F(SessionKeyStoreTest, EnsureFreshWithinTtlKeepsKey) {
    keys::SessionKeyPtr first = keys_.EnsureFresh(kTtl);
    now_ += std::chrono::minutes(10);
    keys::SessionKeyPtr second = keys_.EnsureFresh(kTtl);
    EXPECT_EQ(first->key->raw(), second->key->raw());
    EXPECT_EQ(first->id, second->id);
}

TEST_F(SessionKeyStoreTest, EnsureFreshRotatesWhenExpired) {
    keys::SessionKeyPtr first = keys_.EnsureFresh(kTtl);
    now_ += kTtl + std::chrono::minutes(1);
    keys::SessionKeyPtr second = keys_.EnsureFresh(kTtl);
    EXPECT_NE(first->key->raw(), second->key->raw());
}

TEST_F(SessionKeyStoreTest, UnparsableTimestampRotates) {
    keys::SymmetricKey planted = keys::GenerateSymmetricKey();
    store_.Publish(SessionKeyRecord{base64::Encode(planted.raw()), "yesterday"});
    keys::SessionKeyPtr fresh = keys_.EnsureFresh(kTtl);
    EXPECT_NE(fresh->key->raw(), planted.raw());
    EXPECT_NE(fresh->id, "yesterday");
    ASSERT_TRUE(store_.Fetch().has_value());
    EXPECT_EQ(store_.Fetch()->timestamp, fresh->id);
}

TEST_F(SessionKeyStoreTest, AdoptsPublishedKey) {
    keys::SymmetricKey planted = keys::GenerateSymmetricKey();
    auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(now_.time_since_epoch()).count();
    store_.Publish(SessionKeyRecord{base64::Encode(planted.raw()), std::to_string(stamp - 1000)});
    keys::SessionKeyPtr adopted = keys_.EnsureFresh(kTtl);
    EXPECT_EQ(adopted->key->raw(), planted.raw());
}

TEST_F(SessionKeyStoreTest, FetchFailureRotates) {
    keys::SessionKeyPtr first = keys_.EnsureFresh(kTtl);
    store_.FailNextFetch();
    keys::SessionKeyPtr second = keys_.EnsureFresh(kTtl);
    EXPECT_NE(first->key->raw(), second->key->raw());
}
