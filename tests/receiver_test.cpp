#include <gtest/gtest.h>

#include "swiftdrop/errors.hpp"
#include "swiftdrop/keys.hpp"
#include "swiftdrop/loopback.hpp"
#include "swiftdrop/receiver.hpp"
#include "swiftdrop/session.hpp"

#include "test_helpers.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <random>

using namespace swiftdrop;
using namespace std::chrono_literals;
using swiftdrop::test_support::BuildTransfer;
using swiftdrop::test_support::BuiltTransfer;
using swiftdrop::test_support::Bytes;
using swiftdrop::test_support::PatternBytes;

namespace {

constexpr std::size_t kSegment = 1024;

class ReceiverTest : public ::testing::Test {
protected:
    ReceiverTest() : pair_(loopback::CreatePair()), recipient_(keys::GenerateAsymmetricKeyPair()) {
        options_.sub_range_threshold = kSegment;
        options_.on_complete = [this](const protocol::FileMetadata& file, Bytes data) {
            delivered_name_ = file.name;
            delivered_ = std::move(data);
        };
    }

    // Starts an engine on one end of the pair; frames are fed by hand.
    std::unique_ptr<ReceiverEngine> StartEngine() {
        session_ = std::make_shared<TransferSession>("rx", Role::Receiver);
        auto engine = std::make_unique<ReceiverEngine>(session_, pair_.second, options_, recipient_.private_key);
        engine->Start();
        return engine;
    }

    BuiltTransfer Build(const Bytes& data, std::size_t chunk_size) {
        return BuildTransfer(data, chunk_size, &key_, recipient_.public_key.get(), kSegment);
    }

    std::pair<loopback::LoopbackChannelPtr, loopback::LoopbackChannelPtr> pair_;
    keys::KeyPair recipient_;
    keys::SymmetricKey key_ = keys::GenerateSymmetricKey();
    ReceiveOptions options_;
    TransferSessionPtr session_;
    std::optional<Bytes> delivered_;
    std::string delivered_name_;
};

}  // namespace

TEST_F(ReceiverTest, AnyPermutationReassemblesOriginal) {
    Bytes data = PatternBytes(50 * 1024 + 123);
    BuiltTransfer built = Build(data, 4096);
    ASSERT_EQ(built.chunks.size(), 13u);

    for (std::uint32_t seed : {1u, 2u, 3u, 4u}) {
        delivered_.reset();
        pair_ = loopback::CreatePair();
        std::vector<Bytes> frames = built.chunks;
        std::shuffle(frames.begin(), frames.end(), std::mt19937(seed));
        // Metadata lands somewhere in the middle of the stream.
        frames.insert(frames.begin() + static_cast<std::ptrdiff_t>(seed * 3), built.metadata);

        auto engine = StartEngine();
        for (auto& frame : frames) {
            engine->HandleMessage(frame);
        }
        engine->AwaitCompletion();
        ASSERT_TRUE(delivered_.has_value()) << "seed " << seed;
        EXPECT_EQ(*delivered_, data) << "seed " << seed;
        EXPECT_EQ(delivered_name_, "payload.bin");
        SessionSnapshot snapshot = session_->Snapshot();
        EXPECT_EQ(snapshot.status, TransferStatus::Processing);
        EXPECT_EQ(snapshot.bytes_transferred, data.size());
        EXPECT_EQ(snapshot.chunk_size, 4096u);
        EXPECT_FALSE(pair_.second->IsOpen());
    }
}

TEST_F(ReceiverTest, PlaintextTransfer) {
    Bytes data = PatternBytes(10000, 9);
    BuiltTransfer built = BuildTransfer(data, 3000, nullptr, nullptr);
    auto engine = StartEngine();
    engine->HandleMessage(built.metadata);
    for (auto it = built.chunks.rbegin(); it != built.chunks.rend(); ++it) {
        engine->HandleMessage(*it);
    }
    engine->AwaitCompletion();
    ASSERT_TRUE(delivered_.has_value());
    EXPECT_EQ(*delivered_, data);
}

TEST_F(ReceiverTest, SenderSubRangeThresholdWins) {
    options_.sub_range_threshold = constants::kSubRangeThreshold;
    Bytes data = PatternBytes(20000, 5);
    BuiltTransfer built = BuildTransfer(data, 8192, &key_, recipient_.public_key.get(), kSegment, true);
    auto engine = StartEngine();
    engine->HandleMessage(built.metadata);
    for (auto& frame : built.chunks) {
        engine->HandleMessage(frame);
    }
    engine->AwaitCompletion();
    ASSERT_TRUE(delivered_.has_value());
    EXPECT_EQ(*delivered_, data);
}

TEST_F(ReceiverTest, UnannouncedThresholdMismatchFailsAuthentication) {
    options_.sub_range_threshold = constants::kSubRangeThreshold;
    BuiltTransfer built = Build(PatternBytes(20000, 6), 8192);
    auto engine = StartEngine();
    engine->HandleMessage(built.metadata);
    for (auto& frame : built.chunks) {
        engine->HandleMessage(frame);
    }
    EXPECT_THROW(engine->AwaitCompletion(), CryptoError);
    EXPECT_FALSE(delivered_.has_value());
}

TEST_F(ReceiverTest, DuplicateChunksAreIgnored) {
    Bytes data = PatternBytes(9000, 4);
    BuiltTransfer built = Build(data, 4096);
    auto engine = StartEngine();
    engine->HandleMessage(built.metadata);
    engine->HandleMessage(built.chunks[0]);
    engine->HandleMessage(built.chunks[0]);
    engine->HandleMessage(built.metadata);
    engine->HandleMessage(built.chunks[1]);
    engine->HandleMessage(built.chunks[2]);
    engine->AwaitCompletion();
    ASSERT_TRUE(delivered_.has_value());
    EXPECT_EQ(*delivered_, data);
}

TEST_F(ReceiverTest, ProgressReachesHundredOnce) {
    std::vector<int> seen;
    options_.on_progress = [&](int percent) { seen.push_back(percent); };
    Bytes data = PatternBytes(40000, 5);
    BuiltTransfer built = Build(data, 4000);
    auto engine = StartEngine();
    engine->HandleMessage(built.metadata);
    for (auto& frame : built.chunks) {
        engine->HandleMessage(frame);
    }
    engine->AwaitCompletion();
    ASSERT_FALSE(seen.empty());
    EXPECT_TRUE(std::is_sorted(seen.begin(), seen.end()));
    EXPECT_EQ(seen.back(), 100);
    EXPECT_EQ(std::count(seen.begin(), seen.end(), 100), 1);
}

TEST_F(ReceiverTest, ZeroLengthFile) {
    BuiltTransfer built = Build(Bytes{}, 4096);
    EXPECT_TRUE(built.chunks.empty());
    auto engine = StartEngine();
    engine->HandleMessage(built.metadata);
    engine->AwaitCompletion();
    ASSERT_TRUE(delivered_.has_value());
    EXPECT_TRUE(delivered_->empty());
}

TEST_F(ReceiverTest, DeclaredSizeAboveLimitRejected) {
    options_.max_size = 1000;
    BuiltTransfer built = Build(PatternBytes(1001), 512);
    auto engine = StartEngine();
    engine->HandleMessage(built.metadata);
    EXPECT_THROW(engine->AwaitCompletion(), ValidationError);
    EXPECT_FALSE(delivered_.has_value());
}

TEST_F(ReceiverTest, EarlyDataAboveLimitRejected) {
    options_.max_size = 1000;
    BuiltTransfer built = BuildTransfer(PatternBytes(1600), 400, nullptr, nullptr);
    auto engine = StartEngine();
    for (auto& frame : built.chunks) {
        engine->HandleMessage(frame);
    }
    EXPECT_THROW(engine->AwaitCompletion(), ValidationError);
    EXPECT_FALSE(delivered_.has_value());
}

TEST_F(ReceiverTest, ChunkOutsideDeclaredSizeRejected) {
    BuiltTransfer small = BuildTransfer(PatternBytes(1000), 500, nullptr, nullptr);
    BuiltTransfer large = BuildTransfer(PatternBytes(3000), 500, nullptr, nullptr);
    auto engine = StartEngine();
    engine->HandleMessage(small.metadata);
    engine->HandleMessage(large.chunks[4]);
    EXPECT_THROW(engine->AwaitCompletion(), ValidationError);
    EXPECT_FALSE(delivered_.has_value());
}

TEST_F(ReceiverTest, TamperedChunkFailsDecryption) {
    Bytes data = PatternBytes(8192, 6);
    BuiltTransfer built = Build(data, 4096);
    built.chunks[1][built.chunks[1].size() - 3] ^= 0x10;
    auto engine = StartEngine();
    engine->HandleMessage(built.metadata);
    engine->HandleMessage(built.chunks[0]);
    engine->HandleMessage(built.chunks[1]);
    EXPECT_THROW(engine->AwaitCompletion(), CryptoError);
    EXPECT_FALSE(delivered_.has_value());
}

TEST_F(ReceiverTest, HandshakeTimeout) {
    options_.handshake_timeout = 50ms;
    auto engine = StartEngine();
    EXPECT_THROW(engine->AwaitCompletion(), TimeoutError);
    EXPECT_FALSE(pair_.second->IsOpen());
}

TEST_F(ReceiverTest, ChunkTimeout) {
    options_.chunk_timeout = 50ms;
    BuiltTransfer built = Build(PatternBytes(8192), 4096);
    auto engine = StartEngine();
    engine->HandleMessage(built.metadata);
    engine->HandleMessage(built.chunks[0]);
    EXPECT_THROW(engine->AwaitCompletion(), TimeoutError);
    EXPECT_FALSE(delivered_.has_value());
}

TEST_F(ReceiverTest, DeclinedOfferIsCancellation) {
    options_.auto_accept = false;
    bool asked = false;
    options_.on_offer = [&](const protocol::FileMetadata& file) {
        asked = true;
        EXPECT_EQ(file.name, "payload.bin");
        return false;
    };
    BuiltTransfer built = Build(PatternBytes(100), 4096);
    auto engine = StartEngine();
    engine->HandleMessage(built.metadata);
    EXPECT_THROW(engine->AwaitCompletion(), CancellationError);
    EXPECT_TRUE(asked);
}

TEST_F(ReceiverTest, PeerCancelFrameStopsTransfer) {
    BuiltTransfer built = Build(PatternBytes(8192), 4096);
    auto engine = StartEngine();
    engine->HandleMessage(built.metadata);
    engine->HandleMessage(built.chunks[0]);
    engine->HandleMessage(protocol::EncodeCancel("stopped by sender"));
    EXPECT_THROW(engine->AwaitCompletion(), CancellationError);
    EXPECT_FALSE(delivered_.has_value());
}

TEST_F(ReceiverTest, ClosedChannelIsTransportError) {
    BuiltTransfer built = Build(PatternBytes(8192), 4096);
    auto engine = StartEngine();
    engine->HandleMessage(built.metadata);
    pair_.first->Close();
    EXPECT_THROW(engine->AwaitCompletion(), TransportError);
}
