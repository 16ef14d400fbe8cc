#include <gtest/gtest.h>

#include "swiftdrop/channel.hpp"
#include "swiftdrop/constants.hpp"
#include "swiftdrop/errors.hpp"
#include "swiftdrop/file_source.hpp"
#include "swiftdrop/keys.hpp"
#include "swiftdrop/loopback.hpp"
#include "swiftdrop/orchestrator.hpp"
#include "swiftdrop/receiver.hpp"
#include "swiftdrop/rendezvous.hpp"
#include "swiftdrop/sender.hpp"

#include "test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

using namespace swiftdrop;
using namespace std::chrono_literals;
using swiftdrop::test_support::Bytes;
using swiftdrop::test_support::PatternBytes;

namespace {

constexpr std::size_t kMiB = 1024 * 1024;

// Collects what the receiving side delivers.
struct Delivery {
    std::mutex mutex;
    std::optional<Bytes> data;
    protocol::FileMetadata file;

    CompleteCallback Callback() {
        return [this](const protocol::FileMetadata& meta, Bytes bytes) {
            std::lock_guard<std::mutex> lock(mutex);
            file = meta;
            data = std::move(bytes);
        };
    }
};

class TransferTest : public ::testing::Test {
protected:
    explicit TransferTest(loopback::LoopbackOptions link = {})
        : negotiator_(std::make_shared<loopback::LoopbackNegotiator>(link)),
          store_(std::make_shared<loopback::MemoryRendezvousStore>()),
          context_(store_),
          sender_(context_, negotiator_),
          receiver_(context_, negotiator_) {}

    ReceiveOptions ReceiveWith(Delivery& delivery) {
        ReceiveOptions options;
        options.on_complete = delivery.Callback();
        return options;
    }

    // Runs a full transfer and waits for both ends.
    std::pair<TransferSessionPtr, TransferSessionPtr> Transfer(const file_source::FilePayload& file,
                                                               SendOptions send,
                                                               ReceiveOptions receive) {
        ReceiveTicket ticket = receiver_.CreateReceiveCode(receive);
        TransferSessionPtr outbound = sender_.InitiateSend(file, ticket.code, std::move(send));
        TransferSessionPtr inbound = receiver_.AcceptIncoming(outbound->local_code(), std::move(receive));
        EXPECT_TRUE(outbound->Wait(120s));
        EXPECT_TRUE(inbound->Wait(120s));
        return {outbound, inbound};
    }

    std::shared_ptr<loopback::LoopbackNegotiator> negotiator_;
    std::shared_ptr<loopback::MemoryRendezvousStore> store_;
    TransferContext context_;
    Orchestrator sender_;
    Orchestrator receiver_;
};

class UnorderedTransferTest : public TransferTest {
protected:
    UnorderedTransferTest() : TransferTest(Unordered()) {}

    static loopback::LoopbackOptions Unordered() {
        loopback::LoopbackOptions options;
        options.ordered = false;
        options.reorder_window = 8;
        return options;
    }
};

class SlowLinkTransferTest : public TransferTest {
protected:
    SlowLinkTransferTest() : TransferTest(Slow()) {}

    static loopback::LoopbackOptions Slow() {
        loopback::LoopbackOptions options;
        options.per_message_delay = 500ms;
        return options;
    }
};

class SmallMessageTransferTest : public TransferTest {
protected:
    SmallMessageTransferTest() : TransferTest(Small()) {}

    static loopback::LoopbackOptions Small() {
        loopback::LoopbackOptions options;
        options.max_message_size = 256 * 1024;
        return options;
    }
};

// Forwards to another channel and remembers the largest buffered amount
// observed right after a send.
class PeakTrackingChannel : public Channel {
public:
    explicit PeakTrackingChannel(ChannelPtr inner) : inner_(std::move(inner)) {}

    void Send(Bytes&& message) override {
        inner_->Send(std::move(message));
        std::size_t now = inner_->BufferedAmount();
        std::size_t seen = peak_.load();
        while (now > seen && !peak_.compare_exchange_weak(seen, now)) {
        }
    }
    void Close() override { inner_->Close(); }
    bool IsOpen() const override { return inner_->IsOpen(); }
    std::size_t BufferedAmount() const override { return inner_->BufferedAmount(); }
    std::size_t BufferedAmountLowThreshold() const override { return inner_->BufferedAmountLowThreshold(); }
    void SetBufferedAmountLowThreshold(std::size_t threshold) override {
        inner_->SetBufferedAmountLowThreshold(threshold);
    }
    std::size_t MaxMessageSize() const override { return inner_->MaxMessageSize(); }
    void OnOpen(EventHandler handler) override { inner_->OnOpen(std::move(handler)); }
    void OnMessage(MessageHandler handler) override { inner_->OnMessage(std::move(handler)); }
    void OnClose(EventHandler handler) override { inner_->OnClose(std::move(handler)); }
    void OnError(ErrorHandler handler) override { inner_->OnError(std::move(handler)); }
    void OnBufferedAmountLow(EventHandler handler) override { inner_->OnBufferedAmountLow(std::move(handler)); }

    std::size_t peak() const { return peak_.load(); }

private:
    ChannelPtr inner_;
    std::atomic<std::size_t> peak_{0};
};

// Accepts every message and never drains any of them.
class StalledChannel : public Channel {
public:
    void Send(Bytes&& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        buffered_ += message.size();
    }
    void Close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
    }
    bool IsOpen() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }
    std::size_t BufferedAmount() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffered_;
    }
    std::size_t BufferedAmountLowThreshold() const override { return 0; }
    void SetBufferedAmountLowThreshold(std::size_t) override {}
    std::size_t MaxMessageSize() const override { return 256u * 1024u * 1024u; }
    void OnOpen(EventHandler) override {}
    void OnMessage(MessageHandler) override {}
    void OnClose(EventHandler) override {}
    void OnError(ErrorHandler) override {}
    void OnBufferedAmountLow(EventHandler) override {}

private:
    mutable std::mutex mutex_;
    bool open_ = true;
    std::size_t buffered_ = 0;
};

TransferSessionPtr ProcessingSender(const std::string& id) {
    auto session = std::make_shared<TransferSession>(id, Role::Sender);
    session->Transition(TransferStatus::WaitingAccept);
    session->Transition(TransferStatus::Processing);
    return session;
}

std::string AnswerOf(const TransferSessionPtr& session) {
    return rendezvous::Parse(session->local_code()).negotiation_blob;
}

}  // namespace

TEST_F(UnorderedTransferTest, LargeFileOverShufflingChannel) {
    const std::size_t size = 300 * kMiB;
    file_source::FilePayload file = file_source::FromBytes("large.bin", PatternBytes(size, 300));
    Delivery delivery;
    SendOptions send;
    send.chunk_size = 16 * kMiB;

    auto sessions = Transfer(file, send, ReceiveWith(delivery));
    SessionSnapshot out = sessions.first->Snapshot();
    SessionSnapshot in = sessions.second->Snapshot();
    EXPECT_EQ(out.status, TransferStatus::Success) << out.error_message;
    ASSERT_EQ(in.status, TransferStatus::Success) << in.error_message;
    EXPECT_EQ(in.bytes_transferred, size);
    EXPECT_EQ(in.chunk_size, 16 * kMiB);
    EXPECT_EQ(sessions.second->Progress(), 100);

    std::lock_guard<std::mutex> lock(delivery.mutex);
    ASSERT_TRUE(delivery.data.has_value());
    EXPECT_EQ(delivery.data->size(), size);
    EXPECT_TRUE(*delivery.data == *file.data);
    EXPECT_EQ(delivery.file.name, "large.bin");
}

TEST_F(SmallMessageTransferTest, DefaultOptionsFitSmallMessageLimit) {
    file_source::FilePayload file = file_source::FromBytes("small.bin", PatternBytes(600 * 1024, 31));
    Delivery delivery;
    auto sessions = Transfer(file, SendOptions{}, ReceiveWith(delivery));
    SessionSnapshot out = sessions.first->Snapshot();
    ASSERT_EQ(out.status, TransferStatus::Success) << out.error_message;
    ASSERT_EQ(sessions.second->status(), TransferStatus::Success) << sessions.second->Snapshot().error_message;
    EXPECT_LE(out.chunk_size, 256u * 1024u);
    EXPECT_EQ(out.max_attempts_used, 1u);
    std::lock_guard<std::mutex> lock(delivery.mutex);
    ASSERT_TRUE(delivery.data.has_value());
    EXPECT_TRUE(*delivery.data == *file.data);
}

TEST_F(TransferTest, HighPerformanceReceiveCode) {
    ReceiveOptions fast;
    fast.high_performance = true;
    rendezvous::RendezvousCode advertised = rendezvous::Parse(receiver_.CreateReceiveCode(fast).code);
    EXPECT_EQ(advertised.chunk_size, 128 * kMiB);
    EXPECT_TRUE(advertised.high_performance);
    EXPECT_FALSE(advertised.public_key.empty());

    rendezvous::RendezvousCode plain = rendezvous::Parse(receiver_.CreateReceiveCode().code);
    EXPECT_EQ(plain.chunk_size, 16 * kMiB);
    EXPECT_FALSE(plain.high_performance);
}

TEST_F(TransferTest, CompressedPlaintextTransfer) {
    std::string text;
    while (text.size() < 3 * kMiB) {
        text += "the quick brown fox jumps over the lazy dog\n";
    }
    file_source::FilePayload file = file_source::FromBytes("notes.txt", Bytes(text.begin(), text.end()));
    EXPECT_EQ(file.metadata.content_type, "text/plain");
    Delivery delivery;
    SendOptions send;
    send.encrypt = false;
    send.compression_level = 6;
    send.chunk_size = 1 * kMiB;

    auto sessions = Transfer(file, send, ReceiveWith(delivery));
    ASSERT_EQ(sessions.second->status(), TransferStatus::Success) << sessions.second->Snapshot().error_message;
    EXPECT_EQ(sessions.first->status(), TransferStatus::Success);
    std::lock_guard<std::mutex> lock(delivery.mutex);
    ASSERT_TRUE(delivery.data.has_value());
    EXPECT_TRUE(*delivery.data == *file.data);
    EXPECT_EQ(delivery.file.content_type, "text/plain");
}

TEST_F(TransferTest, EncryptedCompressedTransferWithSmallBatches) {
    file_source::FilePayload file = file_source::FromBytes("mixed.bin", PatternBytes(5 * kMiB + 17, 11));
    Delivery delivery;
    SendOptions send;
    send.compression_level = 1;
    send.chunk_size = 1 * kMiB;
    send.parallelism = 1;
    send.streaming = false;

    auto sessions = Transfer(file, send, ReceiveWith(delivery));
    ASSERT_EQ(sessions.second->status(), TransferStatus::Success) << sessions.second->Snapshot().error_message;
    std::lock_guard<std::mutex> lock(delivery.mutex);
    ASSERT_TRUE(delivery.data.has_value());
    EXPECT_TRUE(*delivery.data == *file.data);
}

TEST_F(TransferTest, EmptyFile) {
    file_source::FilePayload file = file_source::FromBytes("empty", Bytes{});
    Delivery delivery;
    auto sessions = Transfer(file, SendOptions{}, ReceiveWith(delivery));
    EXPECT_EQ(sessions.first->status(), TransferStatus::Success);
    ASSERT_EQ(sessions.second->status(), TransferStatus::Success);
    std::lock_guard<std::mutex> lock(delivery.mutex);
    ASSERT_TRUE(delivery.data.has_value());
    EXPECT_TRUE(delivery.data->empty());
}

TEST_F(SlowLinkTransferTest, SlowProbeHalvesChunkSize) {
    file_source::FilePayload file = file_source::FromBytes("slow.bin", PatternBytes(3 * kMiB, 2));
    Delivery delivery;
    auto sessions = Transfer(file, SendOptions{}, ReceiveWith(delivery));
    ASSERT_EQ(sessions.first->status(), TransferStatus::Success) << sessions.first->Snapshot().error_message;
    ASSERT_EQ(sessions.second->status(), TransferStatus::Success);
    EXPECT_EQ(sessions.first->Snapshot().chunk_size, 2 * kMiB);
}

TEST_F(TransferTest, CancelAfterFortyPercent) {
    file_source::FilePayload file = file_source::FromBytes("big.bin", PatternBytes(64 * kMiB, 3));
    Delivery delivery;
    CancellationSource canceller;
    SendOptions send;
    send.chunk_size = 1 * kMiB;
    send.parallelism = 2;
    send.cancel = canceller.token();
    send.on_progress = [canceller](int percent) mutable {
        if (percent >= 40) {
            canceller.Cancel();
        }
    };

    auto sessions = Transfer(file, send, ReceiveWith(delivery));
    SessionSnapshot out = sessions.first->Snapshot();
    EXPECT_EQ(out.status, TransferStatus::Cancelled);
    EXPECT_EQ(out.error_kind, ErrorKind::Cancelled);
    EXPECT_GE(out.bytes_transferred, 64 * kMiB * 40 / 100);
    EXPECT_LE(out.bytes_transferred, 64 * kMiB * 40 / 100 + 3 * kMiB);
    EXPECT_LT(sessions.first->Progress(), 100);
    EXPECT_EQ(sessions.second->status(), TransferStatus::Cancelled);

    loopback::LoopbackChannelPtr channel = negotiator_->answerer_channel(AnswerOf(sessions.first));
    ASSERT_TRUE(channel);
    EXPECT_FALSE(channel->IsOpen());
    std::lock_guard<std::mutex> lock(delivery.mutex);
    EXPECT_FALSE(delivery.data.has_value());
}

TEST_F(TransferTest, ReceiverCancelStopsSender) {
    file_source::FilePayload file = file_source::FromBytes("big.bin", PatternBytes(64 * kMiB, 4));
    CancellationSource canceller;
    ReceiveOptions receive;
    receive.cancel = canceller.token();
    receive.on_progress = [canceller](int percent) mutable {
        if (percent >= 25) {
            canceller.Cancel();
        }
    };
    SendOptions send;
    send.chunk_size = 1 * kMiB;
    send.parallelism = 2;

    auto sessions = Transfer(file, send, receive);
    EXPECT_EQ(sessions.second->status(), TransferStatus::Cancelled);
    EXPECT_NE(sessions.first->status(), TransferStatus::Success);
}

TEST_F(TransferTest, HandshakeRetriedAfterTransportFailure) {
    negotiator_->FailNextOpens(1);
    file_source::FilePayload file = file_source::FromBytes("retry.bin", PatternBytes(kMiB, 5));
    Delivery delivery;
    SendOptions send;
    send.chunk_size = 256 * 1024;
    send.retry.base_delay = 10ms;
    auto sessions = Transfer(file, send, ReceiveWith(delivery));
    EXPECT_EQ(sessions.first->status(), TransferStatus::Success);
    EXPECT_EQ(sessions.second->status(), TransferStatus::Success);
}

TEST_F(TransferTest, DeclinedOfferCancelsBothEnds) {
    file_source::FilePayload file = file_source::FromBytes("offer.bin", PatternBytes(2 * kMiB, 8));
    ReceiveOptions receive;
    receive.auto_accept = false;
    receive.on_offer = [](const protocol::FileMetadata& meta) { return meta.size < kMiB; };
    SendOptions send;
    send.chunk_size = 256 * 1024;
    send.parallelism = 1;
    send.low_water_mark = 0;

    auto sessions = Transfer(file, send, receive);
    SessionSnapshot in = sessions.second->Snapshot();
    EXPECT_EQ(in.status, TransferStatus::Cancelled);
    EXPECT_EQ(in.error_kind, ErrorKind::Cancelled);
    EXPECT_EQ(in.error_message, "Offer declined");
}

TEST_F(TransferTest, OversizedOfferRejected) {
    file_source::FilePayload file = file_source::FromBytes("huge.bin", PatternBytes(2 * kMiB, 9));
    Delivery delivery;
    ReceiveOptions receive = ReceiveWith(delivery);
    receive.max_size = kMiB;
    SendOptions send;
    send.chunk_size = 256 * 1024;

    auto sessions = Transfer(file, send, receive);
    SessionSnapshot in = sessions.second->Snapshot();
    EXPECT_EQ(in.status, TransferStatus::Failed);
    EXPECT_EQ(in.error_kind, ErrorKind::Validation);
    std::lock_guard<std::mutex> lock(delivery.mutex);
    EXPECT_FALSE(delivery.data.has_value());
}

TEST_F(TransferTest, ReceiverTimesOutWithoutSender) {
    ReceiveOptions receive;
    receive.handshake_timeout = 50ms;
    ReceiveTicket ticket = receiver_.CreateReceiveCode(receive);
    std::string offer = rendezvous::Parse(ticket.code).negotiation_blob;

    rendezvous::RendezvousCode reply;
    reply.negotiation_blob = negotiator_->CreateAnswer(offer);
    reply.ice_server = "stun:stun.example.org";
    TransferSessionPtr inbound = receiver_.AcceptIncoming(rendezvous::Encode(reply), receive);
    ASSERT_TRUE(inbound->Wait(30s));
    SessionSnapshot snapshot = inbound->Snapshot();
    EXPECT_EQ(snapshot.status, TransferStatus::Failed);
    EXPECT_EQ(snapshot.error_kind, ErrorKind::Timeout);
}

TEST_F(TransferTest, DuplicateSessionIdRejected) {
    file_source::FilePayload file = file_source::FromBytes("dup.bin", PatternBytes(kMiB, 10));
    Delivery delivery;
    ReceiveOptions receive = ReceiveWith(delivery);
    ReceiveTicket first = receiver_.CreateReceiveCode(receive);
    ReceiveTicket second = receiver_.CreateReceiveCode(receive);

    SendOptions send;
    send.session_id = "transfer-1";
    send.chunk_size = 256 * 1024;
    TransferSessionPtr outbound = sender_.InitiateSend(file, first.code, send);
    EXPECT_EQ(sender_.Find("transfer-1"), outbound);
    EXPECT_THROW(sender_.InitiateSend(file, second.code, send), ValidationError);

    TransferSessionPtr inbound = receiver_.AcceptIncoming(outbound->local_code(), receive);
    ASSERT_TRUE(outbound->Wait(60s));
    ASSERT_TRUE(inbound->Wait(60s));
    EXPECT_EQ(outbound->status(), TransferStatus::Success);
    EXPECT_EQ(inbound->status(), TransferStatus::Success);
}

TEST_F(TransferTest, ConcurrentSessionsConnectOnce) {
    std::vector<std::pair<TransferSessionPtr, TransferSessionPtr>> sessions;
    std::vector<std::unique_ptr<Delivery>> deliveries;
    for (int i = 0; i < 4; ++i) {
        deliveries.push_back(std::make_unique<Delivery>());
        ReceiveOptions receive = ReceiveWith(*deliveries.back());
        ReceiveTicket ticket = receiver_.CreateReceiveCode(receive);
        SendOptions send;
        send.chunk_size = 256 * 1024;
        file_source::FilePayload file = file_source::FromBytes("f" + std::to_string(i), PatternBytes(kMiB, i + 20));
        TransferSessionPtr outbound = sender_.InitiateSend(file, ticket.code, send);
        sessions.emplace_back(outbound, receiver_.AcceptIncoming(outbound->local_code(), receive));
    }
    for (auto& pair : sessions) {
        ASSERT_TRUE(pair.first->Wait(60s));
        ASSERT_TRUE(pair.second->Wait(60s));
        EXPECT_EQ(pair.first->status(), TransferStatus::Success);
        EXPECT_EQ(pair.second->status(), TransferStatus::Success);
    }
    EXPECT_EQ(store_->connect_count(), 1u);
    ASSERT_TRUE(context_.session_keys().Current());
}

TEST_F(TransferTest, InvalidCodesRejectedUpFront) {
    file_source::FilePayload file = file_source::FromBytes("x", PatternBytes(10));
    EXPECT_THROW(sender_.InitiateSend(file, "garbage", SendOptions{}), ValidationError);

    rendezvous::RendezvousCode no_key;
    no_key.negotiation_blob = negotiator_->CreateOffer();
    no_key.ice_server = "stun:x";
    EXPECT_THROW(sender_.InitiateSend(file, rendezvous::Encode(no_key), SendOptions{}), ValidationError);

    SendOptions bad;
    bad.parallelism = 0;
    ReceiveTicket ticket = receiver_.CreateReceiveCode();
    EXPECT_THROW(sender_.InitiateSend(file, ticket.code, bad), ValidationError);

    rendezvous::RendezvousCode stray;
    stray.negotiation_blob = negotiator_->CreateAnswer(no_key.negotiation_blob);
    EXPECT_THROW(receiver_.AcceptIncoming(rendezvous::Encode(stray)), ValidationError);
    EXPECT_EQ(sender_.active_count(), 0u);
}

TEST(SenderEngineTest, SendRetriedUntilThirdAttempt) {
    auto pair = loopback::CreatePair();
    keys::KeyPair recipient = keys::GenerateAsymmetricKeyPair();
    Bytes data = PatternBytes(3 * kMiB + 5, 77);

    Delivery delivery;
    ReceiveOptions receive;
    receive.on_complete = delivery.Callback();
    auto inbound = std::make_shared<TransferSession>("rx", Role::Receiver);
    ReceiverEngine receiver(inbound, pair.second, receive, recipient.private_key);
    receiver.Start();

    auto outbound = std::make_shared<TransferSession>("tx", Role::Sender);
    outbound->Transition(TransferStatus::WaitingAccept);
    outbound->Transition(TransferStatus::Processing);
    SendOptions send;
    send.chunk_size = kMiB;
    send.retry.attempts = 3;
    send.retry.base_delay = 5ms;

    SendPlan plan;
    plan.file = file_source::FromBytes("retry.bin", data);
    plan.transfer_key = keys::GenerateSymmetricKey();
    plan.wrapped_key = keys::Wrap(plan.transfer_key, recipient.public_key.get());

    pair.first->FailNextSends(2);
    std::exception_ptr sender_error;
    std::thread worker([&] {
        try {
            SenderEngine engine(outbound, pair.first, send);
            engine.Run(std::move(plan));
        } catch (const std::exception&) {
            sender_error = std::current_exception();
        }
    });
    receiver.AwaitCompletion();
    worker.join();
    if (sender_error) {
        std::rethrow_exception(sender_error);
    }

    EXPECT_EQ(outbound->Snapshot().max_attempts_used, 3u);
    EXPECT_EQ(outbound->Snapshot().bytes_transferred, data.size());
    std::lock_guard<std::mutex> lock(delivery.mutex);
    ASSERT_TRUE(delivery.data.has_value());
    EXPECT_TRUE(*delivery.data == data);
}

TEST(SenderEngineTest, ExhaustedRetriesFailAndClose) {
    auto pair = loopback::CreatePair();
    auto outbound = std::make_shared<TransferSession>("tx", Role::Sender);
    outbound->Transition(TransferStatus::WaitingAccept);
    outbound->Transition(TransferStatus::Processing);
    SendOptions send;
    send.encrypt = false;
    send.chunk_size = kMiB;
    send.retry.attempts = 2;
    send.retry.base_delay = 1ms;

    SendPlan plan;
    plan.file = file_source::FromBytes("doomed.bin", PatternBytes(kMiB));
    pair.first->FailNextSends(5);
    SenderEngine engine(outbound, pair.first, send);
    EXPECT_THROW(engine.Run(std::move(plan)), TransportError);
    EXPECT_EQ(outbound->Snapshot().max_attempts_used, 2u);
    EXPECT_FALSE(pair.first->IsOpen());
}

TEST(SenderEngineTest, ChunkFitsChannelLimit) {
    std::size_t limit = 64 * 1024;
    std::size_t fitted = FitChunkToChannel(kMiB, limit, true, 16 * kMiB);
    EXPECT_LE(fitted + constants::kFrameOverhead + constants::kAeadNonceLen + constants::kAeadTagLen, limit);
    EXPECT_GT(fitted, limit / 2);
    EXPECT_EQ(FitChunkToChannel(1000, limit, false, 16 * kMiB), 1000u);
    EXPECT_THROW(FitChunkToChannel(kMiB, 10, true, 16 * kMiB), TransportError);
}

TEST(SenderEngineTest, BufferedAmountStaysNearLowWaterMark) {
    loopback::LoopbackOptions slow;
    slow.per_message_delay = std::chrono::milliseconds(20);
    auto pair = loopback::CreatePair(slow);
    auto tracked = std::make_shared<PeakTrackingChannel>(pair.first);
    Bytes data = PatternBytes(kMiB, 41);

    Delivery delivery;
    ReceiveOptions receive;
    receive.on_complete = delivery.Callback();
    auto inbound = std::make_shared<TransferSession>("rx", Role::Receiver);
    ReceiverEngine receiver(inbound, pair.second, receive, nullptr);
    receiver.Start();

    const std::size_t chunk_size = 32 * 1024;
    const std::size_t low_water = 64 * 1024;
    auto outbound = ProcessingSender("tx");
    SendOptions send;
    send.encrypt = false;
    send.chunk_size = chunk_size;
    send.low_water_mark = low_water;
    SendPlan plan;
    plan.file = file_source::FromBytes("paced.bin", data);

    std::exception_ptr sender_error;
    std::thread worker([&] {
        try {
            SenderEngine engine(outbound, tracked, send);
            engine.Run(std::move(plan));
        } catch (const std::exception&) {
            sender_error = std::current_exception();
        }
    });
    receiver.AwaitCompletion();
    worker.join();
    if (sender_error) {
        std::rethrow_exception(sender_error);
    }

    EXPECT_GT(tracked->peak(), low_water);
    EXPECT_LE(tracked->peak(), low_water + chunk_size + constants::kFrameOverhead);
    std::lock_guard<std::mutex> lock(delivery.mutex);
    ASSERT_TRUE(delivery.data.has_value());
    EXPECT_TRUE(*delivery.data == data);
}

TEST(SenderEngineTest, StalledDrainTimesOut) {
    for (std::size_t low_water : {std::size_t{0}, std::size_t{64} * kMiB}) {
        auto channel = std::make_shared<StalledChannel>();
        auto outbound = ProcessingSender("tx");
        SendOptions send;
        send.encrypt = false;
        send.chunk_size = 64 * 1024;
        send.low_water_mark = low_water;
        send.timeout = std::chrono::milliseconds(100);
        SendPlan plan;
        plan.file = file_source::FromBytes("stuck.bin", PatternBytes(kMiB, 42));

        SenderEngine engine(outbound, channel, send);
        EXPECT_THROW(engine.Run(std::move(plan)), TimeoutError) << "low water " << low_water;
        EXPECT_FALSE(channel->IsOpen());
    }
}

TEST(SenderEngineTest, OversizedFrameFailsWithoutRetry) {
    loopback::LoopbackOptions tight;
    tight.max_message_size = 1024;
    auto pair = loopback::CreatePair(tight);
    auto outbound = ProcessingSender("tx");
    SendOptions send;
    send.encrypt = false;
    send.chunk_size = 512;
    send.retry.attempts = 3;
    send.retry.base_delay = std::chrono::milliseconds(1000);

    SendPlan plan;
    plan.file = file_source::FromBytes(std::string(2000, 'n') + ".bin", PatternBytes(2048, 43));
    SenderEngine engine(outbound, pair.first, send);
    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(engine.Run(std::move(plan)), TransportError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(500));
    EXPECT_EQ(pair.first->sent_count(), 0u);
    EXPECT_FALSE(pair.first->IsOpen());
}
