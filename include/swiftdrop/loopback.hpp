#pragma once

#include "swiftdrop/channel.hpp"
#include "swiftdrop/rendezvous_store.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <utility>

namespace swiftdrop::loopback {

struct LoopbackOptions {
    bool ordered = true;
    // Unordered links deliver a random message among the first reorder_window
    // queued ones.
    std::size_t reorder_window = 8;
    std::size_t max_message_size = 256u * 1024u * 1024u;
    std::uint32_t seed = 0;  // 0 seeds from std::random_device
    std::chrono::microseconds per_message_delay{0};
};

class LoopbackChannel;
using LoopbackChannelPtr = std::shared_ptr<LoopbackChannel>;

// Two connected, open ends.
std::pair<LoopbackChannelPtr, LoopbackChannelPtr> CreatePair(const LoopbackOptions& options = {});

// One end of an in-process channel pair. Each end owns a delivery thread
// that hands its outbound messages to the peer's message handler. A message
// counts towards BufferedAmount() until the delivery thread takes it.
class LoopbackChannel : public Channel {
public:
    LoopbackChannel(const LoopbackOptions& options, std::string name);
    ~LoopbackChannel() override;

    void Send(Bytes&& message) override;
    void Close() override;
    bool IsOpen() const override;

    std::size_t BufferedAmount() const override;
    std::size_t BufferedAmountLowThreshold() const override;
    void SetBufferedAmountLowThreshold(std::size_t threshold) override;
    std::size_t MaxMessageSize() const override;

    void OnOpen(EventHandler handler) override;
    void OnMessage(MessageHandler handler) override;
    void OnClose(EventHandler handler) override;
    void OnError(ErrorHandler handler) override;
    void OnBufferedAmountLow(EventHandler handler) override;

    // The next count calls to Send throw TransportError without queuing.
    void FailNextSends(std::size_t count);
    std::size_t sent_count() const;
    const std::string& name() const { return name_; }

private:
    friend std::pair<LoopbackChannelPtr, LoopbackChannelPtr> CreatePair(const LoopbackOptions& options);

    void Start(const std::shared_ptr<LoopbackChannel>& peer);
    void DeliveryLoop();
    void Receive(Bytes message);
    void PeerClosed();
    void FireClose();

    LoopbackOptions options_;
    std::string name_;
    std::weak_ptr<LoopbackChannel> peer_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Bytes> outbound_;
    std::size_t buffered_ = 0;
    std::size_t low_threshold_ = 0;
    std::size_t fail_sends_ = 0;
    std::size_t sent_ = 0;
    bool open_ = false;
    bool stop_ = false;
    bool close_fired_ = false;
    bool destroying_ = false;
    std::mt19937 rng_;
    EventHandler open_handler_;
    EventHandler close_handler_;
    ErrorHandler error_handler_;
    EventHandler buffered_low_handler_;

    // Serialises inbound delivery against handler replacement.
    std::recursive_mutex inbound_mutex_;
    MessageHandler message_handler_;
    std::deque<Bytes> inbox_;

    std::thread thread_;
};

// Pairs offers and answers in process. The link is created once both sides
// have asked to open it.
class LoopbackNegotiator : public Negotiator {
public:
    explicit LoopbackNegotiator(LoopbackOptions options = {});

    std::string CreateOffer() override;
    std::string CreateAnswer(const std::string& offer) override;
    std::string OfferFor(const std::string& answer) override;
    ChannelPtr OpenAsAnswerer(const std::string& answer, std::chrono::milliseconds timeout) override;
    ChannelPtr OpenAsOfferer(const std::string& answer, std::chrono::milliseconds timeout) override;

    // The next count Open* calls throw TransportError.
    void FailNextOpens(std::size_t count);

    // Channels handed out so far, by side, for inspection.
    LoopbackChannelPtr answerer_channel(const std::string& answer) const;
    LoopbackChannelPtr offerer_channel(const std::string& answer) const;

private:
    struct Link {
        std::string offer;
        bool answerer_waiting = false;
        bool offerer_waiting = false;
        LoopbackChannelPtr answerer;
        LoopbackChannelPtr offerer;
    };

    ChannelPtr Open(const std::string& answer, bool as_answerer, std::chrono::milliseconds timeout);

    LoopbackOptions options_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, bool> offers_;
    std::map<std::string, Link> links_;
    std::size_t fail_opens_ = 0;
};

// Rendezvous key store kept in memory.
class MemoryRendezvousStore : public RendezvousStore {
public:
    void Connect() override;
    void Publish(const SessionKeyRecord& record) override;
    std::optional<SessionKeyRecord> Fetch() override;
    void Clear() override;

    std::size_t connect_count() const;
    // The next Fetch throws TransportError.
    void FailNextFetch();

private:
    mutable std::mutex mutex_;
    std::optional<SessionKeyRecord> record_;
    std::size_t connects_ = 0;
    bool fail_fetch_ = false;
};

}  // namespace swiftdrop::loopback
