#pragma once

#include "swiftdrop/cancel.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace swiftdrop {

// An open, ordered-or-unordered, message-oriented peer-to-peer channel.
// Each event has a single handler slot; setting a handler replaces the
// previous one. Handlers may run on any thread.
class Channel {
public:
    using Bytes = std::vector<std::uint8_t>;
    using EventHandler = std::function<void()>;
    using MessageHandler = std::function<void(Bytes message)>;
    using ErrorHandler = std::function<void(const std::string& reason)>;

    virtual ~Channel() = default;

    // Throws TransportError when the message cannot be queued, in which case
    // message is left intact for another attempt.
    virtual void Send(Bytes&& message) = 0;
    virtual void Close() = 0;
    virtual bool IsOpen() const = 0;

    virtual std::size_t BufferedAmount() const = 0;
    virtual std::size_t BufferedAmountLowThreshold() const = 0;
    virtual void SetBufferedAmountLowThreshold(std::size_t threshold) = 0;
    virtual std::size_t MaxMessageSize() const = 0;

    virtual void OnOpen(EventHandler handler) = 0;
    virtual void OnMessage(MessageHandler handler) = 0;
    virtual void OnClose(EventHandler handler) = 0;
    virtual void OnError(ErrorHandler handler) = 0;
    virtual void OnBufferedAmountLow(EventHandler handler) = 0;
};

using ChannelPtr = std::shared_ptr<Channel>;

// Suspends a sender until the channel's buffered amount falls to the low
// threshold. Installs itself as the channel's buffered-amount-low and close
// handler for its lifetime.
class DrainWaiter {
public:
    explicit DrainWaiter(Channel& channel);
    ~DrainWaiter();

    DrainWaiter(const DrainWaiter&) = delete;
    DrainWaiter& operator=(const DrainWaiter&) = delete;

    // Returns once BufferedAmount() <= threshold. Throws CancellationError,
    // TransportError if the channel closes, TimeoutError after timeout.
    void WaitBelow(std::size_t threshold,
                   const CancellationToken& cancel,
                   std::optional<std::chrono::milliseconds> timeout = std::nullopt);

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::uint64_t generation = 0;
    };

    Channel& channel_;
    std::shared_ptr<State> state_;
};

// Establishes channels out of band. Blobs are opaque to the engine and are
// carried in the "s" field of a rendezvous code.
class Negotiator {
public:
    virtual ~Negotiator() = default;

    // Receiving side: a fresh offer.
    virtual std::string CreateOffer() = 0;
    // Sending side: the answer to a peer's offer.
    virtual std::string CreateAnswer(const std::string& offer) = 0;
    // The offer an answer replies to; throws ValidationError when unknown.
    virtual std::string OfferFor(const std::string& answer) = 0;

    // Blocks until the channel is open. The sending side passes its answer,
    // the receiving side the answer it was handed. Throws TimeoutError or
    // TransportError.
    virtual ChannelPtr OpenAsAnswerer(const std::string& answer, std::chrono::milliseconds timeout) = 0;
    virtual ChannelPtr OpenAsOfferer(const std::string& answer, std::chrono::milliseconds timeout) = 0;
};

}  // namespace swiftdrop
