#pragma once

#include "swiftdrop/channel.hpp"
#include "swiftdrop/crypto.hpp"
#include "swiftdrop/options.hpp"
#include "swiftdrop/session.hpp"

#include <memory>
#include <vector>

namespace swiftdrop {

// Reassembles an inbound transfer. Frames may arrive in any order; they are
// stored by offset and only decrypted once every byte has arrived, so a
// partial file is never handed to the caller.
class ReceiverEngine {
public:
    ReceiverEngine(TransferSessionPtr session,
                   ChannelPtr channel,
                   ReceiveOptions options,
                   crypto::PKey private_key);
    ~ReceiverEngine();

    ReceiverEngine(const ReceiverEngine&) = delete;
    ReceiverEngine& operator=(const ReceiverEngine&) = delete;

    // Installs the channel handlers and starts the handshake clock.
    void Start();

    // Blocks until every byte has arrived, then decrypts, delivers to
    // on_complete and returns. Throws ValidationError, CryptoError,
    // TimeoutError, TransportError or CancellationError.
    void AwaitCompletion();

    // Entry point used by the channel's message handler.
    void HandleMessage(std::vector<std::uint8_t> message);

private:
    struct State;

    std::shared_ptr<State> state_;
};

}  // namespace swiftdrop
