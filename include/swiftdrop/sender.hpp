#pragma once

#include "swiftdrop/channel.hpp"
#include "swiftdrop/chunk.hpp"
#include "swiftdrop/file_source.hpp"
#include "swiftdrop/keys.hpp"
#include "swiftdrop/options.hpp"
#include "swiftdrop/protocol.hpp"
#include "swiftdrop/session.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace swiftdrop {

// Everything the sender needs for one transfer. The engine takes ownership
// and wipes the transfer key when it returns.
struct SendPlan {
    file_source::FilePayload file;
    keys::SymmetricKey transfer_key;  // empty when encryption is off
    std::vector<std::uint8_t> wrapped_key;
    std::string session_key_id;
};

// Largest plaintext chunk whose framed, encrypted form fits max_message_size.
std::size_t FitChunkToChannel(std::size_t chunk_size,
                              std::size_t max_message_size,
                              bool encrypt,
                              std::size_t sub_range_threshold);

class SenderEngine {
public:
    SenderEngine(TransferSessionPtr session, ChannelPtr channel, SendOptions options);
    ~SenderEngine();

    SenderEngine(const SenderEngine&) = delete;
    SenderEngine& operator=(const SenderEngine&) = delete;

    // Runs the transfer on the calling thread. The session must be in
    // Processing. On return the session is still Processing on success; the
    // caller records the outcome. Throws Error; on any failure the channel
    // is closed and a cancellation is announced to the peer first.
    void Run(SendPlan plan);

private:
    std::size_t ChooseChunkSize(std::uint64_t file_size);
    double ProbeThroughput();
    std::vector<std::uint8_t> PrepareChunk(const chunk::ChunkView& view, const keys::SymmetricKey& key) const;
    void SendFrame(std::vector<std::uint8_t> frame, const char* what);
    void WaitForRoom();
    void Flush();
    void AnnounceCancel(const std::string& reason);

    TransferSessionPtr session_;
    ChannelPtr channel_;
    SendOptions options_;
    CancellationToken cancel_;
    DrainWaiter drain_;
};

}  // namespace swiftdrop
