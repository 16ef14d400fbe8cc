#include "swiftdrop/receiver.hpp"

#include "swiftdrop/chunk.hpp"
#include "swiftdrop/cipher.hpp"
#include "swiftdrop/compression.hpp"
#include "swiftdrop/constants.hpp"
#include "swiftdrop/errors.hpp"
#include "swiftdrop/keys.hpp"
#include "swiftdrop/log.hpp"
#include "swiftdrop/protocol.hpp"

#include <chrono>
#include <condition_variable>
#include <exception>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace swiftdrop {

namespace {

using Bytes = std::vector<std::uint8_t>;
using Clock = std::chrono::steady_clock;

struct StoredChunk {
    protocol::FrameHeader header;
    Bytes message;
    std::size_t payload_offset = 0;
    std::size_t payload_size = 0;
};

}  // namespace

struct ReceiverEngine::State {
    TransferSessionPtr session;
    ChannelPtr channel;
    ReceiveOptions options;
    crypto::PKey private_key;
    CancellationToken cancel;
    ProgressReporter progress;

    std::mutex mutex;
    std::condition_variable cv;
    std::mutex report_mutex;  // serialises on_progress calls
    std::vector<int> pending_percents;
    Clock::time_point started;
    Clock::time_point last_activity;
    std::optional<protocol::MetadataMessage> metadata;
    bool encrypted = false;
    keys::SymmetricKey key;
    std::map<std::uint64_t, StoredChunk> chunks;
    std::set<std::uint64_t> seen;
    std::vector<Bytes> early;
    std::uint64_t early_bytes = 0;
    std::uint64_t received = 0;
    bool complete = false;
    bool finished = false;
    bool peer_cancelled = false;
    bool channel_closed = false;
    std::string peer_reason;
    std::exception_ptr failure;

    State(TransferSessionPtr s, ChannelPtr c, ReceiveOptions o, crypto::PKey k)
        : session(std::move(s)),
          channel(std::move(c)),
          options(std::move(o)),
          private_key(std::move(k)),
          cancel(session->cancel_token()),
          progress([this](int percent) { pending_percents.push_back(percent); }) {}

    void Handle(Bytes message);
    void HandleLocked(Bytes message);
    void AcceptMetadata(const protocol::Frame& frame);
    void AcceptChunk(const protocol::Frame& frame, Bytes message);
    Bytes Assemble();
    void Release();
    void ReportProgress();
};

void ReceiverEngine::State::Handle(Bytes message) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (complete || finished || failure || peer_cancelled) {
            return;
        }
        try {
            HandleLocked(std::move(message));
        } catch (const std::exception& ex) {
            log::Get()->debug("receiver rejected frame: {}", ex.what());
            failure = std::current_exception();
        }
    }
    cv.notify_all();
    ReportProgress();
}

// Percentages are queued under the state mutex and reported without it, so
// on_progress may cancel the session.
void ReceiverEngine::State::ReportProgress() {
    if (!options.on_progress) {
        return;
    }
    std::lock_guard<std::mutex> report(report_mutex);
    std::vector<int> percents;
    {
        std::lock_guard<std::mutex> lock(mutex);
        percents.swap(pending_percents);
    }
    for (int percent : percents) {
        options.on_progress(percent);
    }
}

// Called with the mutex held. on_offer runs here.
void ReceiverEngine::State::HandleLocked(Bytes message) {
    protocol::Frame frame = protocol::DecodeFrame(message);
    last_activity = Clock::now();
    switch (frame.header.type) {
        case protocol::FrameType::Probe:
            log::Get()->trace("probe of {} bytes", frame.payload.size);
            return;
        case protocol::FrameType::Cancel:
            peer_cancelled = true;
            peer_reason = protocol::DecodeCancelReason(frame);
            return;
        case protocol::FrameType::Metadata: {
            if (metadata) {
                log::Get()->debug("duplicate metadata ignored");
                return;
            }
            AcceptMetadata(frame);
            std::vector<Bytes> pending = std::move(early);
            early.clear();
            early_bytes = 0;
            for (auto& held : pending) {
                protocol::Frame held_frame = protocol::DecodeFrame(held);
                AcceptChunk(held_frame, std::move(held));
            }
            return;
        }
        case protocol::FrameType::Chunk:
            if (!metadata) {
                if (early_bytes + frame.payload.size > options.max_size) {
                    throw ValidationError("Data received before metadata exceeds max_size");
                }
                early_bytes += frame.payload.size;
                early.push_back(std::move(message));
                return;
            }
            AcceptChunk(frame, std::move(message));
            return;
    }
}

void ReceiverEngine::State::AcceptMetadata(const protocol::Frame& frame) {
    protocol::MetadataMessage meta = protocol::DecodeMetadata(frame);
    if (meta.file.size > options.max_size) {
        throw ValidationError("Declared size " + std::to_string(meta.file.size) + " exceeds max_size "
                              + std::to_string(options.max_size));
    }
    if (meta.file.size > 0) {
        if (meta.chunk_size == 0) {
            throw FormatError("Metadata declares a zero chunk size");
        }
        if (meta.chunk_count != chunk::ChunkCount(meta.file.size, meta.chunk_size)) {
            throw FormatError("Metadata chunk count disagrees with size and chunk size");
        }
    }
    encrypted = (meta.flags & constants::kFrameFlagEncrypted) != 0;
    if (encrypted) {
        if (!private_key) {
            throw CryptoError("Encrypted transfer but no private key to unwrap it");
        }
        key = cipher::UnwrapTransferKey(meta.wrapped_key, private_key.get());
    }
    if (!options.auto_accept && (!options.on_offer || !options.on_offer(meta.file))) {
        throw CancellationError("Offer declined");
    }

    session->SetFile(meta.file);
    session->SetChunkSize(meta.chunk_size);
    session->Transition(TransferStatus::Processing);
    log::Get()->info("receiving {} ({} bytes, {} chunks of {}, session key {})", meta.file.name, meta.file.size,
                     meta.chunk_count, meta.chunk_size, meta.session_key_id.empty() ? "-" : meta.session_key_id);
    if (meta.file.size == 0) {
        complete = true;
    }
    metadata = std::move(meta);
}

void ReceiverEngine::State::AcceptChunk(const protocol::Frame& frame, Bytes message) {
    const protocol::FrameHeader& header = frame.header;
    const std::uint64_t size = metadata->file.size;
    const std::uint64_t chunk_size = metadata->chunk_size;
    if (header.offset >= size) {
        throw ValidationError("Chunk offset " + std::to_string(header.offset) + " outside file of "
                              + std::to_string(size) + " bytes");
    }
    if (header.plain_length == 0 || header.plain_length > size - header.offset) {
        throw ValidationError("Chunk at offset " + std::to_string(header.offset) + " exceeds declared size");
    }
    if (header.offset % chunk_size != 0 || header.sequence != header.offset / chunk_size) {
        throw FormatError("Chunk sequence and offset disagree");
    }
    if (header.plain_length != std::min<std::uint64_t>(chunk_size, size - header.offset)) {
        throw FormatError("Chunk length disagrees with the negotiated chunk size");
    }
    if (header.Has(constants::kFrameFlagEncrypted) != encrypted) {
        throw FormatError("Chunk encryption flag disagrees with metadata");
    }
    if (!seen.insert(header.sequence).second) {
        log::Get()->debug("duplicate chunk {} ignored", header.sequence);
        return;
    }
    if (received + header.plain_length > size || received + header.plain_length > options.max_size) {
        throw ValidationError("Received data exceeds the declared size");
    }

    StoredChunk stored;
    stored.header = header;
    stored.payload_offset = static_cast<std::size_t>(frame.payload.data - message.data());
    stored.payload_size = frame.payload.size;
    stored.message = std::move(message);
    chunks.emplace(header.offset, std::move(stored));

    received += header.plain_length;
    session->AddBytes(header.plain_length);
    progress.Update(received, size);
    log::Get()->trace("chunk {} at offset {} stored ({} of {} bytes)", header.sequence, header.offset, received,
                      size);
    if (received == size) {
        complete = true;
    }
}

// Runs after complete is set; message handlers no longer touch chunks.
Bytes ReceiverEngine::State::Assemble() {
    const std::uint64_t size = metadata->file.size;
    Bytes out;
    out.reserve(static_cast<std::size_t>(size));
    cipher::Options cipher_options{metadata->sub_range_threshold != 0
                                       ? static_cast<std::size_t>(metadata->sub_range_threshold)
                                       : options.sub_range_threshold};
    for (auto it = chunks.begin(); it != chunks.end(); it = chunks.erase(it)) {
        StoredChunk& stored = it->second;
        if (stored.header.offset != out.size()) {
            throw FormatError("Gap in reassembled data at offset " + std::to_string(out.size()));
        }
        chunk::ByteView payload(stored.message.data() + stored.payload_offset, stored.payload_size);
        Bytes plain = encrypted
                          ? cipher::Decrypt(key, payload, protocol::EncodeHeader(stored.header), cipher_options)
                          : payload.ToBytes();
        Bytes().swap(stored.message);
        if (stored.header.Has(constants::kFrameFlagCompressed)) {
            plain = compression::Inflate(plain, static_cast<std::size_t>(stored.header.plain_length));
        }
        if (plain.size() != stored.header.plain_length) {
            throw FormatError("Chunk at offset " + std::to_string(stored.header.offset)
                              + " does not match its declared length");
        }
        out.insert(out.end(), plain.begin(), plain.end());
    }
    if (out.size() != size) {
        throw FormatError("Reassembled " + std::to_string(out.size()) + " of " + std::to_string(size) + " bytes");
    }
    return out;
}

void ReceiverEngine::State::Release() {
    std::lock_guard<std::mutex> lock(mutex);
    finished = true;
    chunks.clear();
    early.clear();
    early_bytes = 0;
    key.Discard();
}

ReceiverEngine::ReceiverEngine(TransferSessionPtr session,
                               ChannelPtr channel,
                               ReceiveOptions options,
                               crypto::PKey private_key)
    : state_(std::make_shared<State>(std::move(session), std::move(channel), std::move(options),
                                     std::move(private_key))) {}

ReceiverEngine::~ReceiverEngine() {
    state_->channel->OnMessage(nullptr);
    state_->channel->OnClose(nullptr);
    state_->channel->OnError(nullptr);
}

void ReceiverEngine::Start() {
    auto state = state_;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->started = Clock::now();
        state->last_activity = state->started;
    }
    if (state->session->status() == TransferStatus::Pending) {
        state->session->Transition(TransferStatus::WaitingAccept);
    }
    state->channel->OnClose([state] {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->channel_closed = true;
        }
        state->cv.notify_all();
    });
    state->channel->OnError([state](const std::string& reason) {
        log::Get()->warn("receiver channel error: {}", reason);
    });
    state->channel->OnMessage([state](Bytes message) { state->Handle(std::move(message)); });
    if (!state->channel->IsOpen()) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->channel_closed = true;
    }
}

void ReceiverEngine::HandleMessage(std::vector<std::uint8_t> message) {
    state_->Handle(std::move(message));
}

void ReceiverEngine::AwaitCompletion() {
    auto state = state_;
    CancellationSource session_source = state->session->cancel_source();
    CancellationRegistration link(state->options.cancel, [session_source]() mutable { session_source.Cancel(); });
    CancellationRegistration wake(state->cancel, [state] {
        // Taking the lock orders this wake after the waiter's last check.
        {
            std::lock_guard<std::mutex> lock(state->mutex);
        }
        state->cv.notify_all();
    });

    try {
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            while (true) {
                if (state->failure) {
                    std::rethrow_exception(state->failure);
                }
                if (state->peer_cancelled) {
                    throw CancellationError("Sender cancelled the transfer: " + state->peer_reason);
                }
                if (state->cancel.IsCancelled()) {
                    throw CancellationError();
                }
                if (state->complete) {
                    break;
                }
                if (state->channel_closed) {
                    throw TransportError("Channel closed before the transfer completed");
                }
                bool handshake = !state->metadata;
                auto deadline = handshake ? state->started + state->options.handshake_timeout
                                          : state->last_activity + state->options.chunk_timeout;
                if (Clock::now() >= deadline) {
                    auto limit = handshake ? state->options.handshake_timeout : state->options.chunk_timeout;
                    throw TimeoutError(std::string(handshake ? "No metadata" : "No chunk") + " received within "
                                       + std::to_string(limit.count()) + " ms");
                }
                state->cv.wait_until(lock, deadline);
            }
        }

        Bytes data = state->Assemble();
        log::Get()->info("session {} received {} bytes", state->session->id(), data.size());
        if (state->options.on_complete) {
            state->options.on_complete(state->metadata->file, std::move(data));
        }
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->progress.Complete();
        }
        state->ReportProgress();
    } catch (const CancellationError& ex) {
        bool from_peer = false;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            from_peer = state->peer_cancelled;
        }
        if (!from_peer) {
            try {
                if (state->channel->IsOpen()) {
                    state->channel->Send(protocol::EncodeCancel(ex.what()));
                }
            } catch (const Error& send_error) {
                log::Get()->warn("could not announce cancellation to peer: {}", send_error.what());
            }
        }
        state->Release();
        state->channel->Close();
        throw;
    } catch (const std::exception&) {
        state->Release();
        state->channel->Close();
        throw;
    }
    state->Release();
    state->channel->Close();
}

}  // namespace swiftdrop
