#include "swiftdrop/sender.hpp"

#include "swiftdrop/cipher.hpp"
#include "swiftdrop/compression.hpp"
#include "swiftdrop/constants.hpp"
#include "swiftdrop/errors.hpp"
#include "swiftdrop/log.hpp"
#include "swiftdrop/retry.hpp"

#include <algorithm>
#include <future>
#include <string>
#include <utility>

namespace swiftdrop {

std::size_t FitChunkToChannel(std::size_t chunk_size,
                              std::size_t max_message_size,
                              bool encrypt,
                              std::size_t sub_range_threshold) {
    if (max_message_size <= constants::kFrameOverhead) {
        throw TransportError("Channel message limit too small for a frame");
    }
    std::size_t budget = max_message_size - constants::kFrameOverhead;
    if (!encrypt) {
        return std::min(chunk_size, budget);
    }
    if (budget <= constants::kAeadNonceLen + constants::kAeadTagLen) {
        throw TransportError("Channel message limit too small for an encrypted frame");
    }
    cipher::Options cipher_options{sub_range_threshold};
    std::size_t candidate = std::min(chunk_size, budget - constants::kAeadNonceLen - constants::kAeadTagLen);
    while (candidate > 0) {
        std::size_t envelope = cipher::EnvelopeSize(candidate, cipher_options);
        if (envelope <= budget) {
            break;
        }
        candidate -= std::min(candidate, envelope - budget);
    }
    if (candidate == 0) {
        throw TransportError("Channel message limit too small for an encrypted frame");
    }
    return candidate;
}

SenderEngine::SenderEngine(TransferSessionPtr session, ChannelPtr channel, SendOptions options)
    : session_(std::move(session)),
      channel_(std::move(channel)),
      options_(std::move(options)),
      cancel_(session_->cancel_token()),
      drain_(*channel_) {
    std::weak_ptr<TransferSession> weak = session_;
    channel_->OnMessage([weak](Channel::Bytes message) {
        auto session = weak.lock();
        if (!session) {
            return;
        }
        try {
            protocol::Frame frame = protocol::DecodeFrame(message);
            if (frame.header.type == protocol::FrameType::Cancel) {
                log::Get()->info("peer cancelled session {}: {}", session->id(),
                                 protocol::DecodeCancelReason(frame));
                session->RequestCancel();
            }
        } catch (const FormatError& ex) {
            log::Get()->warn("sender ignored malformed frame: {}", ex.what());
        }
    });
}

SenderEngine::~SenderEngine() {
    channel_->OnMessage(nullptr);
}

void SenderEngine::Run(SendPlan plan) {
    if (!plan.file.data) {
        throw ValidationError("Send plan has no file data");
    }
    if (options_.encrypt && plan.transfer_key.empty()) {
        throw CryptoError("Encryption requested without a transfer key");
    }
    const chunk::Bytes& data = *plan.file.data;
    const std::uint64_t total = data.size();
    CancellationSource session_source = session_->cancel_source();
    CancellationRegistration link(options_.cancel, [session_source]() mutable { session_source.Cancel(); });

    try {
        cancel_.ThrowIfCancelled();
        if (!channel_->IsOpen()) {
            throw TransportError("Channel is not open");
        }
        channel_->SetBufferedAmountLowThreshold(options_.low_water_mark);

        std::size_t chunk_size = ChooseChunkSize(total);
        session_->SetChunkSize(chunk_size);
        chunk::ChunkSequence chunks = chunk::Split(data, chunk_size);
        log::Get()->info("sending {} ({} bytes) in {} chunks of {} bytes", plan.file.metadata.name, total,
                         chunks.size(), chunk_size);

        protocol::MetadataMessage meta;
        meta.file = plan.file.metadata;
        meta.file.size = total;
        meta.wrapped_key = plan.wrapped_key;
        meta.chunk_size = chunk_size;
        meta.chunk_count = chunks.size();
        meta.sub_range_threshold = options_.sub_range_threshold;
        meta.session_key_id = plan.session_key_id;
        if (options_.encrypt) {
            meta.flags |= constants::kFrameFlagEncrypted;
        }
        if (options_.compression_level > 0) {
            meta.flags |= constants::kFrameFlagCompressed;
        }
        if (chunk::ShouldUseHighPerformanceMode(total)) {
            meta.flags |= constants::kFrameFlagHighPerformance;
        }
        SendFrame(protocol::EncodeMetadata(meta), "metadata send");

        ProgressReporter progress(options_.on_progress);
        std::uint64_t sent = 0;
        const keys::SymmetricKey& key = plan.transfer_key;

        auto prepare_batch = [&](std::size_t first, std::size_t last) {
            std::vector<std::future<chunk::Bytes>> pending;
            pending.reserve(last - first);
            for (std::size_t i = first; i < last; ++i) {
                chunk::ChunkView view = chunks[i];
                pending.push_back(std::async(std::launch::async, [this, view, &key] {
                    return Retry(options_.retry, cancel_, "chunk preparation",
                                 [&] { return PrepareChunk(view, key); });
                }));
            }
            std::vector<chunk::Bytes> frames;
            frames.reserve(pending.size());
            for (auto& future : pending) {
                frames.push_back(future.get());
            }
            return frames;
        };

        auto admit = [&](chunk::Bytes frame, const chunk::ChunkView& view) {
            cancel_.ThrowIfCancelled();
            WaitForRoom();
            SendFrame(std::move(frame), "chunk send");
            sent += view.bytes.size;
            session_->AddBytes(view.bytes.size);
            progress.Update(sent, total);
            log::Get()->trace("chunk {} at offset {} sent ({} bytes)", view.index, view.offset, view.bytes.size);
        };

        const std::size_t batch = options_.parallelism;
        if (options_.streaming) {
            for (std::size_t first = 0; first < chunks.size(); first += batch) {
                cancel_.ThrowIfCancelled();
                std::size_t last = std::min(chunks.size(), first + batch);
                std::vector<chunk::Bytes> frames = prepare_batch(first, last);
                for (std::size_t i = first; i < last; ++i) {
                    admit(std::move(frames[i - first]), chunks[i]);
                }
            }
        } else {
            std::vector<chunk::Bytes> frames;
            frames.reserve(chunks.size());
            for (std::size_t first = 0; first < chunks.size(); first += batch) {
                cancel_.ThrowIfCancelled();
                std::size_t last = std::min(chunks.size(), first + batch);
                for (auto& frame : prepare_batch(first, last)) {
                    frames.push_back(std::move(frame));
                }
            }
            for (std::size_t i = 0; i < chunks.size(); ++i) {
                admit(std::move(frames[i]), chunks[i]);
            }
        }

        Flush();
        progress.Complete();
        log::Get()->info("session {} sent {} bytes", session_->id(), sent);
    } catch (const CancellationError& ex) {
        AnnounceCancel(ex.what());
        channel_->Close();
        throw;
    } catch (const std::exception&) {
        channel_->Close();
        throw;
    }
}

std::size_t SenderEngine::ChooseChunkSize(std::uint64_t file_size) {
    std::size_t chunk_size = options_.chunk_size;
    if (chunk_size == 0) {
        chunk_size = chunk::OptimalChunkSize(file_size);
        if (options_.adaptive_chunking && file_size > 0) {
            double mbps = ProbeThroughput();
            if (mbps > options_.high_speed_threshold_mbps) {
                chunk_size = std::min(chunk_size * 2, constants::kChunkMax);
            } else if (mbps >= 0 && mbps < options_.low_speed_threshold_mbps) {
                chunk_size = std::max(chunk_size / 2, constants::kChunkMin);
            }
            log::Get()->debug("probe measured {:.1f} MB/s, chunk size {}", mbps, chunk_size);
        }
    }
    std::size_t fitted = FitChunkToChannel(chunk_size, channel_->MaxMessageSize(), options_.encrypt,
                                           options_.sub_range_threshold);
    if (fitted != chunk_size) {
        log::Get()->info("chunk size reduced from {} to {} to fit the channel", chunk_size, fitted);
    }
    return fitted;
}

// Returns MiB/s, or -1 when the sample did not drain in time. The sample is
// shrunk to fit the channel's message limit.
double SenderEngine::ProbeThroughput() {
    std::size_t max_message = channel_->MaxMessageSize();
    if (max_message <= constants::kFrameOverhead) {
        log::Get()->warn("channel limit of {} bytes leaves no room for a probe", max_message);
        return -1.0;
    }
    std::size_t sample = std::min(constants::kProbeSampleSize, max_message - constants::kFrameOverhead);
    auto start = std::chrono::steady_clock::now();
    SendFrame(protocol::EncodeProbe(sample), "probe send");
    channel_->SetBufferedAmountLowThreshold(0);
    double mbps = -1.0;
    try {
        drain_.WaitBelow(0, cancel_, constants::kProbeTimeout);
        double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        double mib = static_cast<double>(sample) / static_cast<double>(constants::kMiB);
        mbps = seconds > 0 ? mib / seconds : options_.high_speed_threshold_mbps * 2;
    } catch (const TimeoutError& ex) {
        log::Get()->warn("throughput probe inconclusive: {}", ex.what());
    }
    channel_->SetBufferedAmountLowThreshold(options_.low_water_mark);
    return mbps;
}

chunk::Bytes SenderEngine::PrepareChunk(const chunk::ChunkView& view, const keys::SymmetricKey& key) const {
    protocol::FrameHeader header;
    header.type = protocol::FrameType::Chunk;
    header.sequence = view.index;
    header.offset = view.offset;
    header.plain_length = view.bytes.size;
    if (view.last) {
        header.flags |= constants::kFrameFlagLast;
    }

    chunk::ByteView payload = view.bytes;
    chunk::Bytes deflated;
    if (options_.compression_level > 0) {
        deflated = compression::Deflate(view.bytes, options_.compression_level);
        if (deflated.size() < view.bytes.size) {
            payload = deflated;
            header.flags |= constants::kFrameFlagCompressed;
        }
    }
    if (!options_.encrypt) {
        return protocol::EncodeFrame(header, payload);
    }
    header.flags |= constants::kFrameFlagEncrypted;
    chunk::Bytes envelope = cipher::Encrypt(key, payload, protocol::EncodeHeader(header),
                                            cipher::Options{options_.sub_range_threshold});
    return protocol::EncodeFrame(header, envelope);
}

void SenderEngine::SendFrame(chunk::Bytes frame, const char* what) {
    // An oversized message fails the same way on every attempt.
    if (frame.size() > channel_->MaxMessageSize()) {
        throw TransportError(std::string(what) + ": message of " + std::to_string(frame.size())
                             + " bytes exceeds channel limit of " + std::to_string(channel_->MaxMessageSize()));
    }
    std::uint32_t attempts = 0;
    try {
        Retry(options_.retry, cancel_, what, [&] { channel_->Send(std::move(frame)); }, &attempts);
    } catch (const Error&) {
        session_->RecordAttempts(attempts);
        throw;
    }
    session_->RecordAttempts(attempts);
}

void SenderEngine::WaitForRoom() {
    if (channel_->BufferedAmount() > options_.low_water_mark) {
        log::Get()->trace("channel above low-water mark, waiting to drain");
        drain_.WaitBelow(options_.low_water_mark, cancel_, options_.timeout);
    }
}

void SenderEngine::Flush() {
    channel_->SetBufferedAmountLowThreshold(0);
    drain_.WaitBelow(0, cancel_, options_.timeout);
}

void SenderEngine::AnnounceCancel(const std::string& reason) {
    try {
        if (channel_->IsOpen()) {
            channel_->Send(protocol::EncodeCancel(reason));
        }
    } catch (const Error& ex) {
        log::Get()->warn("could not announce cancellation to peer: {}", ex.what());
    }
}

}  // namespace swiftdrop
