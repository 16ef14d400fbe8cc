#pragma once

#include "swiftdrop/cancel.hpp"
#include "swiftdrop/errors.hpp"
#include "swiftdrop/options.hpp"
#include "swiftdrop/protocol.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace swiftdrop {

enum class TransferStatus {
    Pending,
    WaitingAccept,
    Processing,
    Success,
    Failed,
    Cancelled
};

enum class Role {
    Sender,
    Receiver
};

const char* StatusName(TransferStatus status);
const char* RoleName(Role role);
bool IsTerminal(TransferStatus status);

struct SessionSnapshot {
    std::string id;
    Role role = Role::Sender;
    TransferStatus status = TransferStatus::Pending;
    protocol::FileMetadata file;
    std::uint64_t chunk_size = 0;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::steady_clock::time_point started;
    double bitrate_bps = 0.0;
    std::uint32_t max_attempts_used = 0;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

// State of one transfer. All members are guarded by the session mutex, so
// engines, the orchestrator and callers may touch it from any thread.
//
// Pending -> WaitingAccept -> Processing -> Success | Failed | Cancelled;
// any non-terminal state may move to Failed or Cancelled.
class TransferSession {
public:
    TransferSession(std::string id, Role role);

    const std::string& id() const noexcept { return id_; }
    Role role() const noexcept { return role_; }

    TransferStatus status() const;
    SessionSnapshot Snapshot() const;

    // Throws ValidationError on an illegal transition.
    void Transition(TransferStatus next);

    // Records the error and moves to Failed, or Cancelled for a
    // CancellationError. No-op once terminal.
    void Fail(const Error& error);
    void Fail(ErrorKind kind, const std::string& message);

    void SetFile(const protocol::FileMetadata& file);
    void SetChunkSize(std::uint64_t chunk_size);
    // Monotonic; updates the instantaneous bitrate.
    void AddBytes(std::uint64_t count);
    void RecordAttempts(std::uint32_t attempts);

    // Whole percent; 100 only once Success.
    int Progress() const;

    // The code this side hands to its peer (the answer code for senders).
    std::string local_code() const;
    void set_local_code(std::string code);

    void RequestCancel() { cancel_source_.Cancel(); }
    CancellationToken cancel_token() const { return cancel_source_.token(); }
    CancellationSource cancel_source() const { return cancel_source_; }

    // Blocks until terminal. Returns false if timeout elapsed first.
    bool Wait(std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

private:
    bool CanMove(TransferStatus next) const;

    const std::string id_;
    const Role role_;
    CancellationSource cancel_source_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    TransferStatus status_ = TransferStatus::Pending;
    protocol::FileMetadata file_;
    std::uint64_t chunk_size_ = 0;
    std::uint64_t bytes_ = 0;
    std::chrono::steady_clock::time_point started_;
    std::chrono::steady_clock::time_point last_update_;
    double bitrate_bps_ = 0.0;
    std::uint32_t max_attempts_ = 0;
    ErrorKind error_kind_ = ErrorKind::None;
    std::string error_message_;
    std::string local_code_;
};

using TransferSessionPtr = std::shared_ptr<TransferSession>;

// Fires the callback at most once per whole-percent advance and exactly once
// with 100 on completion.
class ProgressReporter {
public:
    explicit ProgressReporter(ProgressCallback callback) : callback_(std::move(callback)) {}

    void Update(std::uint64_t done, std::uint64_t total);
    void Complete();

private:
    ProgressCallback callback_;
    int last_ = -1;
    bool completed_ = false;
};

}  // namespace swiftdrop
