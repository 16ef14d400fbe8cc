#include "swiftdrop/session.hpp"

#include "swiftdrop/log.hpp"

#include <algorithm>

namespace swiftdrop {

const char* StatusName(TransferStatus status) {
    switch (status) {
        case TransferStatus::Pending:
            return "pending";
        case TransferStatus::WaitingAccept:
            return "waiting-accept";
        case TransferStatus::Processing:
            return "processing";
        case TransferStatus::Success:
            return "success";
        case TransferStatus::Failed:
            return "failed";
        case TransferStatus::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

const char* RoleName(Role role) {
    return role == Role::Sender ? "sender" : "receiver";
}

bool IsTerminal(TransferStatus status) {
    return status == TransferStatus::Success || status == TransferStatus::Failed
           || status == TransferStatus::Cancelled;
}

TransferSession::TransferSession(std::string id, Role role)
    : id_(std::move(id)),
      role_(role),
      started_(std::chrono::steady_clock::now()),
      last_update_(started_) {}

TransferStatus TransferSession::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

SessionSnapshot TransferSession::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionSnapshot snap;
    snap.id = id_;
    snap.role = role_;
    snap.status = status_;
    snap.file = file_;
    snap.chunk_size = chunk_size_;
    snap.bytes_transferred = bytes_;
    snap.total_bytes = file_.size;
    snap.started = started_;
    snap.bitrate_bps = bitrate_bps_;
    snap.max_attempts_used = max_attempts_;
    snap.error_kind = error_kind_;
    snap.error_message = error_message_;
    return snap;
}

bool TransferSession::CanMove(TransferStatus next) const {
    if (IsTerminal(status_)) {
        return false;
    }
    switch (next) {
        case TransferStatus::Pending:
            return false;
        case TransferStatus::WaitingAccept:
            return status_ == TransferStatus::Pending;
        case TransferStatus::Processing:
            return status_ == TransferStatus::WaitingAccept;
        case TransferStatus::Success:
            return status_ == TransferStatus::Processing;
        case TransferStatus::Failed:
        case TransferStatus::Cancelled:
            return true;
    }
    return false;
}

void TransferSession::Transition(TransferStatus next) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!CanMove(next)) {
            throw ValidationError(std::string("Illegal session transition ") + StatusName(status_) + " -> "
                                  + StatusName(next));
        }
        status_ = next;
        if (next == TransferStatus::Processing) {
            started_ = std::chrono::steady_clock::now();
            last_update_ = started_;
        }
    }
    log::Get()->info("{} session {} -> {}", RoleName(role_), id_, StatusName(next));
    cv_.notify_all();
}

void TransferSession::Fail(const Error& error) {
    Fail(error.kind(), error.what());
}

void TransferSession::Fail(ErrorKind kind, const std::string& message) {
    TransferStatus next = kind == ErrorKind::Cancelled ? TransferStatus::Cancelled : TransferStatus::Failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (IsTerminal(status_)) {
            return;
        }
        status_ = next;
        error_kind_ = kind;
        error_message_ = message;
    }
    if (next == TransferStatus::Cancelled) {
        log::Get()->info("{} session {} cancelled: {}", RoleName(role_), id_, message);
    } else {
        log::Get()->error("{} session {} failed ({}): {}", RoleName(role_), id_, ErrorKindName(kind), message);
    }
    cv_.notify_all();
}

void TransferSession::SetFile(const protocol::FileMetadata& file) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_ = file;
}

void TransferSession::SetChunkSize(std::uint64_t chunk_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    chunk_size_ = chunk_size;
}

void TransferSession::AddBytes(std::uint64_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    bytes_ += count;
    auto now = std::chrono::steady_clock::now();
    double seconds = std::chrono::duration<double>(now - last_update_).count();
    if (seconds > 0) {
        bitrate_bps_ = static_cast<double>(count) * 8.0 / seconds;
    }
    last_update_ = now;
}

void TransferSession::RecordAttempts(std::uint32_t attempts) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_attempts_ = std::max(max_attempts_, attempts);
}

int TransferSession::Progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ == TransferStatus::Success) {
        return 100;
    }
    if (file_.size == 0) {
        return 0;
    }
    auto percent = static_cast<int>((bytes_ * 100) / file_.size);
    return std::min(percent, 99);
}

std::string TransferSession::local_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_code_;
}

void TransferSession::set_local_code(std::string code) {
    std::lock_guard<std::mutex> lock(mutex_);
    local_code_ = std::move(code);
}

bool TransferSession::Wait(std::optional<std::chrono::milliseconds> timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    auto done = [this] { return IsTerminal(status_); };
    if (!timeout) {
        cv_.wait(lock, done);
        return true;
    }
    return cv_.wait_for(lock, *timeout, done);
}

void ProgressReporter::Update(std::uint64_t done, std::uint64_t total) {
    if (!callback_ || total == 0 || completed_) {
        return;
    }
    int percent = std::min(99, static_cast<int>((done * 100) / total));
    if (percent > last_) {
        last_ = percent;
        callback_(percent);
    }
}

void ProgressReporter::Complete() {
    if (completed_) {
        return;
    }
    completed_ = true;
    if (callback_) {
        callback_(100);
    }
}

}  // namespace swiftdrop
