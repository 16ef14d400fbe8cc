#include "swiftdrop/cancel.hpp"

#include "swiftdrop/errors.hpp"

#include <thread>
#include <vector>

namespace swiftdrop {

bool CancellationToken::IsCancelled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

void CancellationToken::ThrowIfCancelled() const {
    if (IsCancelled()) {
        throw CancellationError();
    }
}

bool CancellationToken::SleepFor(std::chrono::milliseconds delay) const {
    if (!state_) {
        std::this_thread::sleep_for(delay);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, delay, [this] { return state_->cancelled; });
}

std::uint64_t CancellationToken::Subscribe(std::function<void()> callback) const {
    if (!state_) {
        return 0;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            std::uint64_t id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CancellationToken::Unsubscribe(std::uint64_t id) const {
    if (!state_ || id == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(id);
}

CancellationSource::CancellationSource() : state_(std::make_shared<CancellationToken::State>()) {}

void CancellationSource::Cancel() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) {
            return;
        }
        state_->cancelled = true;
        for (auto& entry : state_->callbacks) {
            callbacks.push_back(std::move(entry.second));
        }
        state_->callbacks.clear();
    }
    state_->cv.notify_all();
    for (auto& callback : callbacks) {
        callback();
    }
}

bool CancellationSource::IsCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

}  // namespace swiftdrop
