#include "swiftdrop/channel.hpp"

#include "swiftdrop/errors.hpp"

namespace swiftdrop {

namespace {

template <typename State>
void Bump(const std::shared_ptr<State>& state) {
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        ++state->generation;
    }
    state->cv.notify_all();
}

}  // namespace

DrainWaiter::DrainWaiter(Channel& channel) : channel_(channel), state_(std::make_shared<State>()) {
    std::weak_ptr<State> weak = state_;
    auto wake = [weak] {
        if (auto state = weak.lock()) {
            Bump(state);
        }
    };
    channel_.OnBufferedAmountLow(wake);
    channel_.OnClose(wake);
}

DrainWaiter::~DrainWaiter() {
    channel_.OnBufferedAmountLow(nullptr);
    channel_.OnClose(nullptr);
}

void DrainWaiter::WaitBelow(std::size_t threshold,
                            const CancellationToken& cancel,
                            std::optional<std::chrono::milliseconds> timeout) {
    auto state = state_;
    CancellationRegistration registration(cancel, [state] { Bump(state); });
    auto deadline = std::chrono::steady_clock::now() + timeout.value_or(std::chrono::milliseconds(0));

    std::unique_lock<std::mutex> lock(state_->mutex);
    while (true) {
        std::uint64_t seen = state_->generation;
        lock.unlock();
        cancel.ThrowIfCancelled();
        if (channel_.BufferedAmount() <= threshold) {
            return;
        }
        if (!channel_.IsOpen()) {
            throw TransportError("Channel closed while waiting to drain");
        }
        lock.lock();
        auto changed = [&] { return state_->generation != seen; };
        if (timeout) {
            if (!state_->cv.wait_until(lock, deadline, changed)) {
                throw TimeoutError("Channel did not drain in time");
            }
        } else {
            state_->cv.wait(lock, changed);
        }
    }
}

}  // namespace swiftdrop
