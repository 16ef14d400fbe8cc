#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace swiftdrop {

// Cooperative cancellation. A default-constructed token can never be
// cancelled; tokens obtained from a CancellationSource observe its Cancel().
class CancellationToken {
public:
    CancellationToken() = default;

    bool IsCancelled() const;
    void ThrowIfCancelled() const;

    // Sleeps for delay or until cancelled. Returns true when cancelled.
    bool SleepFor(std::chrono::milliseconds delay) const;

    // Callback runs once on Cancel(), or immediately if already cancelled.
    // Returns an id for Unsubscribe, 0 for a token that cannot be cancelled.
    std::uint64_t Subscribe(std::function<void()> callback) const;
    void Unsubscribe(std::uint64_t id) const;

private:
    friend class CancellationSource;

    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
        std::uint64_t next_id = 1;
        std::map<std::uint64_t, std::function<void()>> callbacks;
    };

    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

class CancellationSource {
public:
    CancellationSource();

    CancellationToken token() const { return CancellationToken(state_); }
    void Cancel();
    bool IsCancelled() const;

private:
    std::shared_ptr<CancellationToken::State> state_;
};

// RAII subscription.
class CancellationRegistration {
public:
    CancellationRegistration(const CancellationToken& token, std::function<void()> callback)
        : token_(token), id_(token.Subscribe(std::move(callback))) {}
    ~CancellationRegistration() { token_.Unsubscribe(id_); }

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

private:
    CancellationToken token_;
    std::uint64_t id_;
};

}  // namespace swiftdrop
