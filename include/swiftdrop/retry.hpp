#pragma once

#include "swiftdrop/cancel.hpp"
#include "swiftdrop/errors.hpp"
#include "swiftdrop/log.hpp"
#include "swiftdrop/options.hpp"

#include <cstdint>
#include <string_view>
#include <utility>

namespace swiftdrop {

// Runs fn until it succeeds, throws a non-retryable error, or the policy's
// attempts are exhausted. Backoff sleeps wake early on cancellation.
template <typename Fn, typename Pred>
auto RetryIf(const RetryPolicy& policy,
             const CancellationToken& cancel,
             std::string_view what,
             Pred&& retryable,
             Fn&& fn,
             std::uint32_t* attempts_used = nullptr) -> decltype(fn()) {
    for (std::uint32_t attempt = 1;; ++attempt) {
        cancel.ThrowIfCancelled();
        if (attempts_used) {
            *attempts_used = attempt;
        }
        try {
            return fn();
        } catch (const Error& ex) {
            if (!retryable(ex) || attempt >= policy.attempts) {
                throw;
            }
            auto delay = policy.DelayAfter(attempt);
            log::Get()->warn("{} failed (attempt {}/{}): {}; retrying in {} ms", what, attempt, policy.attempts,
                             ex.what(), delay.count());
            if (cancel.SleepFor(delay)) {
                throw CancellationError();
            }
        }
    }
}

template <typename Fn>
auto Retry(const RetryPolicy& policy,
           const CancellationToken& cancel,
           std::string_view what,
           Fn&& fn,
           std::uint32_t* attempts_used = nullptr) -> decltype(fn()) {
    return RetryIf(
        policy, cancel, what, [](const Error& ex) { return ex.retryable(); }, std::forward<Fn>(fn), attempts_used);
}

}  // namespace swiftdrop
