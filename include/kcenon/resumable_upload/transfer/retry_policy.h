/**
 * @file retry_policy.h
 * @brief Bounded exponential backoff shared by all backend operations
 */

#ifndef KCENON_RESUMABLE_UPLOAD_TRANSFER_RETRY_POLICY_H
#define KCENON_RESUMABLE_UPLOAD_TRANSFER_RETRY_POLICY_H

#include <kcenon/resumable_upload/core/types.h>

#include <chrono>
#include <cstddef>
#include <functional>

namespace kcenon::resumable_upload {

/**
 * @brief Retry policy for one class of backend operation
 *
 * The delay before retry n (n >= 1) is initial_delay * multiplier^(n-1),
 * capped at max_delay, then scaled by a random factor in [0.5, 1.5) when
 * jitter is enabled.
 */
struct retry_policy {
    /// Total attempts including the first one
    std::size_t max_attempts = 3;

    /// Delay before the first retry
    std::chrono::milliseconds initial_delay{1000};

    /// Upper bound for a single delay (before jitter)
    std::chrono::milliseconds max_delay{10000};

    /// Multiplier for exponential backoff
    double backoff_multiplier = 2.0;

    /// Add jitter to retry delays
    bool use_jitter = true;

    /// Decides whether an error is worth another attempt; error::retryable if empty
    std::function<bool(const error&)> retryable;

    /// Waits between attempts; std::this_thread::sleep_for if empty
    std::function<void(std::chrono::milliseconds)> sleeper;

    using retry_observer =
        std::function<void(std::size_t attempt, const error&, std::chrono::milliseconds)>;

    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Delay to wait after the given failed attempt (1-based)
     */
    [[nodiscard]] auto delay_for(std::size_t attempt) const -> std::chrono::milliseconds;

    [[nodiscard]] auto should_retry(const error& err) const -> bool;

    void wait(std::chrono::milliseconds delay) const;

    /**
     * @brief Run an operation until it succeeds, fails permanently, or the
     *        attempt budget is spent
     *
     * @param op Callable returning result<T>
     * @param on_retry Called before each backoff wait
     * @return The first success, or the last error
     */
    template <typename Op>
    [[nodiscard]] auto execute(Op&& op, const retry_observer& on_retry = {}) const
        -> decltype(op()) {
        std::size_t attempt = 0;

        while (true) {
            ++attempt;
            auto outcome = op();

            if (outcome.has_value()) {
                return outcome;
            }
            if (attempt >= max_attempts || !should_retry(outcome.error())) {
                return outcome;
            }

            auto delay = delay_for(attempt);
            if (on_retry) {
                on_retry(attempt, outcome.error(), delay);
            }
            wait(delay);
        }
    }
};

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_TRANSFER_RETRY_POLICY_H
