/**
 * @file retry_policy.cpp
 * @brief Backoff computation for retry_policy
 */

#include <kcenon/resumable_upload/transfer/retry_policy.h>

#include <algorithm>
#include <random>
#include <thread>

namespace kcenon::resumable_upload {

auto retry_policy::validate() const -> result<void> {
    if (max_attempts == 0) {
        return unexpected(error{error_code::invalid_configuration,
            "max_attempts must be at least 1"});
    }
    if (initial_delay.count() < 0 || max_delay < initial_delay) {
        return unexpected(error{error_code::invalid_configuration,
            "retry delays must satisfy 0 <= initial_delay <= max_delay"});
    }
    if (backoff_multiplier < 1.0) {
        return unexpected(error{error_code::invalid_configuration,
            "backoff_multiplier must be >= 1.0"});
    }
    return {};
}

auto retry_policy::delay_for(std::size_t attempt) const -> std::chrono::milliseconds {
    auto delay = static_cast<double>(initial_delay.count());

    for (std::size_t i = 1; i < attempt; ++i) {
        delay *= backoff_multiplier;
        if (delay >= static_cast<double>(max_delay.count())) {
            break;
        }
    }

    delay = std::min(delay, static_cast<double>(max_delay.count()));

    if (use_jitter) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_real_distribution<> dis(0.5, 1.5);
        delay *= dis(gen);
    }

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

auto retry_policy::should_retry(const error& err) const -> bool {
    if (retryable) {
        return retryable(err);
    }
    return err.retryable;
}

void retry_policy::wait(std::chrono::milliseconds delay) const {
    if (sleeper) {
        sleeper(delay);
        return;
    }
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
}

}  // namespace kcenon::resumable_upload
