/**
 * @file retry_policy.h
 * @brief Jittered exponential backoff and the retry driver
 * @version 0.1.0
 *
 * A retry budget of N allows at most N + 1 attempts. After a retriable
 * failure the driver sleeps a uniformly random delay in [1, ceiling] ms and
 * doubles the ceiling (10, 20, 40, ... ms by default) until it reaches the
 * maximum sleep.
 */

#ifndef KCENON_AWS_SIGNER_CORE_RETRY_POLICY_H
#define KCENON_AWS_SIGNER_CORE_RETRY_POLICY_H

#include "kcenon/aws_signer/core/aws_error.h"
#include "kcenon/aws_signer/core/types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <type_traits>

namespace kcenon::aws_signer {

/**
 * @brief Per-operation backoff state; never shared between operations
 */
class exponential_backoff {
public:
    static constexpr std::chrono::milliseconds default_initial_sleep{10};
    static constexpr std::chrono::milliseconds default_max_sleep{20000};

    explicit exponential_backoff(uint32_t max_retries,
                                 std::chrono::milliseconds initial_sleep = default_initial_sleep,
                                 std::chrono::milliseconds max_sleep = default_max_sleep);

    /**
     * @brief True while tries < max_retries
     */
    [[nodiscard]] auto can_retry() const -> bool { return tries_ < max_retries_; }

    /**
     * @brief True once max_retries + 1 attempts have failed
     */
    [[nodiscard]] auto finished() const -> bool { return tries_ >= max_retries_ + 1; }

    /**
     * @brief Record a failed attempt: tries += 1, ceiling = min(ceiling * 2, max_sleep)
     */
    void inc();

    /**
     * @brief Uniform random delay in [1, current_max_sleep] ms
     */
    [[nodiscard]] auto next_delay() -> std::chrono::milliseconds;

    /**
     * @brief Reseed the jitter generator
     */
    void seed(uint32_t value) { rng_.seed(value); }

    [[nodiscard]] auto tries() const -> uint32_t { return tries_; }
    [[nodiscard]] auto max_retries() const -> uint32_t { return max_retries_; }
    [[nodiscard]] auto remaining() const -> uint32_t {
        return tries_ < max_retries_ ? max_retries_ - tries_ : 0;
    }
    [[nodiscard]] auto current_max_sleep() const -> std::chrono::milliseconds {
        return current_max_sleep_;
    }
    [[nodiscard]] auto max_sleep() const -> std::chrono::milliseconds { return max_sleep_; }

private:
    uint32_t max_retries_;
    uint32_t tries_ = 0;
    std::chrono::milliseconds max_sleep_;
    std::chrono::milliseconds current_max_sleep_;
    std::mt19937 rng_;
};

/**
 * @brief Sleep function used between attempts
 */
using sleep_function = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Default sleep function (std::this_thread::sleep_for)
 */
[[nodiscard]] auto default_sleep_function() -> sleep_function;

/**
 * @brief Callbacks invoked by the retry driver
 */
struct retry_hooks {
    /// Sleep between attempts (default: std::this_thread::sleep_for)
    sleep_function sleep;

    /// Credential invalidation, called before the retry decision
    std::function<void(const authorization_failure&)> on_authorization_failure;

    /// Notified before every sleep with the failure, attempt number and delay
    std::function<void(const aws_error&, uint32_t, std::chrono::milliseconds)> on_retry;
};

/**
 * @brief Retry settings of one driver
 */
struct retry_options {
    uint32_t max_retries = 3;
    std::chrono::milliseconds initial_sleep = exponential_backoff::default_initial_sleep;
    bool retry_authorization_failures = true;

    /// Upper bound of the backoff ceiling
    std::chrono::milliseconds max_sleep = exponential_backoff::default_max_sleep;

    /// Operation name for log context
    std::string operation;
};

/**
 * @brief Runs attempts until success, a fatal failure, or budget exhaustion
 *
 * Example:
 * @code
 * retry_driver driver(retry_options{3});
 * auto response = driver.run([&](uint32_t tries_left) -> result<int, aws_error> {
 *     return attempt_once();
 * });
 * @endcode
 */
class retry_driver {
public:
    explicit retry_driver(retry_options options, retry_hooks hooks = {});

    /**
     * @brief Run an attempt function under the retry policy
     * @param attempt Callable taking the remaining retry budget and
     *        returning result<T, aws_error>
     * @return First success, or the last failure unchanged
     */
    template <typename Attempt>
    auto run(Attempt&& attempt) -> std::invoke_result_t<Attempt&, uint32_t> {
        for (;;) {
            ++attempts_;
            auto outcome = attempt(backoff_.remaining());
            if (outcome.has_value()) {
                log_success();
                return outcome;
            }
            if (!prepare_retry(outcome.error())) {
                return outcome;
            }
        }
    }

    [[nodiscard]] auto attempts_made() const -> uint32_t { return attempts_; }
    [[nodiscard]] auto backoff() const -> const exponential_backoff& { return backoff_; }
    [[nodiscard]] auto backoff() -> exponential_backoff& { return backoff_; }

private:
    /**
     * @brief Decide on a failure; sleeps and returns true when retrying
     */
    auto prepare_retry(const aws_error& failure) -> bool;

    void log_success() const;

    retry_options options_;
    retry_hooks hooks_;
    exponential_backoff backoff_;
    uint32_t attempts_ = 0;
};

}  // namespace kcenon::aws_signer

#endif  // KCENON_AWS_SIGNER_CORE_RETRY_POLICY_H
