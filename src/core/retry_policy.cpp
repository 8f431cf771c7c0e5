/**
 * @file retry_policy.cpp
 * @brief Jittered exponential backoff and the retry driver
 * @version 0.1.0
 */

#include "kcenon/aws_signer/core/retry_policy.h"

#include "kcenon/aws_signer/core/logging.h"

#include <algorithm>
#include <thread>

namespace kcenon::aws_signer {

// ============================================================================
// exponential_backoff
// ============================================================================

exponential_backoff::exponential_backoff(uint32_t max_retries,
                                         std::chrono::milliseconds initial_sleep,
                                         std::chrono::milliseconds max_sleep)
    : max_retries_(max_retries),
      max_sleep_(std::max(max_sleep, std::chrono::milliseconds(1))),
      current_max_sleep_(std::clamp(initial_sleep, std::chrono::milliseconds(1), max_sleep_)),
      rng_(std::random_device{}()) {}

void exponential_backoff::inc() {
    ++tries_;
    // Compare before doubling so the ceiling cannot overflow
    if (current_max_sleep_ > max_sleep_ / 2) {
        current_max_sleep_ = max_sleep_;
    } else {
        current_max_sleep_ *= 2;
    }
}

auto exponential_backoff::next_delay() -> std::chrono::milliseconds {
    std::uniform_int_distribution<std::chrono::milliseconds::rep> dis(1, current_max_sleep_.count());
    return std::chrono::milliseconds(dis(rng_));
}

auto default_sleep_function() -> sleep_function {
    return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

// ============================================================================
// retry_driver
// ============================================================================

retry_driver::retry_driver(retry_options options, retry_hooks hooks)
    : options_(std::move(options)),
      hooks_(std::move(hooks)),
      backoff_(options_.max_retries, options_.initial_sleep, options_.max_sleep) {
    if (!hooks_.sleep) {
        hooks_.sleep = default_sleep_function();
    }
}

auto retry_driver::prepare_retry(const aws_error& failure) -> bool {
    request_log_context ctx;
    ctx.operation = options_.operation;
    ctx.attempt = attempts_;
    ctx.max_attempts = options_.max_retries + 1;
    ctx.error_type = failure.type();
    ctx.error_message = failure.message();
    if (failure.http_status() != 0) {
        ctx.http_status = failure.http_status();
    }

    if (const auto* auth = failure.as_authorization()) {
        ctx.credential_scope = auth->credential_scope;
        if (hooks_.on_authorization_failure) {
            hooks_.on_authorization_failure(*auth);
        }
    }

    bool allowed = failure.retriable() ||
                   (failure.is_authorization() && options_.retry_authorization_failures);

    if (!allowed || !backoff_.can_retry()) {
        AWS_LOG_ERROR_CTX(log_category::retry,
                          allowed ? "Retry budget exhausted" : "Non-retriable failure",
                          ctx);
        return false;
    }

    auto delay = backoff_.next_delay();
    ctx.delay_ms = static_cast<uint64_t>(delay.count());
    AWS_LOG_WARN_CTX(log_category::retry,
                     std::string("Retrying after ") + to_string(failure.kind()) + " failure",
                     ctx);

    if (hooks_.on_retry) {
        hooks_.on_retry(failure, attempts_, delay);
    }
    hooks_.sleep(delay);
    backoff_.inc();
    return true;
}

void retry_driver::log_success() const {
    if (attempts_ > 1) {
        request_log_context ctx;
        ctx.operation = options_.operation;
        ctx.attempt = attempts_;
        AWS_LOG_INFO_CTX(log_category::retry, "Succeeded after retry", ctx);
    }
}

}  // namespace kcenon::aws_signer
