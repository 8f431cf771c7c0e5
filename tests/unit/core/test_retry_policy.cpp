/**
 * @file test_retry_policy.cpp
 * @brief Unit tests for exponential backoff and the retry driver
 */

#include <gtest/gtest.h>

#include <kcenon/aws_signer/core/retry_policy.h>

#include <chrono>
#include <string>
#include <vector>

namespace kcenon::aws_signer::test {

using namespace std::chrono_literals;

namespace {

auto server_error() -> aws_error {
    return service_failure{"InternalFailure", 500, true, "try again"};
}

auto client_error() -> aws_error {
    return service_failure{"ValidationException", 400, false, "bad input"};
}

auto auth_error() -> aws_error {
    authorization_failure failure;
    failure.type = "com.amazon.coral.service#UnrecognizedClientException";
    failure.message = "The security token included in the request is invalid.";
    failure.credential_scope = "us-east-1/sqs";
    failure.http_status = 400;
    return failure;
}

}  // namespace

// =============================================================================
// Exponential Backoff Tests
// =============================================================================

class ExponentialBackoffTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(ExponentialBackoffTest, InitialState) {
    exponential_backoff backoff(3);

    EXPECT_EQ(backoff.tries(), 0u);
    EXPECT_EQ(backoff.max_retries(), 3u);
    EXPECT_EQ(backoff.remaining(), 3u);
    EXPECT_EQ(backoff.current_max_sleep(), 10ms);
    EXPECT_TRUE(backoff.can_retry());
    EXPECT_FALSE(backoff.finished());
}

TEST_F(ExponentialBackoffTest, CeilingDoublesOnEachFailure) {
    exponential_backoff backoff(3);

    backoff.inc();
    EXPECT_EQ(backoff.current_max_sleep(), 20ms);
    backoff.inc();
    EXPECT_EQ(backoff.current_max_sleep(), 40ms);
    backoff.inc();
    EXPECT_EQ(backoff.current_max_sleep(), 80ms);
}

TEST_F(ExponentialBackoffTest, BudgetBoundaries) {
    exponential_backoff backoff(2);

    backoff.inc();
    EXPECT_TRUE(backoff.can_retry());
    backoff.inc();
    EXPECT_FALSE(backoff.can_retry());
    EXPECT_FALSE(backoff.finished());
    backoff.inc();
    EXPECT_TRUE(backoff.finished());
    EXPECT_EQ(backoff.remaining(), 0u);
}

TEST_F(ExponentialBackoffTest, ZeroBudgetNeverRetries) {
    exponential_backoff backoff(0);

    EXPECT_FALSE(backoff.can_retry());
    backoff.inc();
    EXPECT_TRUE(backoff.finished());
}

TEST_F(ExponentialBackoffTest, DelayWithinCeiling) {
    exponential_backoff backoff(5);
    backoff.seed(42);

    for (int round = 0; round < 4; ++round) {
        for (int i = 0; i < 200; ++i) {
            auto delay = backoff.next_delay();
            EXPECT_GE(delay, 1ms);
            EXPECT_LE(delay, backoff.current_max_sleep());
        }
        backoff.inc();
    }
}

TEST_F(ExponentialBackoffTest, CustomInitialSleep) {
    exponential_backoff backoff(1, 100ms);

    EXPECT_EQ(backoff.current_max_sleep(), 100ms);
    backoff.inc();
    EXPECT_EQ(backoff.current_max_sleep(), 200ms);
}

TEST_F(ExponentialBackoffTest, CeilingSaturatesAtMaxSleep) {
    exponential_backoff backoff(100, 10ms, 50ms);

    backoff.inc();
    EXPECT_EQ(backoff.current_max_sleep(), 20ms);
    backoff.inc();
    EXPECT_EQ(backoff.current_max_sleep(), 40ms);
    backoff.inc();
    EXPECT_EQ(backoff.current_max_sleep(), 50ms);
    backoff.inc();
    EXPECT_EQ(backoff.current_max_sleep(), 50ms);
}

TEST_F(ExponentialBackoffTest, LargeMaxSleepDoesNotOverflow) {
    constexpr auto largest = std::chrono::milliseconds::max();
    exponential_backoff backoff(100, 10ms, largest);
    backoff.seed(3);

    for (int i = 0; i < 100; ++i) {
        backoff.inc();
        EXPECT_GE(backoff.current_max_sleep(), 10ms);
        EXPECT_LE(backoff.current_max_sleep(), largest);
    }
    EXPECT_EQ(backoff.current_max_sleep(), largest);
    EXPECT_GE(backoff.next_delay(), 1ms);
}

TEST_F(ExponentialBackoffTest, InitialSleepClampedToMaxSleep) {
    exponential_backoff backoff(1, 500ms, 100ms);

    EXPECT_EQ(backoff.current_max_sleep(), 100ms);
    EXPECT_EQ(backoff.max_sleep(), 100ms);
}

TEST_F(ExponentialBackoffTest, SameSeedSameDelays) {
    exponential_backoff a(3);
    exponential_backoff b(3);
    a.seed(7);
    b.seed(7);

    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(a.next_delay(), b.next_delay());
    }
}

// =============================================================================
// Retry Driver Tests
// =============================================================================

class RetryDriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        sleeps_.clear();
        hooks_.sleep = [this](std::chrono::milliseconds delay) { sleeps_.push_back(delay); };
    }

    retry_hooks hooks_;
    std::vector<std::chrono::milliseconds> sleeps_;
};

TEST_F(RetryDriverTest, FirstAttemptSucceeds) {
    retry_driver driver(retry_options{3}, hooks_);

    auto outcome = driver.run([](uint32_t) -> result<int, aws_error> { return 42; });

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), 42);
    EXPECT_EQ(driver.attempts_made(), 1u);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(RetryDriverTest, RetriableFailureThenSuccess) {
    retry_driver driver(retry_options{3}, hooks_);
    int calls = 0;

    auto outcome = driver.run([&](uint32_t) -> result<int, aws_error> {
        if (++calls < 3) {
            return unexpected<aws_error>{server_error()};
        }
        return 7;
    });

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(calls, 3);
    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_LE(sleeps_[0], 10ms);
    EXPECT_LE(sleeps_[1], 20ms);
}

TEST_F(RetryDriverTest, AtMostBudgetPlusOneAttempts) {
    retry_driver driver(retry_options{3}, hooks_);
    int calls = 0;

    auto outcome = driver.run([&](uint32_t) -> result<int, aws_error> {
        ++calls;
        return unexpected<aws_error>{server_error()};
    });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(calls, 4);
    EXPECT_EQ(sleeps_.size(), 3u);
    EXPECT_EQ(outcome.error().http_status(), 500);
    EXPECT_EQ(outcome.error().type(), "InternalFailure");
}

TEST_F(RetryDriverTest, SleepsStayWithinDoublingCeilings) {
    retry_driver driver(retry_options{3}, hooks_);

    (void)driver.run([](uint32_t) -> result<int, aws_error> {
        return unexpected<aws_error>{server_error()};
    });

    ASSERT_EQ(sleeps_.size(), 3u);
    EXPECT_GE(sleeps_[0], 1ms);
    EXPECT_LE(sleeps_[0], 10ms);
    EXPECT_GE(sleeps_[1], 1ms);
    EXPECT_LE(sleeps_[1], 20ms);
    EXPECT_GE(sleeps_[2], 1ms);
    EXPECT_LE(sleeps_[2], 40ms);
}

TEST_F(RetryDriverTest, LongRetryBudgetKeepsDelaysBounded) {
    retry_driver driver(retry_options{70}, hooks_);

    auto outcome = driver.run([](uint32_t) -> result<int, aws_error> {
        return unexpected<aws_error>{
            transport_failure{error_code::transport_failure, "connection reset"}};
    });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(driver.attempts_made(), 71u);
    ASSERT_EQ(sleeps_.size(), 70u);
    for (const auto& delay : sleeps_) {
        EXPECT_GE(delay, 1ms);
        EXPECT_LE(delay, exponential_backoff::default_max_sleep);
    }
    EXPECT_EQ(driver.backoff().current_max_sleep(), exponential_backoff::default_max_sleep);
}

TEST_F(RetryDriverTest, MaxSleepOptionBoundsDelays) {
    retry_options options{10};
    options.max_sleep = 30ms;
    retry_driver driver(options, hooks_);

    (void)driver.run([](uint32_t) -> result<int, aws_error> {
        return unexpected<aws_error>{server_error()};
    });

    ASSERT_EQ(sleeps_.size(), 10u);
    for (const auto& delay : sleeps_) {
        EXPECT_GE(delay, 1ms);
        EXPECT_LE(delay, 30ms);
    }
}

TEST_F(RetryDriverTest, TriesLeftDecreases) {
    retry_driver driver(retry_options{2}, hooks_);
    std::vector<uint32_t> seen;

    (void)driver.run([&](uint32_t tries_left) -> result<int, aws_error> {
        seen.push_back(tries_left);
        return unexpected<aws_error>{server_error()};
    });

    EXPECT_EQ(seen, (std::vector<uint32_t>{2, 1, 0}));
}

TEST_F(RetryDriverTest, NonRetriableFailureStopsImmediately) {
    retry_driver driver(retry_options{3}, hooks_);
    int calls = 0;

    auto outcome = driver.run([&](uint32_t) -> result<int, aws_error> {
        ++calls;
        return unexpected<aws_error>{client_error()};
    });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeps_.empty());
    EXPECT_EQ(outcome.error().type(), "ValidationException");
}

TEST_F(RetryDriverTest, PreconditionNeverRetried) {
    retry_driver driver(retry_options{3}, hooks_);
    int calls = 0;

    auto outcome = driver.run([&](uint32_t) -> result<int, aws_error> {
        ++calls;
        return unexpected<aws_error>{
            precondition_violation{error_code::invalid_block_size, "block size too small"}};
    });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(outcome.error().code(), error_code::invalid_block_size);
}

TEST_F(RetryDriverTest, TransportFailureIsRetried) {
    retry_driver driver(retry_options{1}, hooks_);
    int calls = 0;

    auto outcome = driver.run([&](uint32_t) -> result<int, aws_error> {
        if (++calls == 1) {
            return unexpected<aws_error>{
                transport_failure{error_code::transport_failure, "connection reset"}};
        }
        return 1;
    });

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(calls, 2);
}

TEST_F(RetryDriverTest, AuthorizationFailureInvokesHookThenRetries) {
    std::vector<std::string> invalidated;
    hooks_.on_authorization_failure = [&](const authorization_failure& failure) {
        invalidated.push_back(failure.credential_scope);
    };
    retry_driver driver(retry_options{3}, hooks_);
    int calls = 0;

    auto outcome = driver.run([&](uint32_t) -> result<int, aws_error> {
        if (++calls == 1) {
            return unexpected<aws_error>{auth_error()};
        }
        return 5;
    });

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(calls, 2);
    ASSERT_EQ(invalidated.size(), 1u);
    EXPECT_EQ(invalidated[0], "us-east-1/sqs");
    EXPECT_EQ(sleeps_.size(), 1u);
}

TEST_F(RetryDriverTest, AuthorizationFailureNotRetriedWhenDisabled) {
    int hook_calls = 0;
    hooks_.on_authorization_failure = [&](const authorization_failure&) { ++hook_calls; };
    retry_options options{3};
    options.retry_authorization_failures = false;
    retry_driver driver(options, hooks_);
    int calls = 0;

    auto outcome = driver.run([&](uint32_t) -> result<int, aws_error> {
        ++calls;
        return unexpected<aws_error>{auth_error()};
    });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_TRUE(outcome.error().is_authorization());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(hook_calls, 1);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(RetryDriverTest, AuthorizationHookCalledOnLastAttempt) {
    int hook_calls = 0;
    hooks_.on_authorization_failure = [&](const authorization_failure&) { ++hook_calls; };
    retry_driver driver(retry_options{1}, hooks_);

    auto outcome = driver.run([](uint32_t) -> result<int, aws_error> {
        return unexpected<aws_error>{auth_error()};
    });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(driver.attempts_made(), 2u);
    EXPECT_EQ(hook_calls, 2);
}

TEST_F(RetryDriverTest, OnRetryReportsAttemptAndDelay) {
    std::vector<uint32_t> attempts;
    std::vector<std::chrono::milliseconds> delays;
    hooks_.on_retry = [&](const aws_error&, uint32_t attempt, std::chrono::milliseconds delay) {
        attempts.push_back(attempt);
        delays.push_back(delay);
    };
    retry_driver driver(retry_options{2}, hooks_);

    (void)driver.run([](uint32_t) -> result<int, aws_error> {
        return unexpected<aws_error>{server_error()};
    });

    EXPECT_EQ(attempts, (std::vector<uint32_t>{1, 2}));
    EXPECT_EQ(delays, sleeps_);
}

TEST_F(RetryDriverTest, ZeroBudgetMakesSingleAttempt) {
    retry_driver driver(retry_options{0}, hooks_);
    int calls = 0;

    auto outcome = driver.run([&](uint32_t) -> result<int, aws_error> {
        ++calls;
        return unexpected<aws_error>{server_error()};
    });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeps_.empty());
}

}  // namespace kcenon::aws_signer::test
