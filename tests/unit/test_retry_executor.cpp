#include <gtest/gtest.h>
#include "turnkey/engine/retry_executor.hpp"
#include "mocks/fake_clock.hpp"
#include <stdexcept>

using namespace turnkey;
using namespace turnkey::engine;
using namespace turnkey::testing;
using namespace std::chrono_literals;

class RetryExecutorTest : public ::testing::Test {
protected:
    FakeClock fake;

    RetryExecutor make_retry(int max_attempts, std::chrono::milliseconds base_delay = 100ms) {
        return RetryExecutor(RetryPolicy{max_attempts, base_delay}, fake.sleeper());
    }
};

// ============================================================================
// RE-001: Success on attempt k returns after exactly k attempts
// ============================================================================

TEST_F(RetryExecutorTest, SucceedsOnKthAttempt) {
    const int max_attempts = 4;
    for (int k = 1; k <= max_attempts; ++k) {
        auto retry = make_retry(max_attempts);
        int calls = 0;

        auto result = retry.run("op", [&]() -> Expected<int> {
            ++calls;
            if (calls < k) {
                return tl::unexpected(Error{ErrorCode::ServiceTransportFailed, "flaky"});
            }
            return calls * 10;
        });

        ASSERT_TRUE(result.has_value()) << "k=" << k;
        EXPECT_EQ(*result, k * 10);
        EXPECT_EQ(calls, k);
    }
}

// ============================================================================
// RE-002: Always failing -> exactly max attempts, last error propagated
// ============================================================================

TEST_F(RetryExecutorTest, AlwaysFailingAttemptedMaxTimes) {
    auto retry = make_retry(3);
    int calls = 0;

    auto result = retry.run("op", [&]() -> Expected<int> {
        ++calls;
        return tl::unexpected(Error{ErrorCode::ServiceRequestFailed, "failure " + std::to_string(calls)});
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(result.error().code, ErrorCode::ServiceRequestFailed);
    EXPECT_EQ(result.error().message, "failure 3");
}

TEST_F(RetryExecutorTest, RunOrReturnsFallbackOnExhaustion) {
    auto retry = make_retry(2);
    int calls = 0;

    std::string text = retry.run_or("op", [&]() -> Expected<std::string> {
        ++calls;
        return tl::unexpected(Error{ErrorCode::RunTimeout, "too slow"});
    }, std::string("fallback"));

    EXPECT_EQ(text, "fallback");
    EXPECT_EQ(calls, 2);
}

TEST_F(RetryExecutorTest, RunOrReturnsValueOnSuccess) {
    auto retry = make_retry(2);

    std::string text = retry.run_or("op", []() -> Expected<std::string> {
        return std::string("real answer");
    }, std::string("fallback"));

    EXPECT_EQ(text, "real answer");
    EXPECT_TRUE(fake.sleeps.empty());
}

// ============================================================================
// RE-003: Backoff doubles from the base delay, no wait after the last attempt
// ============================================================================

TEST_F(RetryExecutorTest, DelaysDoubleFromBase) {
    auto retry = make_retry(4, 100ms);

    auto result = retry.run("op", []() -> Expected<int> {
        return tl::unexpected(Error{ErrorCode::Unknown, "nope"});
    });

    ASSERT_FALSE(result.has_value());
    ASSERT_EQ(fake.sleeps.size(), 3u);
    EXPECT_EQ(fake.sleeps[0], 100ms);
    EXPECT_EQ(fake.sleeps[1], 200ms);
    EXPECT_EQ(fake.sleeps[2], 400ms);
}

TEST_F(RetryExecutorTest, DelaysSaturateForUnvalidatedPolicies) {
    RetryPolicy policy{100, 1000ms};

    EXPECT_EQ(policy.delay_before(2), 1000ms);
    EXPECT_EQ(policy.delay_before(70), std::chrono::milliseconds::max());
    EXPECT_EQ(policy.delay_before(100), std::chrono::milliseconds::max());

    auto previous = policy.delay_before(2);
    for (int attempt = 3; attempt <= 100; ++attempt) {
        auto delay = policy.delay_before(attempt);
        EXPECT_GE(delay, previous) << "attempt=" << attempt;
        previous = delay;
    }
}

TEST_F(RetryExecutorTest, SingleAttemptNeverSleeps) {
    auto retry = make_retry(1);
    int calls = 0;

    auto result = retry.run("op", [&]() -> Expected<int> {
        ++calls;
        return tl::unexpected(Error{ErrorCode::Unknown, "nope"});
    });

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(fake.sleeps.empty());
}

TEST_F(RetryExecutorTest, ZeroBaseDelayStillRetries) {
    auto retry = make_retry(3, 0ms);
    int calls = 0;

    auto result = retry.run("op", [&]() -> Expected<int> {
        ++calls;
        return tl::unexpected(Error{ErrorCode::Unknown, "nope"});
    });

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(calls, 3);
    ASSERT_EQ(fake.sleeps.size(), 2u);
    EXPECT_EQ(fake.sleeps[0], 0ms);
}

// ============================================================================
// RE-004: Exceptions count as failed attempts
// ============================================================================

TEST_F(RetryExecutorTest, ExceptionCountsAsFailure) {
    auto retry = make_retry(3);
    int calls = 0;

    auto result = retry.run("op", [&]() -> Expected<int> {
        ++calls;
        if (calls == 1) {
            throw std::runtime_error("connection reset");
        }
        return 7;
    });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 7);
    EXPECT_EQ(calls, 2);
}

TEST_F(RetryExecutorTest, AlwaysThrowingBecomesError) {
    auto retry = make_retry(2);

    auto result = retry.run("op", []() -> Expected<int> {
        throw std::runtime_error("boom");
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Unknown);
    EXPECT_EQ(result.error().message, "boom");
}

TEST_F(RetryExecutorTest, VoidOperations) {
    auto retry = make_retry(3);
    int calls = 0;

    auto result = retry.run("cleanup", [&]() -> Expected<void> {
        if (++calls < 2) {
            return tl::unexpected(Error{ErrorCode::ServiceRequestFailed, "busy"});
        }
        return {};
    });

    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(calls, 2);
}
