#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "core/error_recovery.hpp"
#include "core/pipeline_errors.hpp"

namespace
{
    RetryPolicy transientPolicy(int attempts)
    {
        RetryPolicy policy;
        policy.retryable = ErrorKind::TRANSIENT_IO;
        policy.max_attempts = attempts;
        policy.base_delay_ms = 1;
        return policy;
    }
}

TEST(ErrorRecoveryTest, SucceedsWithoutRetry)
{
    int calls = 0;
    int value = ErrorRecovery::retryWithBackoff([&calls]()
                                                {
        ++calls;
        return 42; }, transientPolicy(3), "answer");

    EXPECT_EQ(value, 42);
    EXPECT_EQ(calls, 1);
}

TEST(ErrorRecoveryTest, RetriesRetryableKindUntilSuccess)
{
    int calls = 0;
    std::vector<int> retries;
    std::string value = ErrorRecovery::retryWithBackoff([&calls]()
                                                        {
        if (++calls < 3)
            throw TransientIOError("storage hiccup");
        return std::string("stored"); }, transientPolicy(3), "store", [&retries](int attempt)
                                                        { retries.push_back(attempt); });

    EXPECT_EQ(value, "stored");
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(retries, (std::vector<int>{1, 2}));
}

TEST(ErrorRecoveryTest, RethrowsAfterLastAttempt)
{
    int calls = 0;
    EXPECT_THROW(ErrorRecovery::retryWithBackoff([&calls]()
                                                 {
        ++calls;
        throw TransientIOError("still down"); }, transientPolicy(3), "store"),
                 TransientIOError);
    EXPECT_EQ(calls, 3);
}

TEST(ErrorRecoveryTest, OtherKindsAreNotRetried)
{
    int calls = 0;
    EXPECT_THROW(ErrorRecovery::retryWithBackoff([&calls]()
                                                 {
        ++calls;
        throw DecodeError("corrupt"); }, transientPolicy(3), "decode"),
                 DecodeError);
    EXPECT_EQ(calls, 1);

    calls = 0;
    EXPECT_THROW(ErrorRecovery::retryWithBackoff([&calls]()
                                                 {
        ++calls;
        throw std::runtime_error("bug"); }, transientPolicy(3), "internal"),
                 std::runtime_error);
    EXPECT_EQ(calls, 1);
}

TEST(ErrorRecoveryTest, RenderPolicyRetriesOnce)
{
    RetryPolicy policy;
    policy.retryable = ErrorKind::RENDER;
    policy.max_attempts = 2;

    int calls = 0;
    EXPECT_THROW(ErrorRecovery::retryWithBackoff([&calls]()
                                                 {
        ++calls;
        throw RenderError("encoder crashed"); }, policy, "render"),
                 RenderError);
    EXPECT_EQ(calls, 2);
}

TEST(ErrorRecoveryTest, NonPositiveAttemptsStillRunOnce)
{
    int calls = 0;
    ErrorRecovery::retryWithBackoff([&calls]()
                                    { ++calls; }, transientPolicy(0), "once");
    EXPECT_EQ(calls, 1);
}

TEST(ErrorRecoveryTest, BackoffGrowsExponentially)
{
    RetryPolicy policy = transientPolicy(3);
    policy.base_delay_ms = 20;

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(ErrorRecovery::retryWithBackoff([]()
                                                 { throw TransientIOError("down"); }, policy, "slow"),
                 TransientIOError);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    // 20ms then 40ms between the three attempts
    EXPECT_GE(elapsed.count(), 60);
}

TEST(StageDeadlineTest, FreshDeadlinePasses)
{
    StageDeadline deadline("classifying", 120.0);
    EXPECT_FALSE(deadline.expired());
    EXPECT_NO_THROW(deadline.check());
    EXPECT_EQ(deadline.stageName(), "classifying");
}

TEST(StageDeadlineTest, ExpiredDeadlineThrowsTimeout)
{
    StageDeadline deadline("scoring", 0.01);
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    EXPECT_TRUE(deadline.expired());
    try
    {
        deadline.check();
        FAIL() << "Expected StageTimeoutError";
    }
    catch (const StageTimeoutError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::TIMEOUT);
        EXPECT_EQ(e.describe(), "TimeoutError: stage 'scoring' exceeded its 0.01s budget");
    }
}

TEST(PipelineErrorTest, DescribePrefixesKindName)
{
    EXPECT_EQ(ValidationError("video_ref is empty").describe(), "ValidationError: video_ref is empty");
    EXPECT_EQ(DecodeError("x").describe(), "DecodeError: x");
    EXPECT_EQ(EmptyVideoError("x").describe(), "EmptyVideoError: x");
    EXPECT_EQ(TransientIOError("x").describe(), "TransientIOError: x");
    EXPECT_EQ(InferenceError("x").describe(), "InferenceError: x");
    EXPECT_EQ(RenderError("x").describe(), "RenderError: x");
    EXPECT_EQ(InternalError("x").describe(), "InternalError: x");
}
