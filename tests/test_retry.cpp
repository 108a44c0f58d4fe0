// ═══════════════════════════════════════════════════════════════════
//  test_retry.cpp - Tests for bounded retry with backoff
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <bizgraph/retry.h>

using namespace bizgraph;

TEST(RetryTest, ReturnsFirstSuccess) {
    int calls = 0;
    int value = withRetry("op", RetryPolicy{}, Deadline::never(), [&] { calls++; return 42; });
    EXPECT_EQ(value, 42);
    EXPECT_EQ(calls, 1);
}

TEST(RetryTest, RetriesStoreUnavailable) {
    int calls = 0;
    RetryPolicy policy{3, 1, 2};
    int value = withRetry("op", policy, Deadline::never(), [&] {
        if (++calls < 3) throw Error(ErrorCode::StoreUnavailable, "database is locked");
        return 7;
    });
    EXPECT_EQ(value, 7);
    EXPECT_EQ(calls, 3);
}

TEST(RetryTest, GivesUpAfterMaxAttempts) {
    int calls = 0;
    RetryPolicy policy{2, 1, 2};
    try {
        withRetry("op", policy, Deadline::never(), [&]() -> int {
            calls++;
            throw Error(ErrorCode::StoreUnavailable, "busy");
        });
        FAIL() << "expected StoreUnavailable";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::StoreUnavailable);
    }
    EXPECT_EQ(calls, 2);
}

TEST(RetryTest, NonRetryableErrorsPropagateImmediately) {
    int calls = 0;
    EXPECT_THROW(withRetry("op", RetryPolicy{5, 1, 2}, Deadline::never(), [&]() -> int {
        calls++;
        throw Error(ErrorCode::Conflict, "exists");
    }), Error);
    EXPECT_EQ(calls, 1);
}

TEST(RetryTest, ExpiredDeadlineIsTimeout) {
    auto deadline = Deadline::afterMs(0);
    int calls = 0;
    try {
        withRetry("snapshot", RetryPolicy{}, deadline, [&] { calls++; return 1; });
        FAIL() << "expected Timeout";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::Timeout);
    }
    EXPECT_EQ(calls, 0);
}

TEST(RetryTest, VoidOperations) {
    int calls = 0;
    withRetry("op", RetryPolicy{}, Deadline::never(), [&] { calls++; });
    EXPECT_EQ(calls, 1);
}

TEST(BackoffTest, DelayIsBoundedByMax) {
    RetryPolicy policy{10, 5, 40};
    for (int attempt = 0; attempt < 10; attempt++) {
        auto d = detail::backoffDelay(policy, attempt);
        EXPECT_GE(d.count(), 0);
        EXPECT_LE(d.count(), 40);
    }
}
