#include <ky/http/attempt.hpp>

#include <gtest/gtest.h>

#include <support/scripted_transport.hpp>

using namespace ky::http;
using ky::test::failure;
using ky::test::status;

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------
TEST(RetryableTest, ServerErrorsAndTransportFailuresAreRetryable) {
    EXPECT_TRUE(is_retryable(status(500)));
    EXPECT_TRUE(is_retryable(status(503)));
    EXPECT_TRUE(is_retryable(failure()));
}

TEST(RetryableTest, EverythingBelow500IsAccepted) {
    EXPECT_FALSE(is_retryable(status(200)));
    EXPECT_FALSE(is_retryable(status(302)));
    EXPECT_FALSE(is_retryable(status(404)));
    EXPECT_FALSE(is_retryable(status(429)));
    EXPECT_FALSE(is_retryable(status(499)));
}

// ---------------------------------------------------------------------------
// AttemptRecord transitions
// ---------------------------------------------------------------------------
TEST(AttemptRecordTest, StartsPending) {
    AttemptRecord rec{3};
    EXPECT_EQ(rec.state(), AttemptState::pending);
    EXPECT_EQ(rec.attempts(), 0u);
    EXPECT_EQ(rec.max_attempts(), 3u);
    EXPECT_FALSE(rec.finished());
}

TEST(AttemptRecordTest, AcceptedOnFirstSuccess) {
    AttemptRecord rec{3};
    rec.begin();
    EXPECT_EQ(rec.state(), AttemptState::in_flight);
    EXPECT_EQ(rec.settle(status(201)), AttemptState::accepted);
    EXPECT_TRUE(rec.finished());
    EXPECT_EQ(rec.attempts(), 1u);
}

TEST(AttemptRecordTest, RetryableGoesBackToPendingWhileBudgetLasts) {
    AttemptRecord rec{2};
    rec.begin();
    EXPECT_EQ(rec.settle(status(502)), AttemptState::pending);
    rec.begin();
    EXPECT_EQ(rec.settle(status(502)), AttemptState::exhausted);
    EXPECT_TRUE(rec.finished());
    EXPECT_EQ(rec.attempts(), 2u);
}

TEST(AttemptRecordTest, SingleAttemptBudgetExhaustsImmediately) {
    AttemptRecord rec{1};
    rec.begin();
    EXPECT_EQ(rec.settle(failure()), AttemptState::exhausted);
}

TEST(AttemptRecordTest, StateNames) {
    EXPECT_EQ(to_string(AttemptState::pending), "pending");
    EXPECT_EQ(to_string(AttemptState::exhausted), "exhausted");
}
