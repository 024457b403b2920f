#include <gtest/gtest.h>
#include <chrono>
#include "error.hpp"
#include "operation_context.hpp"

TEST(ErrorTest, TransientCodesAreRetryable) {
    EXPECT_TRUE(isRetryable(ErrorCode::Conflict));
    EXPECT_TRUE(isRetryable(ErrorCode::Unavailable));
    EXPECT_TRUE(isRetryable(ErrorCode::Timeout));
    EXPECT_FALSE(isRetryable(ErrorCode::SnapshotFailed));
    EXPECT_FALSE(isRetryable(ErrorCode::ConflictingFenceState));
    EXPECT_FALSE(isRetryable(ErrorCode::MissingExternalSource));
}

TEST(ErrorTest, DescribeNamesTheCode) {
    EXPECT_EQ(describe(Error{ErrorCode::NotFound, "cluster default/pg not found"}),
              "NotFound: cluster default/pg not found");
}

TEST(OperationContextTest, CancelReachesEveryCopy) {
    OperationContext root;
    OperationContext child = root.withTimeout(std::chrono::minutes(5));
    EXPECT_TRUE(child.check().has_value());

    root.cancel();
    EXPECT_TRUE(child.isCancelled());
    auto checked = child.check();
    ASSERT_FALSE(checked.has_value());
    EXPECT_EQ(checked.error().code, ErrorCode::Cancelled);
}

TEST(OperationContextTest, ExpiredDeadlineIsTimeout) {
    OperationContext ctx = OperationContext().withTimeout(std::chrono::milliseconds(-1));
    auto checked = ctx.check();
    ASSERT_FALSE(checked.has_value());
    EXPECT_EQ(checked.error().code, ErrorCode::Timeout);
}


TEST(OperationContextTest, RemainingTimeFollowsDeadline) {
    EXPECT_FALSE(OperationContext().remaining().has_value());

    auto left = OperationContext().withTimeout(std::chrono::seconds(60)).remaining();
    ASSERT_TRUE(left.has_value());
    EXPECT_GT(*left, std::chrono::seconds(30));

    auto expired = OperationContext().withTimeout(std::chrono::milliseconds(-1)).remaining();
    ASSERT_TRUE(expired.has_value());
    EXPECT_EQ(*expired, std::chrono::milliseconds(0));
}
