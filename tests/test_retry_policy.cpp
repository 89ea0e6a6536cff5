#include <gtest/gtest.h>
#include "RetryPolicy.hpp"
#include "Config.hpp"

using namespace safedb;
using namespace std::chrono_literals;

class RetryPolicyTest : public ::testing::Test {
};

TEST_F(RetryPolicyTest, OnceAllowsSingleAttempt) {
    RetryPolicy policy = RetryPolicies::once();

    EXPECT_TRUE(policy(1));
    EXPECT_FALSE(policy(2));
    EXPECT_FALSE(policy(10));
}

TEST_F(RetryPolicyTest, LimitedStopsAfterMaxAttempts) {
    RetryPolicy policy = RetryPolicies::limited(3);

    EXPECT_TRUE(policy(1));
    EXPECT_TRUE(policy(2));
    EXPECT_TRUE(policy(3));
    EXPECT_FALSE(policy(4));
}

TEST_F(RetryPolicyTest, ZeroAttemptsRefusesImmediately) {
    RetryPolicy policy = RetryPolicies::limited(0);

    EXPECT_FALSE(policy(1));
}

TEST_F(RetryPolicyTest, FirstAttemptNeverWaits) {
    EXPECT_EQ(RetryPolicies::backoffDelay(1, 100ms, 2.0, 10s), 0ms);
}

TEST_F(RetryPolicyTest, BackoffDelayGrows) {
    EXPECT_EQ(RetryPolicies::backoffDelay(2, 100ms, 2.0, 10s), 100ms);
    EXPECT_EQ(RetryPolicies::backoffDelay(3, 100ms, 2.0, 10s), 200ms);
    EXPECT_EQ(RetryPolicies::backoffDelay(4, 100ms, 2.0, 10s), 400ms);
}

TEST_F(RetryPolicyTest, BackoffDelayIsCapped) {
    EXPECT_EQ(RetryPolicies::backoffDelay(10, 100ms, 2.0, 1s), 1000ms);
}

TEST_F(RetryPolicyTest, ConstantDelayWithUnitMultiplier) {
    EXPECT_EQ(RetryPolicies::backoffDelay(5, 50ms, 1.0, 50ms), 50ms);
}

TEST_F(RetryPolicyTest, NoDelayConfigured) {
    EXPECT_EQ(RetryPolicies::backoffDelay(3, 0ms, 2.0, 1s), 0ms);
}

TEST_F(RetryPolicyTest, LimitedWithDelaySleeps) {
    RetryPolicy policy = RetryPolicies::limited(2, 20ms);

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(policy(1));
    EXPECT_TRUE(policy(2));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, 20ms);
}

TEST_F(RetryPolicyTest, FromConfigSingleAttempt) {
    ReconnectConfig config;
    config.max_attempts = 1;

    RetryPolicy policy = RetryPolicies::fromConfig(config);

    EXPECT_TRUE(policy(1));
    EXPECT_FALSE(policy(2));
}

TEST_F(RetryPolicyTest, FromConfigMultipleAttempts) {
    ReconnectConfig config;
    config.max_attempts = 4;
    config.retry_delay = 0ms;

    RetryPolicy policy = RetryPolicies::fromConfig(config);

    EXPECT_TRUE(policy(4));
    EXPECT_FALSE(policy(5));
}
