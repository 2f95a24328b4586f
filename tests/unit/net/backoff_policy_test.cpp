#include <gtest/gtest.h>

#include "cgc/net/backoff_policy.hpp"

using namespace cgc::net;
using namespace std::chrono_literals;

TEST(BackoffPolicyTest, LinearGrowsByBase) {
    BackoffPolicy policy(BackoffStrategy::Linear, 1000ms, 30000ms);
    EXPECT_EQ(policy.delay(0), 0ms);
    EXPECT_EQ(policy.delay(1), 1000ms);
    EXPECT_EQ(policy.delay(2), 2000ms);
    EXPECT_EQ(policy.delay(3), 3000ms);
}

TEST(BackoffPolicyTest, LinearIsNotCapped) {
    BackoffPolicy policy(BackoffStrategy::Linear, 1000ms, 2000ms);
    EXPECT_EQ(policy.delay(5), 5000ms);
}

TEST(BackoffPolicyTest, ExponentialDoubles) {
    BackoffPolicy policy(BackoffStrategy::Exponential, 1000ms, 30000ms);
    EXPECT_EQ(policy.delay(1), 1000ms);
    EXPECT_EQ(policy.delay(2), 2000ms);
    EXPECT_EQ(policy.delay(3), 4000ms);
    EXPECT_EQ(policy.delay(4), 8000ms);
}

TEST(BackoffPolicyTest, ExponentialIsCapped) {
    BackoffPolicy policy(BackoffStrategy::Exponential, 1000ms, 5000ms);
    EXPECT_EQ(policy.delay(4), 5000ms);
    EXPECT_EQ(policy.delay(200), 5000ms);
}

TEST(BackoffPolicyTest, ZeroBaseMeansNoDelay) {
    BackoffPolicy policy(BackoffStrategy::Exponential, 0ms, 5000ms);
    EXPECT_EQ(policy.delay(3), 0ms);
}

TEST(BackoffPolicyTest, JitterStaysWithinTwentyPercent) {
    BackoffPolicy policy(BackoffStrategy::Linear, 1000ms, 30000ms);
    EXPECT_EQ(policy.delayWithJitter(2, [] { return 0.0; }), 1600ms);
    EXPECT_EQ(policy.delayWithJitter(2, [] { return 0.5; }), 2000ms);
    EXPECT_EQ(policy.delayWithJitter(2, [] { return 1.0; }), 2400ms);

    auto random = BackoffPolicy::defaultRandom();
    for (int i = 0; i < 200; ++i) {
        auto d = policy.delayWithJitter(3, random);
        EXPECT_GE(d, 2400ms);
        EXPECT_LE(d, 3600ms);
    }
}

TEST(BackoffPolicyTest, ExponentialJitterNeverExceedsCap) {
    BackoffPolicy policy(BackoffStrategy::Exponential, 1000ms, 4000ms);
    EXPECT_EQ(policy.delayWithJitter(3, [] { return 1.0; }), 4000ms);
}

TEST(BackoffPolicyTest, JitteredInterval) {
    EXPECT_EQ(jittered(5000ms, [] { return 0.0; }), 4000ms);
    EXPECT_EQ(jittered(5000ms, [] { return 1.0; }), 6000ms);
}

TEST(BackoffPolicyTest, FromConfig) {
    ConnectionConfig config;
    config.backoffStrategy = BackoffStrategy::Exponential;
    config.retryBaseDelay = 250ms;
    config.maxRetryDelay = 1000ms;

    auto policy = BackoffPolicy::fromConfig(config);
    EXPECT_EQ(policy.strategy(), BackoffStrategy::Exponential);
    EXPECT_EQ(policy.delay(2), 500ms);
    EXPECT_EQ(policy.delay(6), 1000ms);
}
