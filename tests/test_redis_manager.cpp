#include <gtest/gtest.h>
#include "redis_manager.hpp"
#include "challenge.hpp"

using namespace powgate;

class RedisManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        redis = std::make_unique<RedisManager>("tcp://127.0.0.1:6379?socket_timeout=100ms");
    }

    std::unique_ptr<RedisManager> redis;
};

TEST_F(RedisManagerTest, ConnectionStatus) {
    if (!redis->is_connected()) {
        GTEST_SKIP() << "Redis not available at 127.0.0.1:6379";
    }
    EXPECT_TRUE(redis->is_connected());
}

TEST_F(RedisManagerTest, ChallengeConsumedOnce) {
    if (!redis->is_connected()) GTEST_SKIP();

    std::string challenge = ChallengeIssuer::generate_seed(16);
    EXPECT_TRUE(redis->consume_challenge(challenge, 30));
    EXPECT_FALSE(redis->consume_challenge(challenge, 30));
    EXPECT_FALSE(redis->consume_challenge(challenge, 30));

    // A different challenge is unaffected.
    EXPECT_TRUE(redis->consume_challenge(ChallengeIssuer::generate_seed(16), 30));
}

TEST_F(RedisManagerTest, NonPositiveTtlRejected) {
    if (!redis->is_connected()) GTEST_SKIP();
    EXPECT_FALSE(redis->consume_challenge(ChallengeIssuer::generate_seed(16), 0));
}

TEST_F(RedisManagerTest, LuaRateLimiter) {
    if (!redis->is_connected()) GTEST_SKIP();

    std::string key = "test:" + ChallengeIssuer::generate_seed(8);
    int limit = 2;
    int window = 10;

    auto r1 = redis->rate_limit(key, limit, window);
    EXPECT_TRUE(r1.allowed);

    auto r2 = redis->rate_limit(key, limit, window);
    EXPECT_TRUE(r2.allowed);

    auto r3 = redis->rate_limit(key, limit, window);
    EXPECT_FALSE(r3.allowed);
    EXPECT_GT(r3.reset_after_sec, 0);
}

TEST(RedisManagerOfflineTest, FailsOpenForLimitsClosedForReplay) {
    RedisManager redis("tcp://127.0.0.1:1?connect_timeout=100ms");
    ASSERT_FALSE(redis.is_connected());

    EXPECT_TRUE(redis.rate_limit("anyone", 1, 10).allowed);
    EXPECT_TRUE(redis.rate_limit("anyone", 1, 10).allowed);
    EXPECT_FALSE(redis.consume_challenge("never-seen", 30));
}
