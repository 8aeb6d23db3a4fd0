#include <gtest/gtest.h>
#include "difficulty_policy.hpp"
#include "metrics.hpp"

using namespace powgate;

class DifficultyPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        MetricsRegistry::instance().reset();
    }
    void TearDown() override {
        MetricsRegistry::instance().reset();
    }
};

TEST_F(DifficultyPolicyTest, BaseUnderNormalLoad) {
    DifficultyPolicy policy(4, 0, 15);
    EXPECT_EQ(policy.required_difficulty(), 4);
    EXPECT_EQ(policy.required_difficulty(2), 6);
}

TEST_F(DifficultyPolicyTest, LoadRaisesDifficulty) {
    DifficultyPolicy policy(4, 0, 15);
    auto& metrics = MetricsRegistry::instance();

    metrics.set_gauge("powgate_active_connections", 1000);
    EXPECT_EQ(policy.required_difficulty(), 4);

    metrics.set_gauge("powgate_active_connections", 1001);
    EXPECT_EQ(policy.required_difficulty(), 5);

    metrics.set_gauge("powgate_active_connections", 6000);
    EXPECT_EQ(policy.required_difficulty(), 6);
}

TEST_F(DifficultyPolicyTest, ClampsToBounds) {
    DifficultyPolicy policy(4, 2, 5);
    MetricsRegistry::instance().set_gauge("powgate_active_connections", 10000);
    EXPECT_EQ(policy.required_difficulty(3), 5);
    EXPECT_EQ(policy.required_difficulty(-10), 2);
}

TEST_F(DifficultyPolicyTest, BotScoreMapping) {
    DifficultyPolicy policy(4, 0, 12);
    EXPECT_EQ(policy.for_bot_score(99), 4);
    EXPECT_EQ(policy.for_bot_score(1), 12);
    // 49^2 * 8 / 98^2 = 2
    EXPECT_EQ(policy.for_bot_score(50), 6);

    int previous = policy.for_bot_score(99);
    for (int score = 98; score >= 1; --score) {
        int d = policy.for_bot_score(score);
        EXPECT_GE(d, previous) << "score " << score;
        previous = d;
    }
}

TEST_F(DifficultyPolicyTest, BotScoreOutOfRange) {
    DifficultyPolicy policy(4, 0, 12);
    EXPECT_THROW(policy.for_bot_score(0), std::invalid_argument);
    EXPECT_THROW(policy.for_bot_score(100), std::invalid_argument);
}

TEST_F(DifficultyPolicyTest, InvalidBounds) {
    EXPECT_THROW(DifficultyPolicy(4, 5, 10), std::invalid_argument);
    EXPECT_THROW(DifficultyPolicy(4, 0, 65), std::invalid_argument);
    EXPECT_THROW(DifficultyPolicy(4, -1, 10), std::invalid_argument);
    EXPECT_THROW(DifficultyPolicy(11, 0, 10), std::invalid_argument);
    EXPECT_NO_THROW(DifficultyPolicy(64, 0, 64));
}
