#include "fractal_mc_core/virtual_reward.hpp"
#include "fractal_mc_core/errors.hpp"

#include <gtest/gtest.h>

TEST(VirtualRewardTest, NormalizeMinMaxOverAliveWalkers)
{
    const std::vector<double> out = VirtualRewardCalculator::normalize({1.0, 3.0, 5.0}, {true, true, true});
    EXPECT_DOUBLE_EQ(out[0], 0.0);
    EXPECT_DOUBLE_EQ(out[1], 0.5);
    EXPECT_DOUBLE_EQ(out[2], 1.0);

    // 死亡 walker 不参与 min/max, 结果为 0
    const std::vector<double> masked = VirtualRewardCalculator::normalize({1.0, 100.0, 5.0}, {true, false, true});
    EXPECT_DOUBLE_EQ(masked[0], 0.0);
    EXPECT_DOUBLE_EQ(masked[1], 0.0);
    EXPECT_DOUBLE_EQ(masked[2], 1.0);
}

TEST(VirtualRewardTest, NormalizeZeroRangeGivesOnes)
{
    const std::vector<double> out = VirtualRewardCalculator::normalize({-2.0, -2.0, 7.0}, {true, true, false});
    EXPECT_DOUBLE_EQ(out[0], 1.0);
    EXPECT_DOUBLE_EQ(out[1], 1.0);
    EXPECT_DOUBLE_EQ(out[2], 0.0);
}

TEST(VirtualRewardTest, ProductOfNormalizedRewardAndDistance)
{
    VirtualRewardCalculator calc;
    const VirtualRewardResult r = calc.compute({0.0, 1.0, 2.0}, {2.0, 1.0, 0.0}, {true, true, true});
    EXPECT_DOUBLE_EQ(r.virtual_rewards[0], 0.0);
    EXPECT_DOUBLE_EQ(r.virtual_rewards[1], 0.25);
    EXPECT_DOUBLE_EQ(r.virtual_rewards[2], 0.0);
    EXPECT_FALSE(r.degenerate);
}

TEST(VirtualRewardTest, ScalesAreExponents)
{
    VirtualRewardCalculator exploit(2.0, 0.0);
    const VirtualRewardResult r = exploit.compute({0.0, 1.0, 2.0}, {5.0, 0.0, 1.0}, {true, true, true});
    EXPECT_DOUBLE_EQ(r.virtual_rewards[0], 0.0);
    EXPECT_DOUBLE_EQ(r.virtual_rewards[1], 0.25);
    EXPECT_DOUBLE_EQ(r.virtual_rewards[2], 1.0);

    VirtualRewardCalculator explore(0.0, 1.0);
    const VirtualRewardResult e = explore.compute({0.0, 1.0, 2.0}, {4.0, 0.0, 2.0}, {true, true, true});
    EXPECT_DOUBLE_EQ(e.virtual_rewards[0], 1.0);
    EXPECT_DOUBLE_EQ(e.virtual_rewards[1], 0.0);
    EXPECT_DOUBLE_EQ(e.virtual_rewards[2], 0.5);
}

TEST(VirtualRewardTest, ZeroScalesGiveConstantOneForAliveWalkers)
{
    VirtualRewardCalculator calc(0.0, 0.0);
    const VirtualRewardResult r = calc.compute({-5.0, 3.0, 8.0, 1.0}, {0.0, 2.0, 9.0, 4.0},
                                               {true, true, false, true});
    EXPECT_DOUBLE_EQ(r.virtual_rewards[0], 1.0);
    EXPECT_DOUBLE_EQ(r.virtual_rewards[1], 1.0);
    EXPECT_DOUBLE_EQ(r.virtual_rewards[2], 0.0);
    EXPECT_DOUBLE_EQ(r.virtual_rewards[3], 1.0);
    EXPECT_TRUE(r.degenerate);
}

TEST(VirtualRewardTest, AllDeadGivesZeros)
{
    VirtualRewardCalculator calc;
    const VirtualRewardResult r = calc.compute({1.0, 2.0}, {1.0, 2.0}, {false, false});
    EXPECT_DOUBLE_EQ(r.virtual_rewards[0], 0.0);
    EXPECT_DOUBLE_EQ(r.virtual_rewards[1], 0.0);
    EXPECT_TRUE(r.degenerate);
}

TEST(VirtualRewardTest, ComputesDistancesToCompanions)
{
    VirtualRewardCalculator calc;
    EuclideanDistance euclid;
    const std::vector<std::vector<double>> obs = {{0.0}, {1.0}, {4.0}};
    const VirtualRewardResult r = calc.compute({1.0, 1.0, 1.0}, obs, {true, true, true}, {1, 2, 0}, euclid);
    EXPECT_DOUBLE_EQ(r.distances[0], 1.0);
    EXPECT_DOUBLE_EQ(r.distances[1], 3.0);
    EXPECT_DOUBLE_EQ(r.distances[2], 4.0);
    // 奖励全相同 -> 归一化奖励为 1, VR 只由距离决定
    EXPECT_DOUBLE_EQ(r.virtual_rewards[0], 0.0);
    EXPECT_DOUBLE_EQ(r.virtual_rewards[1], 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(r.virtual_rewards[2], 1.0);
}

TEST(VirtualRewardTest, InvalidScalesThrow)
{
    EXPECT_THROW(VirtualRewardCalculator(-1.0, 1.0), ConfigurationError);
    EXPECT_THROW(VirtualRewardCalculator(1.0, -0.5), ConfigurationError);
}

TEST(VirtualRewardTest, LengthMismatchThrows)
{
    VirtualRewardCalculator calc;
    EXPECT_THROW(calc.compute({1.0}, {1.0, 2.0}, {true, true}), std::invalid_argument);
}
