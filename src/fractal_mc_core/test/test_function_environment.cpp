#include "fractal_mc_core/function_environment.hpp"
#include "fractal_mc_core/errors.hpp"
#include "fractal_mc_core/random_models.hpp"
#include "fractal_mc_core/swarm.hpp"

#include <gtest/gtest.h>
#include <cmath>

TEST(BenchmarkFunctionsTest, KnownMinima)
{
    EXPECT_DOUBLE_EQ(sphere({0.0, 0.0, 0.0}), 0.0);
    EXPECT_DOUBLE_EQ(sphere({1.0, 2.0}), 5.0);
    EXPECT_NEAR(rastrigin({0.0, 0.0}), 0.0, 1e-12);
    EXPECT_NEAR(rastrigin({1.0}), 1.0, 1e-12);
    // michalewicz 2 维最小值约 -1.8013 (2.20, 1.57)
    EXPECT_NEAR(michalewicz({2.20, 1.57}), -1.8013, 1e-3);
    EXPECT_NEAR(eggholder({512.0, 404.2319}), -959.6407, 1e-3);
    EXPECT_THROW(eggholder({1.0}), std::invalid_argument);
}

TEST(BenchmarkFunctionsTest, FactoryNormalizesNames)
{
    EXPECT_DOUBLE_EQ(make_benchmark("Sphere")({3.0}), 9.0);
    EXPECT_NEAR(make_benchmark("RASTRIGIN")({0.0}), 0.0, 1e-12);

    BenchmarkParams params;
    params.rastrigin_A = 5.0;
    EXPECT_NEAR(make_benchmark("rastrigin", params)({0.5}), 0.25 + 10.0, 1e-12);

    EXPECT_THROW(make_benchmark("not-a-function"), ConfigurationError);
    EXPECT_EQ(normalize_key("Michale-wicz_2"), "michalewicz2");
}

TEST(FunctionEnvironmentTest, StepAppliesDisplacementAndNegatesObjective)
{
    FunctionEnvironment env(make_benchmark("sphere"), 2, -5.0, 5.0, "sphere");
    const StepBatch b = env.step({{1.0, 1.0}, {0.0, 0.0}}, {{0.5, -1.0}, {3.0, 4.0}});

    EXPECT_EQ(b.states[0], (std::vector<double>{1.5, 0.0}));
    EXPECT_EQ(b.observations[0], b.states[0]);
    EXPECT_DOUBLE_EQ(b.rewards[0], -2.25);
    EXPECT_FALSE(b.terminals[0]);

    EXPECT_DOUBLE_EQ(b.rewards[1], -25.0);
    EXPECT_FALSE(b.terminals[1]);
}

TEST(FunctionEnvironmentTest, LeavingTheBoxKillsTheWalker)
{
    FunctionEnvironment env(make_benchmark("sphere"), 1, -1.0, 1.0);
    const StepBatch b = env.step({{0.9}, {-0.9}}, {{0.2}, {0.05}});
    EXPECT_TRUE(b.terminals[0]);
    EXPECT_DOUBLE_EQ(b.rewards[0], 0.0);
    EXPECT_FALSE(b.terminals[1]);
}

TEST(FunctionEnvironmentTest, InvalidSetupThrows)
{
    EXPECT_THROW(FunctionEnvironment(make_benchmark("eggholder"), 1, -5.0, 5.0), ConfigurationError);
    EXPECT_NO_THROW(FunctionEnvironment(make_benchmark("eggholder"), 2, -5.0, 5.0));
    EXPECT_THROW(FunctionEnvironment(make_benchmark("sphere"), 0, -1.0, 1.0), ConfigurationError);
    EXPECT_THROW(FunctionEnvironment(make_benchmark("sphere"), 2, 1.0, -1.0), ConfigurationError);
    EXPECT_THROW(FunctionEnvironment(ObjectiveFunction(), 2, -1.0, 1.0), ConfigurationError);

    FunctionEnvironment env(make_benchmark("sphere"), 2, -1.0, 1.0);
    EXPECT_THROW(env.step({{0.0, 0.0}}, {}), CollaboratorContractError);
    EXPECT_THROW(env.step({{0.0}}, {{0.0}}), CollaboratorContractError);
    EXPECT_EQ(env.center(), (std::vector<double>{0.0, 0.0}));
}

TEST(RandomModelsTest, RandomStepProposesPlusMinusStep)
{
    RandomStepModel model(0.25, 3);
    const auto actions = model.propose({{0.0, 0.0, 0.0}, {1.0, 1.0, 1.0}});
    ASSERT_EQ(actions.size(), 2u);
    for (const auto& a : actions) {
        ASSERT_EQ(a.size(), 3u);
        for (double v : a) EXPECT_DOUBLE_EQ(std::abs(v), 0.25);
    }

    // reset 之后序列重新开始
    model.reset();
    EXPECT_EQ(model.propose({{0.0, 0.0, 0.0}, {1.0, 1.0, 1.0}}), actions);
}

TEST(RandomModelsTest, GaussianClipAndValidation)
{
    GaussianModel model(10.0, 4, 0.5);
    for (const auto& a : model.propose(std::vector<std::vector<double>>(20, std::vector<double>(4, 0.0)))) {
        for (double v : a) {
            EXPECT_LE(v, 0.5);
            EXPECT_GE(v, -0.5);
        }
    }
    EXPECT_THROW(GaussianModel(0.0, 1), ConfigurationError);
    EXPECT_THROW(GaussianModel(1.0, 1, -1.0), ConfigurationError);
    EXPECT_THROW(RandomStepModel(0.0, 1), ConfigurationError);
}

TEST(FunctionEnvironmentTest, SwarmImprovesOnSphere)
{
    FunctionEnvironment env(make_benchmark("sphere"), 2, -5.12, 5.12, "sphere");
    GaussianModel model(0.3, 12);

    SwarmConfig config;
    config.n_walkers = 32;
    config.max_steps = 200;
    config.seed = 12;
    config.accumulate_rewards = false;
    Swarm swarm(config, env, model);

    // 从角落出发
    const BestWalker best = swarm.run({4.0, 4.0});
    EXPECT_GT(best.cumulative_reward, -1.0);
    EXPECT_TRUE(env.in_bounds(best.state));
    EXPECT_NEAR(-sphere(best.state), best.cumulative_reward, 1e-12);
}
