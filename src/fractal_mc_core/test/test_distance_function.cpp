#include "fractal_mc_core/distance_function.hpp"
#include "fractal_mc_core/errors.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <random>
#include <stdexcept>

TEST(DistanceFunctionTest, EuclideanIdentityAndSymmetry)
{
    EuclideanDistance d;
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> u(-10.0, 10.0);
    for (int trial = 0; trial < 50; ++trial) {
        std::vector<double> a(4), b(4);
        for (auto& v : a) v = u(rng);
        for (auto& v : b) v = u(rng);
        EXPECT_DOUBLE_EQ(d.distance(a, a), 0.0);
        EXPECT_DOUBLE_EQ(d.distance(a, b), d.distance(b, a));
        EXPECT_GT(d.distance(a, b), 0.0);
    }
}

TEST(DistanceFunctionTest, EuclideanKnownValue)
{
    EuclideanDistance d;
    EXPECT_DOUBLE_EQ(d.distance({0.0, 0.0}, {3.0, 4.0}), 5.0);
}

TEST(DistanceFunctionTest, ManhattanKnownValue)
{
    ManhattanDistance d;
    EXPECT_DOUBLE_EQ(d.distance({1.0, -1.0}, {4.0, 3.0}), 7.0);
}

TEST(DistanceFunctionTest, HammingCountsDifferingCoordinates)
{
    HammingDistance exact;
    EXPECT_DOUBLE_EQ(exact.distance({1.0, 2.0, 3.0}, {1.0, 0.0, 4.0}), 2.0);

    HammingDistance loose(0.5);
    EXPECT_DOUBLE_EQ(loose.distance({1.0, 2.0, 3.0}, {1.2, 0.0, 3.4}), 1.0);

    EXPECT_THROW(HammingDistance(-1.0), ConfigurationError);
}

TEST(DistanceFunctionTest, BatchedDistancesUseCompanions)
{
    EuclideanDistance d;
    const std::vector<std::vector<double>> obs = {{0.0}, {1.0}, {3.0}};
    const std::vector<double> out = d.distances(obs, {1, 2, 0});
    ASSERT_EQ(out.size(), 3u);
    EXPECT_DOUBLE_EQ(out[0], 1.0);
    EXPECT_DOUBLE_EQ(out[1], 2.0);
    EXPECT_DOUBLE_EQ(out[2], 3.0);

    EXPECT_THROW(d.distances(obs, {1, 2}), std::invalid_argument);
    EXPECT_THROW(d.distances(obs, {1, 2, 3}), std::out_of_range);
}

TEST(DistanceFunctionTest, MismatchedShapesThrow)
{
    EuclideanDistance d;
    EXPECT_THROW(d.distance({1.0}, {1.0, 2.0}), std::invalid_argument);
}

TEST(DistanceFunctionTest, CustomDistanceRejectsNegativeAndNaN)
{
    CustomDistance first_coord([](const std::vector<double>& a, const std::vector<double>& b) {
        return std::abs(a[0] - b[0]);
    }, "first");
    EXPECT_DOUBLE_EQ(first_coord.distance({1.0, 9.0}, {4.0, -9.0}), 3.0);
    EXPECT_EQ(first_coord.name(), "first");

    CustomDistance negative([](const std::vector<double>&, const std::vector<double>&) { return -1.0; });
    EXPECT_THROW(negative.distance({0.0}, {1.0}), CollaboratorContractError);

    CustomDistance nan([](const std::vector<double>&, const std::vector<double>&) { return std::nan(""); });
    EXPECT_THROW(nan.distance({0.0}, {1.0}), CollaboratorContractError);

    EXPECT_THROW(CustomDistance{CustomDistance::Metric()}, ConfigurationError);
}
