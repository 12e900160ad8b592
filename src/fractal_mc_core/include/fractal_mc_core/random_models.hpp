#ifndef FRACTAL_MC_CORE__RANDOM_MODELS_HPP_
#define FRACTAL_MC_CORE__RANDOM_MODELS_HPP_

#include <cstdint>
#include <random>
#include <vector>

#include "fractal_mc_core/model.hpp"

// 每个坐标随机走 -step 或 +step
class RandomStepModel : public Model {
public:
    RandomStepModel(double step, std::uint32_t seed);

    std::vector<std::vector<double>> propose(const std::vector<std::vector<double>>& states) override;
    void reset() override;
    std::string name() const override { return "random_step"; }

private:
    double step_;
    std::uint32_t seed_;
    std::mt19937 rng_;
};

// 高斯扰动, clip > 0 时把每个分量截断到 [-clip, clip]
class GaussianModel : public Model {
public:
    GaussianModel(double stddev, std::uint32_t seed, double clip = 0.0);

    std::vector<std::vector<double>> propose(const std::vector<std::vector<double>>& states) override;
    void reset() override;
    std::string name() const override { return "gaussian"; }

private:
    double stddev_;
    double clip_;
    std::uint32_t seed_;
    std::mt19937 rng_;
};

#endif
