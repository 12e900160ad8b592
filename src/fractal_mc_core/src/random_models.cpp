#include "fractal_mc_core/random_models.hpp"
#include "fractal_mc_core/errors.hpp"
#include <algorithm>
#include <cmath>

RandomStepModel::RandomStepModel(double step, std::uint32_t seed)
: step_(step), seed_(seed), rng_(seed)
{
    if (!std::isfinite(step_) || step_ <= 0.0) {
        throw ConfigurationError("random step size must be > 0");
    }
}

std::vector<std::vector<double>> RandomStepModel::propose(const std::vector<std::vector<double>>& states) {
    std::bernoulli_distribution coin(0.5);
    std::vector<std::vector<double>> actions(states.size());
    for (size_t i = 0; i < states.size(); ++i) {
        actions[i].resize(states[i].size());
        for (auto& a : actions[i]) a = coin(rng_) ? step_ : -step_;
    }
    return actions;
}

void RandomStepModel::reset() {
    rng_.seed(seed_);
}

GaussianModel::GaussianModel(double stddev, std::uint32_t seed, double clip)
: stddev_(stddev), clip_(clip), seed_(seed), rng_(seed)
{
    if (!std::isfinite(stddev_) || stddev_ <= 0.0) {
        throw ConfigurationError("gaussian stddev must be > 0");
    }
    if (!std::isfinite(clip_) || clip_ < 0.0) {
        throw ConfigurationError("gaussian clip must be >= 0");
    }
}

std::vector<std::vector<double>> GaussianModel::propose(const std::vector<std::vector<double>>& states) {
    std::normal_distribution<double> gauss(0.0, stddev_);
    std::vector<std::vector<double>> actions(states.size());
    for (size_t i = 0; i < states.size(); ++i) {
        actions[i].resize(states[i].size());
        for (auto& a : actions[i]) {
            a = gauss(rng_);
            if (clip_ > 0.0) a = std::clamp(a, -clip_, clip_);
        }
    }
    return actions;
}

void GaussianModel::reset() {
    rng_.seed(seed_);
}
