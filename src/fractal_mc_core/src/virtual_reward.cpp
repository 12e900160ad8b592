#include "fractal_mc_core/virtual_reward.hpp"
#include "fractal_mc_core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

VirtualRewardCalculator::VirtualRewardCalculator(double reward_scale, double distance_scale)
: reward_scale_(reward_scale), distance_scale_(distance_scale)
{
    if (!std::isfinite(reward_scale_) || reward_scale_ < 0.0) {
        throw ConfigurationError("reward_scale must be a finite value >= 0");
    }
    if (!std::isfinite(distance_scale_) || distance_scale_ < 0.0) {
        throw ConfigurationError("distance_scale must be a finite value >= 0");
    }
}

std::vector<double> VirtualRewardCalculator::normalize(const std::vector<double>& values,
                                                       const std::vector<bool>& alive) {
    if (values.size() != alive.size()) {
        throw std::invalid_argument("normalize: values and alive flags differ in length");
    }
    double lo = std::numeric_limits<double>::max();
    double hi = std::numeric_limits<double>::lowest();
    bool any_alive = false;
    for (size_t i = 0; i < values.size(); ++i) {
        if (!alive[i]) continue;
        any_alive = true;
        lo = std::min(lo, values[i]);
        hi = std::max(hi, values[i]);
    }

    std::vector<double> out(values.size(), 0.0);
    if (!any_alive) return out;

    const double range = hi - lo;
    for (size_t i = 0; i < values.size(); ++i) {
        if (!alive[i]) continue;
        // 区间为 0 时所有人一样好
        out[i] = (range > 0.0) ? (values[i] - lo) / range : 1.0;
    }
    return out;
}

VirtualRewardResult VirtualRewardCalculator::compute(const std::vector<double>& cumulative_rewards,
                                                     const std::vector<std::vector<double>>& observations,
                                                     const std::vector<bool>& alive,
                                                     const std::vector<int>& companions,
                                                     const DistanceFunction& distance) const {
    return compute(cumulative_rewards, distance.distances(observations, companions), alive);
}

VirtualRewardResult VirtualRewardCalculator::compute(const std::vector<double>& cumulative_rewards,
                                                     const std::vector<double>& distances,
                                                     const std::vector<bool>& alive) const {
    const size_t n = alive.size();
    if (cumulative_rewards.size() != n || distances.size() != n) {
        throw std::invalid_argument("VirtualRewardCalculator: batch columns differ in length");
    }

    VirtualRewardResult result;
    result.distances = distances;
    result.normalized_rewards = normalize(cumulative_rewards, alive);
    result.normalized_distances = normalize(distances, alive);
    result.virtual_rewards.assign(n, 0.0);

    bool any_alive = false;
    bool all_equal = true;
    double first = 0.0;
    for (size_t i = 0; i < n; ++i) {
        if (!alive[i]) continue;
        // std::pow(0, 0) == 1, 两个指数都为 0 时 VR 恒为 1
        const double vr = std::pow(result.normalized_rewards[i], reward_scale_) *
                          std::pow(result.normalized_distances[i], distance_scale_);
        result.virtual_rewards[i] = vr;
        if (!any_alive) {
            first = vr;
            any_alive = true;
        } else if (vr != first) {
            all_equal = false;
        }
    }
    result.degenerate = !any_alive || all_equal;
    return result;
}
