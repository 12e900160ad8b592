#ifndef FRACTAL_MC_CORE__VIRTUAL_REWARD_HPP_
#define FRACTAL_MC_CORE__VIRTUAL_REWARD_HPP_

#include <vector>

#include "fractal_mc_core/distance_function.hpp"

struct VirtualRewardResult {
    std::vector<double> distances;           // 到同伴的原始距离
    std::vector<double> normalized_rewards;  // [0,1]
    std::vector<double> normalized_distances;
    std::vector<double> virtual_rewards;     // 死亡 walker 为 0
    bool degenerate = false;                 // 全部死亡，或者所有存活 walker 的 VR 相同
};

// virtual_reward = norm_reward^reward_scale * norm_distance^distance_scale
// reward_scale 控制利用 (exploitation), distance_scale 控制探索 (exploration)
class VirtualRewardCalculator {
public:
    explicit VirtualRewardCalculator(double reward_scale = 1.0, double distance_scale = 1.0);

    VirtualRewardResult compute(const std::vector<double>& cumulative_rewards,
                                const std::vector<std::vector<double>>& observations,
                                const std::vector<bool>& alive,
                                const std::vector<int>& companions,
                                const DistanceFunction& distance) const;

    // 距离已经算好时直接用
    VirtualRewardResult compute(const std::vector<double>& cumulative_rewards,
                                const std::vector<double>& distances,
                                const std::vector<bool>& alive) const;

    // 只在存活 walker 上做 min-max 归一化; max == min 时全部为 1, 死亡 walker 为 0
    static std::vector<double> normalize(const std::vector<double>& values, const std::vector<bool>& alive);

    double reward_scale() const { return reward_scale_; }
    double distance_scale() const { return distance_scale_; }

private:
    double reward_scale_;
    double distance_scale_;
};

#endif
