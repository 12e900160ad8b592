#ifndef FRACTAL_MC_CORE__CLONING_OPERATOR_HPP_
#define FRACTAL_MC_CORE__CLONING_OPERATOR_HPP_

#include <random>
#include <vector>

#include "fractal_mc_core/companion_sampler.hpp"
#include "fractal_mc_core/state_buffer.hpp"

struct CloneDecision {
    std::vector<int> candidates;            // 克隆源 j
    std::vector<double> probabilities;      // clone_probability[i]
    std::vector<bool> will_clone;
    int n_clones = 0;
    bool extinct = false;                   // 没有任何存活 walker
};

class CloningOperator {
public:
    // epsilon: 分母下限, 防止除 0
    explicit CloningOperator(double epsilon = 1e-8);

    // best_index: 当前最优 walker, 不会被覆盖 (-1 表示没有)
    // 克隆源独立重新抽取, 不复用计算 VR 时的同伴
    CloneDecision decide(const std::vector<double>& virtual_rewards,
                         const std::vector<bool>& alive,
                         int best_index,
                         std::mt19937& rng) const;

    // 以克隆前的快照为准, 一次性整批写入
    void apply(const CloneDecision& decision, StateBuffer& buffer) const;

    // p = clamp((vr_j - vr_i) / max(vr_j, epsilon), 0, 1)
    double clone_probability(double vr_i, double vr_j) const;

    double epsilon() const { return epsilon_; }

private:
    double epsilon_;
    CompanionSampler sampler_;
};

#endif
