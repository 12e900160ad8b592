#include "fractal_mc_core/cloning_operator.hpp"
#include "fractal_mc_core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

CloningOperator::CloningOperator(double epsilon)
: epsilon_(epsilon)
{
    if (!std::isfinite(epsilon_) || epsilon_ <= 0.0) {
        throw ConfigurationError("epsilon must be a finite value > 0");
    }
}

double CloningOperator::clone_probability(double vr_i, double vr_j) const {
    const double p = (vr_j - vr_i) / std::max(vr_j, epsilon_);
    return std::min(1.0, std::max(0.0, p));
}

CloneDecision CloningOperator::decide(const std::vector<double>& virtual_rewards,
                                      const std::vector<bool>& alive,
                                      int best_index,
                                      std::mt19937& rng) const {
    const int n = static_cast<int>(alive.size());
    if (static_cast<int>(virtual_rewards.size()) != n) {
        throw std::invalid_argument("CloningOperator: virtual rewards and alive flags differ in length");
    }

    CloneDecision decision;
    decision.candidates.resize(n);
    for (int i = 0; i < n; ++i) decision.candidates[i] = i;
    decision.probabilities.assign(n, 0.0);
    decision.will_clone.assign(n, false);
    decision.extinct = std::none_of(alive.begin(), alive.end(), [](bool a) { return a; });

    // 只有一个 walker 或者全部死亡: 不克隆, 也不消耗随机数
    if (n <= 1 || decision.extinct) return decision;

    // 1. 抽取克隆源: 活着的从全体里抽, 死了的只从活着的里抽
    const std::vector<int> any_compas = sampler_.sample(n, rng);
    const std::vector<int> alive_compas = sampler_.sample_alive(alive, rng);

    std::uniform_real_distribution<double> coin(0.0, 1.0);
    for (int i = 0; i < n; ++i) {
        const int j = alive[i] ? any_compas[i] : alive_compas[i];
        decision.candidates[i] = j;

        // 2. 克隆概率, 死亡 walker 强制为 1
        const double p = alive[i] ? clone_probability(virtual_rewards[i], virtual_rewards[j]) : 1.0;
        decision.probabilities[i] = p;

        // 3. 每个 walker 都掷一次, 保证随机序列不依赖于结果
        const double r = coin(rng);
        if (i == best_index || j == i) continue;
        if (r < p) {
            decision.will_clone[i] = true;
            ++decision.n_clones;
        }
    }
    return decision;
}

void CloningOperator::apply(const CloneDecision& decision, StateBuffer& buffer) const {
    if (static_cast<int>(decision.will_clone.size()) != buffer.size()) {
        throw std::invalid_argument("CloningOperator::apply: decision size does not match buffer");
    }
    std::vector<int> dst;
    std::vector<int> src;
    dst.reserve(decision.n_clones);
    src.reserve(decision.n_clones);
    for (int i = 0; i < buffer.size(); ++i) {
        if (!decision.will_clone[i]) continue;
        dst.push_back(i);
        src.push_back(decision.candidates[i]);
    }
    if (!dst.empty()) buffer.clone(dst, src);
}
