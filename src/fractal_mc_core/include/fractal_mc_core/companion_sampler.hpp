#ifndef FRACTAL_MC_CORE__COMPANION_SAMPLER_HPP_
#define FRACTAL_MC_CORE__COMPANION_SAMPLER_HPP_

#include <random>
#include <vector>

// 给每个 walker 随机配一个同伴
// 不是排列: 同一个 walker 可以同时是很多人的同伴
class CompanionSampler {
public:
    // companion[i] 在 {0..n-1} \ {i} 上均匀; n == 1 时只能配给自己
    std::vector<int> sample(int n, std::mt19937& rng) const;

    // 只从活着的 walker 里选 (死亡 walker 复活用)
    // 没有其他活着的 walker 时配给自己
    std::vector<int> sample_alive(const std::vector<bool>& alive, std::mt19937& rng) const;
};

#endif
