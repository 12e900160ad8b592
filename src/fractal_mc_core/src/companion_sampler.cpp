#include "fractal_mc_core/companion_sampler.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

std::vector<int> CompanionSampler::sample(int n, std::mt19937& rng) const {
    if (n < 1) {
        throw std::invalid_argument("cannot sample companions for " + std::to_string(n) + " walkers");
    }
    std::vector<int> companions(n, 0);
    if (n == 1) return companions;

    // 在 n-1 个位置里抽，跳过自己，不需要拒绝采样
    std::uniform_int_distribution<int> dist(0, n - 2);
    for (int i = 0; i < n; ++i) {
        const int k = dist(rng);
        companions[i] = (k >= i) ? k + 1 : k;
    }
    return companions;
}

std::vector<int> CompanionSampler::sample_alive(const std::vector<bool>& alive, std::mt19937& rng) const {
    const int n = static_cast<int>(alive.size());
    std::vector<int> living;
    living.reserve(n);
    for (int i = 0; i < n; ++i) {
        if (alive[i]) living.push_back(i);
    }

    std::vector<int> companions(n);
    for (int i = 0; i < n; ++i) companions[i] = i;
    if (living.empty()) return companions;

    const int m = static_cast<int>(living.size());
    for (int i = 0; i < n; ++i) {
        if (!alive[i]) {
            std::uniform_int_distribution<int> dist(0, m - 1);
            companions[i] = living[dist(rng)];
        } else if (m > 1) {
            // 自己也在 living 里，抽 m-1 个位置再跳过自己
            std::uniform_int_distribution<int> dist(0, m - 2);
            const int k = dist(rng);
            const int self_pos = static_cast<int>(
                std::lower_bound(living.begin(), living.end(), i) - living.begin());
            companions[i] = living[(k >= self_pos) ? k + 1 : k];
        }
    }
    return companions;
}
