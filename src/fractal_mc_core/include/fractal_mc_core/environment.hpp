#ifndef FRACTAL_MC_CORE__ENVIRONMENT_HPP_
#define FRACTAL_MC_CORE__ENVIRONMENT_HPP_

#include <string>
#include <vector>

// Environment 一次推进整个 batch 的结果 (长度都是 N)
struct StepBatch {
    std::vector<std::vector<double>> states;
    std::vector<std::vector<double>> observations;
    std::vector<double> rewards;
    std::vector<bool> terminals;
};

// 外部协作者: 状态转移函数
// 对 Swarm 来说是纯函数, 自己的并行/多进程由实现负责
class Environment {
public:
    virtual ~Environment() = default;

    virtual StepBatch step(const std::vector<std::vector<double>>& states,
                           const std::vector<std::vector<double>>& actions) = 0;

    virtual std::string name() const { return "environment"; }
};

#endif
