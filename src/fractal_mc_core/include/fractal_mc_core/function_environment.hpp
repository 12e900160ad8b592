#ifndef FRACTAL_MC_CORE__FUNCTION_ENVIRONMENT_HPP_
#define FRACTAL_MC_CORE__FUNCTION_ENVIRONMENT_HPP_

#include <string>
#include <vector>

#include "fractal_mc_core/benchmark_functions.hpp"
#include "fractal_mc_core/environment.hpp"

// 把函数最小化问题包装成 Environment
// state = 点, action = 位移, reward = -f(state + action)
// 走出 [lower, upper] 盒子的 walker 直接死亡
// 配合 SwarmConfig::accumulate_rewards = false 使用
class FunctionEnvironment : public Environment {
public:
    FunctionEnvironment(ObjectiveFunction objective, std::vector<double> lower, std::vector<double> upper,
                        std::string name = "function");

    // 所有维度用同一个区间
    FunctionEnvironment(ObjectiveFunction objective, int dim, double lower, double upper,
                        std::string name = "function");

    StepBatch step(const std::vector<std::vector<double>>& states,
                   const std::vector<std::vector<double>>& actions) override;

    std::string name() const override { return name_; }
    int dim() const { return static_cast<int>(lower_.size()); }
    bool in_bounds(const std::vector<double>& x) const;

    // 盒子的中心, 作为 Swarm 的初始状态
    std::vector<double> center() const;

private:
    ObjectiveFunction objective_;
    std::vector<double> lower_;
    std::vector<double> upper_;
    std::string name_;
};

#endif
