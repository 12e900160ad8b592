#ifndef FRACTAL_MC_CORE__CONVERGENCE_HPP_
#define FRACTAL_MC_CORE__CONVERGENCE_HPP_

#include <functional>
#include <string>

#include "fractal_mc_core/distance_function.hpp"
#include "fractal_mc_core/state_buffer.hpp"

// 可选的停止条件, 每步克隆之后检查
class ConvergencePredicate {
public:
    virtual ~ConvergencePredicate() = default;

    virtual bool converged(const StateBuffer& walkers, const DistanceFunction& distance) const = 0;
    virtual std::string name() const = 0;
};

// 全部存活, 且每个 walker 到 walker 0 的距离都不超过 tolerance
class ClusteredConvergence : public ConvergencePredicate {
public:
    explicit ClusteredConvergence(double tolerance);

    bool converged(const StateBuffer& walkers, const DistanceFunction& distance) const override;
    std::string name() const override { return "clustered"; }

private:
    double tolerance_;
};

class AllDeadConvergence : public ConvergencePredicate {
public:
    bool converged(const StateBuffer& walkers, const DistanceFunction& distance) const override;
    std::string name() const override { return "all_dead"; }
};

class CustomConvergence : public ConvergencePredicate {
public:
    using Predicate = std::function<bool(const StateBuffer&, const DistanceFunction&)>;

    CustomConvergence(Predicate predicate, std::string name = "custom");

    bool converged(const StateBuffer& walkers, const DistanceFunction& distance) const override;
    std::string name() const override { return name_; }

private:
    Predicate predicate_;
    std::string name_;
};

#endif
