#ifndef FRACTAL_MC_CORE__SWARM_HPP_
#define FRACTAL_MC_CORE__SWARM_HPP_

#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "fractal_mc_core/cloning_operator.hpp"
#include "fractal_mc_core/companion_sampler.hpp"
#include "fractal_mc_core/convergence.hpp"
#include "fractal_mc_core/distance_function.hpp"
#include "fractal_mc_core/environment.hpp"
#include "fractal_mc_core/model.hpp"
#include "fractal_mc_core/state_buffer.hpp"
#include "fractal_mc_core/virtual_reward.hpp"

// 严格状态机
enum class SwarmStatus {
    INITIALIZED,
    RUNNING,
    CONVERGED,
    BUDGET_EXHAUSTED
};

std::string to_string(SwarmStatus status);

struct SwarmConfig {
    int n_walkers = 64;
    int max_steps = 500;
    double reward_scale = 1.0;    // 利用
    double distance_scale = 1.0;  // 探索
    double epsilon = 1e-8;
    std::uint32_t seed = 0;
    bool accumulate_rewards = true;

    std::shared_ptr<const DistanceFunction> distance_function = std::make_shared<EuclideanDistance>();
    std::shared_ptr<const ConvergencePredicate> convergence_predicate;  // 可以为空
};

// 配置不合法时抛 ConfigurationError
void validate_config(const SwarmConfig& config);

// 整个 run 里见过的最好的 walker (只看存活的)
// 第一步之前 cumulative_reward 为 lowest()
struct BestWalker {
    std::vector<double> state;
    std::vector<double> observation;
    double cumulative_reward = std::numeric_limits<double>::lowest();
    int step_found = 0;
};

// 每步之后给外部 (日志/可视化) 的只读视图
struct SwarmSnapshot {
    int step;
    SwarmStatus status;
    const StateBuffer& walkers;
    const std::vector<int>& companions;
    const VirtualRewardResult& virtual_rewards;
    const CloneDecision& clones;
    const BestWalker& best;
};

class Swarm {
public:
    using StepCallback = std::function<void(const SwarmSnapshot&)>;

    // env 和 model 由调用者持有, 生命周期必须覆盖整个 Swarm
    Swarm(SwarmConfig config, Environment& env, Model& model);

    void reset(const std::vector<double>& initial_state);
    void reset(const std::vector<double>& initial_state,
               const std::vector<double>& initial_observation);

    // act -> evaluate -> virtual reward -> clone, 返回新的状态
    // 协作方违约时抛 CollaboratorContractError, walker 和最优解保持上一步的值
    SwarmStatus step();

    // reset 之后一直 step 到终止
    BestWalker run(const std::vector<double>& initial_state);
    BestWalker run(const std::vector<double>& initial_state,
                   const std::vector<double>& initial_observation);

    void set_step_callback(StepCallback callback) { callback_ = std::move(callback); }

    SwarmStatus status() const { return status_; }
    bool is_terminal() const;
    int current_step() const { return step_; }
    const SwarmConfig& config() const { return config_; }
    const StateBuffer& walkers() const { return buffer_; }
    const std::vector<int>& companions() const { return companions_; }
    const VirtualRewardResult& virtual_rewards() const { return vr_; }
    const CloneDecision& last_clones() const { return clones_; }
    const BestWalker& best() const { return best_; }
    int best_walker_index() const { return best_index_; }

private:
    void check_actions(const std::vector<std::vector<double>>& actions) const;
    void check_step_batch(const StepBatch& batch) const;
    void update_best();
    void notify();

    SwarmConfig config_;
    Environment& env_;
    Model& model_;

    StateBuffer buffer_;
    CompanionSampler sampler_;
    VirtualRewardCalculator vr_calculator_;
    CloningOperator cloning_;
    std::mt19937 rng_;

    SwarmStatus status_;
    int step_;
    int best_index_;
    BestWalker best_;
    std::vector<int> companions_;
    VirtualRewardResult vr_;
    CloneDecision clones_;
    StepCallback callback_;
};

#endif
