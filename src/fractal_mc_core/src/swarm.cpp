#include "fractal_mc_core/swarm.hpp"
#include "fractal_mc_core/errors.hpp"
#include "rclcpp/logging.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace {

rclcpp::Logger logger() {
    return rclcpp::get_logger("fractal_mc_core");
}

SwarmConfig checked(SwarmConfig config) {
    validate_config(config);
    return config;
}

}  // namespace

std::string to_string(SwarmStatus status) {
    switch (status) {
        case SwarmStatus::INITIALIZED: return "INITIALIZED";
        case SwarmStatus::RUNNING: return "RUNNING";
        case SwarmStatus::CONVERGED: return "CONVERGED";
        case SwarmStatus::BUDGET_EXHAUSTED: return "BUDGET_EXHAUSTED";
    }
    return "UNKNOWN";
}

void validate_config(const SwarmConfig& config) {
    if (config.n_walkers < 1) {
        throw ConfigurationError("n_walkers must be >= 1, got " + std::to_string(config.n_walkers));
    }
    if (config.max_steps < 1) {
        throw ConfigurationError("max_steps must be >= 1, got " + std::to_string(config.max_steps));
    }
    if (!std::isfinite(config.reward_scale) || config.reward_scale < 0.0) {
        throw ConfigurationError("reward_scale must be a finite value >= 0");
    }
    if (!std::isfinite(config.distance_scale) || config.distance_scale < 0.0) {
        throw ConfigurationError("distance_scale must be a finite value >= 0");
    }
    if (!std::isfinite(config.epsilon) || config.epsilon <= 0.0) {
        throw ConfigurationError("epsilon must be a finite value > 0");
    }
    if (!config.distance_function) {
        throw ConfigurationError("distance_function must not be null");
    }
}

Swarm::Swarm(SwarmConfig config, Environment& env, Model& model)
: config_(checked(std::move(config))), env_(env), model_(model),
  buffer_(config_.n_walkers, config_.accumulate_rewards),
  vr_calculator_(config_.reward_scale, config_.distance_scale),
  cloning_(config_.epsilon),
  rng_(config_.seed),
  status_(SwarmStatus::INITIALIZED), step_(0), best_index_(-1)
{
}

void Swarm::reset(const std::vector<double>& initial_state) {
    reset(initial_state, initial_state);
}

void Swarm::reset(const std::vector<double>& initial_state,
                  const std::vector<double>& initial_observation) {
    if (initial_state.empty()) {
        throw ConfigurationError("initial state must not be empty");
    }
    buffer_.reset(initial_state, initial_observation);
    rng_.seed(config_.seed);
    model_.reset();

    status_ = SwarmStatus::INITIALIZED;
    step_ = 0;
    best_index_ = 0;
    best_.state = initial_state;
    best_.observation = initial_observation;
    // 初始状态没有被环境评估过, 第一步之后才有真正的最优
    best_.cumulative_reward = std::numeric_limits<double>::lowest();
    best_.step_found = 0;

    const int n = config_.n_walkers;
    companions_.assign(n, 0);
    for (int i = 0; i < n; ++i) companions_[i] = i;
    vr_ = VirtualRewardResult();
    clones_ = CloneDecision();

    notify();
}

bool Swarm::is_terminal() const {
    return status_ == SwarmStatus::CONVERGED || status_ == SwarmStatus::BUDGET_EXHAUSTED;
}

SwarmStatus Swarm::step() {
    if (is_terminal()) return status_;
    if (buffer_.state_dim() == 0) {
        throw std::logic_error("Swarm::step() called before reset()");
    }
    status_ = SwarmStatus::RUNNING;
    const int n = config_.n_walkers;

    // 1. 策略给动作, 环境推进
    const std::vector<std::vector<double>> actions = model_.propose(buffer_.states());
    check_actions(actions);
    StepBatch batch = env_.step(buffer_.states(), actions);
    check_step_batch(batch);

    // 2. 先在副本上更新并算虚拟奖励, 全部成功后再提交
    //    距离函数抛异常时 buffer / best / 随机数都保持上一步的样子
    std::vector<bool> alive(n);
    for (int i = 0; i < n; ++i) alive[i] = !batch.terminals[i];
    StateBuffer next = buffer_;
    next.update(batch.states, batch.observations, batch.rewards, alive);

    std::mt19937 rng = rng_;
    std::vector<int> companions = sampler_.sample(n, rng);
    VirtualRewardResult vr = vr_calculator_.compute(next.cumulative_rewards(), next.observations(),
                                                    next.alive_flags(), companions,
                                                    *config_.distance_function);

    buffer_ = std::move(next);
    rng_ = rng;
    companions_ = std::move(companions);
    vr_ = std::move(vr);

    // 3. 最优 walker 在克隆之前确定, 克隆时受保护
    update_best();

    const int n_alive = buffer_.n_alive();
    clones_ = CloneDecision();
    if (n_alive == 0) {
        clones_.extinct = true;
        RCLCPP_WARN(logger(), "step %d: all %d walkers are dead, stopping the swarm", step_ + 1, n);
    } else {
        if (vr_.degenerate) {
            RCLCPP_DEBUG(logger(), "step %d: virtual rewards are all equal", step_ + 1);
        }
        // 5. 克隆, N == 1 时完全跳过
        if (n > 1) {
            clones_ = cloning_.decide(vr_.virtual_rewards, buffer_.alive_flags(), best_index_, rng_);
            cloning_.apply(clones_, buffer_);
        }
    }

    ++step_;

    // 6. 状态转移
    if (n_alive == 0) {
        status_ = SwarmStatus::CONVERGED;
    } else if (config_.convergence_predicate &&
               config_.convergence_predicate->converged(buffer_, *config_.distance_function)) {
        status_ = SwarmStatus::CONVERGED;
    } else if (step_ >= config_.max_steps) {
        status_ = SwarmStatus::BUDGET_EXHAUSTED;
    }

    RCLCPP_DEBUG(logger(), "step %d: alive=%d clones=%d best=%f",
                 step_, n_alive, clones_.n_clones, best_.cumulative_reward);

    notify();
    return status_;
}

BestWalker Swarm::run(const std::vector<double>& initial_state) {
    return run(initial_state, initial_state);
}

BestWalker Swarm::run(const std::vector<double>& initial_state,
                      const std::vector<double>& initial_observation) {
    reset(initial_state, initial_observation);
    while (!is_terminal()) step();
    return best_;
}

void Swarm::check_actions(const std::vector<std::vector<double>>& actions) const {
    if (static_cast<int>(actions.size()) != config_.n_walkers) {
        throw CollaboratorContractError("model '" + model_.name() + "' returned " +
                                        std::to_string(actions.size()) + " actions for " +
                                        std::to_string(config_.n_walkers) + " walkers");
    }
}

void Swarm::check_step_batch(const StepBatch& batch) const {
    const size_t n = static_cast<size_t>(config_.n_walkers);
    const std::string who = "environment '" + env_.name() + "'";
    if (batch.states.size() != n || batch.observations.size() != n ||
        batch.rewards.size() != n || batch.terminals.size() != n) {
        throw CollaboratorContractError(who + " returned a batch of the wrong size (states=" +
                                        std::to_string(batch.states.size()) + ", observations=" +
                                        std::to_string(batch.observations.size()) + ", rewards=" +
                                        std::to_string(batch.rewards.size()) + ", terminals=" +
                                        std::to_string(batch.terminals.size()) + ", expected " +
                                        std::to_string(n) + ")");
    }
    for (size_t i = 0; i < n; ++i) {
        if (static_cast<int>(batch.states[i].size()) != buffer_.state_dim()) {
            throw CollaboratorContractError(who + " returned a state of dimension " +
                                            std::to_string(batch.states[i].size()) + " for walker " +
                                            std::to_string(i));
        }
        if (static_cast<int>(batch.observations[i].size()) != buffer_.observation_dim()) {
            throw CollaboratorContractError(who + " returned an observation of dimension " +
                                            std::to_string(batch.observations[i].size()) +
                                            " for walker " + std::to_string(i));
        }
        if (!std::isfinite(batch.rewards[i])) {
            throw CollaboratorContractError(who + " returned a non-finite reward for walker " +
                                            std::to_string(i));
        }
    }
}

void Swarm::update_best() {
    best_index_ = -1;
    for (int i = 0; i < buffer_.size(); ++i) {
        if (!buffer_.alive(i)) continue;
        if (best_index_ < 0 || buffer_.cumulative_reward(i) > buffer_.cumulative_reward(best_index_)) {
            best_index_ = i;
        }
    }
    if (best_index_ < 0) return;

    // 只在严格更好时替换, 记录值单调不减
    if (buffer_.cumulative_reward(best_index_) > best_.cumulative_reward) {
        best_.state = buffer_.state(best_index_);
        best_.observation = buffer_.observation(best_index_);
        best_.cumulative_reward = buffer_.cumulative_reward(best_index_);
        best_.step_found = step_ + 1;
    }
}

void Swarm::notify() {
    if (!callback_) return;
    SwarmSnapshot snapshot{step_, status_, buffer_, companions_, vr_, clones_, best_};
    callback_(snapshot);
}
