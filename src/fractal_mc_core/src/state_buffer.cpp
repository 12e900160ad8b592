#include "fractal_mc_core/state_buffer.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

StateBuffer::StateBuffer(int n_walkers, bool accumulate_rewards)
: n_walkers_(n_walkers), state_dim_(0), observation_dim_(0),
  accumulate_rewards_(accumulate_rewards)
{
    if (n_walkers_ < 1) {
        throw std::invalid_argument("StateBuffer needs at least one walker, got " +
                                    std::to_string(n_walkers_));
    }
    // 只分配一次，之后整个 run 都是原地修改
    states_.resize(n_walkers_);
    observations_.resize(n_walkers_);
    cumulative_rewards_.assign(n_walkers_, 0.0);
    alive_.assign(n_walkers_, true);
}

void StateBuffer::reset(const std::vector<double>& initial_state) {
    reset(initial_state, initial_state);
}

void StateBuffer::reset(const std::vector<double>& initial_state,
                        const std::vector<double>& initial_observation) {
    if (initial_state.empty()) {
        throw std::invalid_argument("initial state must not be empty");
    }
    state_dim_ = static_cast<int>(initial_state.size());
    observation_dim_ = static_cast<int>(initial_observation.size());

    std::fill(states_.begin(), states_.end(), initial_state);
    std::fill(observations_.begin(), observations_.end(), initial_observation);
    std::fill(cumulative_rewards_.begin(), cumulative_rewards_.end(), 0.0);
    std::fill(alive_.begin(), alive_.end(), true);
}

void StateBuffer::update(const std::vector<int>& indices,
                         const std::vector<std::vector<double>>& states,
                         const std::vector<std::vector<double>>& observations,
                         const std::vector<double>& rewards,
                         const std::vector<bool>& alive_flags) {
    const size_t n = indices.size();
    if (states.size() != n || observations.size() != n ||
        rewards.size() != n || alive_flags.size() != n) {
        throw std::invalid_argument("StateBuffer::update: batch columns have different lengths");
    }

    // 1. 先整体检查，避免只写了一半就抛异常
    for (size_t k = 0; k < n; ++k) {
        check_index(indices[k]);
        check_row(states[k], state_dim_, "state");
        check_row(observations[k], observation_dim_, "observation");
    }

    // 2. 写入
    for (size_t k = 0; k < n; ++k) {
        const int i = indices[k];
        states_[i] = states[k];
        observations_[i] = observations[k];
        if (accumulate_rewards_) {
            cumulative_rewards_[i] += rewards[k];
        } else {
            cumulative_rewards_[i] = rewards[k];
        }
        alive_[i] = alive_flags[k];
    }
}

void StateBuffer::update(const std::vector<std::vector<double>>& states,
                         const std::vector<std::vector<double>>& observations,
                         const std::vector<double>& rewards,
                         const std::vector<bool>& alive_flags) {
    std::vector<int> indices(n_walkers_);
    for (int i = 0; i < n_walkers_; ++i) indices[i] = i;
    update(indices, states, observations, rewards, alive_flags);
}

void StateBuffer::clone(const std::vector<int>& dst_indices, const std::vector<int>& src_indices) {
    if (dst_indices.size() != src_indices.size()) {
        throw std::invalid_argument("StateBuffer::clone: dst and src lists differ in length");
    }
    for (size_t k = 0; k < dst_indices.size(); ++k) {
        check_index(dst_indices[k]);
        check_index(src_indices[k]);
    }

    // 快照: 所有源行在任何写入之前复制出来
    const size_t n = src_indices.size();
    std::vector<std::vector<double>> src_states(n);
    std::vector<std::vector<double>> src_observations(n);
    std::vector<double> src_rewards(n);
    std::vector<bool> src_alive(n);
    for (size_t k = 0; k < n; ++k) {
        const int s = src_indices[k];
        src_states[k] = states_[s];
        src_observations[k] = observations_[s];
        src_rewards[k] = cumulative_rewards_[s];
        src_alive[k] = alive_[s];
    }

    for (size_t k = 0; k < n; ++k) {
        const int d = dst_indices[k];
        states_[d] = std::move(src_states[k]);
        observations_[d] = std::move(src_observations[k]);
        cumulative_rewards_[d] = src_rewards[k];
        alive_[d] = src_alive[k];
    }
}

const std::vector<double>& StateBuffer::state(int i) const {
    check_index(i);
    return states_[i];
}

const std::vector<double>& StateBuffer::observation(int i) const {
    check_index(i);
    return observations_[i];
}

double StateBuffer::cumulative_reward(int i) const {
    check_index(i);
    return cumulative_rewards_[i];
}

bool StateBuffer::alive(int i) const {
    check_index(i);
    return alive_[i];
}

int StateBuffer::n_alive() const {
    return static_cast<int>(std::count(alive_.begin(), alive_.end(), true));
}

std::vector<int> StateBuffer::alive_indices() const {
    std::vector<int> out;
    out.reserve(n_walkers_);
    for (int i = 0; i < n_walkers_; ++i) {
        if (alive_[i]) out.push_back(i);
    }
    return out;
}

void StateBuffer::check_index(int i) const {
    if (i < 0 || i >= n_walkers_) {
        throw std::out_of_range("walker index " + std::to_string(i) +
                                " out of range [0, " + std::to_string(n_walkers_) + ")");
    }
}

void StateBuffer::check_row(const std::vector<double>& row, int expected_dim, const char* what) const {
    if (static_cast<int>(row.size()) != expected_dim) {
        throw std::invalid_argument(std::string("StateBuffer: ") + what + " has dimension " +
                                    std::to_string(row.size()) + ", expected " +
                                    std::to_string(expected_dim));
    }
}
