#ifndef FRACTAL_MC_CORE__STATE_BUFFER_HPP_
#define FRACTAL_MC_CORE__STATE_BUFFER_HPP_

#include <vector>

// 所有 walker 的数据，按列存放 (struct-of-arrays)
// 第 i 行 = 第 i 个 walker: state / observation / cumulative_reward / alive
class StateBuffer {
public:
    // accumulate_rewards = false 时 update 直接覆盖奖励 (函数优化模式)
    explicit StateBuffer(int n_walkers, bool accumulate_rewards = true);

    // 所有槽位填成同一个初始状态，奖励清零，全部存活
    void reset(const std::vector<double>& initial_state);
    void reset(const std::vector<double>& initial_state,
               const std::vector<double>& initial_observation);

    // 覆盖 indices 指定的行，奖励累加到 cumulative_reward
    void update(const std::vector<int>& indices,
                const std::vector<std::vector<double>>& states,
                const std::vector<std::vector<double>>& observations,
                const std::vector<double>& rewards,
                const std::vector<bool>& alive_flags);

    // 整个种群一次性更新 (行 0..N-1)
    void update(const std::vector<std::vector<double>>& states,
                const std::vector<std::vector<double>>& observations,
                const std::vector<double>& rewards,
                const std::vector<bool>& alive_flags);

    // src[k] -> dst[k]，所有字段整行复制
    // 先对源行拍快照再写入，同一批里不会出现链式克隆
    void clone(const std::vector<int>& dst_indices, const std::vector<int>& src_indices);

    int size() const { return n_walkers_; }
    int state_dim() const { return state_dim_; }
    int observation_dim() const { return observation_dim_; }
    bool accumulates_rewards() const { return accumulate_rewards_; }

    const std::vector<double>& state(int i) const;
    const std::vector<double>& observation(int i) const;
    double cumulative_reward(int i) const;
    bool alive(int i) const;

    const std::vector<std::vector<double>>& states() const { return states_; }
    const std::vector<std::vector<double>>& observations() const { return observations_; }
    const std::vector<double>& cumulative_rewards() const { return cumulative_rewards_; }
    const std::vector<bool>& alive_flags() const { return alive_; }

    int n_alive() const;
    std::vector<int> alive_indices() const;

private:
    void check_index(int i) const;
    void check_row(const std::vector<double>& row, int expected_dim, const char* what) const;

    int n_walkers_;
    int state_dim_;
    int observation_dim_;
    bool accumulate_rewards_;

    std::vector<std::vector<double>> states_;
    std::vector<std::vector<double>> observations_;
    std::vector<double> cumulative_rewards_;
    std::vector<bool> alive_;
};

#endif
