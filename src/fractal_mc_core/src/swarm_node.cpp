#include "fractal_mc_core/swarm_node.hpp"
#include "fractal_mc_core/errors.hpp"
#include <algorithm>
#include <random>
#include <vector>

SwarmNode::SwarmNode()
: Node("swarm_node"), state_(NodeState::INIT)
{
  // 1. 参数声明
  this->declare_parameter("swarm_id", "Swarm_Alpha");
  this->declare_parameter("n_walkers", 64);
  this->declare_parameter("max_steps", 500);
  this->declare_parameter("reward_scale", 1.0);
  this->declare_parameter("distance_scale", 1.0);
  this->declare_parameter("epsilon", 1e-8);
  this->declare_parameter("seed", -1);
  this->declare_parameter("distance_function", "euclidean");
  this->declare_parameter("hamming_tolerance", 0.0);
  this->declare_parameter("convergence", "none");
  this->declare_parameter("convergence_tolerance", 1e-3);
  this->declare_parameter("timer_period_ms", 10);
  this->declare_parameter("steps_per_tick", 10);
  this->declare_parameter("publish_snapshots", true);
  this->declare_parameter("log_every", 50);
  // 问题参数
  this->declare_parameter("function_name", "Rastrigin");
  this->declare_parameter("gene_dim", 2);
  this->declare_parameter("lower_bound", -5.12);
  this->declare_parameter("upper_bound", 5.12);
  this->declare_parameter("rastrigin_A", 10.0);
  this->declare_parameter("michalewicz_m", 10);
  // 模型参数
  this->declare_parameter("model", "gaussian");
  this->declare_parameter("step_scale", 0.5);

  // 2. 参数读取
  swarm_id_ = this->get_parameter("swarm_id").as_string();
  steps_per_tick_ = std::max<int>(1, this->get_parameter("steps_per_tick").as_int());
  publish_snapshots_ = this->get_parameter("publish_snapshots").as_bool();
  log_every_ = static_cast<int>(this->get_parameter("log_every").as_int());

  // 3. 通信初始化
  auto qos = rclcpp::QoS(rclcpp::KeepLast(10)).reliable();
  snapshot_pub_ = this->create_publisher<fractal_mc_core::msg::SwarmSnapshot>("swarm_snapshots", qos);

  try {
    init_swarm();
  } catch (const ConfigurationError& e) {
    RCLCPP_ERROR(this->get_logger(), "%s: %s", swarm_id_.c_str(), e.what());
    state_ = NodeState::FINISHED;
    return;
  }

  int timer_ms = this->get_parameter("timer_period_ms").as_int();
  timer_ = this->create_wall_timer(std::chrono::milliseconds(timer_ms), std::bind(&SwarmNode::state_machine_callback, this));
}

void SwarmNode::state_machine_callback() {
    if (!swarm_ || state_ == NodeState::FINISHED) return;

    if (state_ == NodeState::INIT) {
        swarm_->reset(env_->center());
        state_ = NodeState::RUNNING;
        return;
    }

    try {
        for (int k = 0; k < steps_per_tick_ && !swarm_->is_terminal(); ++k) {
            swarm_->step();
            if (log_every_ > 0 && swarm_->current_step() % log_every_ == 0) {
                RCLCPP_INFO(this->get_logger(), "%s step %d: alive=%d clones=%d best=%.6f",
                            swarm_id_.c_str(), swarm_->current_step(), swarm_->walkers().n_alive(),
                            swarm_->last_clones().n_clones, swarm_->best().cumulative_reward);
            }
        }
    } catch (const CollaboratorContractError& e) {
        RCLCPP_ERROR(this->get_logger(), "%s: %s", swarm_id_.c_str(), e.what());
        finish("contract error");
        return;
    }

    if (publish_snapshots_) publish_snapshot();

    if (swarm_->is_terminal()) {
        finish(to_string(swarm_->status()));
    }
}

void SwarmNode::finish(const std::string& reason) {
    state_ = NodeState::FINISHED;
    if (timer_) timer_->cancel();
    RCLCPP_INFO(this->get_logger(),
    "🏁 %s finished (%s) after %d steps, best reward %.6f",
    swarm_id_.c_str(),
    reason.c_str(),
    swarm_->current_step(),
    swarm_->best().cumulative_reward);
}

void SwarmNode::publish_snapshot() {
    auto msg = fractal_mc_core::msg::SwarmSnapshot();
    msg.swarm_id = swarm_id_;
    msg.step = swarm_->current_step();
    msg.status = to_string(swarm_->status());
    msg.n_alive = swarm_->walkers().n_alive();
    msg.n_clones = swarm_->last_clones().n_clones;

    const StateBuffer& walkers = swarm_->walkers();
    const std::vector<double>& vr = swarm_->virtual_rewards().virtual_rewards;
    const CloneDecision& clones = swarm_->last_clones();
    for (int i = 0; i < walkers.size(); ++i) {
        auto w = fractal_mc_core::msg::Walker();
        w.state = walkers.state(i);
        w.observation = walkers.observation(i);
        w.cumulative_reward = walkers.cumulative_reward(i);
        w.virtual_reward = i < static_cast<int>(vr.size()) ? vr[i] : 0.0;
        w.companion = swarm_->companions()[i];
        w.cloned = i < static_cast<int>(clones.will_clone.size()) && clones.will_clone[i];
        w.clone_source = w.cloned ? clones.candidates[i] : i;
        w.alive = walkers.alive(i);
        msg.walkers.push_back(w);
    }

    const BestWalker& best = swarm_->best();
    msg.best_state = best.state;
    msg.best_reward = best.cumulative_reward;
    msg.best_step = best.step_found;
    snapshot_pub_->publish(msg);
}

void SwarmNode::init_swarm() {
    const int gene_dim = this->get_parameter("gene_dim").as_int();

    // 1. 目标函数 + 环境
    BenchmarkParams bp;
    bp.rastrigin_A = this->get_parameter("rastrigin_A").as_double();
    bp.michalewicz_m = this->get_parameter("michalewicz_m").as_int();
    const std::string func_name = this->get_parameter("function_name").as_string();
    env_ = std::make_unique<FunctionEnvironment>(make_benchmark(func_name, bp), gene_dim,
        this->get_parameter("lower_bound").as_double(), this->get_parameter("upper_bound").as_double(),
        normalize_key(func_name));

    // 2. 随机种子, -1 表示用 random_device
    SwarmConfig config;
    const int64_t seed = this->get_parameter("seed").as_int();
    if (seed < 0) {
        std::random_device rd;
        config.seed = rd();
    } else {
        config.seed = static_cast<std::uint32_t>(seed);
    }

    // 3. 模型
    const double step_scale = this->get_parameter("step_scale").as_double();
    const std::string model_key = normalize_key(this->get_parameter("model").as_string());
    if (model_key == "randomstep") {
        model_ = std::make_unique<RandomStepModel>(step_scale, config.seed + 1);
    } else if (model_key == "gaussian") {
        model_ = std::make_unique<GaussianModel>(step_scale, config.seed + 1);
    } else {
        throw ConfigurationError("unknown model '" + model_key + "'");
    }

    // 4. Swarm 配置
    config.n_walkers = this->get_parameter("n_walkers").as_int();
    config.max_steps = this->get_parameter("max_steps").as_int();
    config.reward_scale = this->get_parameter("reward_scale").as_double();
    config.distance_scale = this->get_parameter("distance_scale").as_double();
    config.epsilon = this->get_parameter("epsilon").as_double();
    // 函数优化: 分数就是当前点的 -f(x), 不累加
    config.accumulate_rewards = false;

    const std::string dist_key = normalize_key(this->get_parameter("distance_function").as_string());
    if (dist_key == "euclidean") {
        config.distance_function = std::make_shared<EuclideanDistance>();
    } else if (dist_key == "manhattan") {
        config.distance_function = std::make_shared<ManhattanDistance>();
    } else if (dist_key == "hamming") {
        config.distance_function = std::make_shared<HammingDistance>(
            this->get_parameter("hamming_tolerance").as_double());
    } else {
        throw ConfigurationError("unknown distance function '" + dist_key + "'");
    }

    const std::string conv_key = normalize_key(this->get_parameter("convergence").as_string());
    if (conv_key == "clustered") {
        config.convergence_predicate = std::make_shared<ClusteredConvergence>(
            this->get_parameter("convergence_tolerance").as_double());
    } else if (conv_key == "alldead") {
        config.convergence_predicate = std::make_shared<AllDeadConvergence>();
    } else if (conv_key != "none") {
        throw ConfigurationError("unknown convergence predicate '" + conv_key + "'");
    }

    swarm_ = std::make_unique<Swarm>(config, *env_, *model_);

    RCLCPP_INFO(this->get_logger(),
    "%s: %s on %s (dim=%d), n_walkers=%d max_steps=%d reward_scale=%.3f distance_scale=%.3f seed=%u",
    swarm_id_.c_str(), model_->name().c_str(), env_->name().c_str(), gene_dim,
    config.n_walkers, config.max_steps, config.reward_scale, config.distance_scale, config.seed);
}

int main(int argc, char **argv) {
  rclcpp::init(argc, argv);
  rclcpp::spin(std::make_shared<SwarmNode>());
  rclcpp::shutdown();
  return 0;
}
