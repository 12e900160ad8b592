#ifndef FRACTAL_MC_CORE__SWARM_NODE_HPP_
#define FRACTAL_MC_CORE__SWARM_NODE_HPP_

#include "rclcpp/rclcpp.hpp"
#include <string>
#include <memory>

#include "fractal_mc_core/msg/swarm_snapshot.hpp"
#include "fractal_mc_core/function_environment.hpp"
#include "fractal_mc_core/random_models.hpp"
#include "fractal_mc_core/swarm.hpp"

// 节点状态机
enum class NodeState {
    INIT,       // 等待第一次 tick, 做 reset
    RUNNING,    // 每次 tick 跑 steps_per_tick 步
    FINISHED    // Swarm 已终止或出错, 不再计算
};

class SwarmNode : public rclcpp::Node
{
public:
  SwarmNode();

private:
  // 核心循环
  void state_machine_callback();

  void init_swarm();
  void publish_snapshot();
  void finish(const std::string& reason);

  std::string swarm_id_;
  int steps_per_tick_;
  bool publish_snapshots_;
  int log_every_;

  NodeState state_;

  // ROS 组件
  rclcpp::Publisher<fractal_mc_core::msg::SwarmSnapshot>::SharedPtr snapshot_pub_;
  rclcpp::TimerBase::SharedPtr timer_;

  // env / model 必须比 swarm 活得久
  std::unique_ptr<FunctionEnvironment> env_;
  std::unique_ptr<Model> model_;
  std::unique_ptr<Swarm> swarm_;
};

#endif
