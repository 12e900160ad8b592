#ifndef FRACTAL_MC_CORE__MODEL_HPP_
#define FRACTAL_MC_CORE__MODEL_HPP_

#include <string>
#include <vector>

// 外部协作者: 策略, 给一批状态提出一批动作
class Model {
public:
    virtual ~Model() = default;

    virtual std::vector<std::vector<double>> propose(const std::vector<std::vector<double>>& states) = 0;

    // Swarm::reset() 时调用, 有随机数的模型在这里重新播种
    virtual void reset() {}

    virtual std::string name() const { return "model"; }
};

#endif
