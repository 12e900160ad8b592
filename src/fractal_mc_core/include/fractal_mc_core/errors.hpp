#ifndef FRACTAL_MC_CORE__ERRORS_HPP_
#define FRACTAL_MC_CORE__ERRORS_HPP_

#include <stdexcept>
#include <string>

// 构造阶段的参数错误 (N < 1, 负的指数, 空的距离函数 ...)
// 在任何 step 执行之前抛出
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
    : std::invalid_argument("configuration error: " + what) {}
};

// Environment / Model 返回的 batch 尺寸或形状不对
// 不做任何恢复，直接抛给 step() / run() 的调用者
class CollaboratorContractError : public std::runtime_error {
public:
    explicit CollaboratorContractError(const std::string& what)
    : std::runtime_error("collaborator contract error: " + what) {}
};

#endif
