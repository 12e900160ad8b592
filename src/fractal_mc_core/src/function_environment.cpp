#include "fractal_mc_core/function_environment.hpp"
#include "fractal_mc_core/errors.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

FunctionEnvironment::FunctionEnvironment(ObjectiveFunction objective, std::vector<double> lower,
                                         std::vector<double> upper, std::string name)
: objective_(std::move(objective)), lower_(std::move(lower)), upper_(std::move(upper)),
  name_(std::move(name))
{
    if (!objective_) {
        throw ConfigurationError("objective function is empty");
    }
    if (lower_.empty() || lower_.size() != upper_.size()) {
        throw ConfigurationError("bounds must be non-empty and of equal dimension");
    }
    for (size_t k = 0; k < lower_.size(); ++k) {
        if (!(lower_[k] < upper_[k])) {
            throw ConfigurationError("lower bound must be smaller than upper bound in dimension " +
                                     std::to_string(k));
        }
    }
    // 维度不够的目标函数 (比如 1 维的 eggholder) 在这里就报错, 不等到第一步
    try {
        objective_(center());
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError(std::string("objective '") + name_ + "' rejects dimension " +
                                 std::to_string(lower_.size()) + ": " + e.what());
    }
}

FunctionEnvironment::FunctionEnvironment(ObjectiveFunction objective, int dim, double lower, double upper,
                                         std::string name)
: FunctionEnvironment(std::move(objective),
                      std::vector<double>(dim > 0 ? dim : 0, lower),
                      std::vector<double>(dim > 0 ? dim : 0, upper),
                      std::move(name))
{
}

bool FunctionEnvironment::in_bounds(const std::vector<double>& x) const {
    if (x.size() != lower_.size()) return false;
    for (size_t k = 0; k < x.size(); ++k) {
        if (x[k] < lower_[k] || x[k] > upper_[k]) return false;
    }
    return true;
}

std::vector<double> FunctionEnvironment::center() const {
    std::vector<double> c(lower_.size());
    for (size_t k = 0; k < c.size(); ++k) c[k] = 0.5 * (lower_[k] + upper_[k]);
    return c;
}

StepBatch FunctionEnvironment::step(const std::vector<std::vector<double>>& states,
                                    const std::vector<std::vector<double>>& actions) {
    if (states.size() != actions.size()) {
        throw CollaboratorContractError("function environment got " + std::to_string(states.size()) +
                                        " states and " + std::to_string(actions.size()) + " actions");
    }
    const size_t n = states.size();
    StepBatch batch;
    batch.states.resize(n);
    batch.observations.resize(n);
    batch.rewards.assign(n, 0.0);
    batch.terminals.assign(n, false);

    for (size_t i = 0; i < n; ++i) {
        if (states[i].size() != lower_.size() || actions[i].size() != lower_.size()) {
            throw CollaboratorContractError("function environment expects vectors of dimension " +
                                            std::to_string(lower_.size()));
        }
        std::vector<double> x(states[i]);
        for (size_t k = 0; k < x.size(); ++k) x[k] += actions[i][k];

        // 出界: 死亡, 不评估目标函数
        if (!in_bounds(x)) {
            batch.terminals[i] = true;
        } else {
            const double f = objective_(x);
            if (std::isfinite(f)) {
                batch.rewards[i] = -f;
            } else {
                batch.terminals[i] = true;
            }
        }
        batch.observations[i] = x;
        batch.states[i] = std::move(x);
    }
    return batch;
}
