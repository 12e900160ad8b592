#include "fractal_mc_core/convergence.hpp"
#include "fractal_mc_core/errors.hpp"
#include <cmath>
#include <utility>

ClusteredConvergence::ClusteredConvergence(double tolerance)
: tolerance_(tolerance)
{
    if (!std::isfinite(tolerance_) || tolerance_ < 0.0) {
        throw ConfigurationError("convergence tolerance must be a finite value >= 0");
    }
}

bool ClusteredConvergence::converged(const StateBuffer& walkers, const DistanceFunction& distance) const {
    if (walkers.n_alive() != walkers.size()) return false;
    const std::vector<double>& anchor = walkers.observation(0);
    for (int i = 1; i < walkers.size(); ++i) {
        if (distance.distance(walkers.observation(i), anchor) > tolerance_) return false;
    }
    return true;
}

bool AllDeadConvergence::converged(const StateBuffer& walkers, const DistanceFunction&) const {
    return walkers.n_alive() == 0;
}

CustomConvergence::CustomConvergence(Predicate predicate, std::string name)
: predicate_(std::move(predicate)), name_(std::move(name))
{
    if (!predicate_) {
        throw ConfigurationError("custom convergence predicate is empty");
    }
}

bool CustomConvergence::converged(const StateBuffer& walkers, const DistanceFunction& distance) const {
    return predicate_(walkers, distance);
}
