#include "fractal_mc_core/distance_function.hpp"
#include "fractal_mc_core/errors.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace {

void check_same_shape(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("distance between vectors of size " + std::to_string(a.size()) +
                                    " and " + std::to_string(b.size()));
    }
}

}  // namespace

std::vector<double> DistanceFunction::distances(const std::vector<std::vector<double>>& observations,
                                                const std::vector<int>& companions) const {
    if (observations.size() != companions.size()) {
        throw std::invalid_argument("distances: observations and companions differ in length");
    }
    const int n = static_cast<int>(observations.size());
    std::vector<double> out(n, 0.0);
    for (int i = 0; i < n; ++i) {
        const int c = companions[i];
        if (c < 0 || c >= n) {
            throw std::out_of_range("companion index " + std::to_string(c) + " out of range");
        }
        out[i] = distance(observations[i], observations[c]);
    }
    return out;
}

double EuclideanDistance::distance(const std::vector<double>& a, const std::vector<double>& b) const {
    check_same_shape(a, b);
    double sum = 0.0;
    for (size_t k = 0; k < a.size(); ++k) {
        const double d = a[k] - b[k];
        sum += d * d;
    }
    return std::sqrt(sum);
}

double ManhattanDistance::distance(const std::vector<double>& a, const std::vector<double>& b) const {
    check_same_shape(a, b);
    double sum = 0.0;
    for (size_t k = 0; k < a.size(); ++k) sum += std::abs(a[k] - b[k]);
    return sum;
}

HammingDistance::HammingDistance(double tolerance)
: tolerance_(tolerance)
{
    if (!(tolerance_ >= 0.0)) {
        throw ConfigurationError("hamming tolerance must be >= 0");
    }
}

double HammingDistance::distance(const std::vector<double>& a, const std::vector<double>& b) const {
    check_same_shape(a, b);
    int count = 0;
    for (size_t k = 0; k < a.size(); ++k) {
        if (std::abs(a[k] - b[k]) > tolerance_) ++count;
    }
    return static_cast<double>(count);
}

CustomDistance::CustomDistance(Metric metric, std::string name)
: metric_(std::move(metric)), name_(std::move(name))
{
    if (!metric_) {
        throw ConfigurationError("custom distance function is empty");
    }
}

double CustomDistance::distance(const std::vector<double>& a, const std::vector<double>& b) const {
    const double d = metric_(a, b);
    // NaN 也会走到这里
    if (!(d >= 0.0)) {
        throw CollaboratorContractError("distance '" + name_ + "' returned " + std::to_string(d));
    }
    return d;
}
