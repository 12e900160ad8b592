#include "fractal_mc_core/benchmark_functions.hpp"
#include "fractal_mc_core/errors.hpp"
#include <cctype>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

double sphere(const std::vector<double>& x) {
    double s = 0.0;
    for (double v : x) s += v * v;
    return s;
}

double rastrigin(const std::vector<double>& x, double A) {
    double s = 0.0;
    for (double v : x) s += (v * v - A * std::cos(2.0 * M_PI * v));
    return A * static_cast<double>(x.size()) + s;
}

double michalewicz(const std::vector<double>& x, int m) {
    double sum = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        double xi = x[i];
        sum += std::sin(xi) * std::pow(std::sin(((i + 1.0) * xi * xi) / M_PI), 2.0 * m);
    }
    return -sum;
}

double eggholder(const std::vector<double>& x) {
    if (x.size() < 2) {
        throw std::invalid_argument("eggholder needs at least 2 dimensions");
    }
    const double x0 = x[0];
    const double x1 = x[1];
    return -(x1 + 47.0) * std::sin(std::sqrt(std::abs(x0 / 2.0 + (x1 + 47.0)))) -
           x0 * std::sin(std::sqrt(std::abs(x0 - (x1 + 47.0))));
}

std::string normalize_key(const std::string& s) {
    std::string out;
    for (unsigned char ch : s) if (std::isalnum(ch)) out.push_back(static_cast<char>(std::tolower(ch)));
    return out;
}

ObjectiveFunction make_benchmark(const std::string& name, const BenchmarkParams& params) {
    const std::string key = normalize_key(name);
    if (key == "sphere") {
        return [](const std::vector<double>& x) { return sphere(x); };
    }
    if (key == "rastrigin") {
        const double A = params.rastrigin_A;
        return [A](const std::vector<double>& x) { return rastrigin(x, A); };
    }
    if (key == "michalewicz") {
        const int m = params.michalewicz_m;
        return [m](const std::vector<double>& x) { return michalewicz(x, m); };
    }
    if (key == "eggholder") {
        return [](const std::vector<double>& x) { return eggholder(x); };
    }
    throw ConfigurationError("unknown benchmark function '" + name + "'");
}
