#ifndef FRACTAL_MC_CORE__BENCHMARK_FUNCTIONS_HPP_
#define FRACTAL_MC_CORE__BENCHMARK_FUNCTIONS_HPP_

#include <functional>
#include <string>
#include <vector>

// 目标函数, 越小越好
using ObjectiveFunction = std::function<double(const std::vector<double>&)>;

struct BenchmarkParams {
    double rastrigin_A = 10.0;
    int michalewicz_m = 10;
};

double sphere(const std::vector<double>& x);
double rastrigin(const std::vector<double>& x, double A = 10.0);
double michalewicz(const std::vector<double>& x, int m = 10);
double eggholder(const std::vector<double>& x);   // 只看前两维

// 名字不区分大小写, 非字母数字字符忽略; 未知名字抛 ConfigurationError
ObjectiveFunction make_benchmark(const std::string& name, const BenchmarkParams& params = BenchmarkParams());

// "Rastrigin" / "rastrigin" / "RASTRIGIN" -> "rastrigin"
std::string normalize_key(const std::string& s);

#endif
