#ifndef FRACTAL_MC_CORE__DISTANCE_FUNCTION_HPP_
#define FRACTAL_MC_CORE__DISTANCE_FUNCTION_HPP_

#include <functional>
#include <string>
#include <vector>

// 两个 walker observation 之间的相异度 (>= 0, 对称)
class DistanceFunction {
public:
    virtual ~DistanceFunction() = default;

    virtual double distance(const std::vector<double>& a, const std::vector<double>& b) const = 0;
    virtual std::string name() const = 0;

    // 一次算 N 对: out[i] = distance(obs[i], obs[companions[i]])
    virtual std::vector<double> distances(const std::vector<std::vector<double>>& observations,
                                          const std::vector<int>& companions) const;
};

class EuclideanDistance : public DistanceFunction {
public:
    double distance(const std::vector<double>& a, const std::vector<double>& b) const override;
    std::string name() const override { return "euclidean"; }
};

class ManhattanDistance : public DistanceFunction {
public:
    double distance(const std::vector<double>& a, const std::vector<double>& b) const override;
    std::string name() const override { return "manhattan"; }
};

// 不同坐标的个数，差值 <= tolerance 视为相同 (离散/组合状态)
class HammingDistance : public DistanceFunction {
public:
    explicit HammingDistance(double tolerance = 0.0);

    double distance(const std::vector<double>& a, const std::vector<double>& b) const override;
    std::string name() const override { return "hamming"; }

private:
    double tolerance_;
};

// 用户注入的距离，和 FitnessFunction 一样用 std::function
class CustomDistance : public DistanceFunction {
public:
    using Metric = std::function<double(const std::vector<double>&, const std::vector<double>&)>;

    CustomDistance(Metric metric, std::string name = "custom");

    double distance(const std::vector<double>& a, const std::vector<double>& b) const override;
    std::string name() const override { return name_; }

private:
    Metric metric_;
    std::string name_;
};

#endif
