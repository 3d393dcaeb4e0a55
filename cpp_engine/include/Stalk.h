#pragma once

#include <string>

#include <Eigen/Dense>

namespace foxsheaf {

using Vector = Eigen::VectorXd;
using Matrix = Eigen::MatrixXd;

enum class StalkMetric : int {
    // ||x - y||_2 over every coordinate.
    Euclidean = 0,
    // Planar coordinates [0, n-1) compared in Euclidean norm, plus the angular
    // distance of the last coordinate (radians, folded into [0, pi]).
    Bearing = 1,
};

// The space of legal values attached to a cell: R^n with a metric.
class Stalk {
public:
    Stalk() = default;
    Stalk(std::string type_name, int dimension, StalkMetric metric = StalkMetric::Euclidean);

    static Stalk euclidean(const std::string& type_name, int dimension);
    static Stalk bearing(const std::string& type_name, int dimension);

    const std::string& typeName() const { return type_name_; }
    int dimension() const { return dimension_; }
    StalkMetric metric() const { return metric_; }

    // Exactly dimension() entries, all finite.
    bool contains(const Vector& value) const;

    // Throws DomainError naming `context` when value is not a member.
    void requireMember(const Vector& value, const std::string& context) const;

    // Metric distance between two members; DomainError otherwise.
    double distance(const Vector& a, const Vector& b) const;

private:
    std::string type_name_;
    int dimension_ = 0;
    StalkMetric metric_ = StalkMetric::Euclidean;
};

// |a - b| reduced mod 2*pi and folded into [0, pi].
double angularDistance(double a_rad, double b_rad);

// Wrap an angle into (-pi, pi].
double wrapAngle(double a_rad);

} // namespace foxsheaf
