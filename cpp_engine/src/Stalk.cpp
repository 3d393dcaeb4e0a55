#include "Stalk.h"

#include "FoxSheafErrors.h"

#include <cmath>
#include <sstream>
#include <utility>

namespace foxsheaf {

namespace {
constexpr double kTwoPi = 6.283185307179586476925286766559;
constexpr double kPi = 3.14159265358979323846264338327950;
} // namespace

double angularDistance(double a_rad, double b_rad) {
    double d = std::fmod(std::fabs(a_rad - b_rad), kTwoPi);
    if (d > kPi) {
        d = kTwoPi - d;
    }
    return d;
}

double wrapAngle(double a_rad) {
    double w = std::fmod(a_rad, kTwoPi);
    if (w <= -kPi) {
        w += kTwoPi;
    } else if (w > kPi) {
        w -= kTwoPi;
    }
    return w;
}

Stalk::Stalk(std::string type_name, int dimension, StalkMetric metric)
    : type_name_(std::move(type_name)), dimension_(dimension), metric_(metric) {
    if (dimension_ < 1) {
        throw DomainError("stalk '" + type_name_ + "' must have dimension >= 1");
    }
}

Stalk Stalk::euclidean(const std::string& type_name, int dimension) {
    return Stalk(type_name, dimension, StalkMetric::Euclidean);
}

Stalk Stalk::bearing(const std::string& type_name, int dimension) {
    return Stalk(type_name, dimension, StalkMetric::Bearing);
}

bool Stalk::contains(const Vector& value) const {
    if (value.size() != dimension_) {
        return false;
    }
    return value.allFinite();
}

void Stalk::requireMember(const Vector& value, const std::string& context) const {
    if (contains(value)) {
        return;
    }
    std::ostringstream msg;
    msg << context << ": value of size " << value.size()
        << " is not a member of stalk '" << type_name_ << "' (dimension " << dimension_ << ")";
    if (value.size() == dimension_) {
        msg << ", non-finite entry";
    }
    throw DomainError(msg.str());
}

double Stalk::distance(const Vector& a, const Vector& b) const {
    requireMember(a, "distance lhs");
    requireMember(b, "distance rhs");

    if (metric_ == StalkMetric::Euclidean) {
        return (a - b).norm();
    }

    const int planar = dimension_ - 1;
    const double planar_dist = (planar > 0) ? (a.head(planar) - b.head(planar)).norm() : 0.0;
    return planar_dist + angularDistance(a(planar), b(planar));
}

} // namespace foxsheaf
