#include "PropagationLaw.h"

#include <cmath>

namespace foxsheaf {

double PropagationLaw::receivedPower(double power_W, double distance_m) const {
    return power_W / (geometric_factor * std::pow(distance_m, exponent));
}

double PropagationLaw::impliedPower(double received_W, double distance_m) const {
    return received_W * geometric_factor * std::pow(distance_m, exponent);
}

double bearingTo(const Eigen::Vector2d& tx, const Eigen::Vector2d& rx) {
    return std::atan2(tx.x() - rx.x(), tx.y() - rx.y());
}

} // namespace foxsheaf
