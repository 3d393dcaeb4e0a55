#pragma once

#include <Eigen/Dense>

namespace foxsheaf {

// received = power / (geometric_factor * distance^exponent)
//
// Free space (inverse square over a sphere) by default. The data generator and
// the sheaf restriction maps each take their own instance.
struct PropagationLaw {
    double exponent = 2.0;
    double geometric_factor = 12.566370614359172953850573533118; // 4*pi

    double receivedPower(double power_W, double distance_m) const;
    // Inverse of receivedPower for a fixed distance.
    double impliedPower(double received_W, double distance_m) const;
};

// atan2(tx.x - rx.x, tx.y - rx.y): radians clockwise from +y.
double bearingTo(const Eigen::Vector2d& tx, const Eigen::Vector2d& rx);

} // namespace foxsheaf
