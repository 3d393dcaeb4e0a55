#pragma once

#include <string>

#include <Eigen/Dense>

namespace foxsheaf {

enum class QuantityType : int {
    Bearing = 0, // radians, clockwise from +y
    Rssi = 1,    // received power, W
};

const char* toString(QuantityType q);
// Accepts "bearing" / "rssi"; returns false for anything else.
bool parseQuantityType(const std::string& text, QuantityType& out);

// One measurement consumed by the fusion core.
struct ReceptionReport {
    std::string receiver_id;
    double time_s = 0.0;
    Eigen::Vector2d rx_location = Eigen::Vector2d::Zero();
    QuantityType quantity = QuantityType::Bearing;
    double value = 0.0;
    // One-sigma estimate in the quantity's unit; 0 when unknown.
    double uncertainty = 0.0;
    std::string tx_identity;
};

} // namespace foxsheaf
