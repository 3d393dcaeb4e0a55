#pragma once

// measurement/transmitter.h
//
// Synthetic transmitter ("fox") for scenario generation. Produces the
// ReceptionReport values the fusion core consumes; the core never calls
// into this module.

#include <random>
#include <string>

#include <Eigen/Dense>

#include "PropagationLaw.h"
#include "ReceptionReport.h"
#include "noise_model.h"

namespace foxsheaf {
namespace measurement {

struct Transmitter {
    Eigen::Vector2d location = Eigen::Vector2d::Zero();
    double power_W = 1.0;
    std::string identity = "A";

    // One report of `quantity` as seen from rx_location. Noise is applied per
    // NoiseModel; `law` is the generator's own propagation law.
    ReceptionReport reception(double time_s,
                              const std::string& receiver_id,
                              const Eigen::Vector2d& rx_location,
                              QuantityType quantity,
                              const NoiseModel& noise,
                              const PropagationLaw& law,
                              std::mt19937& rng) const;
};

} // namespace measurement
} // namespace foxsheaf
