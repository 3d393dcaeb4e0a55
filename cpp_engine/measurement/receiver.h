#pragma once

// measurement/receiver.h
//
// A receiver collects reception reports of a single quantity type.
// trackingReceiver() reproduces a hunter walking toward the fox: after each
// report it steps `speed_factor` along its own (noisy) bearing.

#include <random>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "PropagationLaw.h"
#include "ReceptionReport.h"
#include "noise_model.h"
#include "transmitter.h"

namespace foxsheaf {
namespace measurement {

class Receiver {
public:
    Receiver() = default;
    Receiver(std::string id, QuantityType capability, const NoiseModel& noise = {});

    const std::string& id() const { return id_; }

    const ReceptionReport& addReception(double time_s,
                                        const Eigen::Vector2d& location,
                                        const Transmitter& tx,
                                        const PropagationLaw& law,
                                        std::mt19937& rng);

    const std::vector<ReceptionReport>& reports() const { return reports_; }

private:
    std::string id_;
    QuantityType capability_ = QuantityType::Bearing;
    NoiseModel noise_{};
    std::vector<ReceptionReport> reports_;
};

// Bearing receiver that takes `steps` reports one second apart, moving
// speed_factor along each reported bearing in between.
Receiver trackingReceiver(const std::string& id,
                          double start_time_s,
                          const Eigen::Vector2d& start_location,
                          double speed_factor,
                          int steps,
                          const Transmitter& tx,
                          const NoiseModel& noise,
                          const PropagationLaw& law,
                          std::mt19937& rng);

} // namespace measurement
} // namespace foxsheaf
