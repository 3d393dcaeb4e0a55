#include "receiver.h"

#include <cmath>
#include <utility>

namespace foxsheaf {
namespace measurement {

Receiver::Receiver(std::string id, QuantityType capability, const NoiseModel& noise)
    : id_(std::move(id)), capability_(capability), noise_(noise) {}

const ReceptionReport& Receiver::addReception(double time_s,
                                              const Eigen::Vector2d& location,
                                              const Transmitter& tx,
                                              const PropagationLaw& law,
                                              std::mt19937& rng) {
    reports_.push_back(tx.reception(time_s, id_, location, capability_, noise_, law, rng));
    return reports_.back();
}

Receiver trackingReceiver(const std::string& id,
                          double start_time_s,
                          const Eigen::Vector2d& start_location,
                          double speed_factor,
                          int steps,
                          const Transmitter& tx,
                          const NoiseModel& noise,
                          const PropagationLaw& law,
                          std::mt19937& rng) {
    Receiver rx(id, QuantityType::Bearing, noise);
    double t = start_time_s;
    Eigen::Vector2d loc = start_location;
    for (int i = 0; i < steps; ++i) {
        const double bearing = rx.addReception(t, loc, tx, law, rng).value;
        loc += speed_factor * Eigen::Vector2d(std::sin(bearing), std::cos(bearing));
        t += 1.0;
    }
    return rx;
}

} // namespace measurement
} // namespace foxsheaf
