#include "transmitter.h"

namespace foxsheaf {
namespace measurement {

ReceptionReport Transmitter::reception(double time_s,
                                       const std::string& receiver_id,
                                       const Eigen::Vector2d& rx_location,
                                       QuantityType quantity,
                                       const NoiseModel& noise,
                                       const PropagationLaw& law,
                                       std::mt19937& rng) const {
    ReceptionReport r;
    r.receiver_id = receiver_id;
    r.time_s = time_s;
    r.rx_location = rx_location;
    r.quantity = quantity;
    r.tx_identity = identity;

    if (quantity == QuantityType::Rssi) {
        const double expected = law.receivedPower(power_W, (location - rx_location).norm());
        r.value = sampleRicePower(expected, noise.rssi_noise_W, rng);
        r.uncertainty = noise.rssi_noise_W;
    } else {
        const double truth = bearingTo(location, rx_location);
        if (noise.bearing_beamwidth_rad > 0.0) {
            const double bw = noise.bearing_beamwidth_rad;
            r.value = sampleVonMises(truth, 1.0 / (bw * bw), rng);
        } else {
            r.value = truth;
        }
        r.uncertainty = noise.bearing_beamwidth_rad;
    }
    return r;
}

} // namespace measurement
} // namespace foxsheaf
