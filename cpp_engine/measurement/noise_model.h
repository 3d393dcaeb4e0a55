#pragma once

// measurement/noise_model.h
//
// Synthetic measurement noise for the data generator.
//
//   - RSSI: Rician amplitude around sqrt(expected power), squared back to
//     power. rssi_noise_W is the noise power N; each quadrature carries
//     variance N/2.
//   - Bearing: von Mises around the true bearing with concentration
//     kappa = 1 / beamwidth^2 (beamwidth in radians).
//   - A zero parameter disables that noise source.

#include <random>

namespace foxsheaf {
namespace measurement {

struct NoiseModel {
    double rssi_noise_W = 0.0;
    double bearing_beamwidth_rad = 0.0;
};

// Noisy received power for a noiseless expected power (both W).
double sampleRicePower(double expected_W, double noise_W, std::mt19937& rng);

// Angle (radians, wrapped to (-pi, pi]) drawn from von Mises(mu, kappa).
double sampleVonMises(double mu_rad, double kappa, std::mt19937& rng);

} // namespace measurement
} // namespace foxsheaf
