// measurement/noise_model.cpp
//
// Von Mises sampling follows Best & Fisher (1979); very concentrated
// distributions fall back to the normal approximation N(mu, 1/sqrt(kappa)).

#include "noise_model.h"

#include "Stalk.h"

#include <algorithm>
#include <cmath>

namespace foxsheaf {
namespace measurement {

static constexpr double kPI = 3.14159265358979323846;
static constexpr double kMinKappa = 1e-8;
static constexpr double kNormalApproxKappa = 1e6;

double sampleRicePower(double expected_W, double noise_W, std::mt19937& rng) {
    if (!(noise_W > 0.0)) {
        return expected_W;
    }
    const double nu = std::sqrt(std::max(0.0, expected_W));
    std::normal_distribution<double> quad(0.0, std::sqrt(noise_W / 2.0));
    const double i = nu + quad(rng);
    const double q = quad(rng);
    return i * i + q * q;
}

double sampleVonMises(double mu_rad, double kappa, std::mt19937& rng) {
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    if (!(kappa > kMinKappa)) {
        return wrapAngle(mu_rad + kPI * (2.0 * unit(rng) - 1.0));
    }
    if (kappa > kNormalApproxKappa) {
        std::normal_distribution<double> approx(0.0, 1.0 / std::sqrt(kappa));
        return wrapAngle(mu_rad + approx(rng));
    }

    const double tau = 1.0 + std::sqrt(1.0 + 4.0 * kappa * kappa);
    const double rho = (tau - std::sqrt(2.0 * tau)) / (2.0 * kappa);
    const double r = (1.0 + rho * rho) / (2.0 * rho);

    double f = 0.0;
    for (;;) {
        const double u1 = unit(rng);
        const double u2 = unit(rng);
        const double z = std::cos(kPI * u1);
        f = (1.0 + r * z) / (r + z);
        const double c = kappa * (r - f);
        if (c * (2.0 - c) - u2 > 0.0) {
            break;
        }
        if (u2 > 0.0 && std::log(c / u2) + 1.0 - c >= 0.0) {
            break;
        }
    }

    const double sign = (unit(rng) < 0.5) ? -1.0 : 1.0;
    const double theta = mu_rad + sign * std::acos(std::max(-1.0, std::min(1.0, f)));
    return wrapAngle(theta);
}

} // namespace measurement
} // namespace foxsheaf
