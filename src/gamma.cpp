// src/gamma.cpp - exponential (Slater) and Gaussian gamma functions

#include <cmath>
#include <numbers>

#include "cpp_dftb/gamma.hpp"
#include "cpp_dftb/errors.hpp"

namespace dftb {

namespace {

constexpr double kMinTauDiff = 1e-4;

double exp_sub_term(double r, double t1, double t2) {
    const double d = t1 * t1 - t2 * t2;
    return std::exp(-t1 * r) * (0.5 * std::pow(t2, 4) * t1 / (d * d)
                                - (std::pow(t2, 6) - 3.0 * std::pow(t2, 4) * t1 * t1) / (r * d * d * d));
}

} // namespace

double gamma_exponential(double r, double ua, double ub) {
    // Slater decay constants tau = 16/5 U
    const double ta = 3.2 * ua, tb = 3.2 * ub;
    if (r == 0.0) {
        if (std::abs(ta - tb) < kMinTauDiff) return 0.15625 * (ta + tb);
        const double s = ta + tb;
        return 0.5 * (ta * tb / s + ta * ta * tb * tb / (s * s * s));
    }
    if (std::abs(ta - tb) < kMinTauDiff) {
        const double t = 0.5 * (ta + tb);
        return 1.0 / r - std::exp(-t * r)
            * (1.0 / r + 0.6875 * t + 0.1875 * r * t * t + r * r * t * t * t / 48.0);
    }
    return 1.0 / r - (exp_sub_term(r, ta, tb) + exp_sub_term(r, tb, ta));
}

double gamma_gaussian(double r, double ua, double ub) {
    // Full widths at half maximum of the Gaussian charge clouds
    const double k = 8.0 * std::numbers::ln2 / std::numbers::pi;
    const double fa2 = k / (ua * ua), fb2 = k / (ub * ub);
    const double c = std::sqrt(4.0 * std::numbers::ln2 / (fa2 + fb2));
    if (r == 0.0) return 2.0 * c / std::sqrt(std::numbers::pi);
    return std::erf(c * r) / r;
}

BatchMatrix build_gamma_matrix(const Geometry& geometry, const OrbitalInfo& orbs,
                               const BatchMatrix& invr, const BatchVector& hubbard_u,
                               GammaScheme scheme) {
    if (geometry.n_systems() != orbs.n_systems() || invr.nbatch != orbs.n_systems()
        || hubbard_u.nbatch != orbs.n_systems())
        throw ConfigurationError("build_gamma_matrix: batch sizes of inputs disagree");

    auto kernel = scheme == GammaScheme::gaussian ? &gamma_gaussian : &gamma_exponential;
    const bool shells = orbs.shell_resolved();

    BatchMatrix gamma(orbs.n_systems(), orbs.res_matrix_size());
    for (std::size_t b = 0; b < orbs.n_systems(); ++b) {
        const std::size_t nr = orbs.n_res(b);
        if (hubbard_u.n < nr) throw ConfigurationError("build_gamma_matrix: too few Hubbard values");
        for (std::size_t i = 0; i < nr; ++i) {
            const std::size_t ai = shells ? (std::size_t)orbs.shell_atoms(b)[i] : i;
            for (std::size_t j = 0; j <= i; ++j) {
                const std::size_t aj = shells ? (std::size_t)orbs.shell_atoms(b)[j] : j;
                const double ir = invr(b, ai, aj);
                const double r = (ai == aj || ir == 0.0) ? 0.0 : 1.0 / ir;
                const double g = kernel(r, hubbard_u(b, i), hubbard_u(b, j));
                gamma(b, i, j) = g;
                gamma(b, j, i) = g;
            }
        }
    }
    return gamma;
}

} // namespace dftb
