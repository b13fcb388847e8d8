// src/filling.cpp - smearing functions, Aufbau filling and chemical potential search

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <numbers>
#include <stdexcept>

#include <boost/math/tools/toms748_solve.hpp>
#include <boost/math/tools/roots.hpp>

#include "cpp_dftb/filling.hpp"

namespace dftb {

// Temperature-safe Fermi-Dirac function
double fermi_smearing(double e, double fermi_energy, double kt) {
    const double tt = std::max(1e-12, std::abs(kt));
    const double y  = (e - fermi_energy) / tt;
    if (y >=  40.0) return 0.0;
    if (y <= -40.0) return 1.0;
    return 1.0 / (1.0 + std::exp(y));
}

double gaussian_smearing(double e, double fermi_energy, double kt) {
    const double tt = std::max(1e-12, std::abs(kt));
    return 0.5 * std::erfc((e - fermi_energy) / tt);
}

Eigen::VectorXd aufbau_filling(const Eigen::Ref<const Eigen::VectorXd>& eigenvalues, double n_electrons) {
    const Eigen::Index n = eigenvalues.size();
    Eigen::VectorXd w = Eigen::VectorXd::Zero(n);
    double left = 0.5 * n_electrons;
    for (Eigen::Index i = 0; i < n && left > 0.0; ++i) {
        w(i) = std::min(1.0, left);
        left -= w(i);
    }
    return w;
}

Eigen::VectorXd fill(const FillingSettings& settings,
                     const Eigen::Ref<const Eigen::VectorXd>& eigenvalues,
                     double fermi_energy, double n_electrons) {
    switch (settings.effective()) {
        case FillingScheme::aufbau:
            return aufbau_filling(eigenvalues, n_electrons);
        case FillingScheme::fermi:
            return eigenvalues.unaryExpr([&](double e){
                return fermi_smearing(e, fermi_energy, settings.temperature); });
        case FillingScheme::gaussian:
            return eigenvalues.unaryExpr([&](double e){
                return gaussian_smearing(e, fermi_energy, settings.temperature); });
    }
    throw std::logic_error("fill: unhandled filling scheme");
}

double fermi_search(const FillingSettings& settings,
                    const Eigen::Ref<const Eigen::VectorXd>& eigenvalues,
                    double n_electrons) {
    const Eigen::Index n = eigenvalues.size();
    if (n == 0) return 0.0;

    if (settings.effective() == FillingScheme::aufbau) {
        // Index of the highest (partially) occupied state
        const Eigen::Index n_occ = (Eigen::Index)std::ceil(0.5 * n_electrons - 1e-12);
        const Eigen::Index homo = std::clamp<Eigen::Index>(n_occ - 1, 0, n - 1);
        const Eigen::Index lumo = std::min<Eigen::Index>(homo + 1, n - 1);
        return 0.5 * (eigenvalues(homo) + eigenvalues(lumo));
    }

    const double kt = settings.temperature;
    auto f = [&](double mu){
        return 2.0 * fill(settings, eigenvalues, mu, n_electrons).sum() - n_electrons;
    };

    // Bracket
    const double pad = 10.0 * std::max(1e-6, kt);
    double a = eigenvalues.minCoeff() - pad, b = eigenvalues.maxCoeff() + pad;
    double fa = f(a), fb = f(b);
    int expand = 0;
    while (!(fa <= 0.0 && fb >= 0.0) && expand < 60) {
        const double w = b - a; a -= w; b += w; fa = f(a); fb = f(b); ++expand;
    }
    if (!(fa <= 0.0 && fb >= 0.0))
        return (std::abs(fa) < std::abs(fb)) ? a : b;
    if (fa == 0.0) return a;
    if (fb == 0.0) return b;

    std::uintmax_t it = 200;
    const auto rng = boost::math::tools::toms748_solve(f, a, b, fa, fb,
                         boost::math::tools::eps_tolerance<double>(52), it);
    return 0.5 * (rng.first + rng.second);
}

double entropy_term(const FillingSettings& settings,
                    const Eigen::Ref<const Eigen::VectorXd>& eigenvalues,
                    double fermi_energy) {
    const double kt = settings.temperature;
    switch (settings.effective()) {
        case FillingScheme::aufbau:
            return 0.0;
        case FillingScheme::fermi: {
            double s = 0.0;
            for (Eigen::Index i = 0; i < eigenvalues.size(); ++i) {
                const double f = fermi_smearing(eigenvalues(i), fermi_energy, kt);
                if (f > 0.0 && f < 1.0) s += f * std::log(f) + (1.0 - f) * std::log(1.0 - f);
            }
            return -kt * s;
        }
        case FillingScheme::gaussian: {
            const Eigen::ArrayXd x = (eigenvalues.array() - fermi_energy) / kt;
            return kt * (-x.square()).exp().sum() / (2.0 * std::sqrt(std::numbers::pi));
        }
    }
    throw std::logic_error("entropy_term: unhandled filling scheme");
}

std::vector<double> fermi_energies(const FillingSettings& settings, const BatchVector& eigenvalues,
                                   const std::vector<double>& n_electrons,
                                   const std::vector<std::size_t>& n_states) {
    if (n_electrons.size() != eigenvalues.nbatch || n_states.size() != eigenvalues.nbatch)
        throw std::invalid_argument("fermi_energies: batch size mismatch");
    std::vector<double> ef(eigenvalues.nbatch);
    for (std::size_t b = 0; b < eigenvalues.nbatch; ++b)
        ef[b] = fermi_search(settings, eigenvalues.row(b).head((Eigen::Index)n_states[b]), n_electrons[b]);
    return ef;
}

BatchVector occupancies(const FillingSettings& settings, const BatchVector& eigenvalues,
                        const std::vector<double>& n_electrons,
                        const std::vector<std::size_t>& n_states) {
    const auto ef = fermi_energies(settings, eigenvalues, n_electrons, n_states);
    BatchVector occ(eigenvalues.nbatch, eigenvalues.n);
    for (std::size_t b = 0; b < eigenvalues.nbatch; ++b) {
        const Eigen::Index m = (Eigen::Index)n_states[b];
        occ.row(b).head(m) = 2.0 * fill(settings, eigenvalues.row(b).head(m), ef[b], n_electrons[b]);
    }
    return occ;
}

} // namespace dftb
