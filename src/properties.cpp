// src/properties.cpp - energies, charges, dipoles and DOS from a DftbResult

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <string>

#include "cpp_dftb/properties.hpp"
#include "cpp_dftb/errors.hpp"
#include "cpp_dftb/filling.hpp"

namespace dftb {

namespace {

std::vector<std::size_t> n_states(const DftbResult& r) {
    std::vector<std::size_t> n(r.orbs.n_systems());
    for (std::size_t b = 0; b < n.size(); ++b) n[b] = r.orbs.n_orbitals(b);
    return n;
}

} // namespace

BatchVector occupancy(const DftbResult& r) {
    return occupancies(r.filling, r.eig_values, r.n_electrons, n_states(r));
}

std::vector<double> fermi_energy(const DftbResult& r) {
    return fermi_energies(r.filling, r.eig_values, r.n_electrons, n_states(r));
}

std::vector<double> band_energy(const DftbResult& r) {
    const BatchVector occ = occupancy(r);
    std::vector<double> e(r.orbs.n_systems());
    for (std::size_t b = 0; b < e.size(); ++b)
        e[b] = r.eig_values.row(b).dot(occ.row(b));
    return e;
}

std::vector<double> core_band_energy(const DftbResult& r) {
    std::vector<double> e(r.orbs.n_systems());
    for (std::size_t b = 0; b < e.size(); ++b)
        e[b] = r.rho.block(b).cwiseProduct(r.core_hamiltonian.block(b)).sum();
    return e;
}

std::vector<double> entropy_energy(const DftbResult& r) {
    const std::vector<double> ef = fermi_energy(r);
    std::vector<double> ts(r.orbs.n_systems());
    for (std::size_t b = 0; b < ts.size(); ++b) {
        const Eigen::Index m = (Eigen::Index)r.orbs.n_orbitals(b);
        ts[b] = 2.0 * entropy_term(r.filling, r.eig_values.row(b).head(m), ef[b]);
    }
    return ts;
}

std::vector<double> band_free_energy(const DftbResult& r) {
    std::vector<double> e = band_energy(r);
    const std::vector<double> ts = entropy_energy(r);
    for (std::size_t b = 0; b < e.size(); ++b) e[b] -= ts[b];
    return e;
}

std::vector<double> scc_energy(const DftbResult& r) {
    std::vector<double> e(r.orbs.n_systems(), 0.0);
    if (!r.scc) return e;
    const Resolution res = native_resolution(r.orbs);
    const BatchVector dq = q_delta(r, res);
    for (std::size_t b = 0; b < e.size(); ++b)
        e[b] = 0.5 * dq.row(b).dot(r.gamma.block(b) * dq.row(b));
    return e;
}

std::vector<double> repulsive_energy(const DftbResult& r) {
    return r.repulsive;
}

std::vector<double> total_energy(const DftbResult& r) {
    std::vector<double> e = r.scc ? core_band_energy(r) : band_energy(r);
    const std::vector<double> rep = repulsive_energy(r);
    if (r.scc) {
        const std::vector<double> escc = scc_energy(r);
        for (std::size_t b = 0; b < e.size(); ++b) e[b] += escc[b];
    }
    for (std::size_t b = 0; b < e.size(); ++b) e[b] += rep[b];
    return e;
}

std::vector<double> mermin_energy(const DftbResult& r) {
    std::vector<double> e = total_energy(r);
    const std::vector<double> ts = entropy_energy(r);
    for (std::size_t b = 0; b < e.size(); ++b) e[b] -= ts[b];
    return e;
}

BatchVector q_final(const DftbResult& r, Resolution res) {
    return mulliken(r.rho, r.overlap, &r.orbs, res);
}

BatchVector q_zero(const DftbResult& r, Resolution res) {
    return resolve(r.q_zero, r.orbs, res);
}

BatchVector q_delta(const DftbResult& r, Resolution res) {
    BatchVector dq = q_final(r, res);
    dq.flat() -= q_zero(r, res).flat();
    return dq;
}

std::vector<Eigen::Vector3d> dipole(const DftbResult& r) {
    const BatchVector dq = q_delta(r, Resolution::atom);
    std::vector<Eigen::Vector3d> mu(r.orbs.n_systems(), Eigen::Vector3d::Zero());
    for (std::size_t b = 0; b < mu.size(); ++b) {
        const auto& pos = r.geometry.positions(b);
        for (std::size_t a = 0; a < pos.size(); ++a) mu[b] += dq(b, a) * pos[a];
    }
    return mu;
}

std::vector<std::pair<double, double>> homo_lumo(const DftbResult& r) {
    const BatchVector occ = occupancy(r);
    std::vector<std::pair<double, double>> hl(r.orbs.n_systems());
    for (std::size_t b = 0; b < hl.size(); ++b) {
        const std::size_t m = r.orbs.n_orbitals(b);
        std::size_t nocc = 0;
        for (std::size_t i = 0; i < m; ++i)
            if (occ(b, i) >= 1e-10) ++nocc;
        if (nocc == 0 || nocc >= m)
            throw ShapeError("HOMO/LUMO are not defined for system " + std::to_string(b)
                             + " (" + std::to_string(nocc) + " of " + std::to_string(m)
                             + " states occupied)");
        hl[b] = {r.eig_values(b, nocc - 1), r.eig_values(b, nocc)};
    }
    return hl;
}

BatchVector dos_energy(const DftbResult& r, std::size_t grid, double margin) {
    if (grid < 2) throw std::invalid_argument("dos_energy: grid needs at least two points");
    BatchVector e(r.orbs.n_systems(), grid);
    for (std::size_t b = 0; b < e.nbatch; ++b) {
        const Eigen::Index m = (Eigen::Index)r.orbs.n_orbitals(b);
        if (m == 0) continue;
        const auto eig = r.eig_values.row(b).head(m);
        e.row(b) = Eigen::VectorXd::LinSpaced((Eigen::Index)grid,
                                              eig.minCoeff() - margin, eig.maxCoeff() + margin);
    }
    return e;
}

BatchVector dos(const DftbResult& r, double sigma, std::size_t grid) {
    if (!(sigma > 0.0)) throw std::invalid_argument("dos: sigma must be positive");
    const BatchVector energies = dos_energy(r, grid);
    const double norm = 1.0 / (sigma * std::sqrt(2.0 * std::numbers::pi));
    BatchVector d(energies.nbatch, energies.n);
    for (std::size_t b = 0; b < d.nbatch; ++b) {
        const std::size_t m = r.orbs.n_orbitals(b);
        for (std::size_t g = 0; g < grid; ++g) {
            double acc = 0.0;
            for (std::size_t i = 0; i < m; ++i) {
                const double x = (energies(b, g) - r.eig_values(b, i)) / sigma;
                acc += std::exp(-0.5 * x * x);
            }
            d(b, g) = norm * acc;
        }
    }
    return d;
}

} // namespace dftb
