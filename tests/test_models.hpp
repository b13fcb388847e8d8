// test_models.hpp - toy parameter feeds and small molecules for the test suite
#pragma once

#include <cmath>
#include <map>
#include <memory>
#include <vector>

#include <Eigen/Core>

#include "cpp_dftb/feeds.hpp"
#include "cpp_dftb/gamma.hpp"
#include "cpp_dftb/geometry.hpp"
#include "cpp_dftb/orbital_info.hpp"
#include "cpp_dftb/population.hpp"
#include "cpp_dftb/scc.hpp"

namespace toy {

using namespace dftb;

struct Molecule {
    std::vector<int> z;
    std::vector<Eigen::Vector3d> r;   // bohr
};

inline Molecule h_atom() { return {{1}, {Eigen::Vector3d(0.0, 0.0, 0.0)}}; }

inline Molecule h2() {
    return {{1, 1}, {Eigen::Vector3d(0.0, 0.0, 0.0), Eigen::Vector3d(1.4, 0.0, 0.0)}};
}

// Heteronuclear, closed shell; needs several SCC steps
inline Molecule lih() {
    return {{3, 1}, {Eigen::Vector3d(0.0, 0.0, 0.0), Eigen::Vector3d(3.0, 0.0, 0.0)}};
}

inline Molecule h2o() {
    return {{8, 1, 1}, {Eigen::Vector3d(0.0, 0.0, 0.0),
                        Eigen::Vector3d(1.8, 0.0, 0.0),
                        Eigen::Vector3d(-0.45, 1.74, 0.0)}};
}

inline OrbitalInfo::ShellDict shell_dict() {
    return {{1, {0}}, {3, {0}}, {6, {0, 1}}, {8, {0, 1}}};
}

inline std::vector<std::vector<int>> numbers(const std::vector<Molecule>& mols) {
    std::vector<std::vector<int>> z;
    for (const auto& m : mols) z.push_back(m.z);
    return z;
}

inline Geometry geometry(const std::vector<Molecule>& mols) {
    std::vector<std::vector<Eigen::Vector3d>> r;
    for (const auto& m : mols) r.push_back(m.r);
    return Geometry(numbers(mols), r);
}

inline OrbitalInfo orbitals(const std::vector<Molecule>& mols, bool shell_resolved = false) {
    return OrbitalInfo(numbers(mols), shell_dict(), shell_resolved);
}

// Per species shell on-site energies (hartree)
inline const std::map<int, std::vector<double>>& onsite() {
    static const std::map<int, std::vector<double>> e{
        {1, {-0.2386}}, {3, {-0.1055}}, {6, {-0.5048, -0.1943}}, {8, {-0.8788, -0.3321}}};
    return e;
}

// Diagonal on-site block, exponentially decaying couplings between
// orbitals on different atoms; nothing between orbitals of one atom.
class ToyIntegralFeed final : public IntegralFeed {
public:
    explicit ToyIntegralFeed(bool overlap) : overlap_(overlap) {}

    BatchMatrix matrix(const Geometry& geometry, const OrbitalInfo& orbs) const override {
        BatchMatrix m(orbs.n_systems(), orbs.orbital_matrix_size());
        const BatchMatrix r = geometry.distances();
        for (std::size_t b = 0; b < orbs.n_systems(); ++b) {
            const auto& atom = orbs.on_atoms(b);
            const auto& shell = orbs.on_shells(b);
            const auto& z = orbs.atomic_numbers(b);
            std::vector<int> first_shell(orbs.n_atoms(b), 0);
            for (std::size_t s = orbs.n_shells(b); s-- > 0;) first_shell[orbs.shell_atoms(b)[s]] = (int)s;

            for (std::size_t i = 0; i < orbs.n_orbitals(b); ++i) {
                const int ai = atom[i];
                m(b, i, i) = overlap_ ? 1.0 : onsite().at(z[ai])[shell[i] - first_shell[ai]];
                for (std::size_t j = 0; j < orbs.n_orbitals(b); ++j) {
                    const int aj = atom[j];
                    if (ai == aj) continue;
                    const double decay = std::exp(-0.6 * r(b, ai, aj));
                    m(b, i, j) = overlap_ ? 0.25 * decay : -0.3 * decay;
                }
            }
        }
        return m;
    }

private:
    bool overlap_;
};

// sum over atom pairs of 0.1 exp(-R)
class ToyRepulsiveFeed final : public RepulsiveFeed {
public:
    std::vector<double> operator()(const Geometry& geometry) const override {
        std::vector<double> e(geometry.n_systems(), 0.0);
        const BatchMatrix r = geometry.distances();
        for (std::size_t b = 0; b < geometry.n_systems(); ++b)
            for (std::size_t i = 0; i < geometry.n_atoms(b); ++i)
                for (std::size_t j = 0; j < i; ++j) e[b] += 0.1 * std::exp(-r(b, i, j));
        return e;
    }
};

inline std::shared_ptr<const IntegralFeed> hamiltonian_feed() {
    return std::make_shared<ToyIntegralFeed>(false);
}

inline std::shared_ptr<const IntegralFeed> overlap_feed() {
    return std::make_shared<ToyIntegralFeed>(true);
}

inline std::shared_ptr<const OccupationFeed> occupation_feed() {
    return std::make_shared<ShellOccupationFeed>(std::map<int, std::vector<double>>{
        {1, {1.0}}, {3, {1.0}}, {6, {2.0, 2.0}}, {8, {2.0, 4.0}}});
}

inline std::shared_ptr<const HubbardFeed> hubbard_feed() {
    return std::make_shared<ShellHubbardFeed>(std::map<int, std::vector<double>>{
        {1, {0.4196}}, {3, {0.1740}}, {6, {0.3647, 0.3647}}, {8, {0.4954, 0.4954}}});
}

inline std::shared_ptr<const RepulsiveFeed> repulsive_feed() {
    return std::make_shared<ToyRepulsiveFeed>();
}

// SCC problem for the given molecules, built the way Dftb2 builds it
inline SccInputs scc_inputs(const std::vector<Molecule>& mols, bool shell_resolved = false,
                            FillingSettings filling = {}) {
    const Geometry geo = geometry(mols);
    OrbitalInfo orbs = orbitals(mols, shell_resolved);
    const BatchVector q0 = (*occupation_feed())(orbs);
    std::vector<double> n_electrons(orbs.n_systems());
    for (std::size_t b = 0; b < orbs.n_systems(); ++b) n_electrons[b] = q0.row(b).sum();
    BatchMatrix gamma = build_gamma_matrix(geo, orbs, geo.inverse_distances(),
                                           (*hubbard_feed())(orbs), GammaScheme::exponential);
    BatchVector q0_res = resolve(q0, orbs, native_resolution(orbs));
    BatchMatrix h0 = hamiltonian_feed()->matrix(geo, orbs);
    BatchMatrix s = overlap_feed()->matrix(geo, orbs);
    return SccInputs{std::move(orbs), std::move(q0_res), std::move(h0), std::move(s),
                     std::move(gamma), std::move(n_electrons), filling};
}

} // namespace toy
