// properties.hpp - derived observables of a finished DFTB calculation
#pragma once

#include <utility>
#include <vector>

#include <Eigen/Core>

#include "cpp_dftb/batch.hpp"
#include "cpp_dftb/dftb.hpp"
#include "cpp_dftb/population.hpp"

namespace dftb {

// Hartree per electronvolt
inline constexpr double kHartreePerEv = 1.0 / 27.211386245988;

// State occupancies scaled by 2; zero on padding states
BatchVector occupancy(const DftbResult& r);
std::vector<double> fermi_energy(const DftbResult& r);

// sum_i f_i e_i
std::vector<double> band_energy(const DftbResult& r);
// sum_ij rho_ij H0_ij
std::vector<double> core_band_energy(const DftbResult& r);
// 2 * TS, zero for Aufbau filling
std::vector<double> entropy_energy(const DftbResult& r);
std::vector<double> band_free_energy(const DftbResult& r);
// 0.5 dq.gamma.dq at the native resolution; zero for DFTB1
std::vector<double> scc_energy(const DftbResult& r);
std::vector<double> repulsive_energy(const DftbResult& r);

// DFTB1: band + repulsive. DFTB2: core band + scc + repulsive.
std::vector<double> total_energy(const DftbResult& r);
// total_energy - TS
std::vector<double> mermin_energy(const DftbResult& r);

BatchVector q_final(const DftbResult& r, Resolution res = Resolution::orbital);
BatchVector q_zero(const DftbResult& r, Resolution res = Resolution::orbital);
BatchVector q_delta(const DftbResult& r, Resolution res = Resolution::orbital);

// sum_a dq_a R_a using atom resolved charge deltas
std::vector<Eigen::Vector3d> dipole(const DftbResult& r);

// (HOMO, LUMO) per system; throws ShapeError if every state of some system is occupied
std::vector<std::pair<double, double>> homo_lumo(const DftbResult& r);

// Per system energy grid spanning the real eigenvalues with `margin` either side
BatchVector dos_energy(const DftbResult& r, std::size_t grid = 1000,
                       double margin = kHartreePerEv);
// Gaussian broadened density of states on dos_energy's grid
BatchVector dos(const DftbResult& r, double sigma = 0.1 * kHartreePerEv,
                std::size_t grid = 1000);

} // namespace dftb
