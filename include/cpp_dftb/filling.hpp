// filling.hpp - occupation filling (Fermi-Dirac, Gaussian, Aufbau) and Fermi search
#pragma once

#include <cstddef>
#include <vector>

#include <Eigen/Core>

#include "cpp_dftb/batch.hpp"

namespace dftb {

enum class FillingScheme { fermi, gaussian, aufbau };

// Scheme chosen once at configuration time. A zero temperature always means
// strict Aufbau filling whatever scheme is named.
struct FillingSettings {
    FillingScheme scheme = FillingScheme::fermi;
    double temperature = 0.0;   // kT in hartree

    FillingScheme effective() const {
        return temperature > 0.0 ? scheme : FillingScheme::aufbau;
    }
};

// Single-state weights in [0,1] (unscaled; multiply by 2 for closed shells)
double fermi_smearing(double e, double fermi_energy, double kt);
double gaussian_smearing(double e, double fermi_energy, double kt);

// Fill the lowest states with one weight each until n_electrons/2 are placed;
// the last partially occupied state takes the fractional remainder.
Eigen::VectorXd aufbau_filling(const Eigen::Ref<const Eigen::VectorXd>& eigenvalues, double n_electrons);

// Weights for the given (real, ascending) eigenvalues
Eigen::VectorXd fill(const FillingSettings& settings,
                     const Eigen::Ref<const Eigen::VectorXd>& eigenvalues,
                     double fermi_energy, double n_electrons);

// Chemical potential at which 2 * sum(weights) == n_electrons. For Aufbau
// filling this is the HOMO/LUMO midpoint.
double fermi_search(const FillingSettings& settings,
                    const Eigen::Ref<const Eigen::VectorXd>& eigenvalues,
                    double n_electrons);

// TS correction per spin channel; zero for Aufbau filling
double entropy_term(const FillingSettings& settings,
                    const Eigen::Ref<const Eigen::VectorXd>& eigenvalues,
                    double fermi_energy);

// Batch helpers; n_states[b] masks out padding states of system b.
std::vector<double> fermi_energies(const FillingSettings& settings, const BatchVector& eigenvalues,
                                   const std::vector<double>& n_electrons,
                                   const std::vector<std::size_t>& n_states);

// Occupancies scaled by 2 (spin restricted); zero on padding states.
BatchVector occupancies(const FillingSettings& settings, const BatchVector& eigenvalues,
                        const std::vector<double>& n_electrons,
                        const std::vector<std::size_t>& n_states);

} // namespace dftb
