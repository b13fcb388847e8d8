// scc.hpp - SCC step and the batch-aware self-consistent charge cycle
#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "cpp_dftb/batch.hpp"
#include "cpp_dftb/filling.hpp"
#include "cpp_dftb/mixers.hpp"
#include "cpp_dftb/orbital_info.hpp"

namespace dftb {

// Working tensors of one SCC problem. Charges and gamma live at the native
// resolution of orbs (shell or atom); matrices are orbital resolved.
struct SccInputs {
    OrbitalInfo orbs;
    BatchVector q_zero;               // (batch, res)
    BatchMatrix core_hamiltonian;     // (batch, orb, orb)
    BatchMatrix overlap;              // (batch, orb, orb)
    BatchMatrix gamma;                // (batch, res, res)
    std::vector<double> n_electrons;  // (batch)
    FillingSettings filling;

    // Throws std::invalid_argument if the tensors disagree with orbs
    void check() const;

    // Listed systems only, padding re-tightened to the largest of them
    SccInputs select(std::span<const std::size_t> idx) const;
};

struct SccStepResult {
    BatchVector q_out;        // (batch, res)
    BatchMatrix hamiltonian;
    BatchVector eig_values;
    BatchMatrix eig_vectors;
    BatchMatrix rho;
};

// Eigensolve H, fill, build rho and Mulliken charges at orbs' native resolution
SccStepResult diagonalise(BatchMatrix hamiltonian, const BatchMatrix& overlap,
                          const OrbitalInfo& orbs, const std::vector<double>& n_electrons,
                          const FillingSettings& filling);

// One SCC step from charges q_in; inputs are not modified.
SccStepResult scc_step(const SccInputs& inputs, const BatchVector& q_in);

struct SccSettings {
    int max_scc_iter = 200;
    bool suppress_scc_error = false;
};

struct SccCycleResult {
    BatchVector q_final;
    BatchMatrix hamiltonian;
    BatchVector eig_values;
    BatchMatrix eig_vectors;
    BatchMatrix rho;
    std::vector<bool> converged;             // per original system
    std::vector<std::size_t> iterations;     // step at which each system was settled
    std::vector<std::size_t> active_counts;  // active systems entering each step

    bool all_converged() const;
};

// Iterates scc_step to self-consistency. Systems leave the working batch as
// soon as they converge; their results are written to the original slot at
// their own size. The mixer is reset and put into batch mode. Throws
// ConvergenceError naming the unconverged systems unless suppressed.
SccCycleResult scc_cycle(const SccInputs& inputs, Mixer& mixer, const SccSettings& settings,
                         const BatchVector* q_initial = nullptr);

} // namespace dftb
