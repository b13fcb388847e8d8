// eigensolver.hpp - batched generalized symmetric eigenproblem H C = S C e
#pragma once

#include <cstddef>
#include <vector>

#include "cpp_dftb/batch.hpp"

namespace dftb {

struct EigenPairs {
    BatchVector values;   // (batch, n): ascending real values, then 0 for padding
    BatchMatrix vectors;  // (batch, n, n): columns S-orthonormal, padding zero
};

// Solves each system on its own leading n_own[b] block so that padded
// rows/cols never reach the solver. Throws std::runtime_error if S is not
// positive definite or the decomposition fails.
EigenPairs eigh_generalized(const BatchMatrix& H, const BatchMatrix& S,
                            const std::vector<std::size_t>& n_own);

} // namespace dftb
