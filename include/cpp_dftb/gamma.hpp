// gamma.hpp - second order charge interaction kernel (gamma matrix)
#pragma once

#include "cpp_dftb/batch.hpp"
#include "cpp_dftb/geometry.hpp"
#include "cpp_dftb/orbital_info.hpp"

namespace dftb {

enum class GammaScheme { exponential, gaussian };

// Pairwise kernel between two charge sites with Hubbard values ua, ub at
// distance r (r == 0 means both sites sit on the same atom).
double gamma_exponential(double r, double ua, double ub);
double gamma_gaussian(double r, double ua, double ub);

// Gamma matrix at the resolution of orbs (shell or atom), built from the
// inverse distance matrix invr (batch, atoms, atoms) and Hubbard values
// hubbard_u (batch, res). Padding rows/cols are exactly zero.
BatchMatrix build_gamma_matrix(const Geometry& geometry, const OrbitalInfo& orbs,
                               const BatchMatrix& invr, const BatchVector& hubbard_u,
                               GammaScheme scheme);

} // namespace dftb
