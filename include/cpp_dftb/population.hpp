// population.hpp - Mulliken population analysis
#pragma once

#include <optional>

#include "cpp_dftb/batch.hpp"
#include "cpp_dftb/orbital_info.hpp"

namespace dftb {

enum class Resolution { orbital, shell, atom };

// Mulliken populations q_i = sum_j rho_ij * S_ij (elementwise, not a matrix
// product). Orbital resolved unless orbs is given, in which case populations
// are summed onto orbs' native resolution or onto `resolution` when set.
// Throws ConfigurationError if `resolution` is set without orbs.
BatchVector mulliken(const BatchMatrix& rho, const BatchMatrix& S,
                     const OrbitalInfo* orbs = nullptr,
                     std::optional<Resolution> resolution = std::nullopt);

// Scatter-sum orbital resolved values onto shells or atoms. Padding indices
// are clamped to slot 0; their source values are zero.
BatchVector resolve(const BatchVector& q_orbital, const OrbitalInfo& orbs, Resolution resolution);

// Resolution matching orbs.shell_resolved()
inline Resolution native_resolution(const OrbitalInfo& orbs) {
    return orbs.shell_resolved() ? Resolution::shell : Resolution::atom;
}

} // namespace dftb
