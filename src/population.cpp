// src/population.cpp - Mulliken populations at orbital/shell/atom resolution

#include <algorithm>

#include "cpp_dftb/population.hpp"
#include "cpp_dftb/errors.hpp"

namespace dftb {

BatchVector resolve(const BatchVector& q_orbital, const OrbitalInfo& orbs, Resolution resolution) {
    if (resolution == Resolution::orbital) return q_orbital;

    const bool shells = resolution == Resolution::shell;
    const std::size_t size = shells ? orbs.shell_matrix_size() : orbs.atomic_matrix_size();
    BatchVector q(q_orbital.nbatch, size);
    for (std::size_t b = 0; b < q_orbital.nbatch; ++b) {
        const auto& ind = shells ? orbs.on_shells(b) : orbs.on_atoms(b);
        const std::size_t n = std::min(q_orbital.n, ind.size());
        for (std::size_t i = 0; i < n; ++i)
            q(b, (std::size_t)std::max(ind[i], 0)) += q_orbital(b, i);
    }
    return q;
}

BatchVector mulliken(const BatchMatrix& rho, const BatchMatrix& S,
                     const OrbitalInfo* orbs,
                     std::optional<Resolution> resolution) {
    if (resolution && !orbs)
        throw ConfigurationError(
            "mulliken: a resolution override cannot be interpreted without an OrbitalInfo");
    if (rho.nbatch != S.nbatch || rho.n != S.n)
        throw std::invalid_argument("mulliken: rho and S must have matching shapes");

    BatchVector q(rho.nbatch, rho.n);
    for (std::size_t b = 0; b < rho.nbatch; ++b)
        q.row(b) = rho.block(b).cwiseProduct(S.block(b)).rowwise().sum();

    if (!orbs) return q;
    return resolve(q, *orbs, resolution.value_or(native_resolution(*orbs)));
}

} // namespace dftb
