// src/scc.cpp - SCC step and cycle over a shrinking active batch

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include <Eigen/Core>
#include <spdlog/spdlog.h>

#ifdef _OPENMP
  #include <omp.h>
#endif

#include "cpp_dftb/scc.hpp"
#include "cpp_dftb/eigensolver.hpp"
#include "cpp_dftb/errors.hpp"
#include "cpp_dftb/population.hpp"
#include "cpp_dftb/prof.hpp"

namespace dftb {

namespace {

std::vector<std::size_t> own_orbitals(const OrbitalInfo& orbs) {
    std::vector<std::size_t> n(orbs.n_systems());
    for (std::size_t b = 0; b < n.size(); ++b) n[b] = orbs.n_orbitals(b);
    return n;
}

double max_residual(const BatchVector& q_new, const BatchVector& q_current) {
    if (q_new.data.empty()) return 0.0;
    return (q_new.flat() - q_current.flat()).abs().maxCoeff();
}

std::string join(const std::vector<std::size_t>& v) {
    std::string s;
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i) s += ", ";
        s += std::to_string(v[i]);
    }
    return s;
}

} // namespace

void SccInputs::check() const {
    const std::size_t nb = orbs.n_systems();
    const std::size_t no = orbs.orbital_matrix_size();
    const std::size_t nr = orbs.res_matrix_size();
    auto matrix_ok = [&](const BatchMatrix& m, std::size_t n){ return m.nbatch == nb && m.n == n; };
    if (!matrix_ok(core_hamiltonian, no) || !matrix_ok(overlap, no))
        throw std::invalid_argument("SccInputs: H0/S must be (batch, orbitals, orbitals)");
    if (!matrix_ok(gamma, nr))
        throw std::invalid_argument("SccInputs: gamma must be (batch, res, res)");
    if (q_zero.nbatch != nb || q_zero.n != nr)
        throw std::invalid_argument("SccInputs: q_zero must be (batch, res)");
    if (n_electrons.size() != nb)
        throw std::invalid_argument("SccInputs: one electron count per system required");
}

SccInputs SccInputs::select(std::span<const std::size_t> idx) const {
    OrbitalInfo sub = orbs.select(idx);
    const std::size_t no = sub.orbital_matrix_size();
    const std::size_t nr = sub.res_matrix_size();
    std::vector<double> ne;
    ne.reserve(idx.size());
    for (std::size_t b : idx) ne.push_back(n_electrons.at(b));
    return SccInputs{std::move(sub),
                     q_zero.select(idx, nr),
                     core_hamiltonian.select(idx, no),
                     overlap.select(idx, no),
                     gamma.select(idx, nr),
                     std::move(ne),
                     filling};
}

SccStepResult diagonalise(BatchMatrix hamiltonian, const BatchMatrix& overlap,
                          const OrbitalInfo& orbs, const std::vector<double>& n_electrons,
                          const FillingSettings& filling) {
    const std::vector<std::size_t> n_own = own_orbitals(orbs);
    EigenPairs eig = eigh_generalized(hamiltonian, overlap, n_own);

    BatchVector occ;
    {
        DFTB_PROFILE_SCOPE("fill");
        occ = occupancies(filling, eig.values, n_electrons, n_own);
    }

    BatchMatrix rho(hamiltonian.nbatch, hamiltonian.n);
    {
        DFTB_PROFILE_SCOPE("build_rho");
#ifdef _OPENMP
        #pragma omp parallel for schedule(static)
#endif
        for (long long bi = 0; bi < (long long)rho.nbatch; ++bi) {
            const std::size_t b = (std::size_t)bi;
            // C * sqrt(f); padding columns carry zero weight
            const MatR cw = eig.vectors.block(b) * occ.row(b).cwiseSqrt().asDiagonal();
            rho.block(b).noalias() = cw * cw.transpose();
        }
    }

    BatchVector q_out;
    {
        DFTB_PROFILE_SCOPE("mulliken");
        q_out = mulliken(rho, overlap, &orbs);
    }
    return SccStepResult{std::move(q_out), std::move(hamiltonian),
                         std::move(eig.values), std::move(eig.vectors), std::move(rho)};
}

SccStepResult scc_step(const SccInputs& inputs, const BatchVector& q_in) {
    inputs.check();
    if (q_in.nbatch != inputs.q_zero.nbatch || q_in.n != inputs.q_zero.n)
        throw std::invalid_argument("scc_step: q_in must match q_zero in shape");

    DFTB_PROFILE_SCOPE("scc_step");
    const OrbitalInfo& orbs = inputs.orbs;
    const std::size_t nb = orbs.n_systems();
    const std::size_t n = orbs.orbital_matrix_size();

    BatchMatrix H(nb, n);
    {
        DFTB_PROFILE_SCOPE("build_hamiltonian");
        for (std::size_t b = 0; b < nb; ++b) {
            // Potential shift per resolved unit, then per orbital
            const Eigen::VectorXd dq = q_in.row(b) - inputs.q_zero.row(b);
            const Eigen::VectorXd shift = inputs.gamma.block(b) * dq;
            const Eigen::VectorXd v = expand_to_orbitals(shift, orbs.orbs_per_res(b), n);

            const MatR vsum = v.replicate(1, (Eigen::Index)n)
                                       + v.transpose().replicate((Eigen::Index)n, 1);
            H.block(b) = inputs.core_hamiltonian.block(b)
                       + 0.5 * inputs.overlap.block(b).cwiseProduct(vsum);
        }
    }
    return diagonalise(std::move(H), inputs.overlap, orbs, inputs.n_electrons, inputs.filling);
}

bool SccCycleResult::all_converged() const {
    return std::all_of(converged.begin(), converged.end(), [](bool c){ return c; });
}

SccCycleResult scc_cycle(const SccInputs& inputs, Mixer& mixer, const SccSettings& settings,
                         const BatchVector* q_initial) {
    inputs.check();
    if (settings.max_scc_iter < 1)
        throw ConfigurationError("scc_cycle: max_scc_iter must be a positive integer");
    if (q_initial && (q_initial->nbatch != inputs.q_zero.nbatch || q_initial->n != inputs.q_zero.n))
        throw std::invalid_argument("scc_cycle: q_initial must match q_zero in shape");

    DFTB_PROFILE_SCOPE("scc_cycle");
    const std::size_t nb = inputs.orbs.n_systems();
    const std::size_t no = inputs.orbs.orbital_matrix_size();
    const std::size_t nr = inputs.orbs.res_matrix_size();

    mixer.reset();
    mixer.set_batch_mode(true);

    SccCycleResult out{BatchVector(nb, nr), BatchMatrix(nb, no), BatchVector(nb, no),
                       BatchMatrix(nb, no), BatchMatrix(nb, no),
                       std::vector<bool>(nb, false), std::vector<std::size_t>(nb, 0), {}};

    std::vector<std::size_t> active(nb);
    for (std::size_t b = 0; b < nb; ++b) active[b] = b;

    SccInputs work = inputs;
    BatchVector q_current = q_initial ? *q_initial : inputs.q_zero;

    // Copy slot k of the working step into the original system's slot
    auto settle = [&](const SccStepResult& step, std::size_t k, std::size_t iter) {
        const std::size_t b = active[k];
        const std::size_t n_orb = work.orbs.n_orbitals(k);
        const std::size_t n_res = work.orbs.n_res(k);
        step.q_out.write_system(k, out.q_final, b, n_res);
        step.hamiltonian.write_system(k, out.hamiltonian, b, n_orb);
        step.rho.write_system(k, out.rho, b, n_orb);
        step.eig_values.write_system(k, out.eig_values, b, n_orb);
        step.eig_vectors.write_system(k, out.eig_vectors, b, n_orb);
        out.iterations[b] = iter;
    };

    for (std::size_t iter = 1; nb > 0; ++iter) {
        out.active_counts.push_back(active.size());
        SccStepResult step = scc_step(work, q_current);

        const std::vector<bool> conv = charges_converged(step.q_out, q_current, mixer.tolerance());
        const auto n_conv = (std::size_t)std::count(conv.begin(), conv.end(), true);
        spdlog::debug("scc iter={} active={} converged={} max|dq|={:.3e}",
                      iter, active.size(), n_conv, max_residual(step.q_out, q_current));

        for (std::size_t k = 0; k < active.size(); ++k) {
            if (!conv[k]) continue;
            settle(step, k, iter);
            out.converged[active[k]] = true;
        }
        if (n_conv == active.size()) {
            spdlog::info("SCC converged: systems={} steps={}", nb, iter);
            break;
        }

        if (iter >= (std::size_t)settings.max_scc_iter) {
            std::vector<std::size_t> failed;
            for (std::size_t k = 0; k < active.size(); ++k)
                if (!conv[k]) failed.push_back(active[k]);
            if (!settings.suppress_scc_error)
                throw ConvergenceError("SCC cycle failed to converge after " + std::to_string(iter)
                                       + " iterations; unconverged systems: " + join(failed), failed);
            spdlog::warn("SCC not converged after {} iterations for systems [{}]; "
                         "returning last iterate", iter, join(failed));
            for (std::size_t k = 0; k < active.size(); ++k)
                if (!conv[k]) settle(step, k, iter);
            break;
        }

        BatchVector q_new = std::move(step.q_out);
        if (n_conv > 0) {
            std::vector<std::size_t> keep_idx;
            std::vector<std::size_t> still_active;
            for (std::size_t k = 0; k < active.size(); ++k) {
                if (conv[k]) continue;
                keep_idx.push_back(k);
                still_active.push_back(active[k]);
            }
            work = work.select(keep_idx);
            const std::size_t nr_new = work.orbs.res_matrix_size();
            q_new = q_new.select(keep_idx, nr_new);
            q_current = q_current.select(keep_idx, nr_new);

            std::vector<bool> keep(conv.size());
            for (std::size_t k = 0; k < conv.size(); ++k) keep[k] = !conv[k];
            mixer.cull(keep, nr_new);
            active = std::move(still_active);
        }
        q_current = mixer(q_new, q_current);
    }

    if (prof_auto_dump_enabled()) prof_dump();
    return out;
}

} // namespace dftb
