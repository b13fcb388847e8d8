// src/dftb.cpp - calculator orchestration: feeds, SCC cycle and gradient modes

#include <algorithm>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "cpp_dftb/dftb.hpp"
#include "cpp_dftb/errors.hpp"
#include "cpp_dftb/gamma.hpp"
#include "cpp_dftb/population.hpp"
#include "cpp_dftb/prof.hpp"
#include "cpp_dftb/scc.hpp"

namespace dftb {

namespace {

void check_matrix(const BatchMatrix& m, const OrbitalInfo& orbs, const char* what) {
    if (m.nbatch != orbs.n_systems() || m.n != orbs.orbital_matrix_size())
        throw ShapeError(std::string(what) + " feed returned a (" + std::to_string(m.nbatch) + ", "
                         + std::to_string(m.n) + ") batch; expected ("
                         + std::to_string(orbs.n_systems()) + ", "
                         + std::to_string(orbs.orbital_matrix_size()) + ")");
}

void check_consistent(const Geometry& geometry, const OrbitalInfo& orbs) {
    if (geometry.n_systems() != orbs.n_systems())
        throw ConfigurationError("geometry and orbital info describe different batch sizes");
    for (std::size_t b = 0; b < orbs.n_systems(); ++b)
        if (geometry.atomic_numbers(b) != orbs.atomic_numbers(b))
            throw ConfigurationError("geometry and orbital info disagree on the atoms of system "
                                     + std::to_string(b));
}

} // namespace

// ---------------- Calculator ----------------
Calculator::Calculator(std::shared_ptr<const IntegralFeed> h_feed,
                       std::shared_ptr<const IntegralFeed> s_feed,
                       std::shared_ptr<const OccupationFeed> o_feed,
                       std::shared_ptr<const RepulsiveFeed> r_feed,
                       DftbConfig config)
    : h_feed_(std::move(h_feed)), s_feed_(std::move(s_feed)), o_feed_(std::move(o_feed)),
      r_feed_(std::move(r_feed)), config_(std::move(config)) {
    if (!h_feed_) throw ConfigurationError("a Hamiltonian feed is required");
    if (!s_feed_) throw ConfigurationError("an overlap feed is required");
    if (!o_feed_) throw ConfigurationError("an occupation feed is required");
    config_.validate();
}

const DftbResult& Calculator::result() const {
    if (!result_) throw std::logic_error("no result available; call compute() first");
    return *result_;
}

DftbResult Calculator::prepare(const Geometry& geometry, const OrbitalInfo& orbs) const {
    check_consistent(geometry, orbs);
    DFTB_PROFILE_SCOPE("feeds");

    DftbResult r{false, geometry, orbs, config_.filling()};
    r.overlap = s_feed_->matrix(geometry, orbs);
    r.core_hamiltonian = h_feed_->matrix(geometry, orbs);
    check_matrix(r.overlap, orbs, "overlap");
    check_matrix(r.core_hamiltonian, orbs, "Hamiltonian");

    r.q_zero = (*o_feed_)(orbs);
    if (r.q_zero.nbatch != orbs.n_systems() || r.q_zero.n != orbs.orbital_matrix_size())
        throw ShapeError("occupation feed must return orbital resolved populations");
    r.n_electrons.resize(orbs.n_systems());
    for (std::size_t b = 0; b < orbs.n_systems(); ++b)
        r.n_electrons[b] = r.q_zero.row(b).sum();

    if (r_feed_) {
        r.repulsive = (*r_feed_)(geometry);
        if (r.repulsive.size() != orbs.n_systems())
            throw ShapeError("repulsive feed must return one energy per system");
    } else {
        r.repulsive.assign(orbs.n_systems(), 0.0);
    }
    return r;
}

const DftbResult& Calculator::store(DftbResult r) {
    result_.emplace(std::move(r));
    return *result_;
}

// ---------------- Dftb1 ----------------
Dftb1::Dftb1(std::shared_ptr<const IntegralFeed> h_feed,
             std::shared_ptr<const IntegralFeed> s_feed,
             std::shared_ptr<const OccupationFeed> o_feed,
             std::shared_ptr<const RepulsiveFeed> r_feed,
             DftbConfig config)
    : Calculator(std::move(h_feed), std::move(s_feed), std::move(o_feed),
                 std::move(r_feed), std::move(config)) {}

const DftbResult& Dftb1::compute(const Geometry& geometry, const OrbitalInfo& orbs,
                                 const DftbCache* /*cache*/) {
    reset();
    DftbResult r = prepare(geometry, orbs);
    SccStepResult step = diagonalise(r.core_hamiltonian, r.overlap, orbs, r.n_electrons, r.filling);
    r.hamiltonian = std::move(step.hamiltonian);
    r.eig_values = std::move(step.eig_values);
    r.eig_vectors = std::move(step.eig_vectors);
    r.rho = std::move(step.rho);
    r.converged.assign(orbs.n_systems(), true);
    spdlog::debug("DFTB1 done: systems={} filling={}", orbs.n_systems(),
                  to_string(r.filling.effective()));
    return store(std::move(r));
}

// ---------------- Dftb2 ----------------
Dftb2::Dftb2(std::shared_ptr<const IntegralFeed> h_feed,
             std::shared_ptr<const IntegralFeed> s_feed,
             std::shared_ptr<const OccupationFeed> o_feed,
             std::shared_ptr<const HubbardFeed> u_feed,
             std::shared_ptr<const RepulsiveFeed> r_feed,
             DftbConfig config)
    : Calculator(std::move(h_feed), std::move(s_feed), std::move(o_feed),
                 std::move(r_feed), std::move(config)),
      u_feed_(std::move(u_feed)) {
    if (!u_feed_) throw ConfigurationError("a Hubbard-U feed is required");
    if (config_.mixer_instance) mixer_ = config_.mixer_instance;
    else mixer_ = make_mixer(config_.mixer, config_.mixer_settings, true);
}

const DftbResult& Dftb2::compute(const Geometry& geometry, const OrbitalInfo& orbs,
                                 const DftbCache* cache) {
    if (config_.grad_mode == GradMode::implicit)
        throw NotImplementedError("The \"implicit\" gradient mode has not been implemented yet");

    reset();
    DftbResult r = prepare(geometry, orbs);
    r.scc = true;

    const std::size_t nr = orbs.res_matrix_size();
    if (cache && cache->gamma) {
        if (cache->gamma->nbatch != orbs.n_systems() || cache->gamma->n != nr)
            throw ShapeError("cached gamma must be (batch, res, res)");
        r.gamma = *cache->gamma;
    } else {
        DFTB_PROFILE_SCOPE("gamma");
        const BatchVector u = (*u_feed_)(orbs);
        r.gamma = build_gamma_matrix(geometry, orbs, geometry.inverse_distances(), u,
                                     config_.gamma_scheme);
    }

    SccInputs inputs{orbs, resolve(r.q_zero, orbs, native_resolution(orbs)),
                     r.core_hamiltonian, r.overlap, r.gamma, r.n_electrons, r.filling};
    const BatchVector* q_initial = (cache && cache->q_initial) ? &*cache->q_initial : nullptr;
    const SccSettings settings{config_.max_scc_iter, config_.suppress_scc_error};

    SccCycleResult cycle = scc_cycle(inputs, *mixer_, settings, q_initial);
    r.converged = cycle.converged;

    if (config_.grad_mode == GradMode::direct) {
        r.hamiltonian = std::move(cycle.hamiltonian);
        r.eig_values = std::move(cycle.eig_values);
        r.eig_vectors = std::move(cycle.eig_vectors);
        r.rho = std::move(cycle.rho);
    } else {
        // last_step: one more step from the settled charges provides the result
        SccStepResult step = scc_step(inputs, cycle.q_final);
        r.hamiltonian = std::move(step.hamiltonian);
        r.eig_values = std::move(step.eig_values);
        r.eig_vectors = std::move(step.eig_vectors);
        r.rho = std::move(step.rho);
    }

    const auto n_conv = std::count(r.converged.begin(), r.converged.end(), true);
    spdlog::info("DFTB2 done: systems={} converged={} filling={} grad_mode={}",
                 orbs.n_systems(), n_conv, to_string(r.filling.effective()),
                 to_string(config_.grad_mode));
    return store(std::move(r));
}

} // namespace dftb
