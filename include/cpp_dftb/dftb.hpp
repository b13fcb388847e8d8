// dftb.hpp - DFTB1 (non-SCC) and DFTB2 (SCC) calculators over padded batches
#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "cpp_dftb/batch.hpp"
#include "cpp_dftb/config.hpp"
#include "cpp_dftb/feeds.hpp"
#include "cpp_dftb/filling.hpp"
#include "cpp_dftb/geometry.hpp"
#include "cpp_dftb/mixers.hpp"
#include "cpp_dftb/orbital_info.hpp"

namespace dftb {

// Data used to bootstrap a calculation
struct DftbCache {
    std::optional<BatchVector> q_initial;   // SCC starting charges, (batch, res)
    std::optional<BatchMatrix> gamma;       // replaces the gamma built from the Hubbard feed
};

// Everything a finished calculation produced. Derived quantities (energies,
// charges, DOS) are free functions in properties.hpp.
struct DftbResult {
    bool scc = false;
    Geometry geometry;
    OrbitalInfo orbs;
    FillingSettings filling;

    BatchMatrix overlap;
    BatchMatrix core_hamiltonian;
    BatchMatrix hamiltonian;
    BatchMatrix gamma;            // (batch, res, res); empty for DFTB1
    BatchMatrix rho;
    BatchVector eig_values;
    BatchMatrix eig_vectors;

    BatchVector q_zero;           // orbital resolved reference populations
    std::vector<double> n_electrons;
    std::vector<double> repulsive;
    std::vector<bool> converged;
};

class Calculator {
public:
    virtual ~Calculator() = default;

    // Runs the calculation and stores the result, replacing any earlier one.
    virtual const DftbResult& compute(const Geometry& geometry, const OrbitalInfo& orbs,
                                      const DftbCache* cache = nullptr) = 0;

    bool has_result() const { return result_.has_value(); }
    // Throws std::logic_error if nothing has been computed since the last reset
    const DftbResult& result() const;
    void reset() { result_.reset(); }

    const DftbConfig& config() const { return config_; }

protected:
    Calculator(std::shared_ptr<const IntegralFeed> h_feed,
               std::shared_ptr<const IntegralFeed> s_feed,
               std::shared_ptr<const OccupationFeed> o_feed,
               std::shared_ptr<const RepulsiveFeed> r_feed,
               DftbConfig config);

    // Feeds evaluated for one geometry; hamiltonian/rho/eigenpairs left empty
    DftbResult prepare(const Geometry& geometry, const OrbitalInfo& orbs) const;
    const DftbResult& store(DftbResult r);

    std::shared_ptr<const IntegralFeed> h_feed_;
    std::shared_ptr<const IntegralFeed> s_feed_;
    std::shared_ptr<const OccupationFeed> o_feed_;
    std::shared_ptr<const RepulsiveFeed> r_feed_;
    DftbConfig config_;

private:
    std::optional<DftbResult> result_;
};

// Non self-consistent DFTB: one eigensolve of the core Hamiltonian.
class Dftb1 final : public Calculator {
public:
    Dftb1(std::shared_ptr<const IntegralFeed> h_feed,
          std::shared_ptr<const IntegralFeed> s_feed,
          std::shared_ptr<const OccupationFeed> o_feed,
          std::shared_ptr<const RepulsiveFeed> r_feed = nullptr,
          DftbConfig config = {});

    const DftbResult& compute(const Geometry& geometry, const OrbitalInfo& orbs,
                              const DftbCache* cache = nullptr) override;
};

// Self-consistent-charge DFTB.
class Dftb2 final : public Calculator {
public:
    Dftb2(std::shared_ptr<const IntegralFeed> h_feed,
          std::shared_ptr<const IntegralFeed> s_feed,
          std::shared_ptr<const OccupationFeed> o_feed,
          std::shared_ptr<const HubbardFeed> u_feed,
          std::shared_ptr<const RepulsiveFeed> r_feed = nullptr,
          DftbConfig config = {});

    const DftbResult& compute(const Geometry& geometry, const OrbitalInfo& orbs,
                              const DftbCache* cache = nullptr) override;

    Mixer& mixer() { return *mixer_; }

private:
    std::shared_ptr<const HubbardFeed> u_feed_;
    std::shared_ptr<Mixer> mixer_;
};

} // namespace dftb
