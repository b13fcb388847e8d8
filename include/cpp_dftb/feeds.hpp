// feeds.hpp - parameter feeds consumed by the calculators
#pragma once

#include <map>
#include <vector>

#include "cpp_dftb/batch.hpp"
#include "cpp_dftb/geometry.hpp"
#include "cpp_dftb/orbital_info.hpp"

namespace dftb {

// Builds a (batch, orbitals, orbitals) matrix: core Hamiltonian or overlap.
// Implementations must be pure and leave padding rows/cols exactly zero.
class IntegralFeed {
public:
    virtual ~IntegralFeed() = default;
    virtual BatchMatrix matrix(const Geometry& geometry, const OrbitalInfo& orbs) const = 0;
};

// Neutral reference populations q_zero, orbital resolved.
class OccupationFeed {
public:
    virtual ~OccupationFeed() = default;
    virtual BatchVector operator()(const OrbitalInfo& orbs) const = 0;
};

// Hubbard-U values at the resolution of orbs.
class HubbardFeed {
public:
    virtual ~HubbardFeed() = default;
    virtual BatchVector operator()(const OrbitalInfo& orbs) const = 0;
};

// Pairwise repulsive energy, one value per system.
class RepulsiveFeed {
public:
    virtual ~RepulsiveFeed() = default;
    virtual std::vector<double> operator()(const Geometry& geometry) const = 0;
};

// Shell occupations per species, e.g. {6, {2.0, 2.0}}; each shell's
// occupation is spread evenly over its 2l+1 orbitals.
class ShellOccupationFeed final : public OccupationFeed {
public:
    explicit ShellOccupationFeed(std::map<int, std::vector<double>> shell_occupations);
    BatchVector operator()(const OrbitalInfo& orbs) const override;

private:
    std::map<int, std::vector<double>> occupations_;
};

// Hubbard-U per species shell. Atom resolved descriptors take the value of
// the species' first shell.
class ShellHubbardFeed final : public HubbardFeed {
public:
    explicit ShellHubbardFeed(std::map<int, std::vector<double>> shell_u);
    BatchVector operator()(const OrbitalInfo& orbs) const override;

private:
    std::map<int, std::vector<double>> u_;
};

} // namespace dftb
