// geometry.hpp - batch of atomic structures (atomic numbers + positions in bohr)
#pragma once

#include <cstddef>
#include <vector>
#include <span>

#include <Eigen/Core>

#include "cpp_dftb/batch.hpp"

namespace dftb {

class Geometry {
public:
    // atomic_numbers may carry trailing zeros as padding; positions are read
    // for the real atoms only.
    Geometry(const std::vector<std::vector<int>>& atomic_numbers,
             const std::vector<std::vector<Eigen::Vector3d>>& positions);

    std::size_t n_systems() const { return numbers_.size(); }
    std::size_t n_atoms(std::size_t b) const { return numbers_[b].size(); }
    std::size_t max_atoms() const;

    const std::vector<int>& atomic_numbers(std::size_t b) const { return numbers_[b]; }
    const std::vector<Eigen::Vector3d>& positions(std::size_t b) const { return positions_[b]; }

    // (batch, max_atoms, max_atoms); zero on the diagonal and for padding
    BatchMatrix distances() const;
    // 1/R, zero where R is zero
    BatchMatrix inverse_distances() const;

    Geometry select(std::span<const std::size_t> idx) const;

private:
    Geometry() = default;

    std::vector<std::vector<int>> numbers_;
    std::vector<std::vector<Eigen::Vector3d>> positions_;
};

} // namespace dftb
