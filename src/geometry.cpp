// src/geometry.cpp - distance matrices for batched structures

#include <algorithm>
#include <string>

#include "cpp_dftb/geometry.hpp"
#include "cpp_dftb/errors.hpp"

namespace dftb {

Geometry::Geometry(const std::vector<std::vector<int>>& atomic_numbers,
                   const std::vector<std::vector<Eigen::Vector3d>>& positions) {
    if (atomic_numbers.size() != positions.size())
        throw ConfigurationError("Geometry: atomic_numbers and positions differ in batch size");

    numbers_.reserve(atomic_numbers.size());
    positions_.reserve(atomic_numbers.size());
    for (std::size_t b = 0; b < atomic_numbers.size(); ++b) {
        const auto& z = atomic_numbers[b];
        const auto real = std::find_if(z.begin(), z.end(), [](int v){ return v <= 0; });
        if (std::any_of(real, z.end(), [](int v){ return v > 0; }))
            throw ConfigurationError("Geometry: padding must trail the real atoms of system " + std::to_string(b));
        const std::size_t na = (std::size_t)(real - z.begin());
        if (positions[b].size() < na)
            throw ConfigurationError("Geometry: missing positions for system " + std::to_string(b));
        numbers_.emplace_back(z.begin(), real);
        positions_.emplace_back(positions[b].begin(), positions[b].begin() + (std::ptrdiff_t)na);
    }
}

std::size_t Geometry::max_atoms() const {
    std::size_t m = 0;
    for (const auto& z : numbers_) m = std::max(m, z.size());
    return m;
}

BatchMatrix Geometry::distances() const {
    BatchMatrix r(n_systems(), max_atoms());
    for (std::size_t b = 0; b < n_systems(); ++b) {
        const auto& pos = positions_[b];
        for (std::size_t i = 0; i < pos.size(); ++i)
            for (std::size_t j = 0; j < i; ++j) {
                const double d = (pos[i] - pos[j]).norm();
                r(b, i, j) = d;
                r(b, j, i) = d;
            }
    }
    return r;
}

BatchMatrix Geometry::inverse_distances() const {
    BatchMatrix r = distances();
    Eigen::Map<Eigen::ArrayXd> a(r.data.data(), (Eigen::Index)r.data.size());
    a = (a != 0.0).select(a.inverse(), 0.0);
    return r;
}

Geometry Geometry::select(std::span<const std::size_t> idx) const {
    Geometry g;
    for (std::size_t b : idx) {
        g.numbers_.push_back(numbers_.at(b));
        g.positions_.push_back(positions_.at(b));
    }
    return g;
}

} // namespace dftb
