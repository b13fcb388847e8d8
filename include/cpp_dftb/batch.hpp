// batch.hpp - padded (batch, n) / (batch, n, n) buffers with Eigen views
#pragma once

#include <cstddef>
#include <vector>
#include <span>
#include <stdexcept>
#include <algorithm>

#include <Eigen/Core>

namespace dftb {

using MatR = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Layout helper for (batch, n, n) row-major (C-order)
inline std::size_t offset(std::size_t n, std::size_t b, std::size_t i, std::size_t j) {
    return (b * n + i) * n + j;
}

// (batch, n) buffer; entries past a system's own length are exact zeros.
struct BatchVector {
    std::size_t nbatch = 0;
    std::size_t n = 0;
    std::vector<double> data;

    BatchVector() = default;
    BatchVector(std::size_t nbatch_, std::size_t n_)
        : nbatch(nbatch_), n(n_), data(nbatch_ * n_, 0.0) {}

    double& operator()(std::size_t b, std::size_t i)       { return data[b * n + i]; }
    double  operator()(std::size_t b, std::size_t i) const { return data[b * n + i]; }

    Eigen::Map<Eigen::VectorXd> row(std::size_t b) {
        return Eigen::Map<Eigen::VectorXd>(data.data() + b * n, (Eigen::Index)n);
    }
    Eigen::Map<const Eigen::VectorXd> row(std::size_t b) const {
        return Eigen::Map<const Eigen::VectorXd>(data.data() + b * n, (Eigen::Index)n);
    }

    // Whole buffer as one flat array (used by the non-batch mixer path)
    Eigen::Map<Eigen::ArrayXd> flat() {
        return Eigen::Map<Eigen::ArrayXd>(data.data(), (Eigen::Index)data.size());
    }
    Eigen::Map<const Eigen::ArrayXd> flat() const {
        return Eigen::Map<const Eigen::ArrayXd>(data.data(), (Eigen::Index)data.size());
    }

    // Keep the listed systems, in the listed order, with padding width new_n.
    // Pure re-indexing: values are copied, never recomputed.
    BatchVector select(std::span<const std::size_t> idx, std::size_t new_n) const {
        BatchVector out(idx.size(), new_n);
        const std::size_t w = std::min(n, new_n);
        for (std::size_t k = 0; k < idx.size(); ++k)
            out.row(k).head((Eigen::Index)w) = row(idx[k]).head((Eigen::Index)w);
        return out;
    }

    // Copy system b (first n_own entries) into slot of dst
    void write_system(std::size_t b, BatchVector& dst, std::size_t slot, std::size_t n_own) const {
        if (n_own > n || n_own > dst.n || slot >= dst.nbatch)
            throw std::out_of_range("write_system: system does not fit destination");
        dst.row(slot).setZero();
        dst.row(slot).head((Eigen::Index)n_own) = row(b).head((Eigen::Index)n_own);
    }
};

// (batch, n, n) buffer; rows/cols past a system's own size are exact zeros.
struct BatchMatrix {
    std::size_t nbatch = 0;
    std::size_t n = 0;
    std::vector<double> data;

    BatchMatrix() = default;
    BatchMatrix(std::size_t nbatch_, std::size_t n_)
        : nbatch(nbatch_), n(n_), data(nbatch_ * n_ * n_, 0.0) {}

    double& operator()(std::size_t b, std::size_t i, std::size_t j)       { return data[offset(n, b, i, j)]; }
    double  operator()(std::size_t b, std::size_t i, std::size_t j) const { return data[offset(n, b, i, j)]; }

    Eigen::Map<MatR> block(std::size_t b) {
        return Eigen::Map<MatR>(data.data() + offset(n, b, 0, 0), (Eigen::Index)n, (Eigen::Index)n);
    }
    Eigen::Map<const MatR> block(std::size_t b) const {
        return Eigen::Map<const MatR>(data.data() + offset(n, b, 0, 0), (Eigen::Index)n, (Eigen::Index)n);
    }

    BatchMatrix select(std::span<const std::size_t> idx, std::size_t new_n) const {
        BatchMatrix out(idx.size(), new_n);
        const Eigen::Index w = (Eigen::Index)std::min(n, new_n);
        for (std::size_t k = 0; k < idx.size(); ++k)
            out.block(k).topLeftCorner(w, w) = block(idx[k]).topLeftCorner(w, w);
        return out;
    }

    void write_system(std::size_t b, BatchMatrix& dst, std::size_t slot, std::size_t n_own) const {
        if (n_own > n || n_own > dst.n || slot >= dst.nbatch)
            throw std::out_of_range("write_system: system does not fit destination");
        const Eigen::Index m = (Eigen::Index)n_own;
        dst.block(slot).setZero();
        dst.block(slot).topLeftCorner(m, m) = block(b).topLeftCorner(m, m);
    }
};

// Repeat each resolved value across the orbitals it governs; the result has
// length n_out and is zero past the expanded entries.
inline Eigen::VectorXd expand_to_orbitals(const Eigen::Ref<const Eigen::VectorXd>& values,
                                          const std::vector<int>& orbs_per_res,
                                          std::size_t n_out) {
    Eigen::VectorXd out = Eigen::VectorXd::Zero((Eigen::Index)n_out);
    Eigen::Index pos = 0;
    for (std::size_t r = 0; r < orbs_per_res.size(); ++r) {
        const Eigen::Index cnt = orbs_per_res[r];
        if (pos + cnt > (Eigen::Index)n_out)
            throw std::out_of_range("expand_to_orbitals: output too short");
        out.segment(pos, cnt).setConstant(values((Eigen::Index)r));
        pos += cnt;
    }
    return out;
}

} // namespace dftb
