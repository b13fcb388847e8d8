// src/eigensolver.cpp - per-system generalized eigendecomposition on padded batches

#include <stdexcept>
#include <string>

#include <Eigen/Cholesky>
#include <Eigen/Eigenvalues>

#ifdef _OPENMP
  #include <omp.h>
#endif

#include "cpp_dftb/eigensolver.hpp"
#include "cpp_dftb/platform.hpp"
#include "cpp_dftb/prof.hpp"

namespace dftb {

EigenPairs eigh_generalized(const BatchMatrix& H, const BatchMatrix& S,
                            const std::vector<std::size_t>& n_own) {
    if (H.nbatch != S.nbatch || H.n != S.n || n_own.size() != H.nbatch)
        throw std::invalid_argument("eigh_generalized: H, S and n_own must agree in shape");

    DFTB_PROFILE_SCOPE("eigh_generalized");
    EigenPairs out{BatchVector(H.nbatch, H.n), BatchMatrix(H.nbatch, H.n)};
    bool failed = false;

#ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (long long bi = 0; bi < (long long)H.nbatch; ++bi) {
        const std::size_t b = (std::size_t)bi;
        const Eigen::Index m = (Eigen::Index)n_own[b];
        if (m == 0) continue;
        const Eigen::MatrixXd Hb = H.block(b).topLeftCorner(m, m);
        const Eigen::MatrixXd Sb = S.block(b).topLeftCorner(m, m);
        // The generalized solver factorises S without reporting failure
        const Eigen::LLT<Eigen::MatrixXd> llt(Sb);
        if (DFTB_UNLIKELY(llt.info() != Eigen::Success)) {
#ifdef _OPENMP
            #pragma omp atomic write
#endif
            failed = true;
            continue;
        }
        Eigen::GeneralizedSelfAdjointEigenSolver<Eigen::MatrixXd> es(Hb, Sb,
            Eigen::ComputeEigenvectors | Eigen::Ax_lBx);
        if (DFTB_UNLIKELY(es.info() != Eigen::Success)) {
#ifdef _OPENMP
            #pragma omp atomic write
#endif
            failed = true;
            continue;
        }
        out.values.row(b).head(m) = es.eigenvalues();
        out.vectors.block(b).topLeftCorner(m, m) = es.eigenvectors();
    }
    if (failed) throw std::runtime_error("generalized EVD failed (overlap not positive definite?)");
    return out;
}

} // namespace dftb
