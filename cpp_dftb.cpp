// Thin Python bindings only. Core logic lives in src/scc.cpp

#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include <cstring>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "cpp_dftb/config.hpp"
#include "cpp_dftb/mixers.hpp"
#include "cpp_dftb/orbital_info.hpp"
#include "cpp_dftb/scc.hpp"

namespace py = pybind11;
using darray = py::array_t<double, py::array::c_style | py::array::forcecast>;

static dftb::BatchVector to_batch_vector(const darray& a, std::size_t nb, std::size_t n, const char* what) {
    if (a.ndim()!=2 || (std::size_t)a.shape(0)!=nb || (std::size_t)a.shape(1)!=n)
        throw std::invalid_argument(std::string(what) + " must be (batch," + std::to_string(n) + ")");
    dftb::BatchVector v(nb, n);
    std::memcpy(v.data.data(), a.data(), v.data.size()*sizeof(double));
    return v;
}

static dftb::BatchMatrix to_batch_matrix(const darray& a, std::size_t nb, std::size_t n, const char* what) {
    if (a.ndim()!=3 || (std::size_t)a.shape(0)!=nb || (std::size_t)a.shape(1)!=n || (std::size_t)a.shape(2)!=n)
        throw std::invalid_argument(std::string(what) + " must be (batch," + std::to_string(n) + "," + std::to_string(n) + ")");
    dftb::BatchMatrix m(nb, n);
    std::memcpy(m.data.data(), a.data(), m.data.size()*sizeof(double));
    return m;
}

static py::array_t<double> to_numpy(const dftb::BatchVector& v) {
    py::array_t<double> out({(py::ssize_t)v.nbatch, (py::ssize_t)v.n});
    std::memcpy(out.mutable_data(), v.data.data(), v.data.size()*sizeof(double));
    return out;
}

static py::array_t<double> to_numpy(const dftb::BatchMatrix& m) {
    py::array_t<double> out({(py::ssize_t)m.nbatch, (py::ssize_t)m.n, (py::ssize_t)m.n});
    std::memcpy(out.mutable_data(), m.data.data(), m.data.size()*sizeof(double));
    return out;
}

static py::tuple scc_cycle_cpp(
    std::vector<std::vector<int>> atomic_numbers,           // (batch, atoms), 0 = padding
    std::map<int, std::vector<int>> shell_dict,
    bool shell_resolved,
    darray q_zero,                                          // (batch, res)
    darray core_hamiltonian,                                // (batch, orb, orb)
    darray overlap,                                         // (batch, orb, orb)
    darray gamma,                                           // (batch, res, res)
    std::vector<double> n_electrons,
    double filling_temp,
    const std::string& filling_scheme,
    int max_scc_iter,
    const std::string& mixer,
    double mix_param,
    double init_mix_param,
    std::size_t generations,
    double tolerance,
    bool suppress_scc_error,
    std::optional<darray> q_initial
) {
    dftb::OrbitalInfo orbs(atomic_numbers, std::move(shell_dict), shell_resolved);
    const std::size_t nb = orbs.n_systems();
    const std::size_t no = orbs.orbital_matrix_size();
    const std::size_t nr = orbs.res_matrix_size();

    dftb::SccInputs inputs{orbs,
                           to_batch_vector(q_zero, nb, nr, "q_zero"),
                           to_batch_matrix(core_hamiltonian, nb, no, "core_hamiltonian"),
                           to_batch_matrix(overlap, nb, no, "overlap"),
                           to_batch_matrix(gamma, nb, nr, "gamma"),
                           std::move(n_electrons),
                           {dftb::parse_filling_scheme(filling_scheme), filling_temp}};
    std::optional<dftb::BatchVector> q0;
    if (q_initial) q0 = to_batch_vector(*q_initial, nb, nr, "q_initial");

    dftb::MixerSettings ms;
    ms.mix_param = mix_param;
    ms.init_mix_param = init_mix_param;
    ms.generations = generations;
    ms.tolerance = tolerance;
    auto mix = dftb::make_mixer(mixer, ms, true);

    dftb::SccCycleResult res;
    {
        py::gil_scoped_release nogil;
        res = dftb::scc_cycle(inputs, *mix, {max_scc_iter, suppress_scc_error}, q0 ? &*q0 : nullptr);
    }

    return py::make_tuple(to_numpy(res.q_final), to_numpy(res.hamiltonian),
                          to_numpy(res.eig_values), to_numpy(res.eig_vectors),
                          to_numpy(res.rho), res.converged);
}

PYBIND11_MODULE(cpp_dftb, m) {
    m.doc() = "Batched SCC-DFTB charge cycle with Eigen + OpenMP + Anderson mixing";
    m.def("scc_cycle", &scc_cycle_cpp,
          py::arg("atomic_numbers"), py::arg("shell_dict"), py::arg("shell_resolved"),
          py::arg("q_zero"), py::arg("core_hamiltonian"), py::arg("overlap"), py::arg("gamma"),
          py::arg("n_electrons"),
          py::arg("filling_temp") = 0.0, py::arg("filling_scheme") = "fermi",
          py::arg("max_scc_iter") = 200, py::arg("mixer") = "anderson",
          py::arg("mix_param") = 0.05, py::arg("init_mix_param") = 0.01,
          py::arg("generations") = 4, py::arg("tolerance") = 1e-6,
          py::arg("suppress_scc_error") = false, py::arg("q_initial") = py::none());
}
