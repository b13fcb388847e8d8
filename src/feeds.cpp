// src/feeds.cpp - species table feeds for reference occupations and Hubbard-U

#include <string>

#include "cpp_dftb/feeds.hpp"
#include "cpp_dftb/errors.hpp"

namespace dftb {

namespace {

const std::vector<double>& lookup(const std::map<int, std::vector<double>>& table, int z,
                                  std::size_t n_shells, const char* what) {
    const auto it = table.find(z);
    if (it == table.end())
        throw ConfigurationError(std::string(what) + ": no entry for species " + std::to_string(z));
    if (it->second.size() < n_shells)
        throw ConfigurationError(std::string(what) + ": too few shell values for species " + std::to_string(z));
    return it->second;
}

} // namespace

ShellOccupationFeed::ShellOccupationFeed(std::map<int, std::vector<double>> shell_occupations)
    : occupations_(std::move(shell_occupations)) {}

BatchVector ShellOccupationFeed::operator()(const OrbitalInfo& orbs) const {
    BatchVector q(orbs.n_systems(), orbs.orbital_matrix_size());
    for (std::size_t b = 0; b < orbs.n_systems(); ++b) {
        std::size_t orb = 0, shell = 0;
        for (std::size_t a = 0; a < orbs.n_atoms(b); ++a) {
            const int z = orbs.atomic_numbers(b)[a];
            const std::size_t ns = orbs.shell_dict().at(z).size();
            const auto& occ = lookup(occupations_, z, ns, "ShellOccupationFeed");
            for (std::size_t s = 0; s < ns; ++s, ++shell) {
                const int nl = orbs.orbs_per_shell(b)[shell];
                for (int m = 0; m < nl; ++m) q(b, orb++) = occ[s] / nl;
            }
        }
    }
    return q;
}

ShellHubbardFeed::ShellHubbardFeed(std::map<int, std::vector<double>> shell_u)
    : u_(std::move(shell_u)) {}

BatchVector ShellHubbardFeed::operator()(const OrbitalInfo& orbs) const {
    BatchVector u(orbs.n_systems(), orbs.res_matrix_size());
    for (std::size_t b = 0; b < orbs.n_systems(); ++b) {
        std::size_t shell = 0;
        for (std::size_t a = 0; a < orbs.n_atoms(b); ++a) {
            const int z = orbs.atomic_numbers(b)[a];
            const std::size_t ns = orbs.shell_dict().at(z).size();
            const auto& vals = lookup(u_, z, orbs.shell_resolved() ? ns : 1, "ShellHubbardFeed");
            if (orbs.shell_resolved())
                for (std::size_t s = 0; s < ns; ++s) u(b, shell++) = vals[s];
            else
                u(b, a) = vals[0];
        }
    }
    return u;
}

} // namespace dftb
