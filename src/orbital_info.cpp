// src/orbital_info.cpp - construction and narrowing of the orbital descriptor

#include <algorithm>
#include <string>

#include "cpp_dftb/orbital_info.hpp"
#include "cpp_dftb/errors.hpp"

namespace dftb {

OrbitalInfo::OrbitalInfo(const std::vector<std::vector<int>>& atomic_numbers,
                         ShellDict shell_dict,
                         bool shell_resolved)
    : shell_dict_(std::move(shell_dict)), shell_resolved_(shell_resolved) {
    systems_.reserve(atomic_numbers.size());
    for (std::size_t b = 0; b < atomic_numbers.size(); ++b) {
        System s;
        bool in_padding = false;
        for (int z : atomic_numbers[b]) {
            if (z <= 0) { in_padding = true; continue; }
            if (in_padding)
                throw ConfigurationError("OrbitalInfo: padding must trail the real atoms of system " + std::to_string(b));
            const auto it = shell_dict_.find(z);
            if (it == shell_dict_.end())
                throw ConfigurationError("OrbitalInfo: species " + std::to_string(z) + " missing from shell_dict");

            const int atom = (int)s.numbers.size();
            int on_atom = 0;
            for (int l : it->second) {
                if (l < 0) throw ConfigurationError("OrbitalInfo: negative angular momentum for species " + std::to_string(z));
                const int shell = (int)s.shell_ls.size();
                const int nl = 2 * l + 1;
                s.shell_ls.push_back(l);
                s.shell_atoms.push_back(atom);
                s.orbs_per_shell.push_back(nl);
                for (int m = 0; m < nl; ++m) {
                    s.on_atoms.push_back(atom);
                    s.on_shells.push_back(shell);
                }
                on_atom += nl;
            }
            s.numbers.push_back(z);
            s.orbs_per_atom.push_back(on_atom);
        }
        s.n_orbitals = s.on_atoms.size();
        max_atoms_    = std::max(max_atoms_, s.numbers.size());
        max_shells_   = std::max(max_shells_, s.shell_ls.size());
        max_orbitals_ = std::max(max_orbitals_, s.n_orbitals);
        systems_.push_back(std::move(s));
    }
    pad_index_maps();
}

void OrbitalInfo::pad_index_maps() {
    for (auto& s : systems_) {
        s.on_atoms.resize(max_orbitals_, -1);
        s.on_shells.resize(max_orbitals_, -1);
    }
}

OrbitalInfo OrbitalInfo::select(std::span<const std::size_t> idx) const {
    std::vector<std::vector<int>> numbers;
    numbers.reserve(idx.size());
    for (std::size_t b : idx) numbers.push_back(systems_.at(b).numbers);
    return OrbitalInfo(numbers, shell_dict_, shell_resolved_);
}

} // namespace dftb
