// orbital_info.hpp - orbital/shell/atom bookkeeping for padded batches
#pragma once

#include <cstddef>
#include <map>
#include <vector>
#include <span>

namespace dftb {

// Maps each system of a batch onto a padded orbital indexing scheme.
// Index maps are padded to orbital_matrix_size(); padding entries hold -1.
class OrbitalInfo {
public:
    // atomic number -> angular momenta of its shells, e.g. {6, {0, 1}}
    using ShellDict = std::map<int, std::vector<int>>;

    OrbitalInfo(const std::vector<std::vector<int>>& atomic_numbers,
                ShellDict shell_dict,
                bool shell_resolved = false);

    std::size_t n_systems() const { return systems_.size(); }
    bool shell_resolved() const { return shell_resolved_; }
    const ShellDict& shell_dict() const { return shell_dict_; }

    const std::vector<int>& atomic_numbers(std::size_t b) const { return systems_[b].numbers; }

    std::size_t n_atoms(std::size_t b) const    { return systems_[b].numbers.size(); }
    std::size_t n_shells(std::size_t b) const   { return systems_[b].shell_ls.size(); }
    std::size_t n_orbitals(std::size_t b) const { return systems_[b].n_orbitals; }
    std::size_t n_res(std::size_t b) const      { return shell_resolved_ ? n_shells(b) : n_atoms(b); }

    // Padded widths across the batch
    std::size_t atomic_matrix_size() const  { return max_atoms_; }
    std::size_t shell_matrix_size() const   { return max_shells_; }
    std::size_t orbital_matrix_size() const { return max_orbitals_; }
    std::size_t res_matrix_size() const     { return shell_resolved_ ? max_shells_ : max_atoms_; }

    // orbital -> owning atom / shell / resolved unit
    const std::vector<int>& on_atoms(std::size_t b) const  { return systems_[b].on_atoms; }
    const std::vector<int>& on_shells(std::size_t b) const { return systems_[b].on_shells; }
    const std::vector<int>& on_res(std::size_t b) const {
        return shell_resolved_ ? systems_[b].on_shells : systems_[b].on_atoms;
    }

    // per shell: angular momentum and owning atom
    const std::vector<int>& shell_ls(std::size_t b) const    { return systems_[b].shell_ls; }
    const std::vector<int>& shell_atoms(std::size_t b) const { return systems_[b].shell_atoms; }

    const std::vector<int>& orbs_per_shell(std::size_t b) const { return systems_[b].orbs_per_shell; }
    const std::vector<int>& orbs_per_atom(std::size_t b) const  { return systems_[b].orbs_per_atom; }
    const std::vector<int>& orbs_per_res(std::size_t b) const {
        return shell_resolved_ ? systems_[b].orbs_per_shell : systems_[b].orbs_per_atom;
    }

    // Narrowed copy holding the listed systems; padding is re-tightened to
    // the largest remaining system.
    OrbitalInfo select(std::span<const std::size_t> idx) const;

private:
    struct System {
        std::vector<int> numbers;
        std::vector<int> shell_ls;
        std::vector<int> shell_atoms;
        std::vector<int> orbs_per_shell;
        std::vector<int> orbs_per_atom;
        std::vector<int> on_atoms;
        std::vector<int> on_shells;
        std::size_t n_orbitals = 0;
    };

    void pad_index_maps();

    ShellDict shell_dict_;
    bool shell_resolved_ = false;
    std::vector<System> systems_;
    std::size_t max_atoms_ = 0, max_shells_ = 0, max_orbitals_ = 0;
};

} // namespace dftb
