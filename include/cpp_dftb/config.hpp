// config.hpp - calculator settings and string option parsing
#pragma once

#include <memory>
#include <string>

#include "cpp_dftb/filling.hpp"
#include "cpp_dftb/gamma.hpp"
#include "cpp_dftb/mixers.hpp"

namespace dftb {

enum class CoulombScheme { search, experience };
enum class GradMode { direct, last_step, implicit };

struct DftbConfig {
    double filling_temp = 0.0;                              // kT in hartree; 0 -> Aufbau
    FillingScheme filling_scheme = FillingScheme::fermi;
    int max_scc_iter = 200;
    std::string mixer = "anderson";                         // used when mixer_instance is null
    std::shared_ptr<Mixer> mixer_instance;                  // preconfigured mixer
    MixerSettings mixer_settings;
    bool suppress_scc_error = false;
    GammaScheme gamma_scheme = GammaScheme::exponential;
    CoulombScheme coulomb_scheme = CoulombScheme::search;  // periodic systems only
    GradMode grad_mode = GradMode::last_step;

    FillingSettings filling() const { return {filling_scheme, filling_temp}; }

    // Throws ConfigurationError on out of range values or an unknown mixer name
    void validate() const;
};

// "fermi", "gaussian", "none"/"aufbau"
FillingScheme parse_filling_scheme(const std::string& s);
// "exponential", "gaussian"
GammaScheme parse_gamma_scheme(const std::string& s);
// "search", "experience"
CoulombScheme parse_coulomb_scheme(const std::string& s);
// "direct", "last_step", "implicit"
GradMode parse_grad_mode(const std::string& s);

std::string to_string(FillingScheme s);
std::string to_string(GradMode m);

} // namespace dftb
