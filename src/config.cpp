// src/config.cpp - option parsing and validation

#include <algorithm>
#include <cctype>
#include <cmath>

#include "cpp_dftb/config.hpp"
#include "cpp_dftb/errors.hpp"

namespace dftb {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

} // namespace

void DftbConfig::validate() const {
    if (!std::isfinite(filling_temp) || filling_temp < 0.0)
        throw ConfigurationError("filling_temp must be a finite value >= 0");
    if (max_scc_iter < 1)
        throw ConfigurationError("max_scc_iter must be a positive integer");
    if (!mixer_instance) {
        const std::string m = lower(mixer);
        if (m != "anderson" && m != "simple")
            throw ConfigurationError("unknown mixer \"" + mixer + "\"; valid options are \"simple\", \"anderson\"");
    }
    if (!(mixer_settings.tolerance >= 0.0))
        throw ConfigurationError("mixer tolerance must be non-negative");
}

FillingScheme parse_filling_scheme(const std::string& s) {
    const std::string k = lower(s);
    if (k == "fermi") return FillingScheme::fermi;
    if (k == "gaussian") return FillingScheme::gaussian;
    if (k == "none" || k == "aufbau" || k.empty()) return FillingScheme::aufbau;
    throw ConfigurationError("unknown filling scheme \"" + s + "\"; valid options are \"fermi\", \"gaussian\", \"none\"");
}

GammaScheme parse_gamma_scheme(const std::string& s) {
    const std::string k = lower(s);
    if (k == "exponential") return GammaScheme::exponential;
    if (k == "gaussian") return GammaScheme::gaussian;
    throw ConfigurationError("unknown gamma scheme \"" + s + "\"; valid options are \"exponential\", \"gaussian\"");
}

CoulombScheme parse_coulomb_scheme(const std::string& s) {
    const std::string k = lower(s);
    if (k == "search") return CoulombScheme::search;
    if (k == "experience") return CoulombScheme::experience;
    throw ConfigurationError("unknown coulomb scheme \"" + s + "\"; valid options are \"search\", \"experience\"");
}

GradMode parse_grad_mode(const std::string& s) {
    const std::string k = lower(s);
    if (k == "direct") return GradMode::direct;
    if (k == "last_step") return GradMode::last_step;
    if (k == "implicit") return GradMode::implicit;
    throw ConfigurationError("\"" + s + "\" does not correspond to a known gradient mode. "
                             "Valid options are \"direct\", \"last_step\", \"implicit\"");
}

std::string to_string(FillingScheme s) {
    switch (s) {
        case FillingScheme::fermi: return "fermi";
        case FillingScheme::gaussian: return "gaussian";
        case FillingScheme::aufbau: return "none";
    }
    return "?";
}

std::string to_string(GradMode m) {
    switch (m) {
        case GradMode::direct: return "direct";
        case GradMode::last_step: return "last_step";
        case GradMode::implicit: return "implicit";
    }
    return "?";
}

} // namespace dftb
