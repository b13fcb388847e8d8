// errors.hpp - exception types raised by the calculators and the SCC driver
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace dftb {

// Bad settings, unknown scheme names, inconsistent inputs. Raised eagerly.
struct ConfigurationError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// SCC cycle ran out of iterations; carries the original batch indices that
// were still active when the limit was hit.
struct ConvergenceError : std::runtime_error {
    std::vector<std::size_t> failed;

    ConvergenceError(const std::string& what, std::vector<std::size_t> failed_)
        : std::runtime_error(what), failed(std::move(failed_)) {}
};

// Quantity undefined for the given shape (e.g. HOMO/LUMO of a fully occupied basis).
struct ShapeError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct NotImplementedError : std::logic_error {
    using std::logic_error::logic_error;
};

} // namespace dftb
