// mixers.hpp - charge mixers (simple damping, Anderson) for the SCC fixed point
#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include <Eigen/Core>

#include "cpp_dftb/batch.hpp"

namespace dftb {

struct MixerSettings {
    double mix_param = 0.05;        // damping of the (extrapolated) residual
    double init_mix_param = 0.01;   // Anderson: damping used while there is no history
    std::size_t generations = 4;    // Anderson: number of previous steps used
    double diagonal_offset = 0.01;  // Anderson: relative regularisation of the LSQ diagonal
    double tolerance = 1e-6;        // max |q_new - q_current| accepted as converged
};

// Stateful fixed-point accelerator. In batch mode every system (row) keeps
// its own history and is mixed independently; otherwise the whole buffer is
// treated as one vector.
class Mixer {
public:
    explicit Mixer(double tolerance, bool batch_mode = false);
    virtual ~Mixer() = default;

    // Drop all history
    virtual void reset();

    // Record (q_current, q_new - q_current) and return the next iterate.
    BatchVector operator()(const BatchVector& q_new, const BatchVector& q_current);

    // Remove the systems whose keep flag is false from the history and
    // truncate (or zero-extend) the remaining per-system vectors to new_size.
    // Remaining systems keep their relative order. Batch mode only.
    virtual void cull(const std::vector<bool>& keep, std::size_t new_size) = 0;

    virtual std::string name() const = 0;

    double tolerance() const { return tolerance_; }
    void set_tolerance(double tol) { tolerance_ = tol; }
    bool batch_mode() const { return batch_mode_; }
    void set_batch_mode(bool on) { batch_mode_ = on; }
    std::size_t step_number() const { return step_; }

protected:
    virtual BatchVector mix(const BatchVector& q_new, const BatchVector& q_current) = 0;
    void require_batch_mode(const char* what) const;

private:
    double tolerance_;
    bool batch_mode_;
    std::size_t step_ = 0;
};

// q_next = q_current + mix_param * (q_new - q_current)
class SimpleMixer final : public Mixer {
public:
    explicit SimpleMixer(bool batch_mode = false, double mix_param = 0.05, double tolerance = 1e-6);

    void cull(const std::vector<bool>& keep, std::size_t new_size) override;
    std::string name() const override { return "simple"; }

    double mix_param() const { return mix_param_; }

protected:
    BatchVector mix(const BatchVector& q_new, const BatchVector& q_current) override;

private:
    double mix_param_;
};

// Anderson extrapolation over the last `generations` (iterate, residual) pairs.
class AndersonMixer final : public Mixer {
public:
    explicit AndersonMixer(bool batch_mode = false, const MixerSettings& settings = {});

    void reset() override;
    void cull(const std::vector<bool>& keep, std::size_t new_size) override;
    std::string name() const override { return "anderson"; }

    const MixerSettings& settings() const { return settings_; }
    // Number of stored history entries for a slot (system)
    std::size_t history_depth(std::size_t slot) const { return slots_.at(slot).x.size(); }
    std::size_t n_slots() const { return slots_.size(); }

protected:
    BatchVector mix(const BatchVector& q_new, const BatchVector& q_current) override;

private:
    struct History {
        std::deque<Eigen::VectorXd> x;   // input iterates, newest first
        std::deque<Eigen::VectorXd> f;   // residuals q_new - q_current, newest first
    };

    Eigen::VectorXd extrapolate(const History& h) const;

    MixerSettings settings_;
    std::vector<History> slots_;
};

// "simple" or "anderson" (case insensitive); throws ConfigurationError otherwise
std::unique_ptr<Mixer> make_mixer(const std::string& name, const MixerSettings& settings = {},
                                  bool batch_mode = false);

// Per-system test max_i |q_new_i - q_current_i| <= tolerance
std::vector<bool> charges_converged(const BatchVector& q_new, const BatchVector& q_current,
                                    double tolerance);

} // namespace dftb
