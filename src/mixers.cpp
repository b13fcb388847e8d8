// src/mixers.cpp - simple and Anderson charge mixing

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

#include <Eigen/Dense>

#include "cpp_dftb/mixers.hpp"
#include "cpp_dftb/errors.hpp"
#include "cpp_dftb/prof.hpp"

namespace dftb {

namespace {

// Slot view: a row in batch mode, the whole buffer otherwise
Eigen::VectorXd slot_vector(const BatchVector& q, std::size_t s, bool batch_mode) {
    if (batch_mode) return q.row(s);
    return Eigen::Map<const Eigen::VectorXd>(q.data.data(), (Eigen::Index)q.data.size());
}

void write_slot(BatchVector& q, std::size_t s, bool batch_mode, const Eigen::VectorXd& v) {
    if (batch_mode) q.row(s) = v;
    else Eigen::Map<Eigen::VectorXd>(q.data.data(), (Eigen::Index)q.data.size()) = v;
}

void resize_zero(Eigen::VectorXd& v, std::size_t n) {
    v.conservativeResizeLike(Eigen::VectorXd::Zero((Eigen::Index)n));
}

} // namespace

// ---------------- Mixer ----------------
Mixer::Mixer(double tolerance, bool batch_mode)
    : tolerance_(tolerance), batch_mode_(batch_mode) {
    if (!(tolerance >= 0.0)) throw ConfigurationError("Mixer: tolerance must be non-negative");
}

void Mixer::reset() { step_ = 0; }

BatchVector Mixer::operator()(const BatchVector& q_new, const BatchVector& q_current) {
    if (q_new.nbatch != q_current.nbatch || q_new.n != q_current.n)
        throw std::invalid_argument("Mixer: q_new and q_current must share a shape");
    ++step_;
    DFTB_PROFILE_SCOPE("mixer");
    return mix(q_new, q_current);
}

void Mixer::require_batch_mode(const char* what) const {
    if (!batch_mode_) throw std::logic_error(std::string(what) + " requires batch mode");
}

// ---------------- Simple ----------------
SimpleMixer::SimpleMixer(bool batch_mode, double mix_param, double tolerance)
    : Mixer(tolerance, batch_mode), mix_param_(mix_param) {}

BatchVector SimpleMixer::mix(const BatchVector& q_new, const BatchVector& q_current) {
    BatchVector out(q_new.nbatch, q_new.n);
    out.flat() = q_current.flat() + mix_param_ * (q_new.flat() - q_current.flat());
    return out;
}

void SimpleMixer::cull(const std::vector<bool>& /*keep*/, std::size_t /*new_size*/) {
    require_batch_mode("SimpleMixer::cull");
}

// ---------------- Anderson ----------------
AndersonMixer::AndersonMixer(bool batch_mode, const MixerSettings& settings)
    : Mixer(settings.tolerance, batch_mode), settings_(settings) {
    if (settings_.generations < 1) throw ConfigurationError("AndersonMixer: generations must be >= 1");
}

void AndersonMixer::reset() {
    Mixer::reset();
    slots_.clear();
}

Eigen::VectorXd AndersonMixer::extrapolate(const History& h) const {
    const Eigen::VectorXd& x0 = h.x.front();
    const Eigen::VectorXd& f0 = h.f.front();
    const std::size_t m = h.x.size() - 1;
    if (m == 0) return x0 + settings_.init_mix_param * f0;

    // Minimise |f0 - sum_j theta_j (f0 - f_j)| over theta
    Eigen::MatrixXd dF(f0.size(), (Eigen::Index)m);
    for (std::size_t j = 0; j < m; ++j) dF.col((Eigen::Index)j) = f0 - h.f[j + 1];

    Eigen::MatrixXd A = dF.transpose() * dF;
    A.diagonal() *= 1.0 + settings_.diagonal_offset;
    const Eigen::VectorXd rhs = dF.transpose() * f0;

    Eigen::LDLT<Eigen::MatrixXd> ldlt(A);
    Eigen::VectorXd theta;
    if (ldlt.info() == Eigen::Success) theta = ldlt.solve(rhs);
    if (ldlt.info() != Eigen::Success || !theta.allFinite())
        return x0 + settings_.mix_param * f0;

    Eigen::VectorXd x_bar = x0, f_bar = f0;
    for (std::size_t j = 0; j < m; ++j) {
        const double t = theta((Eigen::Index)j);
        x_bar += t * (h.x[j + 1] - x0);
        f_bar += t * (h.f[j + 1] - f0);
    }
    return x_bar + settings_.mix_param * f_bar;
}

BatchVector AndersonMixer::mix(const BatchVector& q_new, const BatchVector& q_current) {
    const bool bm = batch_mode();
    const std::size_t nslots = bm ? q_new.nbatch : 1;
    if (slots_.empty()) slots_.resize(nslots);
    if (slots_.size() != nslots)
        throw std::invalid_argument("AndersonMixer: batch size changed without cull");

    BatchVector out(q_new.nbatch, q_new.n);
    for (std::size_t s = 0; s < nslots; ++s) {
        History& h = slots_[s];
        Eigen::VectorXd x = slot_vector(q_current, s, bm);
        if (!h.x.empty() && h.x.front().size() != x.size())
            throw std::invalid_argument("AndersonMixer: charge width changed without cull");
        Eigen::VectorXd f = slot_vector(q_new, s, bm) - x;
        h.x.push_front(std::move(x));
        h.f.push_front(std::move(f));
        while (h.x.size() > settings_.generations + 1) { h.x.pop_back(); h.f.pop_back(); }
        write_slot(out, s, bm, extrapolate(h));
    }
    return out;
}

void AndersonMixer::cull(const std::vector<bool>& keep, std::size_t new_size) {
    require_batch_mode("AndersonMixer::cull");
    if (slots_.empty()) return;   // nothing mixed yet
    if (keep.size() != slots_.size())
        throw std::invalid_argument("AndersonMixer::cull: mask does not match history");

    std::vector<History> kept;
    kept.reserve(slots_.size());
    for (std::size_t s = 0; s < slots_.size(); ++s) {
        if (!keep[s]) continue;
        History h = std::move(slots_[s]);
        for (auto& v : h.x) resize_zero(v, new_size);
        for (auto& v : h.f) resize_zero(v, new_size);
        kept.push_back(std::move(h));
    }
    slots_ = std::move(kept);
}

// ---------------- factory / convergence ----------------
std::unique_ptr<Mixer> make_mixer(const std::string& name, const MixerSettings& settings,
                                  bool batch_mode) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (key == "anderson") return std::make_unique<AndersonMixer>(batch_mode, settings);
    if (key == "simple")   return std::make_unique<SimpleMixer>(batch_mode, settings.mix_param, settings.tolerance);
    throw ConfigurationError("unknown mixer \"" + name + "\"; valid options are \"simple\", \"anderson\"");
}

std::vector<bool> charges_converged(const BatchVector& q_new, const BatchVector& q_current,
                                    double tolerance) {
    if (q_new.nbatch != q_current.nbatch || q_new.n != q_current.n)
        throw std::invalid_argument("charges_converged: shape mismatch");
    std::vector<bool> conv(q_new.nbatch, true);
    for (std::size_t b = 0; b < q_new.nbatch; ++b)
        if (q_new.n > 0)
            conv[b] = (q_new.row(b) - q_current.row(b)).cwiseAbs().maxCoeff() <= tolerance;
    return conv;
}

} // namespace dftb
