// prof.hpp - aggregate scope timers for the SCC phases, enabled via DFTB_ENABLE_PROFILING
#pragma once

#if defined(DFTB_ENABLE_PROFILING)
#  include <algorithm>
#  include <chrono>
#  include <cstdint>
#  include <cstdlib>
#  include <map>
#  include <mutex>
#  include <string>
#  include <utility>
#  include <vector>

#  include <spdlog/spdlog.h>
#endif

namespace dftb {

#if defined(DFTB_ENABLE_PROFILING)

class ProfRegistry {
public:
    static ProfRegistry& inst() {
        static ProfRegistry r; return r;
    }

    void record(const char* label, std::chrono::nanoseconds dt) {
        std::lock_guard<std::mutex> lock(mu_);
        auto& s = stats_[label];
        ++s.count;
        s.total += dt;
    }

    // Sections sorted by total time, logged at info level
    void dump() {
        std::vector<std::pair<std::string, Stats>> rows;
        {
            std::lock_guard<std::mutex> lock(mu_);
            rows.assign(stats_.begin(), stats_.end());
        }
        std::sort(rows.begin(), rows.end(),
                  [](const auto& a, const auto& b) { return a.second.total > b.second.total; });
        spdlog::info("cpp_dftb profile: {} sections", rows.size());
        for (const auto& [label, s] : rows) {
            const double ms = std::chrono::duration<double, std::milli>(s.total).count();
            spdlog::info("  {:<24} calls={:<8} total={:.3f} ms avg={:.3f} ms",
                         label, s.count, ms, ms / (double)s.count);
        }
    }

private:
    struct Stats {
        std::uint64_t count = 0;
        std::chrono::nanoseconds total{0};
    };

    std::map<std::string, Stats> stats_;
    std::mutex mu_;
};

class ScopedTimer {
public:
    explicit ScopedTimer(const char* label) : label_(label), t0_(Clock::now()) {}
    ~ScopedTimer() {
        ProfRegistry::inst().record(label_, std::chrono::duration_cast<std::chrono::nanoseconds>(
                                                Clock::now() - t0_));
    }
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    using Clock = std::chrono::steady_clock;
    const char* label_;
    Clock::time_point t0_;
};

inline void prof_dump() { ProfRegistry::inst().dump(); }

// DFTB_PROFILE set to anything but "0" dumps after each SCC cycle
inline bool prof_auto_dump_enabled() {
    const char* env = std::getenv("DFTB_PROFILE");
    return env && std::string(env) != "0";
}

#  define DFTB_PP_JOIN2(a, b) a##b
#  define DFTB_PP_JOIN(a, b) DFTB_PP_JOIN2(a, b)
#  define DFTB_PROFILE_SCOPE(label) ::dftb::ScopedTimer DFTB_PP_JOIN(dftb_scope_timer_, __LINE__){label}

#else

inline void prof_dump() {}
inline bool prof_auto_dump_enabled() { return false; }

#  define DFTB_PROFILE_SCOPE(label) do {} while (0)

#endif

} // namespace dftb
