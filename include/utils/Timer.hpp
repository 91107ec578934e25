#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace optionlab::utils {

class HighResolutionTimer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::nanoseconds;

    HighResolutionTimer() : start_time_(Clock::now()) {}

    Duration elapsed() const noexcept {
        return std::chrono::duration_cast<Duration>(Clock::now() - start_time_);
    }

private:
    TimePoint start_time_;
};

// Process-wide per-scope call counts and timings, fed by the profiling macros
// in every pricer entry point.
class PerformanceProfiler {
public:
    struct ProfileData {
        std::uint64_t call_count = 0;
        std::uint64_t total_time = 0;
        std::uint64_t min_time = std::numeric_limits<std::uint64_t>::max();
        std::uint64_t max_time = 0;

        void update(std::uint64_t duration_ns) {
            ++call_count;
            total_time += duration_ns;
            min_time = std::min(min_time, duration_ns);
            max_time = std::max(max_time, duration_ns);
        }

        double average_time_ns() const {
            return call_count > 0 ? static_cast<double>(total_time) / call_count : 0.0;
        }

        std::uint64_t get_min_time() const {
            return call_count == 0 ? 0 : min_time;
        }
    };

    static PerformanceProfiler& instance() {
        static PerformanceProfiler profiler;
        return profiler;
    }

    void record(const std::string& name, HighResolutionTimer::Duration duration) {
        std::lock_guard<std::mutex> lock(mutex_);
        profiles_[name].update(static_cast<std::uint64_t>(duration.count()));
    }

    ProfileData get_profile(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = profiles_.find(name);
        return it != profiles_.end() ? it->second : ProfileData{};
    }

    void reset_profile(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        profiles_.erase(name);
    }

    std::vector<std::pair<std::string, ProfileData>> get_all_profiles() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return {profiles_.begin(), profiles_.end()};
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, ProfileData> profiles_;
};

class AutoProfiler {
public:
    explicit AutoProfiler(std::string name) : name_(std::move(name)) {}

    ~AutoProfiler() {
        PerformanceProfiler::instance().record(name_, timer_.elapsed());
    }

    AutoProfiler(const AutoProfiler&) = delete;
    AutoProfiler& operator=(const AutoProfiler&) = delete;

private:
    std::string name_;
    HighResolutionTimer timer_;
};

#define OPTIONLAB_PROFILE_SCOPE(name) ::optionlab::utils::AutoProfiler optionlab_profiler_(name)

}
