#pragma once

#include <chrono>
#include <type_traits>
#include <utility>

namespace ivsurf::utils {

class HighResolutionTimer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::nanoseconds;

    HighResolutionTimer() : start_time_(Clock::now()) {}

    Duration elapsed() const noexcept {
        return std::chrono::duration_cast<Duration>(Clock::now() - start_time_);
    }

    double elapsed_microseconds() const noexcept {
        return elapsed().count() * 1e-3;
    }

private:
    TimePoint start_time_;
};

class ScopedTimer {
public:
    explicit ScopedTimer(HighResolutionTimer::Duration& duration_ref)
        : duration_ref_(duration_ref), timer_() {}

    ~ScopedTimer() {
        duration_ref_ = timer_.elapsed();
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    HighResolutionTimer::Duration& duration_ref_;
    HighResolutionTimer timer_;
};

template<typename Func>
auto time_function(Func&& func) {
    HighResolutionTimer timer;
    if constexpr (std::is_void_v<std::invoke_result_t<Func>>) {
        func();
        return timer.elapsed();
    } else {
        auto result = func();
        auto duration = timer.elapsed();
        return std::make_pair(std::move(result), duration);
    }
}

}
