#include "Clock.hpp"

#include <thread>
#include <utility>

Clock::Clock(NowFn now, SleepFn sleep)
    : now_(std::move(now)),
      sleep_(std::move(sleep)) {}

Clock Clock::System() {
    return Clock(
        [] { return std::chrono::system_clock::now(); },
        [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); });
}

Clock::TimePoint Clock::Now() const {
    if (now_) {
        return now_();
    }

    return std::chrono::system_clock::now();
}

void Clock::SleepFor(std::chrono::milliseconds duration) const {
    if (duration.count() <= 0) {
        return;
    }

    if (sleep_) {
        sleep_(duration);
        return;
    }

    std::this_thread::sleep_for(duration);
}
