#pragma once

#include <chrono>
#include <functional>

class Clock {
public:
    using TimePoint = std::chrono::system_clock::time_point;
    using NowFn = std::function<TimePoint()>;
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    Clock(NowFn now, SleepFn sleep);

    static Clock System();

    TimePoint Now() const;
    void SleepFor(std::chrono::milliseconds duration) const;

private:
    NowFn now_;
    SleepFn sleep_;
};
