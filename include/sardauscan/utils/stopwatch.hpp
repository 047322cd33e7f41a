#pragma once
#include <chrono>

namespace sardauscan {

struct Stopwatch
{
    typedef std::chrono::steady_clock Clock;
    typedef Clock::duration Duration;
    typedef Clock::time_point TimePoint;
    TimePoint start;

    Stopwatch() : start(Clock::now())
    {
    }

    double ellapsed() const
    {
        return toSeconds(Clock::now() - start);
    }

    void restart()
    {
        start = Clock::now();
    }

    static double toSeconds(Duration duration)
    {
        return std::chrono::duration<double>(duration).count();
    }
};

}  // namespace sardauscan
