// include/util/Timer.hpp
#pragma once
#include <chrono>

namespace util {

// Monotonic stopwatch; deadlines in the scheduler are derived from it.
class Timer {
public:
    using Clock = std::chrono::steady_clock;

    Timer();
    void start();
    double elapsed() const;
    std::chrono::milliseconds elapsedMs() const;
    bool expired(std::chrono::milliseconds limit) const;

private:
    Clock::time_point start_time;
};

} // namespace util
