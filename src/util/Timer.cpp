// src/util/Timer.cpp
#include "util/Timer.hpp"

namespace util {

Timer::Timer() {
    start();
}

void Timer::start() {
    start_time = Clock::now();
}

double Timer::elapsed() const {
    return std::chrono::duration<double>(Clock::now() - start_time).count();
}

std::chrono::milliseconds Timer::elapsedMs() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_time);
}

bool Timer::expired(std::chrono::milliseconds limit) const {
    return limit.count() > 0 && elapsedMs() >= limit;
}

} // namespace util
