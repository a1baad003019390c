/**
 * @file time.hpp
 * @brief Wall-clock measurement for build/search cost accounting
 */

#pragma once

#include <chrono>

namespace Annex {

/**
 * @brief Steady-clock stopwatch; times are fractional milliseconds
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;

    Timer() : start_(Clock::now()) {}

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    /**
     * @brief Elapsed time of the current lap; the next lap starts now
     */
    double lap_ms() {
        const Clock::time_point now = Clock::now();
        const double ms = std::chrono::duration<double, std::milli>(now - start_).count();
        start_ = now;
        return ms;
    }

private:
    Clock::time_point start_;
};

} // namespace Annex
