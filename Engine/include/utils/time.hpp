#pragma once

#include <utils/logger.hpp>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <string>
#include <utility>

namespace Regulator {

/**
 * @brief Steady-clock stopwatch.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    void reset() {
        start_ = Clock::now();
    }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

private:
    TimePoint start_;
};

/**
 * @brief Logs a step on construction and its duration on destruction.
 *
 * The elapsed time is also written to @p sink_ms when given, so callers can
 * record phase timings in the run report.
 */
class PhaseTimer {
public:
    explicit PhaseTimer(std::string name, double* sink_ms = nullptr)
        : name_(std::move(name)), sink_ms_(sink_ms) {
        Logger::step(name_ + "...");
    }

    ~PhaseTimer() {
        double ms = timer_.elapsed_ms();
        if (sink_ms_) *sink_ms_ = ms;
        std::ostringstream ss;
        ss << name_ << " done in " << std::fixed << std::setprecision(1) << ms << "ms";
        Logger::info(ss.str());
    }

    PhaseTimer(const PhaseTimer&) = delete;
    PhaseTimer& operator=(const PhaseTimer&) = delete;

private:
    std::string name_;
    double* sink_ms_;
    Timer timer_;
};

} // namespace Regulator
