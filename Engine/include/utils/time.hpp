#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace Lexicode {

/**
 * @brief Wall-clock timer that records named build phases in order.
 *
 * Each call to lap() closes the current phase and starts the next one;
 * the recorded phases end up in the build report.
 */
class PhaseTimer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    PhaseTimer() : start_(Clock::now()), lap_start_(start_) {}

    /**
     * @brief Close the running phase under @p name and return its duration in ms.
     */
    double lap(const std::string& name) {
        TimePoint now = Clock::now();
        double ms = to_ms(now - lap_start_);
        phases_.emplace_back(name, ms);
        lap_start_ = now;
        return ms;
    }

    double elapsed_ms() const {
        return to_ms(Clock::now() - start_);
    }

    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

    const std::vector<std::pair<std::string, double>>& phases() const { return phases_; }

private:
    static double to_ms(Clock::duration d) {
        return std::chrono::duration_cast<std::chrono::microseconds>(d).count() / 1000.0;
    }

    TimePoint start_;
    TimePoint lap_start_;
    std::vector<std::pair<std::string, double>> phases_;
};

} // namespace Lexicode
