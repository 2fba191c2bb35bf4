#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace elz::core {

// Wall-clock split times for the stages of one processing call.
// Owned by the call, so concurrent frames never share a timer.
class StageTimer {
public:
    using clock = std::chrono::steady_clock;

    StageTimer() : t0_(clock::now()), last_(t0_) {}

    // Closes the stage that started at the previous mark (or construction).
    void mark(const char* stage) {
        const auto now = clock::now();
        stages_.push_back({stage, micros(last_, now)});
        last_ = now;
    }

    double total_us() const { return micros(t0_, last_); }

    // "decode=120us classify=340us ... total=900us"
    std::string summary() const {
        std::string out;
        for(const auto& s : stages_) {
            out += s.name;
            out += '=';
            out += std::to_string(static_cast<long long>(s.us));
            out += "us ";
        }
        out += "total=" + std::to_string(static_cast<long long>(total_us())) + "us";
        return out;
    }

private:
    struct Stage {
        const char* name;
        double us;
    };

    static double micros(clock::time_point a, clock::time_point b) {
        return static_cast<double>(std::chrono::duration_cast<std::chrono::microseconds>(b - a).count());
    }

    clock::time_point t0_;
    clock::time_point last_;
    std::vector<Stage> stages_;
};

} // namespace elz::core
