#include "apf_planner/utils/time_utils.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace apf_planner {
namespace time_utils {

std::string format_duration(double seconds) {
    struct Unit {
        double limit;
        double scale;
        const char* suffix;
    };
    static const Unit kUnits[] = {
        {1e-6, 1e9, " ns"},
        {1e-3, 1e6, " us"},
        {1.0, 1e3, " ms"},
        {60.0, 1.0, " s"},
    };

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    for (const auto& unit : kUnits) {
        if (seconds < unit.limit) {
            oss << seconds * unit.scale << unit.suffix;
            return oss.str();
        }
    }

    // 1分以上は「分 秒」表記
    const int minutes = static_cast<int>(seconds / 60.0);
    oss << minutes << "m " << std::setprecision(1) << (seconds - minutes * 60.0) << "s";
    return oss.str();
}

std::string get_timestamp_string() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local_time{};
    localtime_r(&seconds, &local_time);

    std::ostringstream oss;
    oss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

// Timer
Timer::Timer() : running_(false) {}

void Timer::start() {
    start_time_ = Clock::now();
    running_ = true;
}

double Timer::stop() {
    const double seconds = elapsed();
    running_ = false;
    return seconds;
}

void Timer::reset() {
    running_ = false;
}

double Timer::elapsed() const {
    if (!running_) {
        return 0.0;
    }
    return std::chrono::duration<double>(Clock::now() - start_time_).count();
}

// StageTimer
void StageTimer::begin(const std::string& label) {
    finish();
    current_label_ = label;
    timer_.start();
}

void StageTimer::finish() {
    if (!timer_.is_running()) {
        return;
    }
    stages_.emplace_back(current_label_, timer_.stop() * 1000.0);
    current_label_.clear();
}

double StageTimer::stage_ms(const std::string& label) const {
    double total = 0.0;
    for (const auto& stage : stages_) {
        if (stage.first == label) {
            total += stage.second;
        }
    }
    return total;
}

double StageTimer::total_ms() const {
    double total = 0.0;
    for (const auto& stage : stages_) {
        total += stage.second;
    }
    return total;
}

} // namespace time_utils
} // namespace apf_planner
