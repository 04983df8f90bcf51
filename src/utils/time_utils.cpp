#include "utils/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cmath>

namespace updown {
namespace time_utils {

namespace {
    constexpr double MILLISECOND_THRESHOLD = 1e12;
    constexpr double INT64_BOUND = 9223372036854775808.0;  // 2^63
}

std::string to_iso8601(WallClock t) {
    auto time_t = std::chrono::system_clock::to_time_t(t);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()) % 1000;

    std::tm tm = *std::gmtime(&time_t);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';

    return ss.str();
}

std::string epoch_seconds_to_iso8601(EpochSeconds s) {
    return to_iso8601(WallClock(std::chrono::seconds(s)));
}

int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

EpochSeconds epoch_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

EpochSeconds normalize_epoch_seconds(double value) {
    if (!std::isfinite(value)) {
        return 0;
    }

    double seconds = std::floor(value > MILLISECOND_THRESHOLD ? value / 1000.0 : value);
    if (seconds < -INT64_BOUND || seconds >= INT64_BOUND) {
        return 0;
    }
    return static_cast<EpochSeconds>(seconds);
}

// LatencyTimer implementation

LatencyTimer::LatencyTimer()
    : start_(now())
    , end_(start_)
{
}

void LatencyTimer::start() {
    start_ = now();
    running_ = true;
}

void LatencyTimer::stop() {
    end_ = now();
    running_ = false;
}

Duration LatencyTimer::elapsed() const {
    if (running_) {
        return now() - start_;
    }
    return end_ - start_;
}

int64_t LatencyTimer::elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed()).count();
}

} // namespace time_utils
} // namespace updown
