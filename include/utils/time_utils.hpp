#pragma once

#include <string>
#include <chrono>
#include "common/types.hpp"

namespace updown {
namespace time_utils {

/**
 * Convert timestamp to ISO 8601 string.
 */
std::string to_iso8601(WallClock t);
std::string epoch_seconds_to_iso8601(EpochSeconds s);

/**
 * Get current epoch milliseconds.
 */
int64_t epoch_ms();

/**
 * Get current epoch seconds.
 */
EpochSeconds epoch_seconds();

/**
 * Normalize an upstream epoch value to seconds.
 * Values above 10^12 are taken to be milliseconds. Non-finite values and
 * values outside the int64 range yield 0.
 */
EpochSeconds normalize_epoch_seconds(double value);

/**
 * High resolution timer for latency measurement.
 */
class LatencyTimer {
public:
    LatencyTimer();

    void start();
    void stop();

    Duration elapsed() const;
    int64_t elapsed_ms() const;

private:
    Timestamp start_;
    Timestamp end_;
    bool running_{false};
};

} // namespace time_utils
} // namespace updown
