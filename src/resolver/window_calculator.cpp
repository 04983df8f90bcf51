#include "resolver/window_calculator.hpp"
#include "common/errors.hpp"
#include <algorithm>

namespace updown {
namespace window {

EpochSeconds window_start(EpochSeconds now, int64_t duration_seconds) {
    if (duration_seconds <= 0) {
        throw ConfigurationError("Interval duration must be positive");
    }

    // Floor division, also correct for negative timestamps
    EpochSeconds q = now / duration_seconds;
    if (now % duration_seconds != 0 && now < 0) {
        --q;
    }
    return q * duration_seconds;
}

std::vector<EpochSeconds> candidate_window_starts(EpochSeconds now,
                                                  int64_t duration_seconds,
                                                  const std::vector<int>& offsets) {
    EpochSeconds current = window_start(now, duration_seconds);

    std::vector<EpochSeconds> starts;
    starts.reserve(offsets.size());
    for (int offset : offsets) {
        EpochSeconds start = current + static_cast<EpochSeconds>(offset) * duration_seconds;
        if (std::find(starts.begin(), starts.end(), start) == starts.end()) {
            starts.push_back(start);
        }
    }
    return starts;
}

} // namespace window
} // namespace updown
