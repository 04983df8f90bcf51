#pragma once

#include <vector>
#include "common/types.hpp"

namespace updown {
namespace window {

/**
 * Start of the window containing now: floor(now / duration) * duration.
 * Throws ConfigurationError for a non-positive duration.
 */
EpochSeconds window_start(EpochSeconds now, int64_t duration_seconds);

/**
 * Window starts to try, in priority order: one entry per offset
 * (in units of duration) relative to the current window, duplicates removed.
 * The default offsets {0, -1, 1} check the previous window before the next
 * one because discovery indexing trails real time.
 */
std::vector<EpochSeconds> candidate_window_starts(EpochSeconds now,
                                                  int64_t duration_seconds,
                                                  const std::vector<int>& offsets = {0, -1, 1});

} // namespace window
} // namespace updown
