#pragma once

#include <string>
#include <vector>
#include "common/types.hpp"

namespace updown {

/**
 * Expands an asset and interval into candidate identifiers.
 */
class CandidateGenerator {
public:
    explicit CandidateGenerator(std::string slug_marker = "updown");

    // "<alias>-<marker>-<label>-<window_start>"
    std::string make_slug(const std::string& alias, const Interval& interval, EpochSeconds window_start) const;

    // Outer loop over window starts (in the given order), inner loop over aliases
    std::vector<std::string> slug_candidates(const Asset& asset,
                                             const Interval& interval,
                                             const std::vector<EpochSeconds>& window_starts) const;

    // Natural-language queries, primary alias first
    std::vector<std::string> search_phrases(const Asset& asset, const Interval& interval) const;

private:
    std::string slug_marker_;
};

} // namespace updown
