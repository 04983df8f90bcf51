#pragma once

#include <string>
#include <vector>
#include <optional>
#include "common/types.hpp"
#include "resolver/market_validator.hpp"

namespace updown {

// Validated search hit awaiting selection
struct ScoredCandidate {
    MarketRecord record;
    OutcomePair outcomes;
    int score{0};
};

/**
 * Relevance scoring for search hits, over title + identifier:
 *   +5 per asset alias present (case-insensitive substring)
 *   +3 if any up/down marker is present
 *   +2 if any interval phrase variant is present
 */
class CandidateScorer {
public:
    static constexpr int ALIAS_POINTS = 5;
    static constexpr int DIRECTION_POINTS = 3;
    static constexpr int INTERVAL_POINTS = 2;

    static int score(const std::string& title,
                     const std::string& identifier,
                     const Asset& asset,
                     const Interval& interval);

    // Index of the highest score; ties go to the earliest candidate
    static std::optional<size_t> select_best(const std::vector<ScoredCandidate>& candidates);

private:
    static bool has_direction_marker(const std::string& text);
};

} // namespace updown
