#include "resolver/candidate_scorer.hpp"
#include "utils/text_utils.hpp"

namespace updown {

bool CandidateScorer::has_direction_marker(const std::string& text) {
    static const char* COMBINED[] = {"up or down", "up/down", "updown", "higher or lower"};
    for (const char* marker : COMBINED) {
        if (text::contains_ci(text, marker)) return true;
    }

    for (const auto& word : text::words(text)) {
        if (word == "up" || word == "down") return true;
    }
    return false;
}

int CandidateScorer::score(const std::string& title,
                           const std::string& identifier,
                           const Asset& asset,
                           const Interval& interval) {
    const std::string haystack = title + " " + identifier;
    int s = 0;

    for (const auto& alias : asset.aliases) {
        if (text::contains_ci(haystack, alias)) s += ALIAS_POINTS;
    }

    if (has_direction_marker(haystack)) s += DIRECTION_POINTS;

    for (const auto& phrase : interval.phrases) {
        if (text::contains_phrase(haystack, phrase)) {
            s += INTERVAL_POINTS;
            break;
        }
    }

    return s;
}

std::optional<size_t> CandidateScorer::select_best(const std::vector<ScoredCandidate>& candidates) {
    std::optional<size_t> best;
    for (size_t i = 0; i < candidates.size(); i++) {
        if (!best || candidates[i].score > candidates[*best].score) {
            best = i;
        }
    }
    return best;
}

} // namespace updown
