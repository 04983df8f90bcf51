#include "resolver/candidate_generator.hpp"
#include "utils/text_utils.hpp"
#include <algorithm>
#include <set>

namespace updown {

CandidateGenerator::CandidateGenerator(std::string slug_marker)
    : slug_marker_(std::move(slug_marker))
{
}

std::string CandidateGenerator::make_slug(const std::string& alias,
                                          const Interval& interval,
                                          EpochSeconds window_start) const {
    return text::slugify(alias) + "-" + slug_marker_ + "-" + text::to_lower(interval.label) + "-" +
           std::to_string(window_start);
}

std::vector<std::string> CandidateGenerator::slug_candidates(const Asset& asset,
                                                             const Interval& interval,
                                                             const std::vector<EpochSeconds>& window_starts) const {
    std::vector<std::string> candidates;
    candidates.reserve(window_starts.size() * asset.aliases.size());

    for (EpochSeconds start : window_starts) {
        for (const auto& alias : asset.aliases) {
            std::string slug = make_slug(alias, interval, start);
            if (std::find(candidates.begin(), candidates.end(), slug) == candidates.end()) {
                candidates.push_back(slug);
            }
        }
    }
    return candidates;
}

std::vector<std::string> CandidateGenerator::search_phrases(const Asset& asset, const Interval& interval) const {
    std::vector<std::string> phrases;
    std::set<std::string> seen;

    auto add = [&](const std::string& phrase) {
        if (seen.insert(text::to_lower(phrase)).second) {
            phrases.push_back(phrase);
        }
    };

    const std::string& written = interval.primary_phrase();
    for (const auto& alias : asset.aliases) {
        add(alias + " up or down " + written);
        add(alias + " up/down " + interval.label);
        add(alias + " higher or lower " + written);
        add(alias + " " + written + " up");
        add(alias + " " + written + " down");
    }
    return phrases;
}

} // namespace updown
