#include "resolver/market_locator.hpp"
#include "resolver/candidate_scorer.hpp"
#include "common/errors.hpp"
#include <spdlog/spdlog.h>
#include <set>

namespace updown {

MarketLocator::MarketLocator(std::shared_ptr<DiscoveryService> discovery,
                             const ResolverConfig& config,
                             LocatorStrategy strategy)
    : discovery_(std::move(discovery))
    , config_(config)
    , generator_(config.slug_marker)
    , validator_(strategy)
{
}

// SlugLocator

SlugLocator::SlugLocator(std::shared_ptr<DiscoveryService> discovery, const ResolverConfig& config)
    : MarketLocator(std::move(discovery), config, LocatorStrategy::SLUG)
{
}

std::vector<std::string> SlugLocator::generate_candidates(const Asset& asset,
                                                          const Interval& interval,
                                                          const std::vector<EpochSeconds>& window_starts) const {
    return generator_.slug_candidates(asset, interval, window_starts);
}

std::optional<LocatedMarket> SlugLocator::locate(const std::vector<std::string>& candidates,
                                                 const Asset& /*asset*/,
                                                 const Interval& /*interval*/,
                                                 Diagnostics& diag) {
    for (const auto& slug : candidates) {
        diag.enter(ResolutionState::LOCATE);
        diag.record_tried(slug);

        std::optional<MarketRecord> record;
        try {
            record = discovery_->get_by_identifier(slug);
        } catch (const std::exception& e) {
            diag.record_error(ErrorKind::UPSTREAM_TRANSIENT, slug + ": " + e.what());
            continue;
        }

        if (!record) {
            diag.record_error(ErrorKind::EXPECTED_MISS, slug + ": not found");
            continue;
        }

        diag.enter(ResolutionState::VALIDATE);
        auto validation = validator_.validate(*record);
        if (!validation.valid) {
            diag.record_error(validation.rejection, slug + ": " + validation.reason);
            continue;
        }

        spdlog::info("Resolved {} -> '{}'", slug, record->title);

        LocatedMarket located;
        located.record = std::move(*record);
        located.outcomes = validation.outcomes;
        located.candidate = slug;
        return located;
    }

    return std::nullopt;
}

// SearchLocator

SearchLocator::SearchLocator(std::shared_ptr<DiscoveryService> discovery, const ResolverConfig& config)
    : MarketLocator(std::move(discovery), config, LocatorStrategy::SEARCH)
{
}

std::vector<std::string> SearchLocator::generate_candidates(const Asset& asset,
                                                            const Interval& interval,
                                                            const std::vector<EpochSeconds>& /*window_starts*/) const {
    return generator_.search_phrases(asset, interval);
}

std::optional<LocatedMarket> SearchLocator::locate(const std::vector<std::string>& candidates,
                                                   const Asset& asset,
                                                   const Interval& interval,
                                                   Diagnostics& diag) {
    std::vector<ScoredCandidate> pool;
    std::vector<std::string> origins;
    std::set<std::string> seen;
    size_t rejected = 0;

    for (const auto& query : candidates) {
        diag.enter(ResolutionState::LOCATE);
        diag.record_tried(query);

        std::vector<MarketRecord> records;
        try {
            records = discovery_->search_by_text(query);
        } catch (const std::exception& e) {
            diag.record_error(ErrorKind::UPSTREAM_TRANSIENT, "'" + query + "': " + e.what());
            continue;
        }

        diag.enter(ResolutionState::VALIDATE);
        for (auto& record : records) {
            const std::string key = !record.identifier.empty() ? record.identifier : record.condition_id;
            if (key.empty() || !seen.insert(key).second) continue;

            auto validation = validator_.validate(record);
            if (!validation.valid) {
                ++rejected;
                spdlog::debug("Search hit {} rejected: {}", key, validation.reason);
                continue;
            }

            ScoredCandidate candidate;
            candidate.record = std::move(record);
            candidate.outcomes = validation.outcomes;
            pool.push_back(std::move(candidate));
            origins.push_back(query);
        }

        if (static_cast<int>(pool.size()) >= config_.min_search_candidates) {
            spdlog::debug("Search pool reached {} candidates, skipping remaining queries", pool.size());
            break;
        }
    }

    if (pool.empty()) {
        if (rejected > 0) {
            diag.record_error(ErrorKind::MALFORMED_RECORD,
                              std::to_string(rejected) + " search results rejected by validation");
        } else if (!diag.last_error()) {
            diag.record_error(ErrorKind::EXPECTED_MISS, "search returned no markets");
        }
        return std::nullopt;
    }

    diag.enter(ResolutionState::SCORE);
    for (auto& candidate : pool) {
        candidate.score = CandidateScorer::score(candidate.record.title, candidate.record.identifier,
                                                 asset, interval);
    }

    diag.enter(ResolutionState::SELECT);
    auto best = CandidateScorer::select_best(pool);
    if (!best) {
        return std::nullopt;
    }

    const ScoredCandidate& winner = pool[*best];
    if (winner.score < config_.min_search_score) {
        diag.record_error(ErrorKind::EXPECTED_MISS,
                          "best search match '" + winner.record.title + "' scored " +
                          std::to_string(winner.score) + ", below minimum " +
                          std::to_string(config_.min_search_score));
        return std::nullopt;
    }

    spdlog::info("Selected '{}' (score {}) from {} search candidates",
                 winner.record.title, winner.score, pool.size());

    LocatedMarket located;
    located.record = winner.record;
    located.outcomes = winner.outcomes;
    located.candidate = origins[*best];
    located.score = winner.score;
    return located;
}

std::unique_ptr<MarketLocator> make_locator(const ResolverConfig& config,
                                            std::shared_ptr<DiscoveryService> discovery) {
    switch (config.strategy) {
        case LocatorStrategy::SLUG:
            return std::make_unique<SlugLocator>(std::move(discovery), config);
        case LocatorStrategy::SEARCH:
            return std::make_unique<SearchLocator>(std::move(discovery), config);
    }
    throw ConfigurationError("Unknown locator strategy");
}

} // namespace updown
