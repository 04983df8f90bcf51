#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "market_data/discovery_client.hpp"
#include "resolver/candidate_generator.hpp"
#include "resolver/market_validator.hpp"
#include "resolver/diagnostics.hpp"

namespace updown {

// Market chosen by a locator
struct LocatedMarket {
    MarketRecord record;
    OutcomePair outcomes;
    std::string candidate;        // Slug or query that produced it
    std::optional<int> score;     // Search strategy only
};

/**
 * Base class for market locator strategies.
 * Per-candidate failures (not found, unusable record, upstream error) are
 * written to the diagnostics and the next candidate is tried.
 */
class MarketLocator {
public:
    MarketLocator(std::shared_ptr<DiscoveryService> discovery,
                  const ResolverConfig& config,
                  LocatorStrategy strategy);
    virtual ~MarketLocator() = default;

    virtual LocatorStrategy strategy() const = 0;

    // Ordered, de-duplicated candidates for one resolution
    virtual std::vector<std::string> generate_candidates(const Asset& asset,
                                                         const Interval& interval,
                                                         const std::vector<EpochSeconds>& window_starts) const = 0;

    virtual std::optional<LocatedMarket> locate(const std::vector<std::string>& candidates,
                                                const Asset& asset,
                                                const Interval& interval,
                                                Diagnostics& diag) = 0;

protected:
    std::shared_ptr<DiscoveryService> discovery_;
    ResolverConfig config_;
    CandidateGenerator generator_;
    MarketValidator validator_;
};

/**
 * Deterministic slug strategy: fetch each guessed slug in priority order,
 * the first record that validates wins.
 */
class SlugLocator : public MarketLocator {
public:
    SlugLocator(std::shared_ptr<DiscoveryService> discovery, const ResolverConfig& config);

    LocatorStrategy strategy() const override { return LocatorStrategy::SLUG; }

    std::vector<std::string> generate_candidates(const Asset& asset,
                                                 const Interval& interval,
                                                 const std::vector<EpochSeconds>& window_starts) const override;

    std::optional<LocatedMarket> locate(const std::vector<std::string>& candidates,
                                        const Asset& asset,
                                        const Interval& interval,
                                        Diagnostics& diag) override;
};

/**
 * Full-text search strategy: accumulate validated hits across queries until
 * min_search_candidates is reached, then score once and pick the best.
 */
class SearchLocator : public MarketLocator {
public:
    SearchLocator(std::shared_ptr<DiscoveryService> discovery, const ResolverConfig& config);

    LocatorStrategy strategy() const override { return LocatorStrategy::SEARCH; }

    std::vector<std::string> generate_candidates(const Asset& asset,
                                                 const Interval& interval,
                                                 const std::vector<EpochSeconds>& window_starts) const override;

    std::optional<LocatedMarket> locate(const std::vector<std::string>& candidates,
                                        const Asset& asset,
                                        const Interval& interval,
                                        Diagnostics& diag) override;
};

std::unique_ptr<MarketLocator> make_locator(const ResolverConfig& config,
                                            std::shared_ptr<DiscoveryService> discovery);

} // namespace updown
