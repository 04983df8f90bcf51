#pragma once

#include <memory>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "market_data/discovery_client.hpp"

namespace updown {

// One live market returned by a free-text search
struct MarketListing {
    MarketRecord record;
    std::string url;
};

/**
 * Free-text market listing over the discovery service.
 * Keeps tradeable hits only (same flags as the validator), de-duplicated by
 * identifier, ordered by volume then liquidity (missing figures count as 0).
 * UpstreamError from the discovery service propagates to the caller.
 */
class MarketSearch {
public:
    MarketSearch(std::shared_ptr<DiscoveryService> discovery, const ResolverConfig& config);

    std::vector<MarketListing> search(const std::string& query) const;

private:
    std::shared_ptr<DiscoveryService> discovery_;
    ResolverConfig config_;
};

} // namespace updown
