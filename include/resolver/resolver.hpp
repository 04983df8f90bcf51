#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "config/config.hpp"
#include "market_data/clock_source.hpp"
#include "market_data/discovery_client.hpp"
#include "market_data/pricing_client.hpp"
#include "resolver/market_locator.hpp"
#include "resolver/price_fetcher.hpp"

namespace updown {

/**
 * Resolves the live up/down contract for an asset and interval and returns
 * its implied probabilities.
 *
 * Each resolve() call is a sequential pipeline with its own diagnostics and
 * no shared mutable state, so one Resolver may serve concurrent calls for
 * different assets as long as the injected services are thread-safe.
 */
class Resolver {
public:
    Resolver(const ResolverConfig& config,
             std::shared_ptr<ClockSource> clock,
             std::shared_ptr<DiscoveryService> discovery,
             std::shared_ptr<PricingService> pricing);

    /**
     * Throws ConfigurationError for an unknown asset or unsupported interval,
     * before any network call. Every other failure is reported in the result.
     */
    ResolutionResult resolve(const std::string& asset, const std::string& interval);

    LocatorStrategy strategy() const { return locator_->strategy(); }

private:
    ResolverConfig config_;
    std::shared_ptr<ClockSource> clock_;
    std::unique_ptr<MarketLocator> locator_;
    PriceFetcher price_fetcher_;

    void fill_success(ResolutionResult& result, const LocatedMarket& market, Diagnostics& diag);
};

// JSON serialization
void to_json(nlohmann::json& j, const ResolutionResult& r);

} // namespace updown
