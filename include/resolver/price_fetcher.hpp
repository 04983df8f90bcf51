#pragma once

#include <memory>
#include <optional>
#include <string>
#include "common/types.hpp"
#include "market_data/pricing_client.hpp"
#include "resolver/diagnostics.hpp"

namespace updown {

struct PricePair {
    std::optional<Price> up;
    std::optional<Price> down;

    bool complete() const { return up.has_value() && down.has_value(); }
};

/**
 * Fetches current prices for the two outcome tokens of a market.
 * Batch lookup first, then one per-token lookup for each price the batch
 * left unusable. Failures degrade to a null price and a diagnostics warning.
 */
class PriceFetcher {
public:
    explicit PriceFetcher(std::shared_ptr<PricingService> pricing);

    PricePair fetch(const std::string& up_token_id, const std::string& down_token_id, Diagnostics& diag);

private:
    std::shared_ptr<PricingService> pricing_;

    std::optional<Price> fetch_single(const std::string& token_id, Diagnostics& diag);
};

} // namespace updown
