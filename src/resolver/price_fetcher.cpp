#include "resolver/price_fetcher.hpp"
#include "market_data/market_parser.hpp"
#include <spdlog/spdlog.h>

namespace updown {

PriceFetcher::PriceFetcher(std::shared_ptr<PricingService> pricing)
    : pricing_(std::move(pricing))
{
}

PricePair PriceFetcher::fetch(const std::string& up_token_id, const std::string& down_token_id, Diagnostics& diag) {
    PricePair prices;

    try {
        auto batch = pricing_->get_batch_prices({up_token_id, down_token_id});

        auto lookup = [&](const std::string& token_id) -> std::optional<Price> {
            auto it = batch.find(token_id);
            if (it == batch.end()) return std::nullopt;
            auto p = market_parser::parse_probability(it->second);
            if (!p) {
                spdlog::debug("Unusable batch price for {}: {}", token_id, it->second.dump());
            }
            return p;
        };

        prices.up = lookup(up_token_id);
        prices.down = lookup(down_token_id);

    } catch (const std::exception& e) {
        diag.warn(std::string("Batch price lookup failed: ") + e.what());
    }

    if (prices.complete()) {
        return prices;
    }

    if (!prices.up) prices.up = fetch_single(up_token_id, diag);
    if (!prices.down) prices.down = fetch_single(down_token_id, diag);

    if (!prices.complete()) {
        spdlog::warn("Prices incomplete (up: {}, down: {})",
                     prices.up ? std::to_string(*prices.up) : "null",
                     prices.down ? std::to_string(*prices.down) : "null");
    }
    return prices;
}

std::optional<Price> PriceFetcher::fetch_single(const std::string& token_id, Diagnostics& diag) {
    try {
        auto value = pricing_->get_price(token_id);
        auto p = market_parser::parse_probability(value);
        if (!p) {
            diag.warn("Price for token " + token_id + " is not a probability: " + value.dump());
        }
        return p;
    } catch (const std::exception& e) {
        diag.warn("Price lookup failed for token " + token_id + ": " + e.what());
        return std::nullopt;
    }
}

} // namespace updown
