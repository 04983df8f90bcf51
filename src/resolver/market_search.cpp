#include "resolver/market_search.hpp"
#include "resolver/market_validator.hpp"
#include "market_data/market_parser.hpp"
#include "common/errors.hpp"
#include "utils/text_utils.hpp"
#include <algorithm>
#include <set>
#include <spdlog/spdlog.h>

namespace updown {

MarketSearch::MarketSearch(std::shared_ptr<DiscoveryService> discovery, const ResolverConfig& config)
    : discovery_(std::move(discovery))
    , config_(config)
{
}

std::vector<MarketListing> MarketSearch::search(const std::string& query) const {
    if (text::trim(query).empty()) {
        throw ConfigurationError("Search query must not be empty");
    }

    auto records = discovery_->search_by_text(query);

    std::vector<MarketListing> listings;
    std::set<std::string> seen;
    size_t skipped = 0;

    for (auto& record : records) {
        const std::string key = !record.identifier.empty() ? record.identifier : record.condition_id;
        if (key.empty() || !seen.insert(key).second) continue;

        std::string reason;
        if (!MarketValidator::is_tradeable(record, &reason)) {
            ++skipped;
            spdlog::debug("Search hit {} skipped: {}", key, reason);
            continue;
        }

        MarketListing listing;
        listing.url = market_parser::market_url(record, config_.market_url_prefix);
        listing.record = std::move(record);
        listings.push_back(std::move(listing));
    }

    std::stable_sort(listings.begin(), listings.end(),
                     [](const MarketListing& a, const MarketListing& b) {
                         double av = a.record.volume.value_or(0.0);
                         double bv = b.record.volume.value_or(0.0);
                         if (av != bv) return av > bv;
                         return a.record.liquidity.value_or(0.0) > b.record.liquidity.value_or(0.0);
                     });

    if (listings.size() > static_cast<size_t>(config_.search_limit)) {
        listings.resize(static_cast<size_t>(config_.search_limit));
    }

    spdlog::info("Search '{}': {} live of {} markets ({} not tradeable)",
                 query, listings.size(), records.size(), skipped);
    return listings;
}

} // namespace updown
