#include "config/catalog.hpp"
#include "common/errors.hpp"
#include "utils/text_utils.hpp"

namespace updown {
namespace catalog {

namespace {
    constexpr int64_t SECONDS_PER_DAY = 86400;

    struct IntervalAlias {
        const char* alias;
        const char* label;
    };

    const IntervalAlias INTERVAL_ALIASES[] = {
        {"60m", "1h"},
        {"5min", "5m"},
        {"15min", "15m"},
    };
}

const std::vector<Asset>& assets() {
    static const std::vector<Asset> catalog = {
        {"btc", {"btc", "bitcoin"}},
        {"eth", {"eth", "ethereum"}},
        {"sol", {"sol", "solana"}},
        {"xrp", {"xrp", "ripple"}},
    };
    return catalog;
}

const std::vector<Interval>& intervals() {
    static const std::vector<Interval> catalog = {
        {"5m", 300, {"5 minute", "5-minute", "5 min", "5m"}},
        {"15m", 900, {"15 minute", "15-minute", "15 min", "15m"}},
        {"1h", 3600, {"1 hour", "one hour", "60 minute", "60-minute", "hourly", "1h"}},
    };
    return catalog;
}

const Asset& find_asset(const std::string& name) {
    std::string key = text::to_lower(text::trim(name));
    for (const auto& asset : assets()) {
        if (asset.symbol == key) return asset;
        for (const auto& alias : asset.aliases) {
            if (alias == key) return asset;
        }
    }
    throw ConfigurationError("Unknown asset: " + name);
}

const Interval& find_interval(const std::string& label) {
    std::string key = text::to_lower(text::trim(label));
    for (const auto& alias : INTERVAL_ALIASES) {
        if (key == alias.alias) {
            key = alias.label;
            break;
        }
    }

    for (const auto& interval : intervals()) {
        if (interval.label != key) continue;
        // Window alignment is only meaningful when the duration divides a day
        if (interval.duration_seconds <= 0 || SECONDS_PER_DAY % interval.duration_seconds != 0) {
            throw ConfigurationError("Interval does not divide a day: " + label);
        }
        return interval;
    }
    throw ConfigurationError("Unsupported interval: " + label);
}

} // namespace catalog
} // namespace updown
