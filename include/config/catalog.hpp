#pragma once

#include <string>
#include <vector>
#include "common/types.hpp"

namespace updown {

/**
 * Static catalog of supported assets and intervals.
 * Lookups are case-insensitive and throw ConfigurationError on unknown input.
 */
namespace catalog {

const std::vector<Asset>& assets();
const std::vector<Interval>& intervals();

// Accepts the symbol or any alias ("btc", "Bitcoin")
const Asset& find_asset(const std::string& name);

// Accepts the label or an alternate label ("1h", "60m")
const Interval& find_interval(const std::string& label);

} // namespace catalog
} // namespace updown
