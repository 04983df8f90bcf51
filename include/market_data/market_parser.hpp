#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace updown {

/**
 * Parsing of Gamma discovery payloads into MarketRecord.
 * Gamma encodes list fields (clobTokenIds, outcomes, outcomePrices) either as
 * native JSON arrays or as JSON arrays serialized into a string; both are accepted.
 */
namespace market_parser {

// Native list or string-encoded list; anything else yields an empty list
std::vector<std::string> parse_string_list(const nlohmann::json& value);

// Decimal string or number in [0, 1]; anything else is nullopt
std::optional<Price> parse_probability(const nlohmann::json& value);

// Single market object; event supplies fallbacks for title, slug and flags
MarketRecord parse_market(const nlohmann::json& market, const nlohmann::json* event = nullptr);

// Event object with a markets[] array; an event without markets is parsed as a market
std::vector<MarketRecord> parse_event(const nlohmann::json& event);

// public-search payload: events[].markets[] followed by top-level markets[]
std::vector<MarketRecord> parse_search_payload(const nlohmann::json& payload);

// Public page for a record: prefix + market slug, else event slug; empty when neither is known
std::string market_url(const MarketRecord& record, const std::string& prefix);

} // namespace market_parser
} // namespace updown
