#include "market_data/market_parser.hpp"
#include "utils/text_utils.hpp"
#include <cmath>
#include <cstdlib>

namespace updown {
namespace market_parser {

namespace {
    std::string string_field(const nlohmann::json& j, const char* key) {
        if (!j.is_object() || !j.contains(key)) return "";
        const auto& v = j.at(key);
        if (v.is_string()) return v.get<std::string>();
        if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
        return "";
    }

    std::optional<bool> bool_field(const nlohmann::json& j, const char* key) {
        if (!j.is_object() || !j.contains(key)) return std::nullopt;
        const auto& v = j.at(key);
        if (v.is_boolean()) return v.get<bool>();
        if (v.is_string()) {
            std::string s = text::to_lower(v.get<std::string>());
            if (s == "true") return true;
            if (s == "false") return false;
        }
        return std::nullopt;
    }

    std::optional<bool> flag_with_fallback(const nlohmann::json& market,
                                           const nlohmann::json* event,
                                           const char* key) {
        auto v = bool_field(market, key);
        if (!v && event) v = bool_field(*event, key);
        return v;
    }

    // Number or numeric string; Gamma sends volume and liquidity either way
    std::optional<double> number_field(const nlohmann::json& j, const char* key) {
        if (!j.is_object() || !j.contains(key)) return std::nullopt;
        const auto& v = j.at(key);
        double n = 0.0;
        if (v.is_number()) {
            n = v.get<double>();
        } else if (v.is_string()) {
            std::string str = text::trim(v.get<std::string>());
            if (str.empty()) return std::nullopt;
            char* end = nullptr;
            n = std::strtod(str.c_str(), &end);
            if (end != str.c_str() + str.size()) return std::nullopt;
        } else {
            return std::nullopt;
        }
        if (!std::isfinite(n)) return std::nullopt;
        return n;
    }

    std::optional<double> figure_with_fallback(const nlohmann::json& market,
                                               const nlohmann::json* event,
                                               const char* key,
                                               const char* numeric_key) {
        auto v = number_field(market, key);
        if (!v) v = number_field(market, numeric_key);
        if (!v && event) v = number_field(*event, key);
        return v;
    }

    std::string first_non_empty(std::initializer_list<std::string> values) {
        for (const auto& v : values) {
            if (!v.empty()) return v;
        }
        return "";
    }
}

std::vector<std::string> parse_string_list(const nlohmann::json& value) {
    nlohmann::json list = value;
    if (value.is_string()) {
        list = nlohmann::json::parse(value.get<std::string>(), nullptr, false);
    }

    std::vector<std::string> out;
    if (!list.is_array()) return out;

    for (const auto& item : list) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        } else if (item.is_number()) {
            out.push_back(item.dump());
        }
    }
    return out;
}

std::optional<Price> parse_probability(const nlohmann::json& value) {
    double p = 0.0;
    if (value.is_number()) {
        p = value.get<double>();
    } else if (value.is_string()) {
        std::string s = text::trim(value.get<std::string>());
        if (s.empty()) return std::nullopt;
        char* end = nullptr;
        p = std::strtod(s.c_str(), &end);
        if (end != s.c_str() + s.size()) return std::nullopt;
    } else {
        return std::nullopt;
    }

    if (!std::isfinite(p) || p < 0.0 || p > 1.0) return std::nullopt;
    return p;
}

MarketRecord parse_market(const nlohmann::json& market, const nlohmann::json* event) {
    MarketRecord record;

    if (event) {
        record.event_title = string_field(*event, "title");
        record.event_slug = string_field(*event, "slug");
    }

    record.slug = string_field(market, "slug");
    record.condition_id = string_field(market, "conditionId");
    record.identifier = first_non_empty({
        record.slug,
        record.condition_id,
        string_field(market, "id"),
        record.event_slug
    });
    record.title = first_non_empty({
        string_field(market, "question"),
        string_field(market, "title"),
        record.event_title
    });

    record.active = flag_with_fallback(market, event, "active");
    record.closed = flag_with_fallback(market, event, "closed");
    record.archived = flag_with_fallback(market, event, "archived");
    record.order_book_enabled = flag_with_fallback(market, event, "enableOrderBook");

    record.volume = figure_with_fallback(market, event, "volume", "volumeNum");
    record.liquidity = figure_with_fallback(market, event, "liquidity", "liquidityNum");

    std::vector<std::string> ids;
    if (market.contains("clobTokenIds")) {
        ids = parse_string_list(market.at("clobTokenIds"));
    }

    if (!ids.empty()) {
        std::vector<std::string> labels;
        std::vector<std::string> prices;
        if (market.contains("outcomes")) labels = parse_string_list(market.at("outcomes"));
        if (market.contains("outcomePrices")) prices = parse_string_list(market.at("outcomePrices"));

        for (size_t i = 0; i < ids.size(); i++) {
            if (ids[i].empty()) continue;
            OutcomeToken token;
            token.token_id = ids[i];
            if (i < labels.size()) token.label = labels[i];
            if (i < prices.size()) token.snapshot_price = parse_probability(prices[i]);
            record.tokens.push_back(token);
        }
    } else if (market.contains("tokens") && market["tokens"].is_array()) {
        // CLOB-style token objects
        for (const auto& t : market["tokens"]) {
            OutcomeToken token;
            token.token_id = string_field(t, "token_id");
            if (token.token_id.empty()) continue;
            token.label = string_field(t, "outcome");
            if (t.contains("price")) token.snapshot_price = parse_probability(t.at("price"));
            record.tokens.push_back(token);
        }
    }

    return record;
}

std::vector<MarketRecord> parse_event(const nlohmann::json& event) {
    std::vector<MarketRecord> records;
    if (!event.is_object()) return records;

    if (event.contains("markets") && event["markets"].is_array()) {
        for (const auto& m : event["markets"]) {
            if (m.is_object()) records.push_back(parse_market(m, &event));
        }
        return records;
    }

    records.push_back(parse_market(event));
    return records;
}

std::vector<MarketRecord> parse_search_payload(const nlohmann::json& payload) {
    std::vector<MarketRecord> records;
    if (!payload.is_object()) return records;

    if (payload.contains("events") && payload["events"].is_array()) {
        for (const auto& ev : payload["events"]) {
            if (!ev.is_object() || !ev.contains("markets") || !ev["markets"].is_array()) continue;
            for (const auto& m : ev["markets"]) {
                if (m.is_object()) records.push_back(parse_market(m, &ev));
            }
        }
    }

    if (payload.contains("markets") && payload["markets"].is_array()) {
        for (const auto& m : payload["markets"]) {
            if (m.is_object()) records.push_back(parse_market(m));
        }
    }

    return records;
}

std::string market_url(const MarketRecord& record, const std::string& prefix) {
    const std::string& slug = !record.slug.empty() ? record.slug : record.event_slug;
    if (slug.empty()) return "";
    return prefix + slug;
}

} // namespace market_parser
} // namespace updown
