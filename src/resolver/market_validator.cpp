#include "resolver/market_validator.hpp"
#include "utils/text_utils.hpp"

namespace updown {

MarketValidator::MarketValidator(LocatorStrategy strategy)
    : strategy_(strategy)
{
}

bool MarketValidator::is_tradeable(const MarketRecord& record, std::string* reason) {
    auto reject = [&](const char* why) {
        if (reason) *reason = why;
        return false;
    };

    if (record.closed.value_or(false)) return reject("market closed");
    if (record.archived.value_or(false)) return reject("market archived");
    if (!record.active.value_or(true)) return reject("market inactive");
    if (!record.order_book_enabled.value_or(true)) return reject("order book disabled");
    return true;
}

int MarketValidator::direction_of(const std::string& label) {
    std::string l = text::to_lower(text::trim(label));
    if (l == "up" || l == "higher") return 1;
    if (l == "down" || l == "lower") return -1;
    return 0;
}

ValidationResult MarketValidator::validate(const MarketRecord& record) const {
    ValidationResult result;

    if (!is_tradeable(record, &result.reason)) {
        return result;
    }

    if (record.tokens.size() < 2) {
        result.reason = "expected 2 outcome token ids, found " + std::to_string(record.tokens.size());
        result.rejection = ErrorKind::MALFORMED_RECORD;
        return result;
    }

    result.outcomes = select_pair(record);
    result.valid = true;
    return result;
}

OutcomePair MarketValidator::select_pair(const MarketRecord& record) const {
    const OutcomeToken* first = &record.tokens[0];
    const OutcomeToken* second = &record.tokens[1];

    // Multi-outcome search hits: prefer the tokens actually labelled up/down
    if (strategy_ == LocatorStrategy::SEARCH && record.tokens.size() > 2) {
        const OutcomeToken* up = nullptr;
        const OutcomeToken* down = nullptr;
        for (const auto& token : record.tokens) {
            int dir = direction_of(token.label);
            if (dir > 0 && !up) up = &token;
            if (dir < 0 && !down) down = &token;
        }
        if (up && down) {
            first = up;
            second = down;
        }
    }

    OutcomePair pair;
    int d1 = direction_of(first->label);
    int d2 = direction_of(second->label);

    // One recognized label is enough; the other token takes the opposite side
    bool first_is_up = (d1 > 0 && d2 <= 0) || (d1 == 0 && d2 < 0);
    bool first_is_down = (d1 < 0 && d2 >= 0) || (d1 == 0 && d2 > 0);

    if (first_is_up) {
        pair.up = *first;
        pair.down = *second;
    } else if (first_is_down) {
        pair.up = *second;
        pair.down = *first;
    } else {
        pair.up = *first;
        pair.down = *second;
        pair.positional = true;
    }
    return pair;
}

} // namespace updown
