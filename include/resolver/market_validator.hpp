#pragma once

#include <string>
#include "common/types.hpp"

namespace updown {

// Up/down token pair chosen from a validated record
struct OutcomePair {
    OutcomeToken up;
    OutcomeToken down;
    bool positional{false};   // Neither label usable (absent, unrecognized or conflicting), first token taken as up
};

struct ValidationResult {
    bool valid{false};
    std::string reason;       // Rejection reason, empty when valid
    ErrorKind rejection{ErrorKind::EXPECTED_MISS};
    OutcomePair outcomes;
};

/**
 * Accepts or rejects a discovery record.
 * A record passes when it is not closed, archived, inactive or
 * order-book-disabled (absent flags do not reject) and exposes at least two
 * outcome token ids.
 */
class MarketValidator {
public:
    explicit MarketValidator(LocatorStrategy strategy);

    ValidationResult validate(const MarketRecord& record) const;

    // Tradeability flags only
    static bool is_tradeable(const MarketRecord& record, std::string* reason = nullptr);

    // "up"/"higher" -> 1, "down"/"lower" -> -1, anything else 0
    static int direction_of(const std::string& label);

private:
    LocatorStrategy strategy_;

    OutcomePair select_pair(const MarketRecord& record) const;
};

} // namespace updown
