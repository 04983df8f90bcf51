#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace updown {

// Time types
using Timestamp = std::chrono::time_point<std::chrono::steady_clock>;
using WallClock = std::chrono::time_point<std::chrono::system_clock>;
using Duration = std::chrono::nanoseconds;

inline Timestamp now() {
    return std::chrono::steady_clock::now();
}

inline WallClock wall_now() {
    return std::chrono::system_clock::now();
}

// Probability-like price in [0, 1]
using Price = double;

// Epoch seconds
using EpochSeconds = int64_t;

// Market locator strategy
enum class LocatorStrategy {
    SLUG,    // Deterministic slug guessing, first valid hit wins
    SEARCH   // Full-text search, scored selection
};

inline std::string strategy_to_string(LocatorStrategy s) {
    switch (s) {
        case LocatorStrategy::SLUG: return "slug";
        case LocatorStrategy::SEARCH: return "search";
    }
    return "unknown";
}

inline std::optional<LocatorStrategy> strategy_from_string(const std::string& s) {
    if (s == "slug" || s == "SLUG") return LocatorStrategy::SLUG;
    if (s == "search" || s == "SEARCH") return LocatorStrategy::SEARCH;
    return std::nullopt;
}

// Resolution pipeline states
enum class ResolutionState {
    INIT,
    COMPUTE_WINDOW,
    GENERATE_CANDIDATES,
    LOCATE,
    VALIDATE,
    SCORE,
    SELECT,
    FETCH_PRICES,
    DONE,
    NOT_FOUND
};

inline std::string state_to_string(ResolutionState s) {
    switch (s) {
        case ResolutionState::INIT: return "INIT";
        case ResolutionState::COMPUTE_WINDOW: return "COMPUTE_WINDOW";
        case ResolutionState::GENERATE_CANDIDATES: return "GENERATE_CANDIDATES";
        case ResolutionState::LOCATE: return "LOCATE";
        case ResolutionState::VALIDATE: return "VALIDATE";
        case ResolutionState::SCORE: return "SCORE";
        case ResolutionState::SELECT: return "SELECT";
        case ResolutionState::FETCH_PRICES: return "FETCH_PRICES";
        case ResolutionState::DONE: return "DONE";
        case ResolutionState::NOT_FOUND: return "NOT_FOUND";
    }
    return "UNKNOWN";
}

// Error taxonomy
enum class ErrorKind {
    EXPECTED_MISS,       // Candidate not (yet) indexed upstream
    MALFORMED_RECORD,    // Record found but unusable
    UPSTREAM_TRANSIENT,  // Network, timeout, 5xx, unparsable body
    EXHAUSTED,           // All candidates tried, nothing validated
    CONFIGURATION        // Unknown asset or unsupported interval
};

inline std::string error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::EXPECTED_MISS: return "EXPECTED_MISS";
        case ErrorKind::MALFORMED_RECORD: return "MALFORMED_RECORD";
        case ErrorKind::UPSTREAM_TRANSIENT: return "UPSTREAM_TRANSIENT";
        case ErrorKind::EXHAUSTED: return "EXHAUSTED";
        case ErrorKind::CONFIGURATION: return "CONFIGURATION";
    }
    return "UNKNOWN";
}

struct ResolutionError {
    ErrorKind kind{ErrorKind::EXPECTED_MISS};
    std::string message;
};

// Asset with its textual aliases (symbol first)
struct Asset {
    std::string symbol;
    std::vector<std::string> aliases;

    const std::string& primary_alias() const { return aliases.front(); }
};

// Recurring contract interval
struct Interval {
    std::string label;                 // e.g. "5m"
    int64_t duration_seconds{0};
    std::vector<std::string> phrases;  // Written-out variants, first is used in queries

    const std::string& primary_phrase() const { return phrases.front(); }
};

// One side of a binary contract
struct OutcomeToken {
    std::string token_id;
    std::string label;                 // "Up"/"Down" when the record names them, else empty
    std::optional<Price> snapshot_price;
};

// Discovery-service record for a single market
struct MarketRecord {
    std::string identifier;            // Slug, or condition id when no slug
    std::string slug;                  // Market slug as published, may be empty
    std::string condition_id;
    std::string title;
    std::string event_title;
    std::string event_slug;

    // Tradeability flags; absent means unknown
    std::optional<bool> active;
    std::optional<bool> closed;
    std::optional<bool> archived;
    std::optional<bool> order_book_enabled;

    // Market figures, falling back to the parent event's
    std::optional<double> volume;
    std::optional<double> liquidity;

    std::vector<OutcomeToken> tokens;
};

// Final output of one resolution call
struct ResolutionResult {
    bool found{false};
    std::string asset;
    std::string interval;
    LocatorStrategy strategy{LocatorStrategy::SLUG};
    EpochSeconds window_start{0};

    // Success fields
    std::string title;
    std::string identifier;
    std::string url;                   // Public market page
    std::string up_token_id;
    std::string down_token_id;
    std::optional<Price> up_price;
    std::optional<Price> down_price;
    bool positional_outcomes{false};   // Up/down assigned by position, labels absent
    std::optional<int> score;          // Search strategy only

    // Diagnostics trail
    std::vector<std::string> tried_identifiers;
    std::optional<ResolutionError> last_error;
    std::vector<ResolutionState> states;
    std::vector<std::string> warnings;
    int64_t elapsed_ms{0};
};

} // namespace updown
