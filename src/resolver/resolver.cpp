#include "resolver/resolver.hpp"
#include "resolver/window_calculator.hpp"
#include "config/catalog.hpp"
#include "market_data/market_parser.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>

namespace updown {

Resolver::Resolver(const ResolverConfig& config,
                   std::shared_ptr<ClockSource> clock,
                   std::shared_ptr<DiscoveryService> discovery,
                   std::shared_ptr<PricingService> pricing)
    : config_(config)
    , clock_(std::move(clock))
    , locator_(make_locator(config, std::move(discovery)))
    , price_fetcher_(std::move(pricing))
{
}

ResolutionResult Resolver::resolve(const std::string& asset_name, const std::string& interval_label) {
    time_utils::LatencyTimer timer;
    timer.start();

    Diagnostics diag;
    diag.enter(ResolutionState::INIT);

    // Configuration errors surface before any network call
    const Asset& asset = catalog::find_asset(asset_name);
    const Interval& interval = catalog::find_interval(interval_label);

    ResolutionResult result;
    result.asset = asset.symbol;
    result.interval = interval.label;
    result.strategy = locator_->strategy();

    diag.enter(ResolutionState::COMPUTE_WINDOW);
    EpochSeconds now_s = clock_->now_seconds();
    result.window_start = window::window_start(now_s, interval.duration_seconds);
    auto window_starts = window::candidate_window_starts(now_s, interval.duration_seconds,
                                                         config_.window_offsets);

    spdlog::debug("Resolving {} {} at {} (window {})", asset.symbol, interval.label, now_s,
                  time_utils::epoch_seconds_to_iso8601(result.window_start));

    diag.enter(ResolutionState::GENERATE_CANDIDATES);
    auto candidates = locator_->generate_candidates(asset, interval, window_starts);

    auto located = locator_->locate(candidates, asset, interval, diag);

    if (located) {
        fill_success(result, *located, diag);
        diag.enter(ResolutionState::DONE);
    } else {
        diag.enter(ResolutionState::NOT_FOUND);
        std::string message = "No tradeable market after " + std::to_string(diag.tried().size()) +
                              " of " + std::to_string(candidates.size()) + " candidates";
        if (diag.last_error()) {
            message += "; last error (" + error_kind_to_string(diag.last_error()->kind) + "): " +
                       diag.last_error()->message;
        }
        diag.record_error(ErrorKind::EXHAUSTED, message);
    }

    diag.export_to(result);
    timer.stop();
    result.elapsed_ms = timer.elapsed_ms();

    if (result.found) {
        spdlog::info("{} {}: '{}' up={} down={} ({}ms)", result.asset, result.interval, result.title,
                     result.up_price ? std::to_string(*result.up_price) : "null",
                     result.down_price ? std::to_string(*result.down_price) : "null",
                     result.elapsed_ms);
    } else {
        spdlog::info("{} {}: not found after {} candidates ({}ms)", result.asset, result.interval,
                     result.tried_identifiers.size(), result.elapsed_ms);
    }

    return result;
}

void Resolver::fill_success(ResolutionResult& result, const LocatedMarket& market, Diagnostics& diag) {
    result.found = true;
    result.title = market.record.title;
    result.identifier = market.record.identifier;
    result.url = market_parser::market_url(market.record, config_.market_url_prefix);
    result.score = market.score;
    result.up_token_id = market.outcomes.up.token_id;
    result.down_token_id = market.outcomes.down.token_id;
    result.positional_outcomes = market.outcomes.positional;

    if (market.outcomes.positional) {
        diag.warn("Outcome labels for " + market.record.identifier + " not recognized ('" +
                  market.outcomes.up.label + "', '" + market.outcomes.down.label +
                  "'); first token assumed up, second assumed down");
    }

    diag.enter(ResolutionState::FETCH_PRICES);
    PricePair prices = price_fetcher_.fetch(result.up_token_id, result.down_token_id, diag);
    result.up_price = prices.up;
    result.down_price = prices.down;
}

void to_json(nlohmann::json& j, const ResolutionResult& r) {
    auto price_json = [](const std::optional<Price>& p) {
        return p ? nlohmann::json(*p) : nlohmann::json(nullptr);
    };

    j = nlohmann::json{
        {"found", r.found},
        {"asset", r.asset},
        {"interval", r.interval},
        {"strategy", strategy_to_string(r.strategy)},
        {"window_start", r.window_start},
        {"elapsed_ms", r.elapsed_ms}
    };

    if (r.found) {
        j["title"] = r.title;
        j["identifier"] = r.identifier;
        j["url"] = r.url;
        j["up_token_id"] = r.up_token_id;
        j["down_token_id"] = r.down_token_id;
        j["up_price"] = price_json(r.up_price);
        j["down_price"] = price_json(r.down_price);
        j["positional_outcomes"] = r.positional_outcomes;
        if (r.score) j["score"] = *r.score;
    }

    j["tried_identifiers"] = r.tried_identifiers;
    if (r.last_error) {
        j["last_error"] = {
            {"kind", error_kind_to_string(r.last_error->kind)},
            {"message", r.last_error->message}
        };
    } else {
        j["last_error"] = nullptr;
    }

    nlohmann::json states = nlohmann::json::array();
    for (auto s : r.states) states.push_back(state_to_string(s));
    j["states"] = states;
    j["warnings"] = r.warnings;
}

} // namespace updown
