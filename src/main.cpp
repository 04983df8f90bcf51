#include <iostream>
#include <iomanip>
#include <filesystem>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "common/types.hpp"
#include "common/errors.hpp"
#include "config/config.hpp"
#include "config/catalog.hpp"
#include "market_data/http_client.hpp"
#include "market_data/clock_source.hpp"
#include "market_data/discovery_client.hpp"
#include "market_data/pricing_client.hpp"
#include "resolver/market_search.hpp"
#include "resolver/resolver.hpp"
#include "utils/logging.hpp"
#include "utils/time_utils.hpp"

using namespace updown;

namespace {
    constexpr int EXIT_FOUND = 0;
    constexpr int EXIT_CONFIG_ERROR = 1;
    constexpr int EXIT_NOT_FOUND = 2;
}

void print_catalog() {
    std::cout << "Assets:\n";
    for (const auto& asset : catalog::assets()) {
        std::cout << "  " << std::left << std::setw(6) << asset.symbol << " aliases:";
        for (const auto& alias : asset.aliases) std::cout << " " << alias;
        std::cout << "\n";
    }
    std::cout << "Intervals:\n";
    for (const auto& interval : catalog::intervals()) {
        std::cout << "  " << std::left << std::setw(6) << interval.label
                  << interval.duration_seconds << "s\n";
    }
}

std::string format_price(const std::optional<Price>& p) {
    if (!p) return "n/a";
    return fmt::format("{:.1f}% ({:.4f})", *p * 100.0, *p);
}

void print_result(const ResolutionResult& r) {
    std::cout << r.asset << " " << r.interval << " window "
              << time_utils::epoch_seconds_to_iso8601(r.window_start) << "\n";

    if (r.found) {
        std::cout << "Market: " << r.title << "\n";
        std::cout << "Slug:   " << r.identifier << "\n";
        if (!r.url.empty()) std::cout << "URL:    " << r.url << "\n";
        std::cout << "Up:     " << format_price(r.up_price) << "  (" << r.up_token_id << ")\n";
        std::cout << "Down:   " << format_price(r.down_price) << "  (" << r.down_token_id << ")\n";
    } else {
        std::cout << "No live market found. Tried:\n";
        for (const auto& id : r.tried_identifiers) {
            std::cout << "  - " << id << "\n";
        }
        if (r.last_error) {
            std::cout << "Last error: " << r.last_error->message << "\n";
        }
    }

    for (const auto& w : r.warnings) {
        std::cout << "Note: " << w << "\n";
    }
}

std::string format_figure(const std::optional<double>& v) {
    if (!v) return "n/a";
    return fmt::format("{:.0f}", *v);
}

void print_listings(const std::vector<MarketListing>& listings) {
    for (size_t i = 0; i < listings.size(); ++i) {
        const auto& record = listings[i].record;
        std::cout << (i + 1) << ". " << record.title << "\n";
        std::cout << "   volume " << format_figure(record.volume)
                  << "  liquidity " << format_figure(record.liquidity) << "\n";
        if (!listings[i].url.empty()) std::cout << "   " << listings[i].url << "\n";
    }
}

int main(int argc, char* argv[]) {
    CLI::App app{"updown_resolve - resolve the live up/down window market for an asset"};

    std::string config_path = "configs/resolver.json";
    std::string asset = "btc";
    std::string interval = "15m";
    std::string strategy_override;
    bool local_clock = false;
    bool json_output = false;
    bool list_catalog = false;
    bool show_version = false;
    std::string search_query;
    int search_limit = 0;

    app.add_option("-a,--asset", asset, "Asset symbol or name (btc, eth, sol, xrp)");
    app.add_option("-i,--interval", interval, "Interval label (5m, 15m, 1h)");
    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("-s,--strategy", strategy_override, "Locator strategy: slug or search")
        ->check(CLI::IsMember({"slug", "search"}));
    app.add_option("--search", search_query, "List live markets matching free text and exit");
    app.add_option("--limit", search_limit, "Maximum listings shown by --search")
        ->check(CLI::PositiveNumber);
    app.add_flag("--local-clock", local_clock, "Use the local clock instead of server time");
    app.add_flag("--json", json_output, "Print the result as JSON");
    app.add_flag("--list", list_catalog, "List supported assets and intervals and exit");
    app.add_flag("-v,--version", show_version, "Show version information");

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
        std::cout << "updown_resolve v1.0.0\n";
        return EXIT_FOUND;
    }

    if (list_catalog) {
        print_catalog();
        return EXIT_FOUND;
    }

    // Load config
    Config config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return EXIT_CONFIG_ERROR;
    }

    config.apply_env_overrides();
    if (!strategy_override.empty()) {
        config.resolver.strategy = *strategy_from_string(strategy_override);
    }
    if (local_clock) {
        config.connection.use_server_time = false;
    }
    if (search_limit > 0) {
        config.resolver.search_limit = search_limit;
    }

    try {
        setup_logging(config.logging);
    } catch (const ConfigurationError& e) {
        std::cerr << e.what() << "\n";
        return EXIT_CONFIG_ERROR;
    }

    auto http = std::make_shared<CurlHttpClient>();

    if (app.count("--search") > 0) {
        MarketSearch search(std::make_shared<GammaDiscoveryClient>(config.connection, http), config.resolver);
        std::vector<MarketListing> listings;
        try {
            listings = search.search(search_query);
        } catch (const ConfigurationError& e) {
            std::cerr << e.what() << "\n";
            return EXIT_CONFIG_ERROR;
        } catch (const UpstreamError& e) {
            spdlog::error("Search failed: {}", e.what());
            std::cerr << "Search failed: " << e.what() << "\n";
            return EXIT_NOT_FOUND;
        }

        if (listings.empty()) {
            std::cout << "No live markets match '" << search_query << "'\n";
            return EXIT_NOT_FOUND;
        }
        print_listings(listings);
        return EXIT_FOUND;
    }

    std::shared_ptr<ClockSource> clock;
    if (config.connection.use_server_time) {
        clock = std::make_shared<ServerClock>(config.connection, http);
    } else {
        clock = std::make_shared<SystemClock>();
    }

    Resolver resolver(config.resolver,
                      clock,
                      std::make_shared<GammaDiscoveryClient>(config.connection, http),
                      std::make_shared<ClobPricingClient>(config.connection, http));

    ResolutionResult result;
    try {
        result = resolver.resolve(asset, interval);
    } catch (const ConfigurationError& e) {
        spdlog::error("{}", e.what());
        std::cerr << e.what() << " (see --list)\n";
        return EXIT_CONFIG_ERROR;
    }

    if (json_output) {
        nlohmann::json j;
        to_json(j, result);
        std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    } else {
        print_result(result);
    }

    return result.found ? EXIT_FOUND : EXIT_NOT_FOUND;
}
