#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace updown {

struct ConnectionConfig {
    // Polymarket
    std::string gamma_url{"https://gamma-api.polymarket.com"};   // Discovery
    std::string clob_url{"https://clob.polymarket.com"};         // Pricing and server time

    // Connection params
    int request_timeout_ms{12000};           // Discovery and price calls
    int time_sync_timeout_ms{3000};          // Server time call
    bool use_server_time{true};              // Fall back to local clock when false or unreachable
};

struct ResolverConfig {
    LocatorStrategy strategy{LocatorStrategy::SLUG};
    std::vector<int> window_offsets{0, -1, 1};   // Current, previous, next
    int min_search_candidates{25};               // Early-exit threshold for search queries
    int min_search_score{5};                     // Weakest acceptable search match
    std::string slug_marker{"updown"};
    std::string market_url_prefix{"https://polymarket.com/market/"};
    int search_limit{10};                        // Listings shown by --search
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{false};
    bool json_format{true};                  // JSON lines format
    int max_log_file_size_mb{20};
    int max_log_files{3};
};

struct Config {
    ConnectionConfig connection;
    ResolverConfig resolver;
    LoggingConfig logging;

    // Load from file
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // Apply UPDOWN_* environment overrides
    void apply_env_overrides();

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

// JSON serialization
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace updown
