#include "config/config.hpp"
#include <fstream>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace updown {

void to_json(nlohmann::json& j, const ConnectionConfig& c) {
    j = nlohmann::json{
        {"gamma_url", c.gamma_url},
        {"clob_url", c.clob_url},
        {"request_timeout_ms", c.request_timeout_ms},
        {"time_sync_timeout_ms", c.time_sync_timeout_ms},
        {"use_server_time", c.use_server_time}
    };
}

void from_json(const nlohmann::json& j, ConnectionConfig& c) {
    if (j.contains("gamma_url")) j.at("gamma_url").get_to(c.gamma_url);
    if (j.contains("clob_url")) j.at("clob_url").get_to(c.clob_url);
    if (j.contains("request_timeout_ms")) j.at("request_timeout_ms").get_to(c.request_timeout_ms);
    if (j.contains("time_sync_timeout_ms")) j.at("time_sync_timeout_ms").get_to(c.time_sync_timeout_ms);
    if (j.contains("use_server_time")) j.at("use_server_time").get_to(c.use_server_time);
}

void to_json(nlohmann::json& j, const ResolverConfig& c) {
    j = nlohmann::json{
        {"strategy", strategy_to_string(c.strategy)},
        {"window_offsets", c.window_offsets},
        {"min_search_candidates", c.min_search_candidates},
        {"min_search_score", c.min_search_score},
        {"slug_marker", c.slug_marker},
        {"market_url_prefix", c.market_url_prefix},
        {"search_limit", c.search_limit}
    };
}

void from_json(const nlohmann::json& j, ResolverConfig& c) {
    if (j.contains("strategy")) {
        std::string strategy_str = j.at("strategy").get<std::string>();
        auto strategy = strategy_from_string(strategy_str);
        if (!strategy) {
            throw std::runtime_error("Unknown resolver strategy: " + strategy_str);
        }
        c.strategy = *strategy;
    }
    if (j.contains("window_offsets")) j.at("window_offsets").get_to(c.window_offsets);
    if (j.contains("min_search_candidates")) j.at("min_search_candidates").get_to(c.min_search_candidates);
    if (j.contains("min_search_score")) j.at("min_search_score").get_to(c.min_search_score);
    if (j.contains("slug_marker")) j.at("slug_marker").get_to(c.slug_marker);
    if (j.contains("market_url_prefix")) j.at("market_url_prefix").get_to(c.market_url_prefix);
    if (j.contains("search_limit")) j.at("search_limit").get_to(c.search_limit);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"connection", c.connection},
        {"resolver", c.resolver},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("connection")) j.at("connection").get_to(c.connection);
    if (j.contains("resolver")) j.at("resolver").get_to(c.resolver);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    file >> j;

    Config config;
    from_json(j, config);

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool Config::validate() const {
    if (connection.gamma_url.empty() || connection.clob_url.empty()) {
        spdlog::error("gamma_url and clob_url must be set");
        return false;
    }

    if (connection.request_timeout_ms <= 0 || connection.time_sync_timeout_ms <= 0) {
        spdlog::error("Timeouts must be positive");
        return false;
    }

    if (connection.time_sync_timeout_ms > connection.request_timeout_ms) {
        spdlog::warn("time_sync_timeout_ms exceeds request_timeout_ms");
    }

    if (resolver.window_offsets.empty()) {
        spdlog::error("window_offsets must contain at least one offset");
        return false;
    }

    if (resolver.min_search_candidates <= 0) {
        spdlog::error("min_search_candidates must be positive");
        return false;
    }

    if (resolver.slug_marker.empty()) {
        spdlog::error("slug_marker must not be empty");
        return false;
    }

    if (resolver.search_limit <= 0) {
        spdlog::error("search_limit must be positive");
        return false;
    }

    return true;
}

void Config::apply_env_overrides() {
    std::string gamma = get_env("UPDOWN_GAMMA_URL");
    if (!gamma.empty()) connection.gamma_url = gamma;

    std::string clob = get_env("UPDOWN_CLOB_URL");
    if (!clob.empty()) connection.clob_url = clob;

    std::string strategy_str = get_env("UPDOWN_STRATEGY");
    if (!strategy_str.empty()) {
        auto strategy = strategy_from_string(strategy_str);
        if (strategy) {
            resolver.strategy = *strategy;
        } else {
            spdlog::warn("Ignoring UPDOWN_STRATEGY={} (expected slug or search)", strategy_str);
        }
    }

    std::string level = get_env("UPDOWN_LOG_LEVEL");
    if (!level.empty()) logging.log_level = level;
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace updown
