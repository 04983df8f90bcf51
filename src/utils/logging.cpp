#include "utils/logging.hpp"
#include "common/errors.hpp"
#include <filesystem>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace updown {

void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        // stderr keeps stdout clean for --json output
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        try {
            std::filesystem::create_directories(config.log_dir);
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.log_dir + "/updown.log",
                static_cast<size_t>(config.max_log_file_size_mb) * 1024 * 1024,
                static_cast<size_t>(config.max_log_files)
            );
            if (config.json_format) {
                file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
            }
            sinks.push_back(file_sink);
        } catch (const std::filesystem::filesystem_error& e) {
            throw ConfigurationError("Cannot create log directory " + config.log_dir + ": " + e.what());
        } catch (const spdlog::spdlog_ex& e) {
            throw ConfigurationError("Cannot open log file in " + config.log_dir + ": " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("updown", sinks.begin(), sinks.end());

    if (config.log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (config.log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (config.log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
}

} // namespace updown
