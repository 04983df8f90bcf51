#include "market_data/clock_source.hpp"
#include "common/errors.hpp"
#include "utils/text_utils.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdlib>

namespace updown {

namespace {
    // Accepts a bare number, a numeric string, or an object carrying the time
    double extract_time_value(const nlohmann::json& j) {
        if (j.is_number()) return j.get<double>();
        if (j.is_string()) {
            const std::string s = j.get<std::string>();
            char* end = nullptr;
            double v = std::strtod(s.c_str(), &end);
            if (!s.empty() && end == s.c_str() + s.size()) return v;
        }
        if (j.is_object()) {
            for (const char* key : {"time", "serverTime", "timestamp"}) {
                if (j.contains(key)) return extract_time_value(j.at(key));
            }
        }
        throw UpstreamError("Unrecognized server time payload: " + text::utf8_prefix(j.dump(), 100));
    }
}

EpochSeconds SystemClock::now_seconds() {
    return time_utils::epoch_seconds();
}

ServerClock::ServerClock(const ConnectionConfig& config, std::shared_ptr<HttpClient> http)
    : config_(config)
    , http_(std::move(http))
{
}

EpochSeconds ServerClock::now_seconds() {
    std::string url = config_.clob_url + "/time";
    try {
        HttpResponse response = http_->get(url, config_.time_sync_timeout_ms);
        if (!response.ok()) {
            throw UpstreamError("Server time error " + std::to_string(response.status), response.status);
        }

        auto j = nlohmann::json::parse(response.body, nullptr, false);
        if (j.is_discarded()) {
            throw UpstreamError("Unparsable server time response");
        }

        double raw = extract_time_value(j);
        if (!std::isfinite(raw) || raw <= 0) {
            throw UpstreamError("Server time out of range: " + std::to_string(raw));
        }

        EpochSeconds t = time_utils::normalize_epoch_seconds(raw);
        if (t <= 0) {
            throw UpstreamError("Server time out of range");
        }
        return t;

    } catch (const UpstreamError& e) {
        spdlog::warn("Server time unavailable ({}), using local clock", e.what());
        return fallback_.now_seconds();
    }
}

} // namespace updown
