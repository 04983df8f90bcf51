#pragma once

#include <memory>
#include "common/types.hpp"
#include "config/config.hpp"
#include "market_data/http_client.hpp"

namespace updown {

/**
 * Source of the canonical "now" used for window math.
 */
class ClockSource {
public:
    virtual ~ClockSource() = default;

    virtual EpochSeconds now_seconds() = 0;
};

class SystemClock : public ClockSource {
public:
    EpochSeconds now_seconds() override;
};

/**
 * CLOB server time (GET /time), normalized to seconds.
 * Falls back to the local clock when the server is unreachable.
 */
class ServerClock : public ClockSource {
public:
    ServerClock(const ConnectionConfig& config, std::shared_ptr<HttpClient> http);

    EpochSeconds now_seconds() override;

private:
    ConnectionConfig config_;
    std::shared_ptr<HttpClient> http_;
    SystemClock fallback_;
};

} // namespace updown
