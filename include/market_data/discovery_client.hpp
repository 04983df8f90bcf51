#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "market_data/http_client.hpp"

namespace updown {

/**
 * Market discovery service.
 * A missing identifier is an expected outcome and returns nullopt;
 * transport, HTTP and parse failures throw UpstreamError.
 */
class DiscoveryService {
public:
    virtual ~DiscoveryService() = default;

    virtual std::optional<MarketRecord> get_by_identifier(const std::string& identifier) = 0;
    virtual std::vector<MarketRecord> search_by_text(const std::string& query) = 0;
};

/**
 * Polymarket Gamma API client.
 */
class GammaDiscoveryClient : public DiscoveryService {
public:
    GammaDiscoveryClient(const ConnectionConfig& config, std::shared_ptr<HttpClient> http);

    std::optional<MarketRecord> get_by_identifier(const std::string& identifier) override;
    std::vector<MarketRecord> search_by_text(const std::string& query) override;

private:
    ConnectionConfig config_;
    std::shared_ptr<HttpClient> http_;
};

} // namespace updown
