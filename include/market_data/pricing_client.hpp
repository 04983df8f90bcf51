#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config/config.hpp"
#include "market_data/http_client.hpp"

namespace updown {

/**
 * Outcome-token pricing service.
 * Values are returned raw (decimal string or number); the caller decides
 * whether a value is a usable probability. Failures throw UpstreamError.
 */
class PricingService {
public:
    virtual ~PricingService() = default;

    virtual std::map<std::string, nlohmann::json> get_batch_prices(const std::vector<std::string>& token_ids) = 0;
    virtual nlohmann::json get_price(const std::string& token_id) = 0;
};

/**
 * Polymarket CLOB midpoint client.
 */
class ClobPricingClient : public PricingService {
public:
    ClobPricingClient(const ConnectionConfig& config, std::shared_ptr<HttpClient> http);

    // POST /midpoints
    std::map<std::string, nlohmann::json> get_batch_prices(const std::vector<std::string>& token_ids) override;

    // GET /midpoint?token_id=
    nlohmann::json get_price(const std::string& token_id) override;

private:
    ConnectionConfig config_;
    std::shared_ptr<HttpClient> http_;
};

} // namespace updown
