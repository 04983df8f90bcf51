#include "market_data/pricing_client.hpp"
#include "common/errors.hpp"
#include "utils/text_utils.hpp"
#include <spdlog/spdlog.h>

namespace updown {

namespace {
    nlohmann::json checked_body(const HttpResponse& response, const std::string& url) {
        if (!response.ok()) {
            throw UpstreamError("CLOB API error " + std::to_string(response.status) + " for " + url +
                                " :: " + text::utf8_prefix(response.body, 250), response.status);
        }
        auto j = nlohmann::json::parse(response.body, nullptr, false);
        if (j.is_discarded()) {
            throw UpstreamError("Unparsable response from " + url, response.status);
        }
        return j;
    }
}

ClobPricingClient::ClobPricingClient(const ConnectionConfig& config, std::shared_ptr<HttpClient> http)
    : config_(config)
    , http_(std::move(http))
{
}

std::map<std::string, nlohmann::json> ClobPricingClient::get_batch_prices(const std::vector<std::string>& token_ids) {
    nlohmann::json body = nlohmann::json::array();
    for (const auto& id : token_ids) {
        body.push_back({{"token_id", id}});
    }

    std::string url = config_.clob_url + "/midpoints";
    auto j = checked_body(http_->post(url, body.dump(), config_.request_timeout_ms), url);

    std::map<std::string, nlohmann::json> prices;
    if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            prices[it.key()] = it.value();
        }
    } else if (j.is_array()) {
        // Positional [{"mid": "..."}] form
        for (size_t i = 0; i < j.size() && i < token_ids.size(); i++) {
            if (j[i].is_object() && j[i].contains("mid")) {
                prices[token_ids[i]] = j[i]["mid"];
            }
        }
    } else {
        throw UpstreamError("Unexpected midpoints response format from " + url);
    }

    spdlog::debug("CLOB midpoints returned {} of {} tokens", prices.size(), token_ids.size());
    return prices;
}

nlohmann::json ClobPricingClient::get_price(const std::string& token_id) {
    std::string url = config_.clob_url + "/midpoint?token_id=" + text::url_encode(token_id);
    auto j = checked_body(http_->get(url, config_.request_timeout_ms), url);

    if (j.is_object() && j.contains("mid")) {
        return j["mid"];
    }
    if (j.is_object() && j.contains("price")) {
        return j["price"];
    }
    throw UpstreamError("Midpoint missing in response from " + url);
}

} // namespace updown
