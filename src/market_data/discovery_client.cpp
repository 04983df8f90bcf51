#include "market_data/discovery_client.hpp"
#include "market_data/market_parser.hpp"
#include "common/errors.hpp"
#include "utils/text_utils.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace updown {

namespace {
    constexpr long HTTP_NOT_FOUND = 404;

    nlohmann::json parse_body(const HttpResponse& response, const std::string& url) {
        auto j = nlohmann::json::parse(response.body, nullptr, false);
        if (j.is_discarded()) {
            throw UpstreamError("Unparsable response from " + url, response.status);
        }
        return j;
    }

    std::string error_excerpt(const std::string& body) {
        return text::utf8_prefix(body, 250);
    }
}

GammaDiscoveryClient::GammaDiscoveryClient(const ConnectionConfig& config, std::shared_ptr<HttpClient> http)
    : config_(config)
    , http_(std::move(http))
{
}

std::optional<MarketRecord> GammaDiscoveryClient::get_by_identifier(const std::string& identifier) {
    std::string url = config_.gamma_url + "/events/slug/" + text::url_encode(identifier);
    HttpResponse response = http_->get(url, config_.request_timeout_ms);

    if (response.status == HTTP_NOT_FOUND) {
        spdlog::debug("Gamma: {} not found", identifier);
        return std::nullopt;
    }
    if (!response.ok()) {
        throw UpstreamError("Gamma API error " + std::to_string(response.status) + " for " + url +
                            " :: " + error_excerpt(response.body), response.status);
    }

    auto j = parse_body(response, url);

    // Some deployments answer a lookup with an array instead of a single event
    if (j.is_array()) {
        if (j.empty()) return std::nullopt;
        nlohmann::json first = j.front();
        j = std::move(first);
    }

    auto records = market_parser::parse_event(j);
    if (records.empty()) {
        return std::nullopt;
    }

    MarketRecord record = records.front();
    if (record.identifier.empty()) record.identifier = identifier;
    return record;
}

std::vector<MarketRecord> GammaDiscoveryClient::search_by_text(const std::string& query) {
    std::string url = config_.gamma_url + "/public-search?q=" + text::url_encode(query);
    HttpResponse response = http_->get(url, config_.request_timeout_ms);

    if (!response.ok()) {
        throw UpstreamError("Gamma API error " + std::to_string(response.status) + " for " + url +
                            " :: " + error_excerpt(response.body), response.status);
    }

    auto records = market_parser::parse_search_payload(parse_body(response, url));
    spdlog::debug("Gamma search '{}' returned {} markets", query, records.size());
    return records;
}

} // namespace updown
