#include <gtest/gtest.h>
#include "resolver/resolver.hpp"
#include "market_data/discovery_client.hpp"
#include "common/errors.hpp"
#include "test_fakes.hpp"
#include <algorithm>

using namespace updown;
using namespace updown::testing_fakes;

class ResolverTest : public ::testing::Test {
protected:
    static constexpr EpochSeconds NOW = 1700000300;

    void SetUp() override {
        clock_ = std::make_shared<FixedClock>(NOW);
        discovery_ = std::make_shared<FakeDiscovery>();
        pricing_ = std::make_shared<FakePricing>();
        pricing_->batch["tok-up"] = "0.55";
        pricing_->batch["tok-down"] = "0.45";
    }

    Resolver make_resolver() {
        return Resolver(config_, clock_, discovery_, pricing_);
    }

    bool has_state(const ResolutionResult& r, ResolutionState s) {
        return std::find(r.states.begin(), r.states.end(), s) != r.states.end();
    }

    ResolverConfig config_;
    std::shared_ptr<FixedClock> clock_;
    std::shared_ptr<FakeDiscovery> discovery_;
    std::shared_ptr<FakePricing> pricing_;
};

TEST_F(ResolverTest, Slug_PreviousWindowFound) {
    discovery_->by_id["btc-updown-5m-1699999800"] =
        make_updown_market("btc-updown-5m-1699999800", "Bitcoin Up or Down - 5 minute");
    auto resolver = make_resolver();

    auto r = resolver.resolve("btc", "5m");

    ASSERT_TRUE(r.found);
    EXPECT_EQ(r.asset, "btc");
    EXPECT_EQ(r.interval, "5m");
    EXPECT_EQ(r.strategy, LocatorStrategy::SLUG);
    EXPECT_EQ(r.window_start, 1700000100);
    EXPECT_EQ(r.identifier, "btc-updown-5m-1699999800");
    EXPECT_EQ(r.up_token_id, "tok-up");
    EXPECT_EQ(r.down_token_id, "tok-down");
    EXPECT_DOUBLE_EQ(*r.up_price, 0.55);
    EXPECT_DOUBLE_EQ(*r.down_price, 0.45);
    EXPECT_FALSE(r.score.has_value());

    std::vector<std::string> expected_tried = {
        "btc-updown-5m-1700000100",
        "bitcoin-updown-5m-1700000100",
        "btc-updown-5m-1699999800",
    };
    EXPECT_EQ(r.tried_identifiers, expected_tried);
    EXPECT_EQ(r.states.front(), ResolutionState::INIT);
    EXPECT_EQ(r.states.back(), ResolutionState::DONE);
    EXPECT_TRUE(has_state(r, ResolutionState::FETCH_PRICES));
}

TEST_F(ResolverTest, Slug_NothingFoundTriesEveryCandidate) {
    auto resolver = make_resolver();

    auto r = resolver.resolve("btc", "5m");

    EXPECT_FALSE(r.found);
    EXPECT_EQ(r.tried_identifiers.size(), 6u);
    EXPECT_EQ(discovery_->id_calls.size(), 6u);
    ASSERT_TRUE(r.last_error.has_value());
    EXPECT_EQ(r.last_error->kind, ErrorKind::EXHAUSTED);
    EXPECT_NE(r.last_error->message.find("bitcoin-updown-5m-1700000400"), std::string::npos);
    EXPECT_EQ(r.states.back(), ResolutionState::NOT_FOUND);
    EXPECT_FALSE(has_state(r, ResolutionState::FETCH_PRICES));
    EXPECT_EQ(pricing_->batch_calls, 0);
}

TEST_F(ResolverTest, Slug_UpstreamErrorContinuesLoop) {
    discovery_->failing_ids.insert("btc-updown-5m-1700000100");
    discovery_->by_id["bitcoin-updown-5m-1700000100"] =
        make_updown_market("bitcoin-updown-5m-1700000100", "Bitcoin Up or Down");
    auto resolver = make_resolver();

    auto r = resolver.resolve("btc", "5m");

    ASSERT_TRUE(r.found);
    EXPECT_EQ(r.identifier, "bitcoin-updown-5m-1700000100");
    EXPECT_EQ(r.tried_identifiers.size(), 2u);
    // last_error holds the most recent per-candidate failure
    ASSERT_TRUE(r.last_error.has_value());
    EXPECT_EQ(r.last_error->kind, ErrorKind::UPSTREAM_TRANSIENT);
}

TEST_F(ResolverTest, Slug_ClosedMarketSkipped) {
    auto closed = make_updown_market("btc-updown-5m-1700000100", "Bitcoin Up or Down");
    closed.closed = true;
    discovery_->by_id["btc-updown-5m-1700000100"] = closed;
    discovery_->by_id["btc-updown-5m-1700000400"] =
        make_updown_market("btc-updown-5m-1700000400", "Bitcoin Up or Down next");
    auto resolver = make_resolver();

    auto r = resolver.resolve("BTC", "5m");

    ASSERT_TRUE(r.found);
    EXPECT_EQ(r.identifier, "btc-updown-5m-1700000400");
    EXPECT_EQ(r.tried_identifiers.size(), 5u);
}

TEST_F(ResolverTest, Slug_PositionalOutcomesWarn) {
    discovery_->by_id["btc-updown-5m-1700000100"] = make_market(
        "btc-updown-5m-1700000100", "Bitcoin Up or Down",
        {{"tok-up", "", std::nullopt}, {"tok-down", "", std::nullopt}});
    auto resolver = make_resolver();

    auto r = resolver.resolve("btc", "5m");

    ASSERT_TRUE(r.found);
    EXPECT_TRUE(r.positional_outcomes);
    EXPECT_EQ(r.warnings.size(), 1u);
}

TEST_F(ResolverTest, Slug_PositionalWarningNamesLabels) {
    discovery_->by_id["btc-updown-5m-1700000100"] = make_market(
        "btc-updown-5m-1700000100", "Bitcoin Up or Down",
        {{"tok-up", "Yes", std::nullopt}, {"tok-down", "No", std::nullopt}});
    auto resolver = make_resolver();

    auto r = resolver.resolve("btc", "5m");

    ASSERT_TRUE(r.found);
    EXPECT_TRUE(r.positional_outcomes);
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_NE(r.warnings[0].find("'Yes'"), std::string::npos);
    EXPECT_NE(r.warnings[0].find("'No'"), std::string::npos);
}

TEST_F(ResolverTest, Slug_OneRecognizedLabelIsNotPositional) {
    discovery_->by_id["btc-updown-5m-1700000100"] = make_market(
        "btc-updown-5m-1700000100", "Bitcoin Up or Down",
        {{"tok-down", "Down", std::nullopt}, {"tok-up", "", std::nullopt}});
    auto resolver = make_resolver();

    auto r = resolver.resolve("btc", "5m");

    ASSERT_TRUE(r.found);
    EXPECT_FALSE(r.positional_outcomes);
    EXPECT_EQ(r.up_token_id, "tok-up");
    EXPECT_EQ(r.down_token_id, "tok-down");
    EXPECT_TRUE(r.warnings.empty());
}

TEST_F(ResolverTest, Slug_ResultCarriesMarketUrl) {
    auto market = make_updown_market("btc-updown-5m-1700000100", "Bitcoin Up or Down");
    market.slug.clear();
    market.event_slug = "btc-updown-5m-1700000100";
    discovery_->by_id["btc-updown-5m-1700000100"] = market;
    auto resolver = make_resolver();

    auto r = resolver.resolve("btc", "5m");

    ASSERT_TRUE(r.found);
    EXPECT_EQ(r.url, "https://polymarket.com/market/btc-updown-5m-1700000100");

    nlohmann::json j;
    to_json(j, r);
    EXPECT_EQ(j["url"], r.url);
}

TEST_F(ResolverTest, Slug_PricingFailureStillFound) {
    discovery_->by_id["btc-updown-5m-1700000100"] =
        make_updown_market("btc-updown-5m-1700000100", "Bitcoin Up or Down");
    pricing_->batch_fails = true;
    pricing_->single["tok-up"] = "0.6";
    auto resolver = make_resolver();

    auto r = resolver.resolve("btc", "5m");

    ASSERT_TRUE(r.found);
    EXPECT_DOUBLE_EQ(*r.up_price, 0.6);
    EXPECT_FALSE(r.down_price.has_value());
    EXPECT_FALSE(r.warnings.empty());
    EXPECT_FALSE(r.last_error.has_value());
}

TEST_F(ResolverTest, ConfigurationErrorBeforeNetwork) {
    auto resolver = make_resolver();

    EXPECT_THROW(resolver.resolve("doge", "5m"), ConfigurationError);
    EXPECT_THROW(resolver.resolve("btc", "7m"), ConfigurationError);
    EXPECT_TRUE(discovery_->id_calls.empty());
    EXPECT_EQ(pricing_->batch_calls, 0);
}

TEST_F(ResolverTest, Search_BestScoredMarketSelected) {
    config_.strategy = LocatorStrategy::SEARCH;
    discovery_->by_query["btc up or down 5 minute"] = {
        make_market("rain-paris", "Will it rain in Paris",
                    {{"y", "Yes", std::nullopt}, {"n", "No", std::nullopt}}),
        make_updown_market("btc-updown-5m-1700000100", "Bitcoin Up or Down - 5 minute"),
    };
    discovery_->by_query["bitcoin up or down 5 minute"] = {
        make_updown_market("btc-updown-5m-1700000100", "Bitcoin Up or Down - 5 minute"),
    };
    auto resolver = make_resolver();

    auto r = resolver.resolve("btc", "5m");

    ASSERT_TRUE(r.found);
    EXPECT_EQ(r.strategy, LocatorStrategy::SEARCH);
    EXPECT_EQ(r.identifier, "btc-updown-5m-1700000100");
    ASSERT_TRUE(r.score.has_value());
    EXPECT_EQ(*r.score, 15);
    EXPECT_EQ(r.tried_identifiers, discovery_->query_calls);
    EXPECT_TRUE(has_state(r, ResolutionState::SCORE));
    EXPECT_TRUE(has_state(r, ResolutionState::SELECT));
}

TEST_F(ResolverTest, Search_StopsOncePoolIsLargeEnough) {
    config_.strategy = LocatorStrategy::SEARCH;
    config_.min_search_candidates = 1;
    discovery_->by_query["btc up or down 5 minute"] = {
        make_updown_market("btc-updown-5m-1700000100", "Bitcoin Up or Down - 5 minute"),
    };
    auto resolver = make_resolver();

    auto r = resolver.resolve("btc", "5m");

    ASSERT_TRUE(r.found);
    EXPECT_EQ(discovery_->query_calls.size(), 1u);
}

TEST_F(ResolverTest, Search_WeakMatchRejected) {
    config_.strategy = LocatorStrategy::SEARCH;
    discovery_->by_query["btc up or down 5 minute"] = {
        make_market("rain-paris", "Will it rain in Paris",
                    {{"y", "Yes", std::nullopt}, {"n", "No", std::nullopt}}),
    };
    auto resolver = make_resolver();

    auto r = resolver.resolve("btc", "5m");

    EXPECT_FALSE(r.found);
    ASSERT_TRUE(r.last_error.has_value());
    EXPECT_EQ(r.last_error->kind, ErrorKind::EXHAUSTED);
    EXPECT_NE(r.last_error->message.find("below minimum"), std::string::npos);
}

TEST_F(ResolverTest, Search_UpstreamErrorsContinue) {
    config_.strategy = LocatorStrategy::SEARCH;
    discovery_->failing_queries.insert("btc up or down 5 minute");
    discovery_->by_query["btc up/down 5m"] = {
        make_updown_market("btc-updown-5m-1700000100", "Bitcoin Up or Down - 5 minute"),
    };
    auto resolver = make_resolver();

    auto r = resolver.resolve("btc", "5m");

    ASSERT_TRUE(r.found);
    EXPECT_EQ(r.identifier, "btc-updown-5m-1700000100");
}

TEST_F(ResolverTest, ToJson_NotFoundOmitsMarketFields) {
    auto resolver = make_resolver();
    auto r = resolver.resolve("eth", "1h");

    nlohmann::json j;
    to_json(j, r);

    EXPECT_FALSE(j["found"].get<bool>());
    EXPECT_EQ(j["strategy"], "slug");
    EXPECT_FALSE(j.contains("up_price"));
    EXPECT_EQ(j["tried_identifiers"].size(), 6u);
    EXPECT_EQ(j["last_error"]["kind"], error_kind_to_string(ErrorKind::EXHAUSTED));
    EXPECT_EQ(j["states"].front(), "INIT");
}

TEST_F(ResolverTest, ToJson_MissingPriceIsNull) {
    discovery_->by_id["eth-updown-1h-1699999200"] =
        make_updown_market("eth-updown-1h-1699999200", "Ethereum Up or Down - hourly");
    pricing_->batch["tok-up"] = "0.5";
    auto resolver = make_resolver();
    auto r = resolver.resolve("eth", "1h");

    nlohmann::json j;
    to_json(j, r);

    ASSERT_TRUE(j["found"].get<bool>());
    EXPECT_DOUBLE_EQ(j["up_price"].get<double>(), 0.5);
    EXPECT_TRUE(j["down_price"].is_null());
}

TEST_F(ResolverTest, ToJson_MultiByteErrorBodyStaysSerializable) {
    ConnectionConfig connection;
    connection.gamma_url = "http://gamma";
    auto http = std::make_shared<FakeHttpClient>();
    // 249 ASCII bytes then a two-byte character straddling the excerpt limit
    http->on_any_get(500, std::string(249, 'x') + "\xC3\xA9");
    Resolver resolver(config_, clock_, std::make_shared<GammaDiscoveryClient>(connection, http), pricing_);

    auto r = resolver.resolve("btc", "5m");

    EXPECT_FALSE(r.found);
    ASSERT_TRUE(r.last_error.has_value());
    EXPECT_EQ(r.last_error->message.find('\xC3'), std::string::npos);

    nlohmann::json j;
    to_json(j, r);
    EXPECT_NO_THROW(j.dump(2));
}
