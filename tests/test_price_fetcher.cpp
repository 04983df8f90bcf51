#include <gtest/gtest.h>
#include "resolver/price_fetcher.hpp"
#include "test_fakes.hpp"

using namespace updown;
using namespace updown::testing_fakes;

class PriceFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        pricing_ = std::make_shared<FakePricing>();
        fetcher_ = std::make_unique<PriceFetcher>(pricing_);
    }

    std::shared_ptr<FakePricing> pricing_;
    std::unique_ptr<PriceFetcher> fetcher_;
    Diagnostics diag_;
};

TEST_F(PriceFetcherTest, Fetch_BatchReturnsBoth) {
    pricing_->batch["tok1"] = "0.55";
    pricing_->batch["tok2"] = "0.45";

    auto prices = fetcher_->fetch("tok1", "tok2", diag_);

    ASSERT_TRUE(prices.complete());
    EXPECT_DOUBLE_EQ(*prices.up, 0.55);
    EXPECT_DOUBLE_EQ(*prices.down, 0.45);
    EXPECT_EQ(pricing_->batch_calls, 1);
    EXPECT_TRUE(pricing_->single_calls.empty());
    EXPECT_TRUE(diag_.warnings().empty());
}

TEST_F(PriceFetcherTest, Fetch_BatchFailureFallsBackPerToken) {
    pricing_->batch_fails = true;
    pricing_->single["tok1"] = "0.52";

    auto prices = fetcher_->fetch("tok1", "tok2", diag_);

    ASSERT_TRUE(prices.up.has_value());
    EXPECT_DOUBLE_EQ(*prices.up, 0.52);
    EXPECT_FALSE(prices.down.has_value());
    EXPECT_EQ(pricing_->single_calls, (std::vector<std::string>{"tok1", "tok2"}));
    // batch failure and the tok2 failure
    EXPECT_EQ(diag_.warnings().size(), 2u);
    EXPECT_FALSE(diag_.last_error().has_value());
}

TEST_F(PriceFetcherTest, Fetch_OnlyMissingTokensRefetched) {
    pricing_->batch["tok1"] = 0.61;
    pricing_->single["tok2"] = "0.39";

    auto prices = fetcher_->fetch("tok1", "tok2", diag_);

    ASSERT_TRUE(prices.complete());
    EXPECT_DOUBLE_EQ(*prices.up, 0.61);
    EXPECT_DOUBLE_EQ(*prices.down, 0.39);
    EXPECT_EQ(pricing_->single_calls, (std::vector<std::string>{"tok2"}));
}

TEST_F(PriceFetcherTest, Fetch_OutOfRangeBatchValueRefetched) {
    pricing_->batch["tok1"] = "1.7";
    pricing_->batch["tok2"] = "0.40";
    pricing_->single["tok1"] = "0.60";

    auto prices = fetcher_->fetch("tok1", "tok2", diag_);

    ASSERT_TRUE(prices.complete());
    EXPECT_DOUBLE_EQ(*prices.up, 0.60);
}

TEST_F(PriceFetcherTest, Fetch_NonProbabilitySingleValueIsNull) {
    pricing_->batch_fails = true;
    pricing_->single["tok1"] = "abc";
    pricing_->single["tok2"] = "0.5";

    auto prices = fetcher_->fetch("tok1", "tok2", diag_);

    EXPECT_FALSE(prices.up.has_value());
    ASSERT_TRUE(prices.down.has_value());
    EXPECT_DOUBLE_EQ(*prices.down, 0.5);
}
