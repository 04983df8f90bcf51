#include <gtest/gtest.h>
#include "resolver/candidate_scorer.hpp"
#include "config/catalog.hpp"

using namespace updown;

class CandidateScorerTest : public ::testing::Test {
protected:
    void SetUp() override {
        btc_ = &catalog::find_asset("btc");
        five_ = &catalog::find_interval("5m");
        fifteen_ = &catalog::find_interval("15m");
    }

    ScoredCandidate candidate(const std::string& id, int score) {
        ScoredCandidate c;
        c.record.identifier = id;
        c.score = score;
        return c;
    }

    const Asset* btc_{nullptr};
    const Interval* five_{nullptr};
    const Interval* fifteen_{nullptr};
};

TEST_F(CandidateScorerTest, Score_FullMatch) {
    int s = CandidateScorer::score("Bitcoin Up or Down - 15 minute", "btc-updown-15m-1700000100",
                                   *btc_, *fifteen_);
    // both aliases + direction + interval
    EXPECT_EQ(s, 2 * CandidateScorer::ALIAS_POINTS + CandidateScorer::DIRECTION_POINTS +
                 CandidateScorer::INTERVAL_POINTS);
}

TEST_F(CandidateScorerTest, Score_IntervalPointsCountedOnce) {
    int s = CandidateScorer::score("BTC 15 minute 15-minute 15m", "", *btc_, *fifteen_);
    EXPECT_EQ(s, CandidateScorer::ALIAS_POINTS + CandidateScorer::INTERVAL_POINTS);
}

TEST_F(CandidateScorerTest, Score_ShorterIntervalNotMatchedInsideLonger) {
    int s = CandidateScorer::score("btc updown 15m", "", *btc_, *five_);
    EXPECT_EQ(s, CandidateScorer::ALIAS_POINTS + CandidateScorer::DIRECTION_POINTS);
}

TEST_F(CandidateScorerTest, Score_DirectionWordsAloneCount) {
    EXPECT_EQ(CandidateScorer::score("Will BTC go down?", "", *btc_, *five_),
              CandidateScorer::ALIAS_POINTS + CandidateScorer::DIRECTION_POINTS);
    EXPECT_EQ(CandidateScorer::score("BTC higher or lower", "", *btc_, *five_),
              CandidateScorer::ALIAS_POINTS + CandidateScorer::DIRECTION_POINTS);
    // "upgrade" is not the word "up"
    EXPECT_EQ(CandidateScorer::score("BTC upgrade", "", *btc_, *five_),
              CandidateScorer::ALIAS_POINTS);
}

TEST_F(CandidateScorerTest, Score_UnrelatedMarketIsZero) {
    EXPECT_EQ(CandidateScorer::score("Will it rain in Paris", "rain-paris", *btc_, *five_), 0);
}

TEST_F(CandidateScorerTest, Score_IsPure) {
    int first = CandidateScorer::score("Bitcoin Up or Down 5m", "x", *btc_, *five_);
    int second = CandidateScorer::score("Bitcoin Up or Down 5m", "x", *btc_, *five_);
    EXPECT_EQ(first, second);
}

TEST_F(CandidateScorerTest, SelectBest_HighestWins) {
    std::vector<ScoredCandidate> pool = {candidate("a", 3), candidate("b", 12), candidate("c", 8)};

    auto best = CandidateScorer::select_best(pool);

    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(*best, 1u);
}

TEST_F(CandidateScorerTest, SelectBest_TieGoesToEarliest) {
    std::vector<ScoredCandidate> pool = {candidate("a", 5), candidate("b", 10), candidate("c", 10)};

    auto best = CandidateScorer::select_best(pool);

    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(pool[*best].record.identifier, "b");
}

TEST_F(CandidateScorerTest, SelectBest_EmptyPool) {
    EXPECT_FALSE(CandidateScorer::select_best({}).has_value());
}
