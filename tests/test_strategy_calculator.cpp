#include <gtest/gtest.h>
#include "strategy/strategy_calculator.hpp"
#include "fakes.hpp"

using namespace updown;
using namespace updown::testing_fakes;

class StrategyCalculatorTest : public ::testing::Test {
protected:
    StrategyCalculator calc_;
    AssetSettings asset_;

    void SetUp() override {
        asset_.enabled = true;
        asset_.bet_size = 90.0;
        asset_.min_price = 0.90;
        asset_.max_price = 0.94;
    }
};

// ============================================================================
// Win rate table
// ============================================================================

TEST(WinRateTableTest, DefaultBands) {
    WinRateTable table;
    EXPECT_DOUBLE_EQ(table.win_rate(0.92), 0.99);
    EXPECT_DOUBLE_EQ(table.win_rate(0.80), 0.99);
    EXPECT_DOUBLE_EQ(table.win_rate(0.75), 0.98);
    EXPECT_DOUBLE_EQ(table.win_rate(0.65), 0.93);
    EXPECT_DOUBLE_EQ(table.win_rate(0.55), 0.80);
    // Below every band the price itself is the estimate
    EXPECT_DOUBLE_EQ(table.win_rate(0.30), 0.30);
}

TEST(WinRateTableTest, InjectedBandsInAnyOrder) {
    WinRateTable table({{0.50, 0.60}, {0.90, 0.95}});
    EXPECT_DOUBLE_EQ(table.win_rate(0.92), 0.95);
    EXPECT_DOUBLE_EQ(table.win_rate(0.70), 0.60);
}

// ============================================================================
// Evaluate
// ============================================================================

TEST_F(StrategyCalculatorTest, SideAInBand_YieldsUpOpportunity) {
    auto opp = calc_.evaluate(make_quote("m1", 0.92, 0.08), 0.90, 0.94, 90.0);

    ASSERT_TRUE(opp.has_value());
    EXPECT_EQ(opp->side, Outcome::UP);
    EXPECT_EQ(opp->token_id, "m1-up");
    EXPECT_DOUBLE_EQ(opp->price, 0.92);
    EXPECT_NEAR(opp->size_shares, 97.826, 0.001);
    EXPECT_DOUBLE_EQ(opp->expected_win_rate, 0.99);
    EXPECT_NEAR(opp->expected_value, (0.99 - 0.92) * (90.0 / 0.92), 1e-9);
    EXPECT_DOUBLE_EQ(opp->bet_size, 90.0);
}

TEST_F(StrategyCalculatorTest, SideBInBand_YieldsDownOpportunity) {
    auto opp = calc_.evaluate(make_quote("m1", 0.07, 0.93), 0.90, 0.94, 90.0);

    ASSERT_TRUE(opp.has_value());
    EXPECT_EQ(opp->side, Outcome::DOWN);
    EXPECT_EQ(opp->token_id, "m1-down");
}

TEST_F(StrategyCalculatorTest, BothSidesInBand_SideAWins) {
    auto opp = calc_.evaluate(make_quote("m1", 0.50, 0.50), 0.40, 0.60, 10.0);
    ASSERT_TRUE(opp.has_value());
    EXPECT_EQ(opp->side, Outcome::UP);
}

TEST_F(StrategyCalculatorTest, BandEdgesAreInclusive) {
    EXPECT_TRUE(calc_.evaluate(make_quote("m1", 0.90, 0.10), 0.90, 0.94, 90.0).has_value());
    EXPECT_TRUE(calc_.evaluate(make_quote("m1", 0.94, 0.06), 0.90, 0.94, 90.0).has_value());
}

TEST_F(StrategyCalculatorTest, NeitherSideInBand_NoOpportunity) {
    for (double up : {0.05, 0.50, 0.89, 0.95, 0.99}) {
        auto q = make_quote("m1", up, 1.0 - up);
        if (1.0 - up >= 0.90 && 1.0 - up <= 0.94) continue;
        EXPECT_FALSE(calc_.evaluate(q, 0.90, 0.94, 90.0).has_value()) << "up=" << up;
    }
}

TEST_F(StrategyCalculatorTest, OpportunityInvariants_HoldAcrossPrices) {
    for (int cents = 1; cents <= 99; cents++) {
        double up = cents / 100.0;
        auto opp = calc_.evaluate(make_quote("m", up, 0.5), 0.90, 0.94, 90.0);
        if (!opp) continue;
        EXPECT_GE(opp->price, 0.90);
        EXPECT_LE(opp->price, 0.94);
        EXPECT_DOUBLE_EQ(opp->size_shares, 90.0 / opp->price);
    }
}

TEST_F(StrategyCalculatorTest, MissingPrice_NoOpportunity) {
    EXPECT_FALSE(calc_.evaluate(make_quote("m1", 0.92, 0.0), 0.90, 0.94, 90.0).has_value());
    EXPECT_FALSE(calc_.evaluate(make_quote("m1", 0.92, 0.08), 0.90, 0.94, 0.0).has_value());
}

// ============================================================================
// Batch and view
// ============================================================================

TEST_F(StrategyCalculatorTest, FindOpportunities_SortedByEvStable) {
    // 0.90 earns more EV than 0.94 at the same win rate
    std::vector<MarketQuote> quotes = {
        make_quote("a", 0.94, 0.06),
        make_quote("b", 0.50, 0.50),
        make_quote("c", 0.90, 0.10),
        make_quote("d", 0.06, 0.94),
    };

    auto opps = calc_.find_opportunities(quotes, asset_);
    ASSERT_EQ(opps.size(), 3u);
    EXPECT_EQ(opps[0].quote.market_id, "c");
    // a and d tie; discovery order is kept
    EXPECT_EQ(opps[1].quote.market_id, "a");
    EXPECT_EQ(opps[2].quote.market_id, "d");
}

TEST_F(StrategyCalculatorTest, Analyze_BuildsDisplayView) {
    auto q = make_quote("m1", 0.92, 0.09);
    auto now = wall_now();
    q.end_time = now + std::chrono::minutes(30);

    auto view = calc_.analyze(q, asset_, now);
    EXPECT_EQ(view.market_id, "m1");
    EXPECT_NEAR(view.combined_cost, 1.01, 1e-9);
    EXPECT_NEAR(view.hours_left, 0.5, 1e-6);
    EXPECT_TRUE(view.is_viable);
    ASSERT_TRUE(view.viable_side.has_value());
    EXPECT_EQ(*view.viable_side, Outcome::UP);
    EXPECT_GT(view.expected_value, 0.0);

    auto idle = calc_.analyze(make_quote("m2", 0.5, 0.5), asset_, now);
    EXPECT_FALSE(idle.is_viable);
    EXPECT_FALSE(idle.viable_side.has_value());
}
