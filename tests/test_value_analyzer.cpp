// test_value_analyzer.cpp -- Kelly staking, value tiers and per-market verdicts.

#include <gtest/gtest.h>

#include "value_analyzer.hpp"
#include "poisson_model.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <string>

class ValueAnalyzerTest : public ::testing::Test {
protected:
    betting::ValueAnalyzer analyzer;
};

// ===========================================================================
// Kelly criterion
// ===========================================================================

TEST_F(ValueAnalyzerTest, KellyForClearEdge) {
    const auto kelly = analyzer.kellyCriterion(0.6, 2.0);
    EXPECT_NEAR(kelly.raw, 0.2, 1e-12);
    EXPECT_NEAR(kelly.capped, 0.2, 1e-12);
    EXPECT_TRUE(kelly.is_positive);
    EXPECT_EQ(kelly.risk_tier, core::RiskTier::High);
}

TEST_F(ValueAnalyzerTest, NegativeKellyStakesNothing) {
    const auto kelly = analyzer.kellyCriterion(0.4, 2.0);
    EXPECT_NEAR(kelly.raw, -0.2, 1e-12);
    EXPECT_DOUBLE_EQ(kelly.capped, 0.0);
    EXPECT_FALSE(kelly.is_positive);
    EXPECT_EQ(kelly.risk_tier, core::RiskTier::None);
}

TEST_F(ValueAnalyzerTest, KellyIsCappedAtMaximum) {
    const auto kelly = analyzer.kellyCriterion(0.9, 3.0);
    EXPECT_NEAR(kelly.raw, 0.85, 1e-12);
    EXPECT_DOUBLE_EQ(kelly.capped, 0.25);
    EXPECT_DOUBLE_EQ(betting::ValueAnalyzer::kellyCriterion(0.9, 3.0, 0.5).capped, 0.5);
}

TEST_F(ValueAnalyzerTest, EvenMoneyPriceOfOnePaysNothing) {
    const auto kelly = analyzer.kellyCriterion(0.99, 1.0);
    EXPECT_DOUBLE_EQ(kelly.raw, 0.0);
    EXPECT_DOUBLE_EQ(kelly.capped, 0.0);
}

TEST_F(ValueAnalyzerTest, CappedStakeAlwaysWithinBounds) {
    for (double p = 0.0; p <= 1.0; p += 0.05) {
        for (double price : {1.0, 1.01, 1.5, 2.0, 3.75, 10.0, 51.0}) {
            const auto kelly = analyzer.kellyCriterion(std::min(p, 1.0), price);
            EXPECT_GE(kelly.capped, 0.0);
            EXPECT_LE(kelly.capped, analyzer.config().max_kelly_fraction);
        }
    }
}

TEST_F(ValueAnalyzerTest, RiskTiersFollowStakePercent) {
    // raw = 0.08 / 4.4, about 1.8%
    EXPECT_EQ(analyzer.kellyCriterion(0.2, 5.4).risk_tier, core::RiskTier::Low);
    // raw about 7.6%
    EXPECT_EQ(analyzer.kellyCriterion(0.55, 1.95).risk_tier, core::RiskTier::Medium);
}

TEST_F(ValueAnalyzerTest, InvalidInputsThrow) {
    EXPECT_THROW(analyzer.kellyCriterion(1.2, 2.0), core::ValidationException);
    EXPECT_THROW(analyzer.kellyCriterion(-0.1, 2.0), core::ValidationException);
    EXPECT_THROW(analyzer.kellyCriterion(0.5, 0.9), core::ValidationException);
    EXPECT_THROW(analyzer.kellyCriterion(0.5, NAN), core::ValidationException);
    EXPECT_THROW(analyzer.valueLevel(0.5, 0.5), core::ValidationException);
    EXPECT_THROW(betting::ValueAnalyzer::kellyCriterion(0.5, 2.0, 0.0), core::ValidationException);
}

TEST(ValueAnalyzerConfigTest, RejectsInvalidMaximum) {
    core::KellyConfig cfg;
    cfg.max_kelly_fraction = 0.0;
    EXPECT_THROW(betting::ValueAnalyzer{cfg}, core::ValidationException);
}

// ===========================================================================
// Value level and price estimation
// ===========================================================================

TEST_F(ValueAnalyzerTest, ValueTiers) {
    const auto high = analyzer.valueLevel(0.6, 2.0);
    EXPECT_EQ(high.tier, core::ValueTier::High);
    EXPECT_NEAR(high.expected_value, 1.2, 1e-12);
    EXPECT_NEAR(high.edge_percentage, 20.0, 1e-9);
    EXPECT_DOUBLE_EQ(high.implied_probability, 0.5);

    EXPECT_EQ(analyzer.valueLevel(0.55, 1.95).tier, core::ValueTier::Medium);
    EXPECT_EQ(analyzer.valueLevel(0.4, 2.0).tier, core::ValueTier::Neutral);
}

TEST_F(ValueAnalyzerTest, EstimatedPriceIncludesMargin) {
    EXPECT_NEAR(analyzer.estimatePrice(0.5), 1.0 / 0.45, 1e-12);
    EXPECT_NEAR(betting::ValueAnalyzer::estimatePrice(0.5, 0.0), 2.0, 1e-12);
    EXPECT_THROW(analyzer.estimatePrice(0.0), core::ValidationException);
    EXPECT_THROW(betting::ValueAnalyzer::estimatePrice(0.5, 1.0), core::ValidationException);
}

// ===========================================================================
// Market verdicts
// ===========================================================================

TEST_F(ValueAnalyzerTest, HighValueMarketIsRecommended) {
    const auto a = analyzer.analyze("H", 0.6, 2.0);
    EXPECT_EQ(a.market_name, "Home Win");
    EXPECT_FALSE(a.price_is_estimated);
    EXPECT_NEAR(a.kelly_capped, 0.2, 1e-12);
    EXPECT_NEAR(a.kellyPercent(), 20.0, 1e-9);
    EXPECT_EQ(a.value_tier, core::ValueTier::High);
    EXPECT_EQ(a.risk_tier, core::RiskTier::High);
    EXPECT_TRUE(a.should_bet);
}

TEST_F(ValueAnalyzerTest, NeutralMarketIsNotRecommended) {
    const auto a = analyzer.analyze("H", 0.4, 2.0);
    EXPECT_EQ(a.value_tier, core::ValueTier::Neutral);
    EXPECT_FALSE(a.should_bet);
}

TEST_F(ValueAnalyzerTest, TinyKellyIsNotRecommended) {
    // Medium value, but the stake is below the 3% floor
    const auto a = analyzer.analyze("A", 0.2, 5.4);
    EXPECT_EQ(a.value_tier, core::ValueTier::Medium);
    EXPECT_TRUE(a.kelly_raw > 0.0);
    EXPECT_FALSE(a.should_bet);
}

TEST_F(ValueAnalyzerTest, MissingPriceIsEstimatedAndFlagged) {
    const auto a = analyzer.analyze("O2.5", 0.5);
    EXPECT_TRUE(a.price_is_estimated);
    EXPECT_NEAR(a.price, 1.0 / 0.45, 1e-12);
    EXPECT_NEAR(a.expected_value, 1.0 / 0.9, 1e-12);
}

TEST_F(ValueAnalyzerTest, AnalyzeAllMarketsOfAPrediction) {
    models::PoissonModel model(test_helpers::fourTeamHistory(), test_helpers::fourTeams());
    const auto prediction = model.predict(1, 4);

    const std::map<std::string, double> prices = {{"H", 1.8}, {"BTTS", 2.1}};
    const auto analyses = analyzer.analyzeMarkets(prediction, prices);

    int core_markets = 0;
    for (const auto& a : analyses) {
        EXPECT_GT(a.probability, 0.0);
        EXPECT_DOUBLE_EQ(a.probability, prediction.probabilityOf(a.market));
        if (prediction.combos.count(a.market)) {
            EXPECT_GT(a.probability, analyzer.config().min_combo_probability) << a.market;
        } else {
            ++core_markets;
        }
        if (a.market == "H") {
            EXPECT_FALSE(a.price_is_estimated);
            EXPECT_DOUBLE_EQ(a.price, 1.8);
        }
        if (a.market == "D") {
            EXPECT_TRUE(a.price_is_estimated);
        }
    }
    EXPECT_EQ(core_markets, 8);
}
