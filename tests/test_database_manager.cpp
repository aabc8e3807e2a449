// test_database_manager.cpp -- SQLite match store, bet history and rating history
// against an in-memory database.

#include <gtest/gtest.h>

#include "database_manager.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include "test_helpers.hpp"

#include <map>
#include <memory>
#include <vector>

using test_helpers::day;
using test_helpers::makeFixture;
using test_helpers::makeMatch;
using test_helpers::plusDays;

namespace {

core::BetRecord makePendingBet(core::MatchId match_id, const std::string& market, double stake,
                               double price, core::ValueTier tier, core::Timestamp placed_at) {
    core::BetRecord bet;
    bet.match_id = match_id;
    bet.market = market;
    bet.market_name = market;
    bet.stake_amount = stake;
    bet.stake_kelly_percent = 10.0;
    bet.bankroll_at_bet = 1000.0;
    bet.price = price;
    bet.probability = 0.5;
    bet.expected_value = 0.5 * price;
    bet.edge_percentage = (0.5 * price - 1.0) * 100.0;
    bet.value_tier = tier;
    bet.confidence_level = "MEDIUM";
    bet.placed_at = placed_at;
    return bet;
}

}  // namespace

class DatabaseManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        db = test_helpers::makeMemoryDb();
        ASSERT_NE(db, nullptr);

        core::League league;
        league.id = 1;
        league.name = "Test League";
        league.season = 2024;
        ASSERT_TRUE(db->saveLeagues({league}));
        ASSERT_TRUE(db->saveTeams(test_helpers::fourTeams()));

        history = test_helpers::fourTeamHistory();
        ASSERT_TRUE(db->saveMatches(history));
    }

    std::unique_ptr<data::DatabaseManager> db;
    std::vector<core::Match> history;
};

TEST_F(DatabaseManagerTest, SchemaInitializationIsIdempotent) {
    EXPECT_TRUE(db->initializeSchema());
    EXPECT_EQ(db->listFinishedMatches().size(), history.size());
}

TEST_F(DatabaseManagerTest, FinishedMatchesComeBackInDateOrder) {
    const auto matches = db->listFinishedMatches();
    ASSERT_EQ(matches.size(), history.size());
    for (size_t i = 1; i < matches.size(); ++i) {
        EXPECT_FALSE(matches[i] < matches[i - 1]);
    }
    EXPECT_EQ(matches.front().id, 100);
    EXPECT_EQ(*matches.front().home_goals, 2);
    EXPECT_EQ(core::utils::timestampToString(matches.front().match_date), "2024-01-06T00:00:00Z");
}

TEST_F(DatabaseManagerTest, BeforeCutoffIsExclusive) {
    // Rounds fall on 01-06, 01-13, ...: strictly before 01-13 is the first round only
    const auto matches = db->listFinishedMatches(day("2024-01-13"));
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].id, 100);
    EXPECT_EQ(matches[1].id, 101);
}

TEST_F(DatabaseManagerTest, LeagueFilter) {
    EXPECT_EQ(db->listFinishedMatches(std::nullopt, {1}).size(), history.size());
    EXPECT_TRUE(db->listFinishedMatches(std::nullopt, {99}).empty());
}

TEST_F(DatabaseManagerTest, UpsertReplacesExistingMatch) {
    core::Match changed = history.front();
    changed.home_goals = 5;
    ASSERT_TRUE(db->saveMatches({changed}));

    const auto fetched = db->getMatch(changed.id);
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(*fetched->home_goals, 5);
    EXPECT_EQ(db->listFinishedMatches().size(), history.size());
}

TEST_F(DatabaseManagerTest, ScheduledFixturesAndResultBackfill) {
    const core::Match fixture = makeFixture(500, 1, 1, 2, day("2024-03-01"));
    ASSERT_TRUE(db->saveMatches({fixture}));

    auto scheduled = db->listScheduledMatches(day("2024-02-25"), day("2024-03-05"));
    ASSERT_EQ(scheduled.size(), 1u);
    EXPECT_FALSE(scheduled.front().hasScore());
    EXPECT_TRUE(db->listScheduledMatches(day("2024-03-02")).empty());

    ASSERT_TRUE(db->updateMatchResult(500, core::MatchStatus::Finished, 2, 1));
    EXPECT_TRUE(db->listScheduledMatches().empty());
    const auto played = db->getMatch(500);
    ASSERT_TRUE(played.has_value());
    EXPECT_TRUE(played->isFinished());
    EXPECT_EQ(db->listFinishedMatches().size(), history.size() + 1);
}

TEST_F(DatabaseManagerTest, TeamsAndLeagues) {
    EXPECT_EQ(db->listAllTeams().size(), 4u);
    EXPECT_EQ(db->listTeams(1).size(), 4u);
    EXPECT_TRUE(db->listTeams(2).empty());
    const auto leagues = db->listLeagues();
    ASSERT_EQ(leagues.size(), 1u);
    EXPECT_EQ(leagues.front().name, "Test League");
    EXPECT_FALSE(db->getMatch(9999).has_value());
}

TEST_F(DatabaseManagerTest, BetInsertAndQueryFilters) {
    const auto placed = day("2024-02-01");
    const long long first = db->insertBet(makePendingBet(100, "H", 50.0, 2.4, core::ValueTier::High, placed));
    const long long second = db->insertBet(makePendingBet(101, "O2.5", 20.0, 1.9, core::ValueTier::Medium,
                                                          plusDays(placed, 1)));
    EXPECT_GT(second, first);

    const auto bet = db->getBet(first);
    ASSERT_TRUE(bet.has_value());
    EXPECT_EQ(bet->market, "H");
    EXPECT_EQ(bet->status, core::BetStatus::Pending);
    EXPECT_DOUBLE_EQ(bet->price, 2.4);
    EXPECT_FALSE(bet->pnl.has_value());
    EXPECT_FALSE(bet->settled_at.has_value());

    // Newest first
    const auto all = db->queryBets({});
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all.front().id, second);

    data::BetQuery high_only;
    high_only.value_tier = core::ValueTier::High;
    const auto high = db->queryBets(high_only);
    ASSERT_EQ(high.size(), 1u);
    EXPECT_EQ(high.front().id, first);

    data::BetQuery limited;
    limited.limit = 1;
    EXPECT_EQ(db->queryBets(limited).size(), 1u);
    EXPECT_EQ(db->countBets(core::BetStatus::Pending), 2);
}

TEST_F(DatabaseManagerTest, SettlementAppliesOnlyOnce) {
    const long long id = db->insertBet(makePendingBet(100, "H", 100.0, 2.5, core::ValueTier::High, day("2024-02-01")));

    auto settleable = db->querySettleableBets();
    ASSERT_EQ(settleable.size(), 1u);
    EXPECT_EQ(settleable.front().first.id, id);
    EXPECT_EQ(settleable.front().second.id, 100);

    core::BetRecord settled = *db->getBet(id);
    settled.status = core::BetStatus::Won;
    settled.actual_result = "H";
    settled.is_winner = true;
    settled.pnl = 150.0;
    settled.roi_percent = 150.0;
    settled.bankroll_after = 1150.0;
    settled.settled_at = day("2024-02-02");

    EXPECT_TRUE(db->applySettlement(settled));
    EXPECT_FALSE(db->applySettlement(settled));

    const auto stored = db->getBet(id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, core::BetStatus::Won);
    EXPECT_DOUBLE_EQ(*stored->pnl, 150.0);
    EXPECT_TRUE(db->querySettleableBets().empty());
    EXPECT_EQ(db->querySettledBets().size(), 1u);
}

TEST_F(DatabaseManagerTest, PendingBetOnUnplayedMatchIsNotSettleable) {
    ASSERT_TRUE(db->saveMatches({makeFixture(500, 1, 1, 2, day("2024-03-01"))}));
    db->insertBet(makePendingBet(500, "H", 10.0, 2.0, core::ValueTier::Medium, day("2024-02-20")));
    EXPECT_TRUE(db->querySettleableBets().empty());
}

TEST_F(DatabaseManagerTest, RatingHistoryIsReplacedOnSave) {
    std::map<core::TeamId, core::TimeSeries<core::TimePoint>> history_in;
    history_in[1] = {{day("2024-01-06"), 1510.0}, {day("2024-01-13"), 1522.5}};
    history_in[2] = {{day("2024-01-06"), 1490.0}};
    ASSERT_TRUE(db->saveRatingHistory(history_in));

    auto team_one = db->queryRatingHistory(1);
    ASSERT_EQ(team_one.size(), 2u);
    EXPECT_DOUBLE_EQ(team_one[1].value, 1522.5);

    history_in[1] = {{day("2024-01-06"), 1505.0}};
    ASSERT_TRUE(db->saveRatingHistory(history_in));
    team_one = db->queryRatingHistory(1);
    ASSERT_EQ(team_one.size(), 1u);
    EXPECT_DOUBLE_EQ(team_one[0].value, 1505.0);
    EXPECT_TRUE(db->queryRatingHistory(3).empty());
}

TEST(DatabaseManagerStandaloneTest, QueriesBeforeConnectThrow) {
    data::DatabaseManager db(":memory:");
    EXPECT_FALSE(db.isConnected());
    EXPECT_FALSE(db.initializeSchema());
    EXPECT_THROW(db.listFinishedMatches(), core::DataLoadException);
}
