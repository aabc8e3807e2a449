// test_statistics_cache.cpp -- Point-in-time feature queries over a small league.
//
// History (league 1, one round per week from 2024-01-06):
//   R0 01-06: 1-2 2-0, 3-4 1-1     R3 01-27: 2-1 1-2, 4-3 0-2
//   R1 01-13: 2-3 1-0, 4-1 0-3     R4 02-03: 3-2 1-1, 1-4 4-0
//   R2 01-20: 1-3 3-1, 2-4 2-1     R5 02-10: 3-1 0-1, 4-2 1-2
// Team 1 wins every match, team 4 never wins.

#include <gtest/gtest.h>

#include "statistics_cache.hpp"
#include "match_features.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <vector>

using test_helpers::day;

class StatisticsCacheTest : public ::testing::Test {
protected:
    StatisticsCacheTest()
        : cache(test_helpers::fourTeamHistory(), test_helpers::fourTeams()) {}

    features::StatisticsCache cache;
    const core::Timestamp season_end = day("2024-03-01");
};

// ===========================================================================
// Form
// ===========================================================================

TEST_F(StatisticsCacheTest, FormOverLastFiveMatches) {
    const auto form = cache.form(1, season_end, 5);
    EXPECT_EQ(form.matches_played, 5);
    EXPECT_EQ(form.wins, 5);
    EXPECT_EQ(form.points, 15);
    EXPECT_DOUBLE_EQ(form.win_rate, 1.0);
    EXPECT_DOUBLE_EQ(form.weighted_points, 3.0);
}

TEST_F(StatisticsCacheTest, MatchOnTheCutoffDateIsExcluded) {
    // Round 1 is played on 01-13; as of that instant only round 0 counts
    const auto form = cache.form(4, day("2024-01-13"), 5);
    EXPECT_EQ(form.matches_played, 1);
    EXPECT_EQ(form.draws, 1);
    EXPECT_EQ(form.goals_for, 1);
    EXPECT_EQ(form.goals_against, 1);
}

TEST_F(StatisticsCacheTest, NoHistoryGivesNeutralBaseline) {
    const auto form = cache.form(1, day("2024-01-01"), 5);
    EXPECT_EQ(form.matches_played, 0);
    EXPECT_EQ(form.points, 0);
    EXPECT_DOUBLE_EQ(form.weighted_points, 0.0);
}

TEST_F(StatisticsCacheTest, VenueFilterKeepsHomeMatchesOnly) {
    const auto form = cache.form(1, season_end, 5, core::Venue::Home);
    EXPECT_EQ(form.matches_played, 3);
    EXPECT_EQ(form.goals_for, 9);
    EXPECT_EQ(form.goals_against, 1);
}

TEST_F(StatisticsCacheTest, RecencyWeightingFavoursLatestResults) {
    // Team 2, most recent first: W, D, L, W, W
    const double decay = cache.config().recency_decay;
    const double points[] = {3, 1, 0, 3, 3};
    double weighted = 0.0;
    double total = 0.0;
    for (int i = 0; i < 5; ++i) {
        weighted += points[i] * std::pow(decay, i);
        total += std::pow(decay, i);
    }

    const auto plain = cache.form(2, season_end, 5);
    const auto recent = cache.form(2, season_end, 5, core::Venue::All, true);
    EXPECT_DOUBLE_EQ(plain.weighted_points, 2.0);
    EXPECT_NEAR(recent.weighted_points, weighted / total, 1e-12);
    EXPECT_EQ(recent.points, plain.points);
}

TEST_F(StatisticsCacheTest, FormResultsAreMemoized) {
    EXPECT_EQ(cache.memoSize(), 0u);
    const auto first = cache.form(3, season_end, 5);
    const auto second = cache.form(3, season_end, 5);
    EXPECT_EQ(cache.memoSize(), 1u);
    EXPECT_EQ(first.points, second.points);
    cache.form(3, season_end, 5, core::Venue::Home);
    EXPECT_EQ(cache.memoSize(), 2u);
}

// ===========================================================================
// Head to head
// ===========================================================================

TEST_F(StatisticsCacheTest, HeadToHeadIsOrientedToFirstTeam) {
    // Meetings: 1-2 2-0 and 2-1 1-2
    const auto h2h = cache.headToHead(2, 1, season_end, 5);
    EXPECT_EQ(h2h.matches, 2);
    EXPECT_EQ(h2h.team_a_wins, 0);
    EXPECT_EQ(h2h.team_b_wins, 2);
    EXPECT_DOUBLE_EQ(h2h.avg_goals_a, 0.5);
    EXPECT_DOUBLE_EQ(h2h.avg_goals_b, 2.0);
    EXPECT_DOUBLE_EQ(h2h.avg_total_goals, 2.5);

    const auto mirrored = cache.headToHead(1, 2, season_end, 5);
    EXPECT_EQ(mirrored.team_a_wins, 2);
    EXPECT_DOUBLE_EQ(mirrored.avg_goals_a, 2.0);
}

TEST_F(StatisticsCacheTest, HeadToHeadWindowLimitsMeetings) {
    const auto h2h = cache.headToHead(1, 2, season_end, 1);
    EXPECT_EQ(h2h.matches, 1);
    EXPECT_DOUBLE_EQ(h2h.avg_total_goals, 3.0); // The 2-1 meeting
}

// ===========================================================================
// League table, goals, rest and streaks
// ===========================================================================

TEST_F(StatisticsCacheTest, LeaguePositionFromTableBeforeCutoff) {
    EXPECT_EQ(cache.leaguePosition(1, 1, season_end), 1);
    EXPECT_EQ(cache.leaguePosition(4, 1, season_end), 4);
}

TEST_F(StatisticsCacheTest, LeaguePositionFallsBackToMidTable) {
    // Four-team roster, nothing played yet
    EXPECT_EQ(cache.leaguePosition(1, 1, day("2024-01-01")), 2);
}

TEST_F(StatisticsCacheTest, MidTableUsesDefaultSizeWithoutRoster) {
    features::StatisticsCache no_roster(test_helpers::fourTeamHistory(), {});
    EXPECT_EQ(no_roster.leaguePosition(1, 1, day("2024-01-01")), 10);
    EXPECT_EQ(no_roster.leaguePosition(1, 1, season_end), 1);
}

TEST_F(StatisticsCacheTest, GoalStatisticsRates) {
    const auto stats = cache.goalStatistics(1, season_end, 10);
    EXPECT_EQ(stats.matches, 6);
    EXPECT_DOUBLE_EQ(stats.clean_sheet_rate, 4.0 / 6.0);
    EXPECT_DOUBLE_EQ(stats.failed_to_score_rate, 0.0);
    EXPECT_DOUBLE_EQ(stats.btts_rate, 2.0 / 6.0);
    EXPECT_DOUBLE_EQ(stats.over_25_rate, 4.0 / 6.0);
}

TEST_F(StatisticsCacheTest, RestDaysCappedWithDefault) {
    EXPECT_EQ(cache.restDays(1, day("2024-02-17")), 7);
    EXPECT_EQ(cache.restDays(1, day("2024-06-01")), 30);
    EXPECT_EQ(cache.restDays(1, day("2024-01-01")), 14);
}

TEST_F(StatisticsCacheTest, StreakSign) {
    EXPECT_EQ(cache.currentStreak(1, season_end), 5);
    EXPECT_EQ(cache.currentStreak(4, season_end), -5);
    EXPECT_EQ(cache.currentStreak(3, season_end), -1); // Loss after a draw
}

TEST_F(StatisticsCacheTest, RecentGoals) {
    // Team 2's last three: 2-1 away win, 1-1, 1-2 home loss
    const auto goals = cache.recentGoals(2, season_end, 3);
    EXPECT_EQ(goals.matches, 3);
    EXPECT_EQ(goals.scored, 4);
    EXPECT_EQ(goals.conceded, 4);
}

// ===========================================================================
// Validation and construction
// ===========================================================================

TEST_F(StatisticsCacheTest, UnknownTeamAndLeagueAreRejected) {
    EXPECT_THROW(cache.form(99, season_end, 5), core::ValidationException);
    EXPECT_THROW(cache.headToHead(1, 99, season_end, 5), core::ValidationException);
    EXPECT_THROW(cache.leaguePosition(1, 42, season_end), core::ValidationException);
    EXPECT_FALSE(cache.hasLeague(42));
}

TEST_F(StatisticsCacheTest, NonPositiveWindowIsRejected) {
    EXPECT_THROW(cache.form(1, season_end, 0), core::ValidationException);
    EXPECT_THROW(cache.goalStatistics(1, season_end, -1), core::ValidationException);
    EXPECT_THROW(cache.recentGoals(1, season_end, 0), core::ValidationException);
}

TEST_F(StatisticsCacheTest, UnplayedFixturesAreDropped) {
    auto history = test_helpers::fourTeamHistory();
    history.push_back(test_helpers::makeFixture(900, 1, 1, 4, day("2024-02-17")));
    features::StatisticsCache with_fixture(history, test_helpers::fourTeams());
    EXPECT_EQ(with_fixture.matches().size(), history.size() - 1);
}

TEST_F(StatisticsCacheTest, RegisteredTeamWithoutMatchesIsKnown) {
    auto teams = test_helpers::fourTeams();
    teams.push_back(test_helpers::makeTeam(5, 1, "Newcomers"));
    features::StatisticsCache with_newcomer(test_helpers::fourTeamHistory(), teams);
    EXPECT_TRUE(with_newcomer.hasTeam(5));
    EXPECT_EQ(with_newcomer.form(5, season_end, 5).matches_played, 0);
    // Five-team roster: mid-table is third
    EXPECT_EQ(with_newcomer.leaguePosition(5, 1, season_end), 3);
}

// ===========================================================================
// Match features
// ===========================================================================

TEST_F(StatisticsCacheTest, FeatureRecordForFixture) {
    const core::Match fixture = test_helpers::makeFixture(900, 1, 1, 4, day("2024-02-17"));
    const auto f = features::buildMatchFeatures(cache, fixture, 1580.0, 1420.0);

    EXPECT_EQ(f.schema_version, features::kFeatureSchemaVersion);
    EXPECT_EQ(f.match_id, 900);
    EXPECT_EQ(f.home_form_all.wins, 5);
    EXPECT_EQ(f.away_form_all.wins, 0);
    EXPECT_EQ(f.positionDiff(), -3);
    EXPECT_EQ(f.restAdvantage(), 0);
    EXPECT_EQ(f.home_streak, 5);
    EXPECT_EQ(f.h2h.matches, 2);
    EXPECT_EQ(f.h2h.team_a_wins, 2);
    EXPECT_DOUBLE_EQ(f.eloDiff(), 160.0);

    EXPECT_EQ(features::kFeatureSchemaVersion, 2);
    EXPECT_TRUE(f.is_title_race);
    EXPECT_FALSE(f.is_relegation_battle);
    EXPECT_NEAR(f.season_progress, 0.6, 1e-9); // February, no round number
}

TEST_F(StatisticsCacheTest, SeasonContextFromRoundThenCalendar) {
    core::Match fixture = test_helpers::makeFixture(901, 1, 2, 3, day("2024-10-05"));
    EXPECT_NEAR(features::seasonProgress(fixture), 0.2, 1e-9);

    fixture.match_date = day("2024-05-11");
    EXPECT_NEAR(features::seasonProgress(fixture), 0.9, 1e-9);

    fixture.round = "Regular Season - 19";
    EXPECT_NEAR(features::seasonProgress(fixture), 0.5, 1e-9);
    fixture.round = "Regular Season - 40";
    EXPECT_DOUBLE_EQ(features::seasonProgress(fixture), 1.0);

    EXPECT_DOUBLE_EQ(features::matchImportance(0.3), 0.5);
    EXPECT_DOUBLE_EQ(features::matchImportance(0.7), 0.6);
    EXPECT_DOUBLE_EQ(features::matchImportance(0.9), 0.7);

    fixture.round = "Regular Season - 34";
    const auto f = features::buildMatchFeatures(cache, fixture, 1500.0, 1500.0);
    EXPECT_NEAR(f.season_progress, 34.0 / 38.0, 1e-9);
    EXPECT_DOUBLE_EQ(f.match_importance, 0.7);
}
