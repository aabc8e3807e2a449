// test_elo_tracker.cpp -- Elo replay, point-in-time lookup and partitioned replay.

#include <gtest/gtest.h>

#include "elo_tracker.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

using test_helpers::day;
using test_helpers::makeMatch;
using test_helpers::plusDays;

namespace {

double expectedHome(double home, double away, double advantage = 100.0) {
    return 1.0 / (1.0 + std::pow(10.0, (away - (home + advantage)) / 400.0));
}

// Two leagues with disjoint teams plus a cup tie joining league 1 and league 3
std::vector<core::Match> multiLeagueHistory() {
    std::vector<core::Match> matches;
    const auto start = day("2024-01-06");
    core::MatchId id = 1;
    for (int round = 0; round < 6; ++round) {
        const auto date = plusDays(start, round * 7);
        // League 1: teams 1-4
        matches.push_back(makeMatch(id++, 1, 1 + round % 4, 1 + (round + 1) % 4, date, round % 3, 1));
        matches.push_back(makeMatch(id++, 1, 1 + (round + 2) % 4, 1 + (round + 3) % 4, date, 2, round % 2));
        // League 2: teams 11-14
        matches.push_back(makeMatch(id++, 2, 11 + round % 4, 11 + (round + 1) % 4, date, 1, round % 3));
        matches.push_back(makeMatch(id++, 2, 11 + (round + 2) % 4, 11 + (round + 3) % 4, date, round % 2, 0));
        // League 3: teams 21-22
        matches.push_back(makeMatch(id++, 3, 21 + round % 2, 21 + (round + 1) % 2, date, round % 4, 2));
    }
    // Cup tie in a separate competition id between teams of leagues 1 and 3
    matches.push_back(makeMatch(id++, 9, 1, 21, plusDays(start, 45), 0, 2));
    return matches;
}

}  // namespace

TEST(EloTrackerTest, SingleHomeWinMovesBothRatings) {
    models::EloTracker elo;
    elo.update(makeMatch(1, 1, 1, 2, day("2024-01-06"), 2, 0));

    const double e = expectedHome(1500.0, 1500.0);
    EXPECT_NEAR(elo.currentRating(1), 1500.0 + 32.0 * (1.0 - e), 1e-9);
    EXPECT_NEAR(elo.currentRating(2), 1500.0 - 32.0 * (1.0 - e), 1e-9);
    EXPECT_EQ(elo.matchesProcessed(), 1u);
}

TEST(EloTrackerTest, DrawFavoursTheAwaySide) {
    models::EloTracker elo;
    elo.update(makeMatch(1, 1, 1, 2, day("2024-01-06"), 1, 1));
    // Home advantage makes a draw below expectation for the home team
    EXPECT_LT(elo.currentRating(1), 1500.0);
    EXPECT_GT(elo.currentRating(2), 1500.0);
}

TEST(EloTrackerTest, RatingsAreZeroSum) {
    models::EloTracker elo;
    elo.replay(test_helpers::fourTeamHistory());
    double total = 0.0;
    for (core::TeamId team = 1; team <= 4; ++team) total += elo.currentRating(team);
    EXPECT_NEAR(total, 4 * 1500.0, 1e-9);
    EXPECT_EQ(elo.teamCount(), 4u);
}

TEST(EloTrackerTest, RatingAsOfUsesOnlyEarlierMatches) {
    models::EloTracker elo;
    const auto match_day = day("2024-01-06");
    elo.update(makeMatch(1, 1, 1, 2, match_day, 2, 0));

    EXPECT_DOUBLE_EQ(elo.ratingAsOf(1, match_day), 1500.0);
    EXPECT_DOUBLE_EQ(elo.ratingAsOf(1, plusDays(match_day, 1)), elo.currentRating(1));
    EXPECT_DOUBLE_EQ(elo.ratingAsOf(99, plusDays(match_day, 1)), 1500.0);
}

TEST(EloTrackerTest, RatingAsOfPicksTheLatestEarlierPoint) {
    models::EloTracker elo;
    elo.replay(test_helpers::fourTeamHistory());
    const auto history = elo.exportHistory();
    const auto& team_one = history.at(1);
    ASSERT_EQ(team_one.size(), 6u);

    // Between round 2 (01-20) and round 3 (01-27)
    EXPECT_DOUBLE_EQ(elo.ratingAsOf(1, day("2024-01-22")), team_one[2].value);
    EXPECT_DOUBLE_EQ(elo.ratingAsOf(1, day("2024-01-27")), team_one[2].value);
}

TEST(EloTrackerTest, OutOfOrderUpdateIsRejected) {
    models::EloTracker elo;
    elo.update(makeMatch(2, 1, 1, 2, day("2024-01-13"), 1, 0));
    EXPECT_THROW(elo.update(makeMatch(1, 1, 3, 4, day("2024-01-06"), 1, 0)), core::ValidationException);
}

TEST(EloTrackerTest, UnfinishedMatchesAreIgnored) {
    models::EloTracker elo;
    elo.update(test_helpers::makeFixture(1, 1, 1, 2, day("2024-01-06")));
    EXPECT_EQ(elo.matchesProcessed(), 0u);
    EXPECT_EQ(elo.teamCount(), 0u);
}

TEST(EloTrackerTest, ReplaySortsItsInput) {
    auto history = test_helpers::fourTeamHistory();
    std::reverse(history.begin(), history.end());

    models::EloTracker reversed;
    reversed.replay(history);
    models::EloTracker ordered;
    ordered.replay(test_helpers::fourTeamHistory());

    for (core::TeamId team = 1; team <= 4; ++team) {
        EXPECT_DOUBLE_EQ(reversed.currentRating(team), ordered.currentRating(team));
    }
}

TEST(EloTrackerTest, PartitionedReplayMatchesSequentialReplay) {
    const auto history = multiLeagueHistory();

    models::EloTracker sequential;
    sequential.replay(history);
    const auto partitioned = models::EloTracker::replayPartitioned(history);

    EXPECT_EQ(partitioned.matchesProcessed(), sequential.matchesProcessed());
    EXPECT_EQ(partitioned.teamCount(), sequential.teamCount());
    for (core::TeamId team : {1, 2, 3, 4, 11, 12, 13, 14, 21, 22}) {
        EXPECT_NEAR(partitioned.currentRating(team), sequential.currentRating(team), 1e-9) << "team " << team;
    }
    const auto seq_history = sequential.exportHistory();
    const auto par_history = partitioned.exportHistory();
    EXPECT_EQ(seq_history.at(21).size(), par_history.at(21).size());
}

TEST(EloTrackerTest, PredictionSplitsDrawProbability) {
    models::EloTracker elo;
    const auto p = elo.predict(1, 2); // Both unrated: equal ratings
    EXPECT_DOUBLE_EQ(p.draw, 0.35);
    EXPECT_NEAR(p.home_win, expectedHome(1500.0, 1500.0) * 0.65, 1e-12);
    EXPECT_NEAR(p.home_win + p.draw + p.away_win, 1.0, 1e-12);
    EXPECT_EQ(p.predicted, core::Outcome::HomeWin);
}

TEST(EloTrackerTest, DrawProbabilityHasFloor) {
    models::EloTracker elo;
    // Team 1 beats team 2 repeatedly until the gap exceeds 200 points
    auto date = day("2024-01-06");
    for (int i = 0; i < 40; ++i) {
        elo.update(makeMatch(i + 1, 1, 2, 1, plusDays(date, i), 0, 3));
    }
    ASSERT_GT(elo.currentRating(1) - elo.currentRating(2), 200.0);
    const auto p = elo.predict(2, 1);
    EXPECT_DOUBLE_EQ(p.draw, 0.15);
    EXPECT_EQ(p.predicted, core::Outcome::AwayWin);
}

TEST(EloTrackerTest, TopTeamsRankedByRating) {
    models::EloTracker elo;
    elo.replay(test_helpers::fourTeamHistory());
    const auto top = elo.topTeams(2);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top.front().first, 1);
    EXPECT_GE(top[0].second, top[1].second);
    EXPECT_EQ(elo.topTeams(10).size(), 4u);
}
