#pragma once

#include "datatypes.hpp"
#include "statistics_cache.hpp"

namespace features {

    // Bumped whenever a field is added, removed or changes meaning
    constexpr int kFeatureSchemaVersion = 2;

    // Season context thresholds, sized for a 20-team, 38-round league
    constexpr int kSeasonRounds = 38;
    constexpr int kTitleRacePosition = 4;       // Either side at or above this position
    constexpr int kRelegationPosition = 17;     // Either side at or below this position

    // Fixed feature record for one fixture, computed strictly from history before kick-off
    struct MatchFeatures {
        int schema_version = kFeatureSchemaVersion;

        core::MatchId match_id = 0;
        core::LeagueId league_id = 0;
        core::TeamId home_team_id = 0;
        core::TeamId away_team_id = 0;
        core::Timestamp as_of;

        FormStats home_form_all;
        FormStats home_form_home;
        FormStats away_form_all;
        FormStats away_form_away;
        double home_weighted_form = 0.0;
        double away_weighted_form = 0.0;

        GoalStatistics home_goals;
        GoalStatistics away_goals;

        HeadToHead h2h;

        int home_league_position = 0;
        int away_league_position = 0;

        int home_rest_days = 0;
        int away_rest_days = 0;
        int home_streak = 0;
        int away_streak = 0;

        RecentGoals home_recent;
        RecentGoals away_recent;

        double home_elo = 0.0;
        double away_elo = 0.0;

        // Added in schema version 2
        double season_progress = 0.0;   // 0 at the start of the season, 1 at the end
        double match_importance = 0.5;
        bool is_title_race = false;
        bool is_relegation_battle = false;

        int positionDiff() const { return home_league_position - away_league_position; }
        int restAdvantage() const { return home_rest_days - away_rest_days; }
        double eloDiff() const { return home_elo - away_elo; }
    };

    // Round number / kSeasonRounds, capped at 1. Without a numeric round the calendar is used,
    // August = 0.0 through May = 0.9.
    double seasonProgress(const core::Match& fixture);

    // 0.5 base, +0.1 past 60% of the season, +0.2 past 80%
    double matchImportance(double season_progress);

    // Assembles the feature record for 'fixture' as of its kick-off time.
    // Ratings are supplied by the caller (already taken as of the same date).
    MatchFeatures buildMatchFeatures(const StatisticsCache& cache, const core::Match& fixture,
                                     double home_elo, double away_elo);

} // namespace features
