#include "match_features.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>

namespace features {

    double seasonProgress(const core::Match& fixture) {
        // "Regular Season - 12" -> 12
        std::string digits;
        for (char c : fixture.round) {
            if (std::isdigit(static_cast<unsigned char>(c))) digits += c;
        }
        if (!digits.empty() && digits.size() <= 3) {
            return std::min(std::stoi(digits) / static_cast<double>(kSeasonRounds), 1.0);
        }

        const int month = core::utils::monthOf(fixture.match_date);
        if (month >= 8) {
            return (month - 8) / 10.0;
        }
        return (month + 4) / 10.0;
    }

    double matchImportance(double season_progress) {
        double importance = 0.5;
        if (season_progress > 0.8) importance += 0.2;
        else if (season_progress > 0.6) importance += 0.1;
        return std::min(1.0, importance);
    }

    MatchFeatures buildMatchFeatures(const StatisticsCache& cache, const core::Match& fixture,
                                     double home_elo, double away_elo) {
        const auto& cfg = cache.config();
        const core::Timestamp as_of = fixture.match_date;
        const core::TeamId home = fixture.home_team_id;
        const core::TeamId away = fixture.away_team_id;

        MatchFeatures f;
        f.match_id = fixture.id;
        f.league_id = fixture.league_id;
        f.home_team_id = home;
        f.away_team_id = away;
        f.as_of = as_of;

        f.home_form_all = cache.form(home, as_of, cfg.form_window, core::Venue::All);
        f.home_form_home = cache.form(home, as_of, cfg.form_window, core::Venue::Home);
        f.away_form_all = cache.form(away, as_of, cfg.form_window, core::Venue::All);
        f.away_form_away = cache.form(away, as_of, cfg.form_window, core::Venue::Away);
        f.home_weighted_form = cache.form(home, as_of, cfg.goal_stats_window, core::Venue::All, true).weighted_points;
        f.away_weighted_form = cache.form(away, as_of, cfg.goal_stats_window, core::Venue::All, true).weighted_points;

        f.home_goals = cache.goalStatistics(home, as_of, cfg.goal_stats_window);
        f.away_goals = cache.goalStatistics(away, as_of, cfg.goal_stats_window);

        f.h2h = cache.headToHead(home, away, as_of, cfg.h2h_window);

        f.home_league_position = cache.leaguePosition(home, fixture.league_id, as_of);
        f.away_league_position = cache.leaguePosition(away, fixture.league_id, as_of);

        f.home_rest_days = cache.restDays(home, as_of);
        f.away_rest_days = cache.restDays(away, as_of);
        f.home_streak = cache.currentStreak(home, as_of);
        f.away_streak = cache.currentStreak(away, as_of);

        f.home_recent = cache.recentGoals(home, as_of, 3);
        f.away_recent = cache.recentGoals(away, as_of, 3);

        f.home_elo = home_elo;
        f.away_elo = away_elo;

        f.season_progress = seasonProgress(fixture);
        f.match_importance = matchImportance(f.season_progress);
        f.is_title_race = f.home_league_position <= kTitleRacePosition ||
                          f.away_league_position <= kTitleRacePosition;
        f.is_relegation_battle = f.home_league_position >= kRelegationPosition ||
                                 f.away_league_position >= kRelegationPosition;

        core::logging::getLogger()->trace("Features v{} built for match {} ({} vs {}).",
                                          f.schema_version, fixture.id, home, away);
        return f;
    }

} // namespace features
