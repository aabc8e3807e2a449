#pragma once

#include <vector>
#include <map>
#include <unordered_map>
#include <unordered_set>
#include <mutex>
#include <tuple>
#include <optional>

#include "datatypes.hpp"
#include "config.hpp"
#include "match_history_store.hpp"

namespace features {

    // --- Result Structs ---

    struct FormStats {
        int wins = 0;
        int draws = 0;
        int losses = 0;
        int goals_for = 0;
        int goals_against = 0;
        int points = 0;
        int matches_played = 0;
        double weighted_points = 0.0; // Points per match, recency weighted when requested
        double win_rate = 0.0;
        double avg_goals_for = 0.0;
        double avg_goals_against = 0.0;
    };

    // Goals are oriented to team_a regardless of who was at home
    struct HeadToHead {
        int matches = 0;
        int team_a_wins = 0;
        int draws = 0;
        int team_b_wins = 0;
        double avg_goals_a = 0.0;
        double avg_goals_b = 0.0;
        double avg_total_goals = 0.0;
    };

    struct GoalStatistics {
        int matches = 0;
        double clean_sheet_rate = 0.0;
        double failed_to_score_rate = 0.0;
        double btts_rate = 0.0;
        double over_25_rate = 0.0;
    };

    struct RecentGoals {
        int matches = 0;
        int scored = 0;
        int conceded = 0;
    };

    // --- Point-in-Time Statistics Cache ---
    // Holds a read-only, date-sorted copy of the finished match history and answers
    // feature queries as of a cutoff date. Only matches strictly before the cutoff
    // are ever aggregated. Results of form() are memoized; the memo is the only
    // mutable state and is guarded by a mutex, so one cache can serve many threads.
    class StatisticsCache {
    public:
        // 'history' may contain unfinished matches; they are dropped.
        // 'teams' registers known teams and league membership (league size for the
        // mid-table fallback). Teams seen only in history are known too.
        StatisticsCache(std::vector<core::Match> history,
                        const std::vector<core::Team>& teams,
                        core::StatisticsConfig config = {});

        // Bulk-fetches every finished match (and every team) from the store once
        static StatisticsCache fromStore(data::MatchHistoryStore& store,
                                         core::StatisticsConfig config = {});

        StatisticsCache(const StatisticsCache&) = delete;
        StatisticsCache& operator=(const StatisticsCache&) = delete;
        StatisticsCache(StatisticsCache&& other) noexcept;
        StatisticsCache& operator=(StatisticsCache&&) = delete;

        FormStats form(core::TeamId team_id, core::Timestamp as_of, int window_n,
                       core::Venue venue = core::Venue::All,
                       bool recency_weighted = false) const;

        HeadToHead headToHead(core::TeamId team_a, core::TeamId team_b,
                              core::Timestamp as_of, int window_n) const;

        // 1-based rank by points, then goal difference, then goals for.
        // Mid-table when the team has no league matches before as_of.
        int leaguePosition(core::TeamId team_id, core::LeagueId league_id, core::Timestamp as_of) const;

        GoalStatistics goalStatistics(core::TeamId team_id, core::Timestamp as_of, int window_n,
                                      core::Venue venue = core::Venue::All) const;

        // Days since the last match, capped at 30; 14 without history
        int restDays(core::TeamId team_id, core::Timestamp as_of) const;

        // +n for n straight wins, -n for n straight losses, over the last 5 matches
        int currentStreak(core::TeamId team_id, core::Timestamp as_of) const;

        RecentGoals recentGoals(core::TeamId team_id, core::Timestamp as_of, int last_n) const;

        bool hasTeam(core::TeamId team_id) const;
        bool hasLeague(core::LeagueId league_id) const;

        const std::vector<core::Match>& matches() const { return matches_; }
        const core::StatisticsConfig& config() const { return config_; }
        size_t memoSize() const;

    private:
        // (team, venue, as_of ticks, window, weighted)
        using FormKey = std::tuple<core::TeamId, int, long long, int, bool>;

        std::vector<core::Match> matches_; // Finished, sorted by date then id
        std::unordered_map<core::TeamId, std::vector<size_t>> team_index_; // Positions in matches_, ascending
        std::map<core::LeagueId, std::vector<core::TeamId>> league_teams_;
        std::unordered_set<core::TeamId> known_teams_;
        core::StatisticsConfig config_;

        mutable std::mutex memo_mutex_;
        mutable std::map<FormKey, FormStats> form_memo_;

        // Most recent first, at most window_n (all when window_n <= 0) matches before as_of
        std::vector<const core::Match*> recentMatches(core::TeamId team_id, core::Timestamp as_of,
                                                      core::Venue venue, int window_n) const;

        FormStats computeForm(core::TeamId team_id, core::Timestamp as_of, int window_n,
                              core::Venue venue, bool recency_weighted) const;

        void requireTeam(core::TeamId team_id) const;
        static void requireWindow(int window_n);
    };

} // namespace features
