#include "statistics_cache.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <string>

namespace features {

    namespace {

        struct Standing {
            core::TeamId team_id = 0;
            int points = 0;
            int goal_difference = 0;
            int goals_for = 0;
        };

        // Goals from the point of view of 'team_id'
        void orientedScore(const core::Match& match, core::TeamId team_id, int& scored, int& conceded) {
            const bool is_home = match.home_team_id == team_id;
            scored = is_home ? *match.home_goals : *match.away_goals;
            conceded = is_home ? *match.away_goals : *match.home_goals;
        }

        int pointsFor(int scored, int conceded) {
            if (scored > conceded) return 3;
            if (scored == conceded) return 1;
            return 0;
        }

    } // end anonymous namespace

    StatisticsCache::StatisticsCache(std::vector<core::Match> history,
                                     const std::vector<core::Team>& teams,
                                     core::StatisticsConfig config)
        : config_(config)
    {
        auto logger = core::logging::getLogger();

        history.erase(std::remove_if(history.begin(), history.end(),
                                     [](const core::Match& m) { return !m.isFinished(); }),
                      history.end());
        std::sort(history.begin(), history.end());
        matches_ = std::move(history);

        for (const auto& team : teams) {
            known_teams_.insert(team.id);
            league_teams_[team.league_id].push_back(team.id);
        }

        for (size_t i = 0; i < matches_.size(); ++i) {
            const auto& match = matches_[i];
            team_index_[match.home_team_id].push_back(i);
            team_index_[match.away_team_id].push_back(i);
            known_teams_.insert(match.home_team_id);
            known_teams_.insert(match.away_team_id);
            // Leagues seen only through matches are valid but have no roster
            league_teams_.emplace(match.league_id, std::vector<core::TeamId>{});
        }

        logger->debug("StatisticsCache built: {} finished matches, {} teams, {} leagues.",
                      matches_.size(), known_teams_.size(), league_teams_.size());
    }

    StatisticsCache StatisticsCache::fromStore(data::MatchHistoryStore& store, core::StatisticsConfig config) {
        return StatisticsCache(store.listFinishedMatches(), store.listAllTeams(), config);
    }

    StatisticsCache::StatisticsCache(StatisticsCache&& other) noexcept
        : matches_(std::move(other.matches_)),
          team_index_(std::move(other.team_index_)),
          league_teams_(std::move(other.league_teams_)),
          known_teams_(std::move(other.known_teams_)),
          config_(other.config_)
    {
        std::lock_guard<std::mutex> lock(other.memo_mutex_);
        form_memo_ = std::move(other.form_memo_);
    }

    bool StatisticsCache::hasTeam(core::TeamId team_id) const {
        return known_teams_.count(team_id) > 0;
    }

    bool StatisticsCache::hasLeague(core::LeagueId league_id) const {
        return league_teams_.count(league_id) > 0;
    }

    size_t StatisticsCache::memoSize() const {
        std::lock_guard<std::mutex> lock(memo_mutex_);
        return form_memo_.size();
    }

    void StatisticsCache::requireTeam(core::TeamId team_id) const {
        if (!hasTeam(team_id)) {
            throw core::ValidationException("Unknown team id: " + std::to_string(team_id));
        }
    }

    void StatisticsCache::requireWindow(int window_n) {
        if (window_n <= 0) {
            throw core::ValidationException("Window size must be positive, got " + std::to_string(window_n));
        }
    }

    std::vector<const core::Match*> StatisticsCache::recentMatches(core::TeamId team_id, core::Timestamp as_of,
                                                                   core::Venue venue, int window_n) const {
        std::vector<const core::Match*> result;
        auto it = team_index_.find(team_id);
        if (it == team_index_.end()) {
            return result;
        }
        const auto& positions = it->second;

        // First position whose match is on or after the cutoff
        auto cutoff = std::lower_bound(positions.begin(), positions.end(), as_of,
            [this](size_t pos, const core::Timestamp& ts) { return matches_[pos].match_date < ts; });

        for (auto rit = std::make_reverse_iterator(cutoff); rit != positions.rend(); ++rit) {
            const core::Match& match = matches_[*rit];
            if (match.match_date >= as_of) {
                throw core::LeakageViolation("Match " + std::to_string(match.id) + " dated " +
                    core::utils::timestampToString(match.match_date) + " crossed the as-of cutoff " +
                    core::utils::timestampToString(as_of));
            }
            if (venue == core::Venue::Home && match.home_team_id != team_id) continue;
            if (venue == core::Venue::Away && match.away_team_id != team_id) continue;

            result.push_back(&match);
            if (window_n > 0 && static_cast<int>(result.size()) >= window_n) break;
        }
        return result;
    }

    FormStats StatisticsCache::form(core::TeamId team_id, core::Timestamp as_of, int window_n,
                                    core::Venue venue, bool recency_weighted) const {
        requireTeam(team_id);
        requireWindow(window_n);

        const FormKey key{team_id, static_cast<int>(venue),
                          static_cast<long long>(as_of.time_since_epoch().count()),
                          window_n, recency_weighted};
        {
            std::lock_guard<std::mutex> lock(memo_mutex_);
            auto it = form_memo_.find(key);
            if (it != form_memo_.end()) {
                return it->second;
            }
        }

        FormStats stats = computeForm(team_id, as_of, window_n, venue, recency_weighted);

        std::lock_guard<std::mutex> lock(memo_mutex_);
        form_memo_.emplace(key, stats);
        return stats;
    }

    FormStats StatisticsCache::computeForm(core::TeamId team_id, core::Timestamp as_of, int window_n,
                                           core::Venue venue, bool recency_weighted) const {
        FormStats stats;
        const auto recent = recentMatches(team_id, as_of, venue, window_n);
        if (recent.empty()) {
            return stats; // Neutral baseline
        }

        double weighted_sum = 0.0;
        double weight_total = 0.0;
        for (size_t i = 0; i < recent.size(); ++i) {
            int scored = 0;
            int conceded = 0;
            orientedScore(*recent[i], team_id, scored, conceded);
            const int points = pointsFor(scored, conceded);

            stats.goals_for += scored;
            stats.goals_against += conceded;
            stats.points += points;
            if (scored > conceded) ++stats.wins;
            else if (scored == conceded) ++stats.draws;
            else ++stats.losses;

            const double weight = recency_weighted ? std::pow(config_.recency_decay, static_cast<double>(i)) : 1.0;
            weighted_sum += points * weight;
            weight_total += weight;
        }

        stats.matches_played = static_cast<int>(recent.size());
        const double n = static_cast<double>(stats.matches_played);
        stats.weighted_points = weight_total > 0.0 ? weighted_sum / weight_total : 0.0;
        stats.win_rate = stats.wins / n;
        stats.avg_goals_for = stats.goals_for / n;
        stats.avg_goals_against = stats.goals_against / n;
        return stats;
    }

    HeadToHead StatisticsCache::headToHead(core::TeamId team_a, core::TeamId team_b,
                                           core::Timestamp as_of, int window_n) const {
        requireTeam(team_a);
        requireTeam(team_b);
        requireWindow(window_n);

        HeadToHead h2h;
        int goals_a = 0;
        int goals_b = 0;
        // Walk team_a's full history; meetings are filtered from it
        for (const core::Match* match : recentMatches(team_a, as_of, core::Venue::All, 0)) {
            if (!match->involves(team_b)) continue;

            int scored = 0;
            int conceded = 0;
            orientedScore(*match, team_a, scored, conceded);
            goals_a += scored;
            goals_b += conceded;
            if (scored > conceded) ++h2h.team_a_wins;
            else if (scored == conceded) ++h2h.draws;
            else ++h2h.team_b_wins;

            if (++h2h.matches >= window_n) break;
        }

        if (h2h.matches > 0) {
            const double n = static_cast<double>(h2h.matches);
            h2h.avg_goals_a = goals_a / n;
            h2h.avg_goals_b = goals_b / n;
            h2h.avg_total_goals = (goals_a + goals_b) / n;
        }
        return h2h;
    }

    int StatisticsCache::leaguePosition(core::TeamId team_id, core::LeagueId league_id, core::Timestamp as_of) const {
        requireTeam(team_id);
        auto league_it = league_teams_.find(league_id);
        if (league_it == league_teams_.end()) {
            throw core::ValidationException("Unknown league id: " + std::to_string(league_id));
        }

        const int league_size = league_it->second.empty()
            ? config_.default_league_size
            : static_cast<int>(league_it->second.size());
        const int mid_table = (league_size + 1) / 2;

        std::map<core::TeamId, Standing> table;
        // matches_ is date sorted, so the cutoff is a single binary search
        auto end = std::lower_bound(matches_.begin(), matches_.end(), as_of,
            [](const core::Match& m, const core::Timestamp& ts) { return m.match_date < ts; });
        for (auto it = matches_.begin(); it != end; ++it) {
            if (it->league_id != league_id) continue;
            const int hg = *it->home_goals;
            const int ag = *it->away_goals;

            Standing& home = table[it->home_team_id];
            Standing& away = table[it->away_team_id];
            home.team_id = it->home_team_id;
            away.team_id = it->away_team_id;
            home.goals_for += hg;
            away.goals_for += ag;
            home.goal_difference += hg - ag;
            away.goal_difference += ag - hg;
            home.points += pointsFor(hg, ag);
            away.points += pointsFor(ag, hg);
        }

        if (table.find(team_id) == table.end()) {
            return mid_table;
        }

        std::vector<Standing> sorted;
        sorted.reserve(table.size());
        for (const auto& entry : table) sorted.push_back(entry.second);
        std::sort(sorted.begin(), sorted.end(), [](const Standing& a, const Standing& b) {
            if (a.points != b.points) return a.points > b.points;
            if (a.goal_difference != b.goal_difference) return a.goal_difference > b.goal_difference;
            if (a.goals_for != b.goals_for) return a.goals_for > b.goals_for;
            return a.team_id < b.team_id;
        });

        for (size_t i = 0; i < sorted.size(); ++i) {
            if (sorted[i].team_id == team_id) {
                return static_cast<int>(i) + 1;
            }
        }
        return mid_table;
    }

    GoalStatistics StatisticsCache::goalStatistics(core::TeamId team_id, core::Timestamp as_of, int window_n,
                                                   core::Venue venue) const {
        requireTeam(team_id);
        requireWindow(window_n);

        GoalStatistics stats;
        const auto recent = recentMatches(team_id, as_of, venue, window_n);
        if (recent.empty()) {
            return stats;
        }

        int clean_sheets = 0;
        int failed_to_score = 0;
        int btts = 0;
        int over_25 = 0;
        for (const core::Match* match : recent) {
            int scored = 0;
            int conceded = 0;
            orientedScore(*match, team_id, scored, conceded);
            if (conceded == 0) ++clean_sheets;
            if (scored == 0) ++failed_to_score;
            if (scored > 0 && conceded > 0) ++btts;
            if (scored + conceded > 2) ++over_25;
        }

        stats.matches = static_cast<int>(recent.size());
        const double n = static_cast<double>(stats.matches);
        stats.clean_sheet_rate = clean_sheets / n;
        stats.failed_to_score_rate = failed_to_score / n;
        stats.btts_rate = btts / n;
        stats.over_25_rate = over_25 / n;
        return stats;
    }

    int StatisticsCache::restDays(core::TeamId team_id, core::Timestamp as_of) const {
        requireTeam(team_id);
        const auto last = recentMatches(team_id, as_of, core::Venue::All, 1);
        if (last.empty()) {
            return 14;
        }
        const long long days = core::utils::daysBetween(last.front()->match_date, as_of);
        return static_cast<int>(std::min<long long>(days, 30));
    }

    int StatisticsCache::currentStreak(core::TeamId team_id, core::Timestamp as_of) const {
        requireTeam(team_id);
        int streak = 0;
        for (const core::Match* match : recentMatches(team_id, as_of, core::Venue::All, 5)) {
            int scored = 0;
            int conceded = 0;
            orientedScore(*match, team_id, scored, conceded);
            if (scored > conceded) {
                if (streak < 0) break;
                ++streak;
            } else if (scored < conceded) {
                if (streak > 0) break;
                --streak;
            } else {
                break; // Draw ends any streak
            }
        }
        return streak;
    }

    RecentGoals StatisticsCache::recentGoals(core::TeamId team_id, core::Timestamp as_of, int last_n) const {
        requireTeam(team_id);
        requireWindow(last_n);

        RecentGoals goals;
        for (const core::Match* match : recentMatches(team_id, as_of, core::Venue::All, last_n)) {
            int scored = 0;
            int conceded = 0;
            orientedScore(*match, team_id, scored, conceded);
            goals.scored += scored;
            goals.conceded += conceded;
            ++goals.matches;
        }
        return goals;
    }

} // namespace features
