#include "elo_tracker.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <iterator>
#include <unordered_map>

namespace models {

    namespace {

        // Union-find over league ids
        class LeagueGroups {
        public:
            core::LeagueId find(core::LeagueId id) {
                auto it = parent_.find(id);
                if (it == parent_.end()) {
                    parent_[id] = id;
                    return id;
                }
                if (it->second == id) return id;
                core::LeagueId root = find(it->second);
                parent_[id] = root;
                return root;
            }

            void unite(core::LeagueId a, core::LeagueId b) {
                core::LeagueId ra = find(a);
                core::LeagueId rb = find(b);
                if (ra != rb) parent_[std::max(ra, rb)] = std::min(ra, rb);
            }

        private:
            std::unordered_map<core::LeagueId, core::LeagueId> parent_;
        };

    } // end anonymous namespace

    EloTracker::EloTracker(core::EloConfig config)
        : config_(config) {}

    double EloTracker::expectedHomeScore(double home_rating, double away_rating) const {
        const double adjusted_home = home_rating + config_.home_advantage;
        return 1.0 / (1.0 + std::pow(10.0, (away_rating - adjusted_home) / 400.0));
    }

    void EloTracker::update(const core::Match& match) {
        if (!match.isFinished()) {
            return;
        }
        const auto order = std::make_pair(match.match_date, match.id);
        if (last_applied_ && order < *last_applied_) {
            throw core::ValidationException("Match " + std::to_string(match.id) + " on " +
                core::utils::timestampToString(match.match_date) +
                " is older than the last rated match " + std::to_string(last_applied_->second));
        }

        RatingState& home = ratings_.try_emplace(match.home_team_id, RatingState{config_.initial_rating, {}}).first->second;
        RatingState& away = ratings_.try_emplace(match.away_team_id, RatingState{config_.initial_rating, {}}).first->second;

        const double home_expected = expectedHomeScore(home.current, away.current);
        const double away_expected = 1.0 - home_expected;

        double home_actual = 0.5;
        if (*match.home_goals > *match.away_goals) home_actual = 1.0;
        else if (*match.home_goals < *match.away_goals) home_actual = 0.0;
        const double away_actual = 1.0 - home_actual;

        home.current += config_.k_factor * (home_actual - home_expected);
        away.current += config_.k_factor * (away_actual - away_expected);
        home.history.push_back({match.match_date, home.current});
        away.history.push_back({match.match_date, away.current});

        last_applied_ = order;
        ++matches_processed_;
    }

    void EloTracker::replay(std::vector<core::Match> matches) {
        std::sort(matches.begin(), matches.end());
        size_t before = matches_processed_;
        for (const auto& match : matches) {
            update(match);
        }
        core::logging::getLogger()->debug("EloTracker replayed {} matches ({} teams rated).",
                                          matches_processed_ - before, ratings_.size());
    }

    void EloTracker::absorb(EloTracker&& other) {
        for (auto& entry : other.ratings_) {
            if (ratings_.count(entry.first)) {
                throw core::ValidationException("Cannot merge rating groups: team " +
                                                std::to_string(entry.first) + " appears in both");
            }
            ratings_.emplace(entry.first, std::move(entry.second));
        }
        if (other.last_applied_ && (!last_applied_ || *last_applied_ < *other.last_applied_)) {
            last_applied_ = other.last_applied_;
        }
        matches_processed_ += other.matches_processed_;
    }

    EloTracker EloTracker::replayPartitioned(const std::vector<core::Match>& matches, core::EloConfig config) {
        auto logger = core::logging::getLogger();

        // Leagues sharing any team must be replayed together
        LeagueGroups groups;
        std::unordered_map<core::TeamId, core::LeagueId> team_league;
        for (const auto& match : matches) {
            if (!match.isFinished()) continue;
            groups.find(match.league_id);
            for (core::TeamId team : {match.home_team_id, match.away_team_id}) {
                auto it = team_league.find(team);
                if (it == team_league.end()) team_league.emplace(team, match.league_id);
                else groups.unite(it->second, match.league_id);
            }
        }

        std::map<core::LeagueId, std::vector<core::Match>> partitions;
        for (const auto& match : matches) {
            if (!match.isFinished()) continue;
            partitions[groups.find(match.league_id)].push_back(match);
        }

        logger->info("Replaying Elo ratings for {} independent league groups.", partitions.size());

        std::vector<std::future<EloTracker>> futures;
        futures.reserve(partitions.size());
        for (auto& partition : partitions) {
            futures.push_back(std::async(std::launch::async,
                [config](std::vector<core::Match> group) {
                    EloTracker tracker(config);
                    tracker.replay(std::move(group));
                    return tracker;
                },
                std::move(partition.second)));
        }

        EloTracker merged(config);
        for (auto& future : futures) {
            merged.absorb(future.get());
        }
        return merged;
    }

    double EloTracker::ratingAsOf(core::TeamId team_id, core::Timestamp as_of) const {
        auto it = ratings_.find(team_id);
        if (it == ratings_.end()) {
            return config_.initial_rating;
        }
        const auto& history = it->second.history;
        auto first_not_before = std::lower_bound(history.begin(), history.end(), as_of,
            [](const core::TimePoint& point, const core::Timestamp& ts) { return point.timestamp < ts; });
        if (first_not_before == history.begin()) {
            return config_.initial_rating;
        }
        return std::prev(first_not_before)->value;
    }

    double EloTracker::currentRating(core::TeamId team_id) const {
        auto it = ratings_.find(team_id);
        return it != ratings_.end() ? it->second.current : config_.initial_rating;
    }

    std::vector<std::pair<core::TeamId, double>> EloTracker::topTeams(size_t n) const {
        std::vector<std::pair<core::TeamId, double>> teams;
        teams.reserve(ratings_.size());
        for (const auto& entry : ratings_) {
            teams.emplace_back(entry.first, entry.second.current);
        }
        std::stable_sort(teams.begin(), teams.end(),
            [](const auto& a, const auto& b) { return a.second > b.second; });
        if (teams.size() > n) teams.resize(n);
        return teams;
    }

    EloPrediction EloTracker::predict(core::TeamId home_team_id, core::TeamId away_team_id) const {
        EloPrediction p;
        p.home_rating = currentRating(home_team_id);
        p.away_rating = currentRating(away_team_id);

        const double home_expected = expectedHomeScore(p.home_rating, p.away_rating);
        const double away_expected = 1.0 - home_expected;

        // Draws are likelier between evenly rated teams
        p.draw = std::max(0.15, 0.35 - std::fabs(p.home_rating - p.away_rating) / 1000.0);
        p.home_win = home_expected * (1.0 - p.draw);
        p.away_win = away_expected * (1.0 - p.draw);

        if (p.home_win > p.away_win && p.home_win > p.draw) p.predicted = core::Outcome::HomeWin;
        else if (p.away_win > p.draw) p.predicted = core::Outcome::AwayWin;
        else p.predicted = core::Outcome::Draw;
        return p;
    }

    std::map<core::TeamId, core::TimeSeries<core::TimePoint>> EloTracker::exportHistory() const {
        std::map<core::TeamId, core::TimeSeries<core::TimePoint>> history;
        for (const auto& entry : ratings_) {
            history.emplace(entry.first, entry.second.history);
        }
        return history;
    }

} // namespace models
