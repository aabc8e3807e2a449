#pragma once

#include <map>
#include <vector>
#include <string>
#include <utility>
#include <optional>

#include "datatypes.hpp"
#include "config.hpp"

namespace models {

    struct RatingState {
        double current = 0.0;
        core::TimeSeries<core::TimePoint> history; // Append-only, one point per rated match
    };

    struct EloPrediction {
        double home_rating = 0.0;
        double away_rating = 0.0;
        double home_win = 0.0;
        double draw = 0.0;
        double away_win = 0.0;
        core::Outcome predicted = core::Outcome::Draw;
    };

    // --- Elo Rating Tracker ---
    // Ratings move only on finished matches, applied in (date, id) order.
    class EloTracker {
    public:
        explicit EloTracker(core::EloConfig config = {});

        // Sorts and applies every finished match. Matches must not precede the last
        // match already applied (ValidationException); unfinished matches are ignored.
        void replay(std::vector<core::Match> matches);

        // Applies one finished match. Throws ValidationException when out of order.
        void update(const core::Match& match);

        // Splits 'matches' into groups of leagues that share no team, replays each
        // group on its own thread and merges the results.
        static EloTracker replayPartitioned(const std::vector<core::Match>& matches,
                                            core::EloConfig config = {});

        // Last rating recorded strictly before 'as_of'; the initial rating otherwise
        double ratingAsOf(core::TeamId team_id, core::Timestamp as_of) const;
        double currentRating(core::TeamId team_id) const;

        std::vector<std::pair<core::TeamId, double>> topTeams(size_t n) const;

        EloPrediction predict(core::TeamId home_team_id, core::TeamId away_team_id) const;

        // Expected score of the home side, home advantage included
        double expectedHomeScore(double home_rating, double away_rating) const;

        std::map<core::TeamId, core::TimeSeries<core::TimePoint>> exportHistory() const;

        size_t matchesProcessed() const { return matches_processed_; }
        size_t teamCount() const { return ratings_.size(); }
        const core::EloConfig& config() const { return config_; }

    private:
        core::EloConfig config_;
        std::map<core::TeamId, RatingState> ratings_;
        std::optional<std::pair<core::Timestamp, core::MatchId>> last_applied_;
        size_t matches_processed_ = 0;

        // Takes over the ratings of a tracker built from a disjoint set of teams
        void absorb(EloTracker&& other);
    };

} // namespace models
