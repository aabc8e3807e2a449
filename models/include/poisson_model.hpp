#pragma once

#include <vector>
#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "datatypes.hpp"
#include "config.hpp"

namespace models {

    // Attack/defense relative to a 1.0 league-average baseline
    struct TeamStrengthProfile {
        double attack = 1.0;
        double defense = 1.0;
        int home_matches = 0;
        int away_matches = 0;
    };

    struct ScoreProbability {
        int home_goals = 0;
        int away_goals = 0;
        double probability = 0.0;
    };

    // --- Scoreline Distribution ---
    // (max_goals + 1) x (max_goals + 1) joint goal probabilities, normalized to 1.0.
    // Every market probability is a sum over cells of this one matrix.
    class ScorelineDistribution {
    public:
        // Dixon-Coles adjusted matrix for the given rates. Throws NumericalException
        // when the mass cannot be normalized (non-finite, non-positive, negative cell).
        static ScorelineDistribution build(double lambda_home, double lambda_away,
                                           double rho, int max_goals, double tolerance);

        double at(int home_goals, int away_goals) const;
        int maxGoals() const { return max_goals_; }
        double lambdaHome() const { return lambda_home_; }
        double lambdaAway() const { return lambda_away_; }
        double total() const;

        // Probability that a bet on 'market_code' wins. Throws ValidationException for unknown codes.
        double marketProbability(const std::string& market_code) const;

        ScoreProbability mostLikelyScore() const;
        std::vector<ScoreProbability> topScores(size_t n) const;

    private:
        ScorelineDistribution(std::vector<double> cells, int max_goals, double lambda_home, double lambda_away);

        std::vector<double> cells_; // Row-major, index = home * (max_goals + 1) + away
        int max_goals_;
        double lambda_home_;
        double lambda_away_;
    };

    // Everything a consumer needs for one fixture
    struct FixturePrediction {
        core::MatchId match_id = 0;
        core::TeamId home_team_id = 0;
        core::TeamId away_team_id = 0;

        double expected_home_goals = 0.0;
        double expected_away_goals = 0.0;

        double home_win = 0.0;
        double draw = 0.0;
        double away_win = 0.0;

        double home_or_draw = 0.0; // 1X
        double home_or_away = 0.0; // 12
        double draw_or_away = 0.0; // X2

        double over_15 = 0.0;
        double under_15 = 0.0;
        double over_25 = 0.0;
        double under_25 = 0.0;
        double over_35 = 0.0;
        double under_35 = 0.0;

        double btts_yes = 0.0;
        double btts_no = 0.0;

        std::map<std::string, double> combos; // 1_over_25, x_btts, ...

        ScoreProbability most_likely_score;
        std::vector<ScoreProbability> top_scores; // Five most likely, descending

        double home_elo = 0.0;
        double away_elo = 0.0;

        // Probability for any market code (H, 1X, O2.5, BTTS, combos ...)
        double probabilityOf(const std::string& market_code) const;
    };

    // --- Dixon-Coles Poisson Model ---
    // Team strengths are fitted once from a finished-match history and never change.
    class PoissonModel {
    public:
        // 'teams' lists teams that may be predicted without history (neutral strength)
        PoissonModel(const std::vector<core::Match>& history,
                     const std::vector<core::Team>& teams,
                     core::PoissonConfig config = {});

        bool hasTeam(core::TeamId team_id) const;

        // Throws ValidationException for unknown teams
        const TeamStrengthProfile& strength(core::TeamId team_id) const;

        // (lambda_home, lambda_away) after home advantage and clamping
        std::pair<double, double> expectedGoals(core::TeamId home_team_id, core::TeamId away_team_id) const;

        ScorelineDistribution scorelineMatrix(core::TeamId home_team_id, core::TeamId away_team_id) const;

        FixturePrediction predict(core::TeamId home_team_id, core::TeamId away_team_id) const;

        double leagueAvgHomeGoals() const { return avg_home_goals_; }
        double leagueAvgAwayGoals() const { return avg_away_goals_; }
        const core::PoissonConfig& config() const { return config_; }

    private:
        core::PoissonConfig config_;
        double avg_home_goals_;
        double avg_away_goals_;
        std::unordered_map<core::TeamId, TeamStrengthProfile> strengths_;
        std::unordered_set<core::TeamId> known_teams_;
        TeamStrengthProfile neutral_;

        void requireTeam(core::TeamId team_id) const;
    };

} // namespace models
