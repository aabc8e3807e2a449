#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional> // For scores that are only known once a match is played

namespace core {

    // Using system_clock for time points, all values are UTC
    using Timestamp = std::chrono::system_clock::time_point;

    using TeamId = long long;
    using LeagueId = long long;
    using MatchId = long long;

    // Lifecycle status of a fixture as reported by the data provider
    enum class MatchStatus {
        NotStarted, // NS
        Live,       // LIVE, 1H, 2H
        HalfTime,   // HT
        Finished,   // FT
        AfterExtraTime, // AET
        Penalties,  // PEN
        Postponed,  // PST
        Cancelled,  // CANC
        Abandoned   // ABD
    };

    // Venue filter used by the feature queries
    enum class Venue {
        All,
        Home,
        Away
    };

    // Three-way match result
    enum class Outcome {
        HomeWin,
        Draw,
        AwayWin
    };

    struct League {
        LeagueId id = 0;
        std::string name;
        std::string country;
        int season = 0;
    };

    struct Team {
        TeamId id = 0;
        LeagueId league_id = 0;
        std::string name;
        std::string code;    // Short code (e.g. MCI)
        std::string country;
    };

    struct Match {
        MatchId id = 0;
        LeagueId league_id = 0;
        int season = 0;
        TeamId home_team_id = 0;
        TeamId away_team_id = 0;
        Timestamp match_date;
        std::string round;
        MatchStatus status = MatchStatus::NotStarted;
        std::optional<int> home_goals;
        std::optional<int> away_goals;
        std::optional<int> home_goals_halftime;
        std::optional<int> away_goals_halftime;

        bool hasScore() const {
            return home_goals.has_value() && away_goals.has_value();
        }

        // Finished with a usable result (the only matches that feed the models)
        bool isFinished() const {
            return status == MatchStatus::Finished && hasScore();
        }

        bool involves(TeamId team_id) const {
            return home_team_id == team_id || away_team_id == team_id;
        }

        bool operator<(const Match& other) const {
            if (match_date != other.match_date) return match_date < other.match_date;
            return id < other.id;
        }
    };

    // Time-ordered (timestamp, value) point, used for rating histories and equity curves
    struct TimePoint {
        Timestamp timestamp;
        double value = 0.0;
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

    // Expected-value classification of a bet
    enum class ValueTier {
        Neutral,
        Medium,
        High
    };

    // Classification of the capped Kelly stake
    enum class RiskTier {
        None,
        Low,
        Medium,
        High
    };

    enum class BetStatus {
        Pending,
        Won,
        Lost
    };

    // A placed stake. Created PENDING, mutated exactly once by settlement.
    struct BetRecord {
        long long id = 0;
        MatchId match_id = 0;
        std::string market;        // Market code: H, D, A, 1X, O2.5, BTTS, 1_over_25, ...
        std::string market_name;
        double stake_amount = 0.0;
        double stake_kelly_percent = 0.0;
        double bankroll_at_bet = 0.0;
        double price = 0.0;        // Decimal odds
        bool is_estimated_price = false;
        double probability = 0.0;
        double expected_value = 0.0;
        double edge_percentage = 0.0;
        ValueTier value_tier = ValueTier::Neutral;
        std::string confidence_level; // HIGH / MEDIUM / LOW from the Kelly percentage
        BetStatus status = BetStatus::Pending;
        std::optional<std::string> actual_result; // H / D / A
        std::optional<bool> is_winner;
        std::optional<double> pnl;
        std::optional<double> roi_percent;
        std::optional<double> bankroll_after;
        Timestamp placed_at;
        std::optional<Timestamp> settled_at;
        std::string notes;
    };

    // Stored pre-match picks for one fixture, scored once the result is known
    struct PredictionRecord {
        long long id = 0;
        MatchId match_id = 0;
        std::string model_version;
        std::string predicted_result; // H / D / A, most probable outcome
        double confidence = 0.0;      // Probability of predicted_result
        double home_win = 0.0;
        double draw = 0.0;
        double away_win = 0.0;
        std::string btts_pick;        // BTTS or BTTS_NO
        std::string over_15_pick;     // O1.5 or U1.5
        std::string over_25_pick;
        std::string over_35_pick;
        Timestamp predicted_at;

        // Filled by evaluation
        std::optional<std::string> actual_result;
        std::optional<bool> is_correct;
        std::optional<bool> btts_correct;
        std::optional<bool> over_15_correct;
        std::optional<bool> over_25_correct;
        std::optional<bool> over_35_correct;
        std::optional<Timestamp> evaluated_at;

        bool isEvaluated() const { return actual_result.has_value(); }
    };

    std::string toString(MatchStatus status);
    MatchStatus matchStatusFromString(const std::string& code);

    std::string toString(Venue venue);
    std::string toString(Outcome outcome); // "H", "D", "A"

    Outcome outcomeFromScore(int home_goals, int away_goals);

    std::string toString(ValueTier tier);   // HIGH / MEDIUM / NEUTRAL
    ValueTier valueTierFromString(const std::string& tier);
    std::string toString(RiskTier tier);    // NONE / LOW / MEDIUM / HIGH
    std::string toString(BetStatus status); // PENDING / WON / LOST
    BetStatus betStatusFromString(const std::string& status);

} // namespace core
