#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <functional>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp"
#include "match_history_store.hpp"

namespace data {

    // Optional filters for bet history queries
    struct BetQuery {
        std::optional<core::ValueTier> value_tier;
        std::optional<core::BetStatus> status;
        int limit = 50; // <= 0 means unlimited
    };

    // SQLite-backed match store and bet/rating persistence
    class DatabaseManager : public MatchHistoryStore {
    public:
        explicit DatabaseManager(const std::string& db_path);
        ~DatabaseManager() override;

        DatabaseManager(const DatabaseManager&) = delete;
        DatabaseManager& operator=(const DatabaseManager&) = delete;
        DatabaseManager(DatabaseManager&&) = delete;
        DatabaseManager& operator=(DatabaseManager&&) = delete;

        bool connect();
        void disconnect();
        bool isConnected() const;

        // Creates leagues, teams, matches, bet_history, elo_history and predictions if missing
        bool initializeSchema();

        bool executeSQL(const std::string& sql);

        // --- Match store writes (bulk, transactional, upsert by id) ---
        bool saveLeagues(const std::vector<core::League>& leagues);
        bool saveTeams(const std::vector<core::Team>& teams);
        bool saveMatches(const std::vector<core::Match>& matches);

        // Score backfill once a fixture is played
        bool updateMatchResult(core::MatchId match_id, core::MatchStatus status,
                               std::optional<int> home_goals, std::optional<int> away_goals);

        // --- MatchHistoryStore ---
        std::vector<core::Match> listFinishedMatches(
            std::optional<core::Timestamp> before = std::nullopt,
            const std::vector<core::LeagueId>& league_ids = {}) override;
        std::vector<core::Match> listScheduledMatches(
            std::optional<core::Timestamp> from = std::nullopt,
            std::optional<core::Timestamp> to = std::nullopt) override;
        std::vector<core::Team> listTeams(core::LeagueId league_id) override;
        std::vector<core::Team> listAllTeams() override;
        std::vector<core::League> listLeagues() override;
        std::optional<core::Match> getMatch(core::MatchId match_id) override;

        // --- Bet history ---
        // Inserts a PENDING bet and returns its new id. Throws DataLoadException.
        long long insertBet(const core::BetRecord& bet);

        std::optional<core::BetRecord> getBet(long long bet_id);
        std::vector<core::BetRecord> queryBets(const BetQuery& query);

        // Settled bets ordered by settlement time then id
        std::vector<core::BetRecord> querySettledBets();

        // PENDING bets whose linked match is FT with a score
        std::vector<std::pair<core::BetRecord, core::Match>> querySettleableBets();

        int countBets(core::BetStatus status);

        // Writes the settlement fields only if the row is still PENDING.
        // Returns false when another run already settled it. Throws DataLoadException on SQL errors.
        bool applySettlement(const core::BetRecord& settled);

        // --- Prediction accuracy ---
        // Upsert by (match_id, model_version); rows already evaluated are left untouched
        bool savePredictions(const std::vector<core::PredictionRecord>& predictions);

        std::optional<core::PredictionRecord> getPrediction(core::MatchId match_id, const std::string& model_version);

        // Unevaluated predictions whose match is FT with a score
        std::vector<std::pair<core::PredictionRecord, core::Match>> queryEvaluablePredictions();

        std::vector<core::PredictionRecord> queryEvaluatedPredictions(
            const std::optional<std::string>& model_version = std::nullopt);

        // Writes the outcome only if the row is still unevaluated. Throws DataLoadException on SQL errors.
        bool applyPredictionOutcome(const core::PredictionRecord& evaluated);

        // --- Rating history ---
        bool saveRatingHistory(const std::map<core::TeamId, core::TimeSeries<core::TimePoint>>& history);
        core::TimeSeries<core::TimePoint> queryRatingHistory(core::TeamId team_id);

    private:
        std::string database_path_;
        sqlite3* db_ = nullptr; // SQLite database connection handle
        bool connected_ = false;

        using Binder = std::function<void(sqlite3_stmt*)>;
        using RowReader = std::function<void(sqlite3_stmt*)>;

        // Prepares, binds, steps every row through 'reader'. Throws DataLoadException.
        void runQuery(const std::string& sql, const Binder& binder, const RowReader& reader, const char* what);

        void requireConnection(const char* what) const;
    };

} // namespace data
