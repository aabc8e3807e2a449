#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp" // For timestampToString/stringToTimestamp
#include <spdlog/fmt/fmt.h>
#include <vector>
#include <string>
#include <sstream>

namespace data
{

    namespace {

        // Finalizes a prepared statement when leaving scope
        struct StatementGuard {
            sqlite3_stmt* stmt = nullptr;
            ~StatementGuard() { sqlite3_finalize(stmt); }
        };

        const char* kMatchColumns =
            "id, league_id, season, home_team_id, away_team_id, match_date, round, status, "
            "home_goals, away_goals, home_goals_halftime, away_goals_halftime";

        const char* kBetColumns =
            "id, match_id, market, market_name, stake_amount, stake_kelly_percent, bankroll_at_bet, "
            "odds, is_estimated_odds, ai_probability, expected_value, edge_percentage, value_level, "
            "confidence_level, status, actual_result, is_winner, pnl, roi_percent, bankroll_after, "
            "placed_at, settled_at, notes";

        std::string columnText(sqlite3_stmt* stmt, int col) {
            const unsigned char* text = sqlite3_column_text(stmt, col);
            return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
        }

        std::optional<int> columnOptionalInt(sqlite3_stmt* stmt, int col) {
            if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
            return sqlite3_column_int(stmt, col);
        }

        std::optional<double> columnOptionalDouble(sqlite3_stmt* stmt, int col) {
            if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
            return sqlite3_column_double(stmt, col);
        }

        void bindText(sqlite3_stmt* stmt, int idx, const std::string& value) {
            sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
        }

        void bindOptionalInt(sqlite3_stmt* stmt, int idx, const std::optional<int>& value) {
            if (value) sqlite3_bind_int(stmt, idx, *value);
            else sqlite3_bind_null(stmt, idx);
        }

        void bindOptionalDouble(sqlite3_stmt* stmt, int idx, const std::optional<double>& value) {
            if (value) sqlite3_bind_double(stmt, idx, *value);
            else sqlite3_bind_null(stmt, idx);
        }

        constexpr int kBetColumnCount = 23;
        constexpr int kPredictionColumnCount = 20;

        const char* kPredictionColumns =
            "id, match_id, model_version, predicted_result, confidence, home_win_prob, draw_prob, away_win_prob, "
            "btts_pick, over_15_pick, over_25_pick, over_35_pick, predicted_at, actual_result, is_correct, "
            "btts_correct, over_15_correct, over_25_correct, over_35_correct, evaluated_at";

        // "id, status" with alias "b" -> "b.id, b.status"
        std::string qualifiedColumns(const char* columns, const char* alias)
        {
            std::ostringstream out;
            std::istringstream cols(columns);
            std::string col;
            bool first = true;
            while (std::getline(cols, col, ','))
            {
                col.erase(0, col.find_first_not_of(' '));
                out << (first ? "" : ", ") << alias << "." << col;
                first = false;
            }
            return out.str();
        }

        std::optional<bool> columnOptionalBool(sqlite3_stmt* stmt, int col) {
            if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
            return sqlite3_column_int(stmt, col) != 0;
        }

        void bindOptionalBool(sqlite3_stmt* stmt, int idx, const std::optional<bool>& value) {
            if (value) sqlite3_bind_int(stmt, idx, *value ? 1 : 0);
            else sqlite3_bind_null(stmt, idx);
        }

        core::Match readMatchRow(sqlite3_stmt* stmt, int offset = 0) {
            core::Match match;
            match.id = sqlite3_column_int64(stmt, offset + 0);
            match.league_id = sqlite3_column_int64(stmt, offset + 1);
            match.season = sqlite3_column_int(stmt, offset + 2);
            match.home_team_id = sqlite3_column_int64(stmt, offset + 3);
            match.away_team_id = sqlite3_column_int64(stmt, offset + 4);
            match.match_date = core::utils::stringToTimestamp(columnText(stmt, offset + 5));
            match.round = columnText(stmt, offset + 6);
            match.status = core::matchStatusFromString(columnText(stmt, offset + 7));
            match.home_goals = columnOptionalInt(stmt, offset + 8);
            match.away_goals = columnOptionalInt(stmt, offset + 9);
            match.home_goals_halftime = columnOptionalInt(stmt, offset + 10);
            match.away_goals_halftime = columnOptionalInt(stmt, offset + 11);
            return match;
        }

        core::PredictionRecord readPredictionRow(sqlite3_stmt* stmt) {
            core::PredictionRecord p;
            p.id = sqlite3_column_int64(stmt, 0);
            p.match_id = sqlite3_column_int64(stmt, 1);
            p.model_version = columnText(stmt, 2);
            p.predicted_result = columnText(stmt, 3);
            p.confidence = sqlite3_column_double(stmt, 4);
            p.home_win = sqlite3_column_double(stmt, 5);
            p.draw = sqlite3_column_double(stmt, 6);
            p.away_win = sqlite3_column_double(stmt, 7);
            p.btts_pick = columnText(stmt, 8);
            p.over_15_pick = columnText(stmt, 9);
            p.over_25_pick = columnText(stmt, 10);
            p.over_35_pick = columnText(stmt, 11);
            p.predicted_at = core::utils::stringToTimestamp(columnText(stmt, 12));
            if (sqlite3_column_type(stmt, 13) != SQLITE_NULL) {
                p.actual_result = columnText(stmt, 13);
            }
            p.is_correct = columnOptionalBool(stmt, 14);
            p.btts_correct = columnOptionalBool(stmt, 15);
            p.over_15_correct = columnOptionalBool(stmt, 16);
            p.over_25_correct = columnOptionalBool(stmt, 17);
            p.over_35_correct = columnOptionalBool(stmt, 18);
            if (sqlite3_column_type(stmt, 19) != SQLITE_NULL) {
                p.evaluated_at = core::utils::stringToTimestamp(columnText(stmt, 19));
            }
            return p;
        }

        core::BetRecord readBetRow(sqlite3_stmt* stmt, int offset = 0) {
            core::BetRecord bet;
            bet.id = sqlite3_column_int64(stmt, offset + 0);
            bet.match_id = sqlite3_column_int64(stmt, offset + 1);
            bet.market = columnText(stmt, offset + 2);
            bet.market_name = columnText(stmt, offset + 3);
            bet.stake_amount = sqlite3_column_double(stmt, offset + 4);
            bet.stake_kelly_percent = sqlite3_column_double(stmt, offset + 5);
            bet.bankroll_at_bet = sqlite3_column_double(stmt, offset + 6);
            bet.price = sqlite3_column_double(stmt, offset + 7);
            bet.is_estimated_price = sqlite3_column_int(stmt, offset + 8) != 0;
            bet.probability = sqlite3_column_double(stmt, offset + 9);
            bet.expected_value = sqlite3_column_double(stmt, offset + 10);
            bet.edge_percentage = sqlite3_column_double(stmt, offset + 11);
            bet.value_tier = core::valueTierFromString(columnText(stmt, offset + 12));
            bet.confidence_level = columnText(stmt, offset + 13);
            bet.status = core::betStatusFromString(columnText(stmt, offset + 14));
            if (sqlite3_column_type(stmt, offset + 15) != SQLITE_NULL) {
                bet.actual_result = columnText(stmt, offset + 15);
            }
            if (sqlite3_column_type(stmt, offset + 16) != SQLITE_NULL) {
                bet.is_winner = sqlite3_column_int(stmt, offset + 16) != 0;
            }
            bet.pnl = columnOptionalDouble(stmt, offset + 17);
            bet.roi_percent = columnOptionalDouble(stmt, offset + 18);
            bet.bankroll_after = columnOptionalDouble(stmt, offset + 19);
            bet.placed_at = core::utils::stringToTimestamp(columnText(stmt, offset + 20));
            if (sqlite3_column_type(stmt, offset + 21) != SQLITE_NULL) {
                bet.settled_at = core::utils::stringToTimestamp(columnText(stmt, offset + 21));
            }
            bet.notes = columnText(stmt, offset + 22);
            return bet;
        }

    } // end anonymous namespace

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect(); // Ensure disconnection
    }

    bool DatabaseManager::connect()
    {
        auto logger = core::logging::getLogger();
        if (connected_)
        {
            logger->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        logger->info("Connecting to SQLite database: {}", database_path_);

        // FULLMUTEX: one connection may be shared by settlement workers
        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            logger->error("Cannot open SQLite database '{}': {}", database_path_, sqlite3_errmsg(db_));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        sqlite3_busy_timeout(db_, 5000);
        if (!executeSQL("PRAGMA foreign_keys = ON;"))
        {
            logger->warn("Could not enable foreign key enforcement on {}.", database_path_);
        }
        logger->info("Successfully connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        if (core::logging::isInitialized())
        {
            core::logging::getLogger()->info("Disconnecting from SQLite database: {}", database_path_);
        }
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK && core::logging::isInitialized())
        {
            // This usually happens if prepared statements are not finalized
            core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    void DatabaseManager::requireConnection(const char* what) const
    {
        if (!isConnected())
        {
            throw core::DataLoadException(fmt::format("Cannot {}: not connected to database '{}'.", what, database_path_));
        }
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        logger->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            logger->error("SQL error: {}", error_msg ? error_msg : sqlite3_errmsg(db_));
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        logger->info("Initializing SQLite database schema if needed...");

        const std::string create_leagues_sql = R"(
        CREATE TABLE IF NOT EXISTS leagues (
            id INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            country TEXT,
            season INTEGER
        );
    )";

        const std::string create_teams_sql = R"(
        CREATE TABLE IF NOT EXISTS teams (
            id INTEGER PRIMARY KEY,
            league_id INTEGER REFERENCES leagues(id),
            name TEXT NOT NULL,
            code TEXT,
            country TEXT
        );
    )";

        const std::string create_matches_sql = R"(
        CREATE TABLE IF NOT EXISTS matches (
            id INTEGER PRIMARY KEY,
            league_id INTEGER REFERENCES leagues(id),
            season INTEGER,
            home_team_id INTEGER NOT NULL REFERENCES teams(id),
            away_team_id INTEGER NOT NULL REFERENCES teams(id),
            match_date TEXT NOT NULL, -- ISO 8601 UTC, sortable as TEXT
            round TEXT,
            status TEXT NOT NULL,     -- NS, LIVE, FT, PST, CANC ...
            home_goals INTEGER,
            away_goals INTEGER,
            home_goals_halftime INTEGER,
            away_goals_halftime INTEGER
        );
    )";

        const std::string create_matches_index_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_matches_status_date
        ON matches (status, match_date);
    )";

        const std::string create_bets_sql = R"(
        CREATE TABLE IF NOT EXISTS bet_history (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            match_id INTEGER NOT NULL REFERENCES matches(id),
            market TEXT NOT NULL,
            market_name TEXT,
            stake_amount REAL NOT NULL,
            stake_kelly_percent REAL NOT NULL,
            bankroll_at_bet REAL NOT NULL,
            odds REAL NOT NULL,
            is_estimated_odds INTEGER NOT NULL DEFAULT 0,
            ai_probability REAL NOT NULL,
            expected_value REAL,
            edge_percentage REAL,
            value_level TEXT NOT NULL,
            confidence_level TEXT,
            status TEXT NOT NULL DEFAULT 'PENDING',
            actual_result TEXT,
            is_winner INTEGER,
            pnl REAL,
            roi_percent REAL,
            bankroll_after REAL,
            placed_at TEXT NOT NULL,
            settled_at TEXT,
            notes TEXT
        );
    )";

        const std::string create_bets_index_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_bet_history_status
        ON bet_history (status, settled_at);
    )";

        const std::string create_elo_sql = R"(
        CREATE TABLE IF NOT EXISTS elo_history (
            team_id INTEGER NOT NULL,
            recorded_at TEXT NOT NULL,
            seq INTEGER NOT NULL, -- Position in the team's history, keeps same-day entries ordered
            rating REAL NOT NULL,
            PRIMARY KEY (team_id, seq)
        );
    )";

        const std::string create_predictions_sql = R"(
        CREATE TABLE IF NOT EXISTS predictions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            match_id INTEGER NOT NULL REFERENCES matches(id),
            model_version TEXT NOT NULL,
            predicted_result TEXT NOT NULL, -- H, D, A
            confidence REAL NOT NULL,
            home_win_prob REAL NOT NULL,
            draw_prob REAL NOT NULL,
            away_win_prob REAL NOT NULL,
            btts_pick TEXT NOT NULL,
            over_15_pick TEXT NOT NULL,
            over_25_pick TEXT NOT NULL,
            over_35_pick TEXT NOT NULL,
            predicted_at TEXT NOT NULL,
            actual_result TEXT,       -- NULL until the match is evaluated
            is_correct INTEGER,
            btts_correct INTEGER,
            over_15_correct INTEGER,
            over_25_correct INTEGER,
            over_35_correct INTEGER,
            evaluated_at TEXT,
            UNIQUE (match_id, model_version)
        );
    )";

        bool success = true;
        success &= executeSQL(create_leagues_sql);
        success &= executeSQL(create_teams_sql);
        success &= executeSQL(create_matches_sql);
        success &= executeSQL(create_matches_index_sql);
        success &= executeSQL(create_bets_sql);
        success &= executeSQL(create_bets_index_sql);
        success &= executeSQL(create_elo_sql);
        success &= executeSQL(create_predictions_sql);

        if (success)
        {
            logger->info("SQLite database schema initialization check complete.");
        }
        else
        {
            logger->error("SQLite database schema initialization failed for one or more statements.");
        }
        return success;
    }

    void DatabaseManager::runQuery(const std::string& sql, const Binder& binder, const RowReader& reader, const char* what)
    {
        requireConnection(what);
        auto logger = core::logging::getLogger();

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            throw core::DataLoadException(fmt::format("Failed to prepare statement for {} [{}]: {}", what, rc, sqlite3_errmsg(db_)));
        }
        if (binder)
        {
            binder(guard.stmt);
        }

        int row_count = 0;
        while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW)
        {
            ++row_count;
            reader(guard.stmt);
        }
        if (rc != SQLITE_DONE)
        {
            throw core::DataLoadException(fmt::format("Error stepping through {} results [{}]: {}", what, rc, sqlite3_errmsg(db_)));
        }
        logger->trace("{}: {} rows", what, row_count);
    }

    // --- Match store writes ---

    bool DatabaseManager::saveLeagues(const std::vector<core::League>& leagues)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save leagues: Not connected to database.");
            return false;
        }
        if (leagues.empty()) return true;

        const char* sql = R"(
INSERT INTO leagues (id, name, country, season) VALUES (?, ?, ?, ?)
ON CONFLICT(id) DO UPDATE SET name = excluded.name, country = excluded.country, season = excluded.season;
)";
        StatementGuard guard;
        if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr) != SQLITE_OK)
        {
            logger->error("Failed to prepare league upsert: {}", sqlite3_errmsg(db_));
            return false;
        }
        if (!executeSQL("BEGIN TRANSACTION;")) return false;

        bool success = true;
        for (const auto& league : leagues)
        {
            sqlite3_bind_int64(guard.stmt, 1, league.id);
            bindText(guard.stmt, 2, league.name);
            bindText(guard.stmt, 3, league.country);
            sqlite3_bind_int(guard.stmt, 4, league.season);
            if (sqlite3_step(guard.stmt) != SQLITE_DONE)
            {
                logger->error("Failed to upsert league {}: {}", league.id, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            sqlite3_reset(guard.stmt);
        }

        if (!executeSQL(success ? "COMMIT;" : "ROLLBACK;"))
        {
            return false;
        }
        if (success) logger->debug("Saved {} leagues.", leagues.size());
        return success;
    }

    bool DatabaseManager::saveTeams(const std::vector<core::Team>& teams)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save teams: Not connected to database.");
            return false;
        }
        if (teams.empty()) return true;

        const char* sql = R"(
INSERT INTO teams (id, league_id, name, code, country) VALUES (?, ?, ?, ?, ?)
ON CONFLICT(id) DO UPDATE SET league_id = excluded.league_id, name = excluded.name,
    code = excluded.code, country = excluded.country;
)";
        StatementGuard guard;
        if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr) != SQLITE_OK)
        {
            logger->error("Failed to prepare team upsert: {}", sqlite3_errmsg(db_));
            return false;
        }
        if (!executeSQL("BEGIN TRANSACTION;")) return false;

        bool success = true;
        for (const auto& team : teams)
        {
            sqlite3_bind_int64(guard.stmt, 1, team.id);
            sqlite3_bind_int64(guard.stmt, 2, team.league_id);
            bindText(guard.stmt, 3, team.name);
            bindText(guard.stmt, 4, team.code);
            bindText(guard.stmt, 5, team.country);
            if (sqlite3_step(guard.stmt) != SQLITE_DONE)
            {
                logger->error("Failed to upsert team {}: {}", team.id, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            sqlite3_reset(guard.stmt);
        }

        if (!executeSQL(success ? "COMMIT;" : "ROLLBACK;"))
        {
            return false;
        }
        if (success) logger->debug("Saved {} teams.", teams.size());
        return success;
    }

    bool DatabaseManager::saveMatches(const std::vector<core::Match>& matches)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save matches: Not connected to database.");
            return false;
        }
        if (matches.empty())
        {
            logger->debug("No matches provided to save.");
            return true;
        }

        const char* sql = R"(
INSERT INTO matches (id, league_id, season, home_team_id, away_team_id, match_date, round, status,
                     home_goals, away_goals, home_goals_halftime, away_goals_halftime)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
ON CONFLICT(id) DO UPDATE SET
    match_date = excluded.match_date, round = excluded.round, status = excluded.status,
    home_goals = excluded.home_goals, away_goals = excluded.away_goals,
    home_goals_halftime = excluded.home_goals_halftime, away_goals_halftime = excluded.away_goals_halftime;
)";

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare match upsert [{}]: {}", rc, sqlite3_errmsg(db_));
            return false;
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            logger->error("Failed to begin transaction for saving matches.");
            return false;
        }

        bool success = true;
        for (const auto& match : matches)
        {
            sqlite3_bind_int64(guard.stmt, 1, match.id);
            sqlite3_bind_int64(guard.stmt, 2, match.league_id);
            sqlite3_bind_int(guard.stmt, 3, match.season);
            sqlite3_bind_int64(guard.stmt, 4, match.home_team_id);
            sqlite3_bind_int64(guard.stmt, 5, match.away_team_id);
            bindText(guard.stmt, 6, core::utils::timestampToString(match.match_date));
            bindText(guard.stmt, 7, match.round);
            bindText(guard.stmt, 8, core::toString(match.status));
            bindOptionalInt(guard.stmt, 9, match.home_goals);
            bindOptionalInt(guard.stmt, 10, match.away_goals);
            bindOptionalInt(guard.stmt, 11, match.home_goals_halftime);
            bindOptionalInt(guard.stmt, 12, match.away_goals_halftime);

            rc = sqlite3_step(guard.stmt);
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to upsert match {} [{}]: {}", match.id, rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            sqlite3_reset(guard.stmt);
        }

        if (!executeSQL(success ? "COMMIT;" : "ROLLBACK;"))
        {
            logger->error("Failed to {} transaction for saving matches.", success ? "COMMIT" : "ROLLBACK");
            return false;
        }
        if (success)
        {
            logger->info("Saved {} matches.", matches.size());
        }
        else
        {
            logger->warn("Transaction rolled back due to error during match save.");
        }
        return success;
    }

    bool DatabaseManager::updateMatchResult(core::MatchId match_id, core::MatchStatus status,
                                            std::optional<int> home_goals, std::optional<int> away_goals)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot update match result: Not connected to database.");
            return false;
        }

        const char* sql = "UPDATE matches SET status = ?, home_goals = ?, away_goals = ? WHERE id = ?;";
        StatementGuard guard;
        if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr) != SQLITE_OK)
        {
            logger->error("Failed to prepare match result update: {}", sqlite3_errmsg(db_));
            return false;
        }
        bindText(guard.stmt, 1, core::toString(status));
        bindOptionalInt(guard.stmt, 2, home_goals);
        bindOptionalInt(guard.stmt, 3, away_goals);
        sqlite3_bind_int64(guard.stmt, 4, match_id);

        if (sqlite3_step(guard.stmt) != SQLITE_DONE)
        {
            logger->error("Failed to update result for match {}: {}", match_id, sqlite3_errmsg(db_));
            return false;
        }
        if (sqlite3_changes(db_) == 0)
        {
            logger->warn("Result update for unknown match {} ignored.", match_id);
            return false;
        }
        logger->debug("Match {} updated to {}.", match_id, core::toString(status));
        return true;
    }

    // --- MatchHistoryStore ---

    std::vector<core::Match> DatabaseManager::listFinishedMatches(
        std::optional<core::Timestamp> before,
        const std::vector<core::LeagueId>& league_ids)
    {
        std::ostringstream sql;
        sql << "SELECT " << kMatchColumns << " FROM matches"
            << " WHERE status = 'FT' AND home_goals IS NOT NULL AND away_goals IS NOT NULL";
        if (before)
        {
            sql << " AND match_date < ?";
        }
        if (!league_ids.empty())
        {
            sql << " AND league_id IN (";
            for (size_t i = 0; i < league_ids.size(); ++i)
            {
                sql << (i == 0 ? "?" : ", ?");
            }
            sql << ")";
        }
        sql << " ORDER BY match_date ASC, id ASC;";

        const std::string before_str = before ? core::utils::timestampToString(*before) : std::string();

        std::vector<core::Match> matches;
        runQuery(sql.str(),
            [&](sqlite3_stmt* stmt) {
                int idx = 1;
                if (before) bindText(stmt, idx++, before_str);
                for (core::LeagueId league_id : league_ids)
                {
                    sqlite3_bind_int64(stmt, idx++, league_id);
                }
            },
            [&](sqlite3_stmt* stmt) { matches.push_back(readMatchRow(stmt)); },
            "list finished matches");

        core::logging::getLogger()->debug("Loaded {} finished matches.", matches.size());
        return matches;
    }

    std::vector<core::Match> DatabaseManager::listScheduledMatches(
        std::optional<core::Timestamp> from,
        std::optional<core::Timestamp> to)
    {
        std::ostringstream sql;
        sql << "SELECT " << kMatchColumns << " FROM matches WHERE status = 'NS'";
        if (from) sql << " AND match_date >= ?";
        if (to) sql << " AND match_date < ?";
        sql << " ORDER BY match_date ASC, id ASC;";

        const std::string from_str = from ? core::utils::timestampToString(*from) : std::string();
        const std::string to_str = to ? core::utils::timestampToString(*to) : std::string();

        std::vector<core::Match> matches;
        runQuery(sql.str(),
            [&](sqlite3_stmt* stmt) {
                int idx = 1;
                if (from) bindText(stmt, idx++, from_str);
                if (to) bindText(stmt, idx++, to_str);
            },
            [&](sqlite3_stmt* stmt) { matches.push_back(readMatchRow(stmt)); },
            "list scheduled matches");
        return matches;
    }

    std::vector<core::Team> DatabaseManager::listTeams(core::LeagueId league_id)
    {
        std::vector<core::Team> teams;
        runQuery("SELECT id, league_id, name, code, country FROM teams WHERE league_id = ? ORDER BY id;",
            [&](sqlite3_stmt* stmt) { sqlite3_bind_int64(stmt, 1, league_id); },
            [&](sqlite3_stmt* stmt) {
                core::Team team;
                team.id = sqlite3_column_int64(stmt, 0);
                team.league_id = sqlite3_column_int64(stmt, 1);
                team.name = columnText(stmt, 2);
                team.code = columnText(stmt, 3);
                team.country = columnText(stmt, 4);
                teams.push_back(team);
            },
            "list teams");
        return teams;
    }

    std::vector<core::Team> DatabaseManager::listAllTeams()
    {
        std::vector<core::Team> teams;
        runQuery("SELECT id, league_id, name, code, country FROM teams ORDER BY id;",
            nullptr,
            [&](sqlite3_stmt* stmt) {
                core::Team team;
                team.id = sqlite3_column_int64(stmt, 0);
                team.league_id = sqlite3_column_int64(stmt, 1);
                team.name = columnText(stmt, 2);
                team.code = columnText(stmt, 3);
                team.country = columnText(stmt, 4);
                teams.push_back(team);
            },
            "list all teams");
        return teams;
    }

    std::vector<core::League> DatabaseManager::listLeagues()
    {
        std::vector<core::League> leagues;
        runQuery("SELECT id, name, country, season FROM leagues ORDER BY id;",
            nullptr,
            [&](sqlite3_stmt* stmt) {
                core::League league;
                league.id = sqlite3_column_int64(stmt, 0);
                league.name = columnText(stmt, 1);
                league.country = columnText(stmt, 2);
                league.season = sqlite3_column_int(stmt, 3);
                leagues.push_back(league);
            },
            "list leagues");
        return leagues;
    }

    std::optional<core::Match> DatabaseManager::getMatch(core::MatchId match_id)
    {
        std::optional<core::Match> result;
        runQuery(std::string("SELECT ") + kMatchColumns + " FROM matches WHERE id = ?;",
            [&](sqlite3_stmt* stmt) { sqlite3_bind_int64(stmt, 1, match_id); },
            [&](sqlite3_stmt* stmt) { result = readMatchRow(stmt); },
            "get match");
        return result;
    }

    // --- Bet history ---

    long long DatabaseManager::insertBet(const core::BetRecord& bet)
    {
        requireConnection("insert bet");
        auto logger = core::logging::getLogger();

        const char* sql = R"(
INSERT INTO bet_history (match_id, market, market_name, stake_amount, stake_kelly_percent, bankroll_at_bet,
                         odds, is_estimated_odds, ai_probability, expected_value, edge_percentage,
                         value_level, confidence_level, status, placed_at, notes)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 'PENDING', ?, ?);
)";
        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            throw core::DataLoadException(fmt::format("Failed to prepare bet insert [{}]: {}", rc, sqlite3_errmsg(db_)));
        }

        sqlite3_bind_int64(guard.stmt, 1, bet.match_id);
        bindText(guard.stmt, 2, bet.market);
        bindText(guard.stmt, 3, bet.market_name);
        sqlite3_bind_double(guard.stmt, 4, bet.stake_amount);
        sqlite3_bind_double(guard.stmt, 5, bet.stake_kelly_percent);
        sqlite3_bind_double(guard.stmt, 6, bet.bankroll_at_bet);
        sqlite3_bind_double(guard.stmt, 7, bet.price);
        sqlite3_bind_int(guard.stmt, 8, bet.is_estimated_price ? 1 : 0);
        sqlite3_bind_double(guard.stmt, 9, bet.probability);
        sqlite3_bind_double(guard.stmt, 10, bet.expected_value);
        sqlite3_bind_double(guard.stmt, 11, bet.edge_percentage);
        bindText(guard.stmt, 12, core::toString(bet.value_tier));
        bindText(guard.stmt, 13, bet.confidence_level);
        bindText(guard.stmt, 14, core::utils::timestampToString(bet.placed_at));
        bindText(guard.stmt, 15, bet.notes);

        rc = sqlite3_step(guard.stmt);
        if (rc != SQLITE_DONE)
        {
            throw core::DataLoadException(fmt::format("Failed to insert bet for match {} [{}]: {}", bet.match_id, rc, sqlite3_errmsg(db_)));
        }
        long long new_id = sqlite3_last_insert_rowid(db_);
        logger->debug("Inserted bet {} (match {}, market {}).", new_id, bet.match_id, bet.market);
        return new_id;
    }

    std::optional<core::BetRecord> DatabaseManager::getBet(long long bet_id)
    {
        std::optional<core::BetRecord> result;
        runQuery(std::string("SELECT ") + kBetColumns + " FROM bet_history WHERE id = ?;",
            [&](sqlite3_stmt* stmt) { sqlite3_bind_int64(stmt, 1, bet_id); },
            [&](sqlite3_stmt* stmt) { result = readBetRow(stmt); },
            "get bet");
        return result;
    }

    std::vector<core::BetRecord> DatabaseManager::queryBets(const BetQuery& query)
    {
        std::ostringstream sql;
        sql << "SELECT " << kBetColumns << " FROM bet_history WHERE 1 = 1";
        if (query.value_tier) sql << " AND value_level = ?";
        if (query.status) sql << " AND status = ?";
        sql << " ORDER BY placed_at DESC, id DESC";
        if (query.limit > 0) sql << " LIMIT ?";
        sql << ";";

        std::vector<core::BetRecord> bets;
        runQuery(sql.str(),
            [&](sqlite3_stmt* stmt) {
                int idx = 1;
                if (query.value_tier) bindText(stmt, idx++, core::toString(*query.value_tier));
                if (query.status) bindText(stmt, idx++, core::toString(*query.status));
                if (query.limit > 0) sqlite3_bind_int(stmt, idx++, query.limit);
            },
            [&](sqlite3_stmt* stmt) { bets.push_back(readBetRow(stmt)); },
            "query bets");
        return bets;
    }

    std::vector<core::BetRecord> DatabaseManager::querySettledBets()
    {
        std::vector<core::BetRecord> bets;
        runQuery(std::string("SELECT ") + kBetColumns +
                 " FROM bet_history WHERE status IN ('WON', 'LOST') AND settled_at IS NOT NULL"
                 " ORDER BY settled_at ASC, id ASC;",
            nullptr,
            [&](sqlite3_stmt* stmt) { bets.push_back(readBetRow(stmt)); },
            "query settled bets");
        return bets;
    }

    std::vector<std::pair<core::BetRecord, core::Match>> DatabaseManager::querySettleableBets()
    {
        // Both tables have 'id' and 'status', so every column is qualified
        std::ostringstream sql;
        sql << "SELECT " << qualifiedColumns(kBetColumns, "b") << ", " << qualifiedColumns(kMatchColumns, "m")
            << " FROM bet_history b JOIN matches m ON b.match_id = m.id"
            << " WHERE b.status = 'PENDING' AND m.status = 'FT'"
            << " AND m.home_goals IS NOT NULL AND m.away_goals IS NOT NULL"
            << " ORDER BY b.id ASC;";

        std::vector<std::pair<core::BetRecord, core::Match>> rows;
        runQuery(sql.str(),
            nullptr,
            [&](sqlite3_stmt* stmt) {
                rows.emplace_back(readBetRow(stmt), readMatchRow(stmt, kBetColumnCount));
            },
            "query settleable bets");
        return rows;
    }

    int DatabaseManager::countBets(core::BetStatus status)
    {
        int count = 0;
        runQuery("SELECT COUNT(*) FROM bet_history WHERE status = ?;",
            [&](sqlite3_stmt* stmt) { bindText(stmt, 1, core::toString(status)); },
            [&](sqlite3_stmt* stmt) { count = sqlite3_column_int(stmt, 0); },
            "count bets");
        return count;
    }

    bool DatabaseManager::applySettlement(const core::BetRecord& settled)
    {
        requireConnection("apply settlement");

        const char* sql = R"(
UPDATE bet_history
SET status = ?, actual_result = ?, is_winner = ?, pnl = ?, roi_percent = ?, bankroll_after = ?, settled_at = ?
WHERE id = ? AND status = 'PENDING';
)";
        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            throw core::DataLoadException(fmt::format("Failed to prepare settlement update [{}]: {}", rc, sqlite3_errmsg(db_)));
        }

        bindText(guard.stmt, 1, core::toString(settled.status));
        bindText(guard.stmt, 2, settled.actual_result.value_or(""));
        sqlite3_bind_int(guard.stmt, 3, settled.is_winner.value_or(false) ? 1 : 0);
        bindOptionalDouble(guard.stmt, 4, settled.pnl);
        bindOptionalDouble(guard.stmt, 5, settled.roi_percent);
        bindOptionalDouble(guard.stmt, 6, settled.bankroll_after);
        if (settled.settled_at)
        {
            bindText(guard.stmt, 7, core::utils::timestampToString(*settled.settled_at));
        }
        else
        {
            sqlite3_bind_null(guard.stmt, 7);
        }
        sqlite3_bind_int64(guard.stmt, 8, settled.id);

        rc = sqlite3_step(guard.stmt);
        if (rc != SQLITE_DONE)
        {
            throw core::DataLoadException(fmt::format("Failed to settle bet {} [{}]: {}", settled.id, rc, sqlite3_errmsg(db_)));
        }
        return sqlite3_changes(db_) == 1;
    }

    // --- Prediction accuracy ---

    bool DatabaseManager::savePredictions(const std::vector<core::PredictionRecord>& predictions)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save predictions: Not connected to database.");
            return false;
        }
        if (predictions.empty()) return true;

        // A re-run replaces an unevaluated prediction; a scored one is kept as it was
        const char* sql = R"(
INSERT INTO predictions (match_id, model_version, predicted_result, confidence, home_win_prob, draw_prob,
                         away_win_prob, btts_pick, over_15_pick, over_25_pick, over_35_pick, predicted_at)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
ON CONFLICT(match_id, model_version) DO UPDATE SET
    predicted_result = excluded.predicted_result, confidence = excluded.confidence,
    home_win_prob = excluded.home_win_prob, draw_prob = excluded.draw_prob, away_win_prob = excluded.away_win_prob,
    btts_pick = excluded.btts_pick, over_15_pick = excluded.over_15_pick, over_25_pick = excluded.over_25_pick,
    over_35_pick = excluded.over_35_pick, predicted_at = excluded.predicted_at
WHERE predictions.actual_result IS NULL;
)";
        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare prediction upsert [{}]: {}", rc, sqlite3_errmsg(db_));
            return false;
        }
        if (!executeSQL("BEGIN TRANSACTION;")) return false;

        bool success = true;
        for (const auto& p : predictions)
        {
            sqlite3_bind_int64(guard.stmt, 1, p.match_id);
            bindText(guard.stmt, 2, p.model_version);
            bindText(guard.stmt, 3, p.predicted_result);
            sqlite3_bind_double(guard.stmt, 4, p.confidence);
            sqlite3_bind_double(guard.stmt, 5, p.home_win);
            sqlite3_bind_double(guard.stmt, 6, p.draw);
            sqlite3_bind_double(guard.stmt, 7, p.away_win);
            bindText(guard.stmt, 8, p.btts_pick);
            bindText(guard.stmt, 9, p.over_15_pick);
            bindText(guard.stmt, 10, p.over_25_pick);
            bindText(guard.stmt, 11, p.over_35_pick);
            bindText(guard.stmt, 12, core::utils::timestampToString(p.predicted_at));

            rc = sqlite3_step(guard.stmt);
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to save prediction for match {} [{}]: {}", p.match_id, rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            sqlite3_reset(guard.stmt);
        }

        if (!executeSQL(success ? "COMMIT;" : "ROLLBACK;"))
        {
            return false;
        }
        if (success) logger->debug("Saved {} predictions.", predictions.size());
        return success;
    }

    std::optional<core::PredictionRecord> DatabaseManager::getPrediction(core::MatchId match_id,
                                                                         const std::string& model_version)
    {
        std::optional<core::PredictionRecord> result;
        runQuery(std::string("SELECT ") + kPredictionColumns +
                 " FROM predictions WHERE match_id = ? AND model_version = ?;",
            [&](sqlite3_stmt* stmt) {
                sqlite3_bind_int64(stmt, 1, match_id);
                bindText(stmt, 2, model_version);
            },
            [&](sqlite3_stmt* stmt) { result = readPredictionRow(stmt); },
            "get prediction");
        return result;
    }

    std::vector<std::pair<core::PredictionRecord, core::Match>> DatabaseManager::queryEvaluablePredictions()
    {
        std::ostringstream sql;
        sql << "SELECT " << qualifiedColumns(kPredictionColumns, "p") << ", " << qualifiedColumns(kMatchColumns, "m")
            << " FROM predictions p JOIN matches m ON p.match_id = m.id"
            << " WHERE p.actual_result IS NULL AND m.status = 'FT'"
            << " AND m.home_goals IS NOT NULL AND m.away_goals IS NOT NULL"
            << " ORDER BY p.id ASC;";

        std::vector<std::pair<core::PredictionRecord, core::Match>> rows;
        runQuery(sql.str(),
            nullptr,
            [&](sqlite3_stmt* stmt) {
                rows.emplace_back(readPredictionRow(stmt), readMatchRow(stmt, kPredictionColumnCount));
            },
            "query evaluable predictions");
        return rows;
    }

    std::vector<core::PredictionRecord> DatabaseManager::queryEvaluatedPredictions(
        const std::optional<std::string>& model_version)
    {
        std::string sql = std::string("SELECT ") + kPredictionColumns + " FROM predictions WHERE actual_result IS NOT NULL";
        if (model_version) sql += " AND model_version = ?";
        sql += " ORDER BY id ASC;";

        std::vector<core::PredictionRecord> predictions;
        runQuery(sql,
            [&](sqlite3_stmt* stmt) {
                if (model_version) bindText(stmt, 1, *model_version);
            },
            [&](sqlite3_stmt* stmt) { predictions.push_back(readPredictionRow(stmt)); },
            "query evaluated predictions");
        return predictions;
    }

    bool DatabaseManager::applyPredictionOutcome(const core::PredictionRecord& evaluated)
    {
        requireConnection("apply prediction outcome");

        const char* sql = R"(
UPDATE predictions
SET actual_result = ?, is_correct = ?, btts_correct = ?, over_15_correct = ?, over_25_correct = ?,
    over_35_correct = ?, evaluated_at = ?
WHERE id = ? AND actual_result IS NULL;
)";
        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            throw core::DataLoadException(fmt::format("Failed to prepare prediction update [{}]: {}", rc, sqlite3_errmsg(db_)));
        }

        bindText(guard.stmt, 1, evaluated.actual_result.value_or(""));
        bindOptionalBool(guard.stmt, 2, evaluated.is_correct);
        bindOptionalBool(guard.stmt, 3, evaluated.btts_correct);
        bindOptionalBool(guard.stmt, 4, evaluated.over_15_correct);
        bindOptionalBool(guard.stmt, 5, evaluated.over_25_correct);
        bindOptionalBool(guard.stmt, 6, evaluated.over_35_correct);
        if (evaluated.evaluated_at)
        {
            bindText(guard.stmt, 7, core::utils::timestampToString(*evaluated.evaluated_at));
        }
        else
        {
            sqlite3_bind_null(guard.stmt, 7);
        }
        sqlite3_bind_int64(guard.stmt, 8, evaluated.id);

        rc = sqlite3_step(guard.stmt);
        if (rc != SQLITE_DONE)
        {
            throw core::DataLoadException(fmt::format("Failed to evaluate prediction {} [{}]: {}", evaluated.id, rc, sqlite3_errmsg(db_)));
        }
        return sqlite3_changes(db_) == 1;
    }

    // --- Rating history ---

    bool DatabaseManager::saveRatingHistory(const std::map<core::TeamId, core::TimeSeries<core::TimePoint>>& history)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save rating history: Not connected to database.");
            return false;
        }

        // History is recomputable from matches, so the table is rewritten as a whole
        if (!executeSQL("BEGIN TRANSACTION;")) return false;
        if (!executeSQL("DELETE FROM elo_history;"))
        {
            if (!executeSQL("ROLLBACK;"))
            {
                logger->error("Failed to ROLLBACK after clearing elo_history failed.");
            }
            return false;
        }

        const char* sql = "INSERT INTO elo_history (team_id, recorded_at, seq, rating) VALUES (?, ?, ?, ?);";
        bool success = true;
        size_t saved = 0;
        {
            StatementGuard guard;
            if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr) != SQLITE_OK)
            {
                logger->error("Failed to prepare rating history insert: {}", sqlite3_errmsg(db_));
                success = false;
            }
            for (auto it = history.begin(); success && it != history.end(); ++it)
            {
                int seq = 0;
                for (const auto& point : it->second)
                {
                    sqlite3_bind_int64(guard.stmt, 1, it->first);
                    bindText(guard.stmt, 2, core::utils::timestampToString(point.timestamp));
                    sqlite3_bind_int(guard.stmt, 3, seq++);
                    sqlite3_bind_double(guard.stmt, 4, point.value);
                    if (sqlite3_step(guard.stmt) != SQLITE_DONE)
                    {
                        logger->error("Failed to insert rating history for team {}: {}", it->first, sqlite3_errmsg(db_));
                        success = false;
                        break;
                    }
                    sqlite3_reset(guard.stmt);
                    ++saved;
                }
            }
        }

        if (!executeSQL(success ? "COMMIT;" : "ROLLBACK;"))
        {
            return false;
        }
        if (success) logger->info("Saved {} rating history points for {} teams.", saved, history.size());
        return success;
    }

    core::TimeSeries<core::TimePoint> DatabaseManager::queryRatingHistory(core::TeamId team_id)
    {
        core::TimeSeries<core::TimePoint> points;
        runQuery("SELECT recorded_at, rating FROM elo_history WHERE team_id = ? ORDER BY seq ASC;",
            [&](sqlite3_stmt* stmt) { sqlite3_bind_int64(stmt, 1, team_id); },
            [&](sqlite3_stmt* stmt) {
                core::TimePoint point;
                point.timestamp = core::utils::stringToTimestamp(columnText(stmt, 0));
                point.value = sqlite3_column_double(stmt, 1);
                points.push_back(point);
            },
            "query rating history");
        return points;
    }

} // namespace data
