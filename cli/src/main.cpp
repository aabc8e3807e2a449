// cli/src/main.cpp

// Standard includes
#include <iostream>
#include <string>
#include <vector>
#include <exception>
#include <chrono>
#include <cstdlib>     // For std::getenv
#include <memory>      // For std::shared_ptr
#include <optional>

// Project includes
#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "config.hpp"
#include "utils.hpp"
#include "database_manager.hpp"
#include "model_snapshot.hpp"
#include "value_analyzer.hpp"
#include "double_chance.hpp"
#include "bet_ledger.hpp"
#include "accuracy_tracker.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <spdlog/fmt/fmt.h>

namespace {

    void printUsage() {
        std::cout <<
            "Usage: matchedge_cli [--config <file>] <command> [options]\n"
            "\n"
            "Commands:\n"
            "  predict <home_team_id> <away_team_id>   Market probabilities for a fixture\n"
            "  scan [--bankroll X] [--days N] [--place] Value scan of scheduled fixtures\n"
            "  settle                                  Settle pending bets on finished matches\n"
            "  accuracy                                Score stored predictions and report hit rates\n"
            "  report [--initial-bankroll X] [--limit N]  Performance report and recent bets\n"
            "  ratings [n]                             Top n Elo ratings (saves rating history)\n";
    }

    struct CliArgs {
        std::optional<std::string> config_path;
        std::string command;
        std::vector<std::string> positional;
        std::optional<double> bankroll;
        std::optional<double> initial_bankroll;
        std::optional<int> days;
        std::optional<int> limit;
        bool place = false;
    };

    double parseDouble(const std::string& flag, const std::string& value) {
        try {
            size_t used = 0;
            double parsed = std::stod(value, &used);
            if (used != value.size()) throw std::invalid_argument(value);
            return parsed;
        } catch (const std::logic_error&) {
            throw core::ValidationException("Invalid number for " + flag + ": " + value);
        }
    }

    long long parseInteger(const std::string& what, const std::string& value) {
        try {
            size_t used = 0;
            long long parsed = std::stoll(value, &used);
            if (used != value.size()) throw std::invalid_argument(value);
            return parsed;
        } catch (const std::logic_error&) {
            throw core::ValidationException("Invalid integer for " + what + ": " + value);
        }
    }

    CliArgs parseArgs(int argc, char* argv[]) {
        CliArgs args;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            auto next = [&](const std::string& flag) -> std::string {
                if (i + 1 >= argc) throw core::ValidationException("Missing value for " + flag);
                return argv[++i];
            };

            if (arg == "--config") args.config_path = next(arg);
            else if (arg == "--bankroll") args.bankroll = parseDouble(arg, next(arg));
            else if (arg == "--initial-bankroll") args.initial_bankroll = parseDouble(arg, next(arg));
            else if (arg == "--days") args.days = static_cast<int>(parseInteger(arg, next(arg)));
            else if (arg == "--limit") args.limit = static_cast<int>(parseInteger(arg, next(arg)));
            else if (arg == "--place") args.place = true;
            else if (args.command.empty()) args.command = arg;
            else args.positional.push_back(arg);
        }
        return args;
    }

    core::EngineConfig resolveConfig(const CliArgs& args) {
        if (args.config_path) {
            return core::loadConfig(*args.config_path);
        }
        core::EngineConfig cfg;
        const char* db_env = std::getenv("MATCHEDGE_DB_PATH");
        if (db_env && *db_env) cfg.database_path = db_env;
        return cfg;
    }

    int runPredict(const CliArgs& args, data::DatabaseManager& db, const core::EngineConfig& cfg) {
        auto logger = core::logging::getLogger();
        if (args.positional.size() < 2) {
            throw core::ValidationException("predict needs <home_team_id> <away_team_id>");
        }
        core::Match fixture;
        fixture.home_team_id = parseInteger("home_team_id", args.positional[0]);
        fixture.away_team_id = parseInteger("away_team_id", args.positional[1]);
        fixture.match_date = std::chrono::system_clock::now();

        auto snapshot = models::ModelSnapshot::build(db, cfg);
        const models::FixturePrediction p = snapshot->predictFixture(fixture);

        logger->info("--- Prediction: {} vs {} ---", fixture.home_team_id, fixture.away_team_id);
        logger->info("Expected goals: {:.2f} - {:.2f}", p.expected_home_goals, p.expected_away_goals);
        logger->info("1X2: H {:.1f}% | D {:.1f}% | A {:.1f}%", p.home_win * 100, p.draw * 100, p.away_win * 100);
        logger->info("Double chance: 1X {:.1f}% | 12 {:.1f}% | X2 {:.1f}%",
                     p.home_or_draw * 100, p.home_or_away * 100, p.draw_or_away * 100);
        logger->info("Over 1.5/2.5/3.5: {:.1f}% / {:.1f}% / {:.1f}%", p.over_15 * 100, p.over_25 * 100, p.over_35 * 100);
        logger->info("BTTS: {:.1f}%", p.btts_yes * 100);
        for (const auto& combo : p.combos) {
            logger->info("Combo {}: {:.1f}%", combo.first, combo.second * 100);
        }
        for (const auto& score : p.top_scores) {
            logger->info("Score {}-{}: {:.1f}%", score.home_goals, score.away_goals, score.probability * 100);
        }
        logger->info("Elo: {:.0f} vs {:.0f}", p.home_elo, p.away_elo);

        const auto dc = betting::recommendDoubleChance(p.home_win, p.draw, p.away_win);
        if (dc.recommended) {
            logger->info("Double chance pick: {} ({:.1f}%, {} risk) - {}", dc.market, dc.confidence * 100,
                         dc.risk_level, dc.reasoning);
        } else {
            logger->info("No double chance pick: {}", dc.reasoning);
        }
        return 0;
    }

    int runScan(const CliArgs& args, data::DatabaseManager& db, const core::EngineConfig& cfg) {
        auto logger = core::logging::getLogger();
        const double bankroll = args.bankroll.value_or(cfg.ledger.initial_bankroll);
        const int days = args.days.value_or(7);

        const auto now = std::chrono::system_clock::now();
        const auto fixtures = db.listScheduledMatches(now, now + std::chrono::hours(24 * days));
        logger->info("Scanning {} scheduled fixtures in the next {} days (bankroll {:.2f}).",
                     fixtures.size(), days, bankroll);
        if (fixtures.empty()) {
            return 0;
        }

        auto snapshot = models::ModelSnapshot::build(db, cfg);
        const models::BatchPrediction batch = snapshot->predictFixtures(fixtures);
        ledger::AccuracyTracker tracker(db);
        if (!tracker.recordPredictions(batch.predictions)) {
            logger->warn("Predictions were not recorded; accuracy tracking will miss this scan.");
        }
        betting::ValueAnalyzer analyzer(cfg.kelly);
        ledger::BetLedger bet_ledger(db, cfg.ledger);

        int opportunities = 0;
        int placed = 0;
        for (const auto& prediction : batch.predictions) {
            for (const auto& analysis : analyzer.analyzeMarkets(prediction)) {
                if (!analysis.should_bet) continue;
                ++opportunities;
                logger->info("Match {} | {} | p {:.1f}% @ {:.2f}{} | EV {:.3f} | {} value | Kelly {:.1f}% ({} risk)",
                             prediction.match_id, analysis.market_name, analysis.probability * 100,
                             analysis.price, analysis.price_is_estimated ? " (est.)" : "",
                             analysis.expected_value, core::toString(analysis.value_tier),
                             analysis.kellyPercent(), core::toString(analysis.risk_tier));
                if (args.place) {
                    bet_ledger.placeBet(prediction.match_id, analysis, bankroll, "scan");
                    ++placed;
                }
            }
        }
        for (const auto& skipped : batch.skipped) {
            logger->warn("Fixture {} not priced: {}", skipped.match_id, skipped.reason);
        }
        logger->info("Scan complete: {} value opportunities, {} bets placed.", opportunities, placed);
        return 0;
    }

    int runSettle(data::DatabaseManager& db, const core::EngineConfig& cfg) {
        ledger::BetLedger bet_ledger(db, cfg.ledger);
        const auto summary = bet_ledger.settlePending();
        return (summary.conflicts > 0 || summary.invalid > 0) ? 2 : 0;
    }

    int runAccuracy(data::DatabaseManager& db) {
        auto logger = core::logging::getLogger();
        ledger::AccuracyTracker tracker(db);

        const auto summary = tracker.updateFinished();
        tracker.accuracyStats().logStats();

        logger->info("1X2 accuracy by confidence:");
        for (const auto& bucket : tracker.accuracyByConfidence()) {
            if (bucket.total == 0) continue;
            logger->info("  {:<7} {:.1f}% ({}/{})", bucket.label, bucket.accuracy() * 100.0,
                         bucket.correct, bucket.total);
        }

        logger->info("Calibration (expected vs observed):");
        for (const auto& point : tracker.calibration()) {
            logger->info("  {:.0f}% -> {:.1f}% over {} predictions (error {:.1f} pts)", point.expected * 100.0,
                         point.actual * 100.0, point.sample_size, point.error * 100.0);
        }
        return summary.invalid > 0 ? 2 : 0;
    }

    int runReport(const CliArgs& args, data::DatabaseManager& db, const core::EngineConfig& cfg) {
        auto logger = core::logging::getLogger();
        ledger::BetLedger bet_ledger(db, cfg.ledger);

        const auto stats = bet_ledger.performanceStats(args.initial_bankroll);
        stats.logStats();

        const auto curve = bet_ledger.equityCurve(args.initial_bankroll);
        logger->info("Equity curve ({} points):", curve.size());
        for (const auto& point : curve) {
            logger->info("  {} bankroll {:.2f} (cumulative pnl {:.2f}, {} bets)",
                         core::utils::timestampToString(point.timestamp), point.bankroll,
                         point.cumulative_pnl, point.bet_count);
        }

        data::BetQuery query;
        query.limit = args.limit.value_or(20);
        for (const auto& bet : bet_ledger.history(query)) {
            logger->info("  #{} match {} {} stake {:.2f} @ {:.2f} {} {}", bet.id, bet.match_id, bet.market,
                         bet.stake_amount, bet.price, core::toString(bet.status),
                         bet.pnl ? fmt::format("pnl {:.2f}", *bet.pnl) : std::string());
        }
        return 0;
    }

    int runRatings(const CliArgs& args, data::DatabaseManager& db, const core::EngineConfig& cfg) {
        auto logger = core::logging::getLogger();
        const size_t n = args.positional.empty() ? 20 : static_cast<size_t>(parseInteger("n", args.positional[0]));

        auto snapshot = models::ModelSnapshot::build(db, cfg);
        const auto& elo = snapshot->elo();
        if (!db.saveRatingHistory(elo.exportHistory())) {
            logger->error("Failed to save Elo rating history.");
            return 1;
        }

        int rank = 0;
        for (const auto& entry : elo.topTeams(n)) {
            logger->info("{:>3}. team {} - {:.1f}", ++rank, entry.first, entry.second);
        }
        return 0;
    }

} // end anonymous namespace

int main(int argc, char* argv[]) {
    // Define logger pointer early in the main scope
    std::shared_ptr<spdlog::logger> logger = nullptr;

    // Main try block for exception handling
    try {
        CliArgs args = parseArgs(argc, argv);
        core::EngineConfig cfg = resolveConfig(args);

        // --- Initialize Logging ---
        core::logging::initialize(cfg.logging);
        logger = core::logging::getLogger();
        logger->info("MatchEdge CLI starting...");

        if (args.command.empty() || args.command == "help" || args.command == "--help") {
            printUsage();
            return args.command.empty() ? 1 : 0;
        }

        // --- Database Setup ---
        logger->info("Using SQLite database path: {}", cfg.database_path);
        data::DatabaseManager db_manager(cfg.database_path);
        if (!db_manager.connect()) {
            logger->critical("Could not connect to database {}.", cfg.database_path);
            return 1;
        }
        if (!db_manager.initializeSchema()) {
            logger->critical("Database schema initialization failed.");
            return 1;
        }

        int rc = 0;
        if (args.command == "predict") rc = runPredict(args, db_manager, cfg);
        else if (args.command == "scan") rc = runScan(args, db_manager, cfg);
        else if (args.command == "settle") rc = runSettle(db_manager, cfg);
        else if (args.command == "accuracy") rc = runAccuracy(db_manager);
        else if (args.command == "report") rc = runReport(args, db_manager, cfg);
        else if (args.command == "ratings") rc = runRatings(args, db_manager, cfg);
        else {
            logger->error("Unknown command: {}", args.command);
            printUsage();
            rc = 1;
        }

        db_manager.disconnect();
        logger->info("MatchEdge CLI finished.");
        return rc;

    // --- Exception Handling ---
    } catch (const core::MatchEdgeException& ex) {
        std::cerr << "MatchEdge Error: " << ex.what() << std::endl;
        if (logger) logger->critical("MatchEdge Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }
}
