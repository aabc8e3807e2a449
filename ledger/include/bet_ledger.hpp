#pragma once

#include <optional>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "database_manager.hpp"
#include "value_analyzer.hpp"

namespace ledger {

    // --- Performance Stats Struct ---
    struct PerformanceStats {
        int total_bets = 0;      // Settled bets only
        int pending_bets = 0;
        int won_bets = 0;
        int lost_bets = 0;
        double total_staked = 0.0;
        double total_pnl = 0.0;
        double roi_percent = 0.0;
        double win_rate = 0.0;   // Percent
        double avg_odds = 0.0;
        double avg_stake = 0.0;
        double best_win = 0.0;
        double worst_loss = 0.0;
        int high_value_bets = 0;
        int high_value_won = 0;
        double high_value_win_rate = 0.0;
        int medium_value_bets = 0;
        int medium_value_won = 0;
        double medium_value_win_rate = 0.0;
        double max_drawdown_pct = 0.0; // Fraction of the running peak bankroll

        void logStats() const {
            auto logger = core::logging::getLogger();
            logger->info("--- Betting Performance ---");
            logger->info("Settled Bets: {} (won {}, lost {}), Pending: {}", total_bets, won_bets, lost_bets, pending_bets);
            logger->info("Total Staked: {:.2f}", total_staked);
            logger->info("Total PnL: {:.2f}", total_pnl);
            logger->info("ROI: {:.2f}%", roi_percent);
            logger->info("Win Rate: {:.2f}%", win_rate);
            logger->info("Avg Odds: {:.2f}, Avg Stake: {:.2f}", avg_odds, avg_stake);
            logger->info("Best Win: {:.2f}, Worst Loss: {:.2f}", best_win, worst_loss);
            logger->info("HIGH value: {} bets, {:.2f}% won", high_value_bets, high_value_win_rate);
            logger->info("MEDIUM value: {} bets, {:.2f}% won", medium_value_bets, medium_value_win_rate);
            logger->info("Max Drawdown: {:.2f}%", max_drawdown_pct * 100.0);
            logger->info("---------------------------");
        }
    };

    // --- Equity Curve Point ---
    struct EquityPoint {
        core::Timestamp timestamp;
        double bankroll = 0.0;
        double cumulative_pnl = 0.0;
        int bet_count = 0;
        std::optional<core::BetStatus> result; // Empty for the starting point
        double pnl = 0.0;
    };

    struct SettlementSummary {
        int settled = 0;
        int won = 0;
        int lost = 0;
        int conflicts = 0;
        int invalid = 0;   // Rows whose market or score could not be evaluated
        double total_pnl = 0.0;
    };

    enum class SettleResult {
        Settled,
        Conflict, // Bet was no longer PENDING
        NotReady  // Match has no final FT score yet
    };

    // --- Bet Ledger ---
    // Places stakes as PENDING rows and settles each one at most once.
    class BetLedger {
    public:
        explicit BetLedger(data::DatabaseManager& db, core::LedgerConfig config = {});

        // stake = capped Kelly * bankroll. Throws ValidationException for a non-positive
        // bankroll or stake, or an unknown market code.
        core::BetRecord placeBet(core::MatchId match_id, const betting::ValueAnalysis& analysis,
                                 double bankroll, const std::string& notes = "");

        // Settles every PENDING bet whose match is FT with a score. Conflicts and rows with an
        // unknown market code are logged and skipped; the rest of the batch still settles.
        SettlementSummary settlePending();

        // Throws ValidationException for an unknown bet id
        SettleResult settleBet(long long bet_id);

        // Drawdown is measured on the equity curve started from 'initial_bankroll'
        PerformanceStats performanceStats(std::optional<double> initial_bankroll = std::nullopt);

        // One starting point, then one point per settled bet in settlement order
        std::vector<EquityPoint> equityCurve(std::optional<double> initial_bankroll = std::nullopt);

        std::vector<core::BetRecord> history(const data::BetQuery& query = {});

        // Settlement fields for 'bet' given the final score; does not touch storage
        static core::BetRecord resolveSettlement(const core::BetRecord& bet, int home_goals, int away_goals,
                                                 core::Timestamp settled_at);

        // HIGH (>= 15%), MEDIUM (>= 8%), LOW
        static std::string confidenceLevel(double kelly_percent);

    private:
        data::DatabaseManager& db_;
        core::LedgerConfig config_;

        // Throws SettlementConflictException when the row was already settled
        void commitSettlement(const core::BetRecord& settled);
    };

} // namespace ledger
