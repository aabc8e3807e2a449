#include "bet_ledger.hpp"
#include "markets.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <algorithm>
#include <chrono>

namespace ledger {

    BetLedger::BetLedger(data::DatabaseManager& db, core::LedgerConfig config)
        : db_(db), config_(config)
    {
        if (config_.initial_bankroll <= 0) {
            throw core::ValidationException("Initial bankroll must be positive.");
        }
    }

    std::string BetLedger::confidenceLevel(double kelly_percent) {
        if (kelly_percent >= 15.0) return "HIGH";
        if (kelly_percent >= 8.0) return "MEDIUM";
        return "LOW";
    }

    core::BetRecord BetLedger::placeBet(core::MatchId match_id, const betting::ValueAnalysis& analysis,
                                        double bankroll, const std::string& notes) {
        auto logger = core::logging::getLogger();
        if (bankroll <= 0) {
            throw core::ValidationException("Bankroll must be positive to place a bet.");
        }
        if (!core::markets::isKnownMarket(analysis.market)) {
            throw core::ValidationException("Cannot place bet on unknown market: " + analysis.market);
        }

        core::BetRecord bet;
        bet.match_id = match_id;
        bet.market = analysis.market;
        bet.market_name = analysis.market_name;
        bet.stake_kelly_percent = analysis.kellyPercent();
        bet.stake_amount = analysis.kelly_capped * bankroll;
        bet.bankroll_at_bet = bankroll;
        bet.price = analysis.price;
        bet.is_estimated_price = analysis.price_is_estimated;
        bet.probability = analysis.probability;
        bet.expected_value = analysis.expected_value;
        bet.edge_percentage = analysis.edge_percentage;
        bet.value_tier = analysis.value_tier;
        bet.confidence_level = confidenceLevel(bet.stake_kelly_percent);
        bet.status = core::BetStatus::Pending;
        bet.placed_at = std::chrono::system_clock::now();
        bet.notes = notes;

        if (bet.stake_amount <= 0) {
            throw core::ValidationException("Kelly stake for market " + analysis.market + " is zero; nothing to place.");
        }

        bet.id = db_.insertBet(bet);
        logger->info("Placed bet {}: match {} {} stake {:.2f} @ {:.2f} ({} value, {:.1f}% Kelly).",
                     bet.id, match_id, bet.market, bet.stake_amount, bet.price,
                     core::toString(bet.value_tier), bet.stake_kelly_percent);
        return bet;
    }

    core::BetRecord BetLedger::resolveSettlement(const core::BetRecord& bet, int home_goals, int away_goals,
                                                 core::Timestamp settled_at) {
        core::BetRecord settled = bet;
        const bool won = core::markets::isWinning(bet.market, home_goals, away_goals);

        settled.actual_result = core::toString(core::outcomeFromScore(home_goals, away_goals));
        settled.is_winner = won;
        settled.status = won ? core::BetStatus::Won : core::BetStatus::Lost;
        const double pnl = won ? bet.stake_amount * (bet.price - 1.0) : -bet.stake_amount;
        settled.pnl = pnl;
        settled.roi_percent = bet.stake_amount > 0 ? pnl / bet.stake_amount * 100.0 : 0.0;
        settled.bankroll_after = bet.bankroll_at_bet + pnl;
        settled.settled_at = settled_at;
        return settled;
    }

    void BetLedger::commitSettlement(const core::BetRecord& settled) {
        if (!db_.applySettlement(settled)) {
            throw core::SettlementConflictException("Bet " + std::to_string(settled.id) + " is no longer PENDING.");
        }
    }

    SettlementSummary BetLedger::settlePending() {
        auto logger = core::logging::getLogger();
        SettlementSummary summary;

        const auto candidates = db_.querySettleableBets();
        logger->info("Settling {} pending bets with finished matches...", candidates.size());

        const core::Timestamp now = std::chrono::system_clock::now();
        for (const auto& entry : candidates) {
            const core::BetRecord& bet = entry.first;
            const core::Match& match = entry.second;

            core::BetRecord settled;
            try {
                settled = resolveSettlement(bet, *match.home_goals, *match.away_goals, now);
            } catch (const core::ValidationException& e) {
                // A corrupt row must not block the bets behind it; it stays PENDING
                logger->warn("Bet {} cannot be settled, skipping: {}", bet.id, e.what());
                ++summary.invalid;
                continue;
            }
            try {
                commitSettlement(settled);
            } catch (const core::SettlementConflictException& e) {
                logger->warn("Settlement conflict, skipping: {}", e.what());
                ++summary.conflicts;
                continue;
            }

            ++summary.settled;
            if (settled.status == core::BetStatus::Won) ++summary.won;
            else ++summary.lost;
            summary.total_pnl += *settled.pnl;
            logger->debug("Bet {} ({}) settled {} on {}-{}: pnl {:.2f}.", bet.id, bet.market,
                          core::toString(settled.status), *match.home_goals, *match.away_goals, *settled.pnl);
        }

        logger->info("Settlement complete: {} settled ({} won, {} lost), {} conflicts, {} invalid, pnl {:.2f}.",
                     summary.settled, summary.won, summary.lost, summary.conflicts, summary.invalid,
                     summary.total_pnl);
        return summary;
    }

    SettleResult BetLedger::settleBet(long long bet_id) {
        auto logger = core::logging::getLogger();

        const auto bet = db_.getBet(bet_id);
        if (!bet) {
            throw core::ValidationException("Unknown bet id: " + std::to_string(bet_id));
        }
        if (bet->status != core::BetStatus::Pending) {
            logger->warn("Bet {} already settled as {}; skipping.", bet_id, core::toString(bet->status));
            return SettleResult::Conflict;
        }

        const auto match = db_.getMatch(bet->match_id);
        if (!match || !match->isFinished()) {
            logger->info("Bet {}: match {} has no final score yet.", bet_id, bet->match_id);
            return SettleResult::NotReady;
        }

        core::BetRecord settled = resolveSettlement(*bet, *match->home_goals, *match->away_goals,
                                                    std::chrono::system_clock::now());
        try {
            commitSettlement(settled);
        } catch (const core::SettlementConflictException& e) {
            logger->warn("Settlement conflict, skipping: {}", e.what());
            return SettleResult::Conflict;
        }
        logger->info("Bet {} settled {}: pnl {:.2f}.", bet_id, core::toString(settled.status), *settled.pnl);
        return SettleResult::Settled;
    }

    PerformanceStats BetLedger::performanceStats(std::optional<double> initial_bankroll) {
        auto logger = core::logging::getLogger();
        PerformanceStats stats;
        stats.pending_bets = db_.countBets(core::BetStatus::Pending);

        const auto settled_bets = db_.querySettledBets();
        if (settled_bets.empty()) {
            logger->info("No settled bets yet ({} pending).", stats.pending_bets);
            return stats;
        }

        double total_odds = 0.0;
        for (const auto& bet : settled_bets) {
            const double pnl = bet.pnl.value_or(0.0);
            const bool won = bet.status == core::BetStatus::Won;

            ++stats.total_bets;
            stats.total_staked += bet.stake_amount;
            stats.total_pnl += pnl;
            total_odds += bet.price;
            if (won) {
                ++stats.won_bets;
                stats.best_win = std::max(stats.best_win, pnl);
            } else {
                ++stats.lost_bets;
                stats.worst_loss = std::min(stats.worst_loss, pnl);
            }

            if (bet.value_tier == core::ValueTier::High) {
                ++stats.high_value_bets;
                if (won) ++stats.high_value_won;
            } else if (bet.value_tier == core::ValueTier::Medium) {
                ++stats.medium_value_bets;
                if (won) ++stats.medium_value_won;
            }
        }

        const double n = static_cast<double>(stats.total_bets);
        stats.roi_percent = stats.total_staked > 0 ? stats.total_pnl / stats.total_staked * 100.0 : 0.0;
        stats.win_rate = stats.won_bets / n * 100.0;
        stats.avg_odds = total_odds / n;
        stats.avg_stake = stats.total_staked / n;
        stats.high_value_win_rate = stats.high_value_bets > 0
            ? static_cast<double>(stats.high_value_won) / stats.high_value_bets * 100.0 : 0.0;
        stats.medium_value_win_rate = stats.medium_value_bets > 0
            ? static_cast<double>(stats.medium_value_won) / stats.medium_value_bets * 100.0 : 0.0;

        // --- Max Drawdown ---
        const auto curve = equityCurve(initial_bankroll);
        double peak = curve.front().bankroll;
        double max_drawdown = 0.0;
        for (const auto& point : curve) {
            peak = std::max(peak, point.bankroll);
            double current_drawdown = (peak > 1e-9) ? (peak - point.bankroll) / peak : 0.0;
            max_drawdown = std::max(max_drawdown, current_drawdown);
        }
        stats.max_drawdown_pct = max_drawdown;
        return stats;
    }

    std::vector<EquityPoint> BetLedger::equityCurve(std::optional<double> initial_bankroll) {
        const double start = initial_bankroll.value_or(config_.initial_bankroll);
        if (start <= 0) {
            throw core::ValidationException("Initial bankroll must be positive.");
        }

        std::vector<EquityPoint> curve;
        const auto settled_bets = db_.querySettledBets();
        if (settled_bets.empty()) {
            EquityPoint point;
            point.timestamp = std::chrono::system_clock::now();
            point.bankroll = start;
            curve.push_back(point);
            return curve;
        }

        EquityPoint first;
        first.timestamp = settled_bets.front().placed_at;
        first.bankroll = start;
        curve.push_back(first);

        double cumulative_pnl = 0.0;
        int count = 0;
        for (const auto& bet : settled_bets) {
            const double pnl = bet.pnl.value_or(0.0);
            cumulative_pnl += pnl;

            EquityPoint point;
            point.timestamp = bet.settled_at.value_or(bet.placed_at);
            point.bankroll = start + cumulative_pnl;
            point.cumulative_pnl = cumulative_pnl;
            point.bet_count = ++count;
            point.result = bet.status;
            point.pnl = pnl;
            curve.push_back(point);
        }
        return curve;
    }

    std::vector<core::BetRecord> BetLedger::history(const data::BetQuery& query) {
        return db_.queryBets(query);
    }

} // namespace ledger
