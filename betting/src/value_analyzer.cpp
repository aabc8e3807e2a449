#include "value_analyzer.hpp"
#include "markets.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace betting {

    namespace {

        void validateProbability(double probability) {
            if (!(probability >= 0.0 && probability <= 1.0)) {
                throw core::ValidationException("Probability must be between 0 and 1, got " + std::to_string(probability));
            }
        }

        void validatePrice(double price) {
            if (!(price >= 1.0) || !std::isfinite(price)) {
                throw core::ValidationException("Decimal price must be >= 1.0, got " + std::to_string(price));
            }
        }

        core::RiskTier riskTierFor(double capped) {
            const double percent = capped * 100.0;
            if (percent <= 0.0) return core::RiskTier::None;
            if (percent < 5.0) return core::RiskTier::Low;
            if (percent < 15.0) return core::RiskTier::Medium;
            return core::RiskTier::High;
        }

    } // end anonymous namespace

    ValueAnalyzer::ValueAnalyzer(core::KellyConfig config)
        : config_(config)
    {
        if (!(config_.max_kelly_fraction > 0.0 && config_.max_kelly_fraction <= 1.0)) {
            throw core::ValidationException("max_kelly_fraction must be in (0, 1]");
        }
    }

    KellyResult ValueAnalyzer::kellyCriterion(double probability, double price) const {
        return kellyCriterion(probability, price, config_.max_kelly_fraction);
    }

    KellyResult ValueAnalyzer::kellyCriterion(double probability, double price, double max_kelly) {
        validateProbability(probability);
        validatePrice(price);
        if (!(max_kelly > 0.0 && max_kelly <= 1.0)) {
            throw core::ValidationException("max_kelly must be in (0, 1], got " + std::to_string(max_kelly));
        }

        KellyResult result;
        const double b = price - 1.0;
        const double q = 1.0 - probability;
        // Price 1.0 pays nothing
        result.raw = (b == 0.0) ? 0.0 : (b * probability - q) / b;
        result.is_positive = result.raw > 0.0;
        result.capped = std::max(0.0, std::min(result.raw, max_kelly));
        result.risk_tier = riskTierFor(result.capped);
        return result;
    }

    ValueLevel ValueAnalyzer::valueLevel(double probability, double price) const {
        validateProbability(probability);
        validatePrice(price);

        ValueLevel level;
        level.expected_value = probability * price;
        level.edge_percentage = (level.expected_value - 1.0) * 100.0;
        level.implied_probability = 1.0 / price;
        if (level.expected_value >= config_.high_value_ev) {
            level.tier = core::ValueTier::High;
        } else if (level.expected_value >= config_.medium_value_ev) {
            level.tier = core::ValueTier::Medium;
        } else {
            level.tier = core::ValueTier::Neutral;
        }
        return level;
    }

    double ValueAnalyzer::estimatePrice(double probability) const {
        return estimatePrice(probability, config_.bookmaker_margin);
    }

    double ValueAnalyzer::estimatePrice(double probability, double margin) {
        if (!(probability > 0.0 && probability <= 1.0)) {
            throw core::ValidationException("Cannot estimate a price for probability " + std::to_string(probability));
        }
        if (!(margin >= 0.0 && margin < 1.0)) {
            throw core::ValidationException("Bookmaker margin must be in [0, 1), got " + std::to_string(margin));
        }
        return 1.0 / (probability * (1.0 - margin));
    }

    ValueAnalysis ValueAnalyzer::analyze(const std::string& market, double probability,
                                         std::optional<double> price) const {
        validateProbability(probability);

        ValueAnalysis analysis;
        analysis.market = market;
        analysis.market_name = core::markets::isKnownMarket(market) ? core::markets::marketName(market) : market;
        analysis.probability = probability;
        if (price) {
            analysis.price = *price;
            analysis.price_is_estimated = false;
        } else {
            analysis.price = estimatePrice(probability);
            analysis.price_is_estimated = true;
        }

        const KellyResult kelly = kellyCriterion(probability, analysis.price);
        const ValueLevel level = valueLevel(probability, analysis.price);

        analysis.kelly_raw = kelly.raw;
        analysis.kelly_capped = kelly.capped;
        analysis.risk_tier = kelly.risk_tier;
        analysis.expected_value = level.expected_value;
        analysis.edge_percentage = level.edge_percentage;
        analysis.implied_probability = level.implied_probability;
        analysis.value_tier = level.tier;

        analysis.should_bet = kelly.is_positive
            && (level.tier == core::ValueTier::High || level.tier == core::ValueTier::Medium)
            && kelly.capped >= config_.min_kelly_to_bet;
        return analysis;
    }

    std::vector<ValueAnalysis> ValueAnalyzer::analyzeMarkets(const models::FixturePrediction& prediction,
                                                             const std::map<std::string, double>& prices) const {
        std::vector<std::string> codes = {"H", "D", "A", "1X", "12", "X2", "O2.5", "BTTS"};
        for (const auto& combo : prediction.combos) {
            if (combo.second > config_.min_combo_probability) {
                codes.push_back(combo.first);
            }
        }

        std::vector<ValueAnalysis> analyses;
        analyses.reserve(codes.size());
        for (const auto& code : codes) {
            const double probability = prediction.probabilityOf(code);
            if (probability <= 0.0) {
                continue; // Nothing to price
            }
            auto price_it = prices.find(code);
            std::optional<double> price;
            if (price_it != prices.end()) price = price_it->second;
            analyses.push_back(analyze(code, probability, price));
        }

        core::logging::getLogger()->debug("Match {}: analyzed {} markets, {} recommended.",
            prediction.match_id, analyses.size(),
            std::count_if(analyses.begin(), analyses.end(), [](const ValueAnalysis& a) { return a.should_bet; }));
        return analyses;
    }

} // namespace betting
