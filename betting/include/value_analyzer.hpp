#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "config.hpp"
#include "poisson_model.hpp"

namespace betting {

    struct KellyResult {
        double raw = 0.0;    // (b*p - q) / b, may be negative
        double capped = 0.0; // clamp(raw, 0, max_kelly)
        bool is_positive = false;
        core::RiskTier risk_tier = core::RiskTier::None;
    };

    struct ValueLevel {
        core::ValueTier tier = core::ValueTier::Neutral;
        double expected_value = 0.0;  // p * price
        double edge_percentage = 0.0; // (EV - 1) * 100
        double implied_probability = 0.0;
    };

    // One market's value verdict; immutable once computed
    struct ValueAnalysis {
        std::string market;
        std::string market_name;
        double probability = 0.0;
        double price = 0.0;
        bool price_is_estimated = false;
        double implied_probability = 0.0;
        double kelly_raw = 0.0;
        double kelly_capped = 0.0;
        double expected_value = 0.0;
        double edge_percentage = 0.0;
        core::ValueTier value_tier = core::ValueTier::Neutral;
        core::RiskTier risk_tier = core::RiskTier::None;
        bool should_bet = false;

        double kellyPercent() const { return kelly_capped * 100.0; }
    };

    // --- Value Analyzer ---
    // Stateless apart from its thresholds; safe to share across threads.
    // Every operation validates its inputs and throws ValidationException instead of clamping.
    class ValueAnalyzer {
    public:
        explicit ValueAnalyzer(core::KellyConfig config = {});

        // Kelly stake fraction capped at the configured maximum
        KellyResult kellyCriterion(double probability, double price) const;
        static KellyResult kellyCriterion(double probability, double price, double max_kelly);

        ValueLevel valueLevel(double probability, double price) const;

        // Price a bookmaker would likely offer: 1 / (p * (1 - margin))
        double estimatePrice(double probability) const;
        static double estimatePrice(double probability, double margin);

        // Full verdict for one market. Without a price, an estimated one is used and flagged.
        ValueAnalysis analyze(const std::string& market, double probability,
                              std::optional<double> price = std::nullopt) const;

        // 1X2, double chance, over 2.5, BTTS and every combo above the probability floor.
        // 'prices' maps market codes to quoted prices; missing codes are estimated.
        std::vector<ValueAnalysis> analyzeMarkets(const models::FixturePrediction& prediction,
                                                  const std::map<std::string, double>& prices = {}) const;

        const core::KellyConfig& config() const { return config_; }

    private:
        core::KellyConfig config_;
    };

} // namespace betting
