#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace core {

    using json = nlohmann::json;

    struct StatisticsConfig {
        int form_window = 5;          // Matches per form window
        int goal_stats_window = 10;
        int h2h_window = 5;
        double recency_decay = 0.85;  // Weight of match i positions back is decay^i
        int default_league_size = 20; // Used for mid-table fallback when a league has no known teams
    };

    struct PoissonConfig {
        double home_advantage = 0.25;
        double rho = -0.13;           // Dixon-Coles low-score correlation
        int max_goals = 8;
        double default_avg_home_goals = 1.5;
        double default_avg_away_goals = 1.2;
        double min_lambda_home = 0.3;
        double max_lambda_home = 4.0;
        double min_lambda_away = 0.3;
        double max_lambda_away = 3.5;
        double normalization_tolerance = 1e-9;
    };

    struct EloConfig {
        double initial_rating = 1500.0;
        double k_factor = 32.0;
        double home_advantage = 100.0; // Elo points
    };

    struct KellyConfig {
        double max_kelly_fraction = 0.25;
        double min_kelly_to_bet = 0.03;
        double bookmaker_margin = 0.10;
        double high_value_ev = 1.15;
        double medium_value_ev = 1.05;
        double min_combo_probability = 0.10;
    };

    struct LedgerConfig {
        double initial_bankroll = 1000.0;
    };

    struct LoggingConfig {
        std::string base_filename = "matchedge";
        std::string directory = "logs";
        std::string console_level = "info";
        std::string file_level = "debug";
    };

    struct EngineConfig {
        std::string database_path = "matchedge.db";
        LoggingConfig logging;
        StatisticsConfig statistics;
        PoissonConfig poisson;
        EloConfig elo;
        KellyConfig kelly;
        LedgerConfig ledger;

        // Throws ConfigException on out-of-range values
        void validate() const;
    };

    // Parse a config object; missing fields keep their defaults. Throws ConfigException.
    EngineConfig parseConfig(const json& config);

    // Load from a JSON file and apply MATCHEDGE_DB_PATH. Throws ConfigException.
    EngineConfig loadConfig(const std::string& path);

} // namespace core
