#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <fstream>            // For std::ifstream
#include <cstdlib>            // For std::getenv
#include <type_traits>

namespace core {

    namespace { // File-local helpers

        template <typename T>
        void readNumber(const json& section, const char* key, T& target, const std::string& section_name) {
            if (!section.contains(key)) return;
            if (!section[key].is_number()) {
                throw ConfigException(fmt::format("Config field '{}.{}' must be a number.", section_name, key));
            }
            if constexpr (std::is_integral<T>::value) {
                // get<int>() would truncate 5.5 silently
                if (!section[key].is_number_integer()) {
                    throw ConfigException(fmt::format("Config field '{}.{}' must be an integer.", section_name, key));
                }
            }
            target = section[key].get<T>();
        }

        void readString(const json& section, const char* key, std::string& target, const std::string& section_name) {
            if (!section.contains(key)) return;
            if (!section[key].is_string()) {
                throw ConfigException(fmt::format("Config field '{}.{}' must be a string.", section_name, key));
            }
            target = section[key].get<std::string>();
        }

        const json* findSection(const json& config, const char* name) {
            if (!config.contains(name)) return nullptr;
            if (!config[name].is_object()) {
                throw ConfigException(fmt::format("Config section '{}' must be an object.", name));
            }
            return &config[name];
        }

        void require(bool condition, const std::string& message) {
            if (!condition) throw ConfigException(message);
        }

    } // end anonymous namespace

    void EngineConfig::validate() const {
        require(!database_path.empty(), "database.path must not be empty.");

        require(statistics.form_window > 0, "statistics.form_window must be positive.");
        require(statistics.goal_stats_window > 0, "statistics.goal_stats_window must be positive.");
        require(statistics.h2h_window > 0, "statistics.h2h_window must be positive.");
        require(statistics.recency_decay > 0.0 && statistics.recency_decay <= 1.0,
                "statistics.recency_decay must be in (0, 1].");
        require(statistics.default_league_size > 0, "statistics.default_league_size must be positive.");

        require(poisson.max_goals >= 1 && poisson.max_goals <= 20, "poisson.max_goals must be in [1, 20].");
        require(poisson.home_advantage >= 0.0, "poisson.home_advantage must be non-negative.");
        require(poisson.default_avg_home_goals > 0.0 && poisson.default_avg_away_goals > 0.0,
                "poisson default league averages must be positive.");
        require(poisson.min_lambda_home > 0.0 && poisson.min_lambda_home <= poisson.max_lambda_home,
                "poisson home lambda bounds are inconsistent.");
        require(poisson.min_lambda_away > 0.0 && poisson.min_lambda_away <= poisson.max_lambda_away,
                "poisson away lambda bounds are inconsistent.");

        require(elo.k_factor > 0.0, "elo.k_factor must be positive.");
        require(elo.initial_rating > 0.0, "elo.initial_rating must be positive.");

        require(kelly.max_kelly_fraction > 0.0 && kelly.max_kelly_fraction <= 1.0,
                "kelly.max_kelly_fraction must be in (0, 1].");
        require(kelly.min_kelly_to_bet >= 0.0 && kelly.min_kelly_to_bet <= kelly.max_kelly_fraction,
                "kelly.min_kelly_to_bet must be in [0, max_kelly_fraction].");
        require(kelly.bookmaker_margin >= 0.0 && kelly.bookmaker_margin < 1.0,
                "kelly.bookmaker_margin must be in [0, 1).");
        require(kelly.medium_value_ev <= kelly.high_value_ev, "kelly.medium_value_ev must not exceed high_value_ev.");

        require(ledger.initial_bankroll > 0.0, "ledger.initial_bankroll must be positive.");
    }

    EngineConfig parseConfig(const json& config) {
        if (!config.is_object()) {
            throw ConfigException("Engine config must be a JSON object.");
        }

        EngineConfig cfg;

        if (const json* db = findSection(config, "database")) {
            readString(*db, "path", cfg.database_path, "database");
        }
        if (const json* log = findSection(config, "logging")) {
            readString(*log, "base_filename", cfg.logging.base_filename, "logging");
            readString(*log, "directory", cfg.logging.directory, "logging");
            readString(*log, "console_level", cfg.logging.console_level, "logging");
            readString(*log, "file_level", cfg.logging.file_level, "logging");
        }
        if (const json* stats = findSection(config, "statistics")) {
            readNumber(*stats, "form_window", cfg.statistics.form_window, "statistics");
            readNumber(*stats, "goal_stats_window", cfg.statistics.goal_stats_window, "statistics");
            readNumber(*stats, "h2h_window", cfg.statistics.h2h_window, "statistics");
            readNumber(*stats, "recency_decay", cfg.statistics.recency_decay, "statistics");
            readNumber(*stats, "default_league_size", cfg.statistics.default_league_size, "statistics");
        }
        if (const json* poisson = findSection(config, "poisson")) {
            readNumber(*poisson, "home_advantage", cfg.poisson.home_advantage, "poisson");
            readNumber(*poisson, "rho", cfg.poisson.rho, "poisson");
            readNumber(*poisson, "max_goals", cfg.poisson.max_goals, "poisson");
            readNumber(*poisson, "default_avg_home_goals", cfg.poisson.default_avg_home_goals, "poisson");
            readNumber(*poisson, "default_avg_away_goals", cfg.poisson.default_avg_away_goals, "poisson");
            readNumber(*poisson, "min_lambda_home", cfg.poisson.min_lambda_home, "poisson");
            readNumber(*poisson, "max_lambda_home", cfg.poisson.max_lambda_home, "poisson");
            readNumber(*poisson, "min_lambda_away", cfg.poisson.min_lambda_away, "poisson");
            readNumber(*poisson, "max_lambda_away", cfg.poisson.max_lambda_away, "poisson");
        }
        if (const json* elo = findSection(config, "elo")) {
            readNumber(*elo, "initial_rating", cfg.elo.initial_rating, "elo");
            readNumber(*elo, "k_factor", cfg.elo.k_factor, "elo");
            readNumber(*elo, "home_advantage", cfg.elo.home_advantage, "elo");
        }
        if (const json* kelly = findSection(config, "kelly")) {
            readNumber(*kelly, "max_kelly_fraction", cfg.kelly.max_kelly_fraction, "kelly");
            readNumber(*kelly, "min_kelly_to_bet", cfg.kelly.min_kelly_to_bet, "kelly");
            readNumber(*kelly, "bookmaker_margin", cfg.kelly.bookmaker_margin, "kelly");
            readNumber(*kelly, "high_value_ev", cfg.kelly.high_value_ev, "kelly");
            readNumber(*kelly, "medium_value_ev", cfg.kelly.medium_value_ev, "kelly");
            readNumber(*kelly, "min_combo_probability", cfg.kelly.min_combo_probability, "kelly");
        }
        if (const json* ledger = findSection(config, "ledger")) {
            readNumber(*ledger, "initial_bankroll", cfg.ledger.initial_bankroll, "ledger");
        }

        cfg.validate();
        return cfg;
    }

    EngineConfig loadConfig(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException(fmt::format("Failed to open config file: {}", path));
        }

        json raw;
        try {
            raw = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw ConfigException(fmt::format("Failed to parse config file '{}': {}", path, e.what()));
        }

        EngineConfig cfg = parseConfig(raw);

        const char* db_env = std::getenv("MATCHEDGE_DB_PATH");
        if (db_env && *db_env) {
            cfg.database_path = db_env;
        }

        if (logging::isInitialized()) {
            logging::getLogger()->info("Engine config loaded from {} (db: {})", path, cfg.database_path);
        }
        return cfg;
    }

} // namespace core
