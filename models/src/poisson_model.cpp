#include "poisson_model.hpp"
#include "markets.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace models {

    namespace {

        double poissonPmf(int k, double lambda) {
            return std::exp(k * std::log(lambda) - lambda - std::lgamma(k + 1.0));
        }

        // Dixon-Coles low-score correction
        double tau(int home_goals, int away_goals, double lambda_home, double lambda_away, double rho) {
            if (home_goals > 1 || away_goals > 1) {
                return 1.0;
            }
            return 1.0 - lambda_home * lambda_away * rho;
        }

        struct GoalTotals {
            int scored_home = 0;
            int conceded_home = 0;
            int scored_away = 0;
            int conceded_away = 0;
            int home_matches = 0;
            int away_matches = 0;
        };

        double ratio(double per_match, double league_avg) {
            return league_avg > 0.0 ? per_match / league_avg : 1.0;
        }

    } // end anonymous namespace

    // --- ScorelineDistribution ---

    ScorelineDistribution::ScorelineDistribution(std::vector<double> cells, int max_goals,
                                                 double lambda_home, double lambda_away)
        : cells_(std::move(cells)), max_goals_(max_goals),
          lambda_home_(lambda_home), lambda_away_(lambda_away) {}

    ScorelineDistribution ScorelineDistribution::build(double lambda_home, double lambda_away,
                                                       double rho, int max_goals, double tolerance) {
        if (max_goals < 1) {
            throw core::ValidationException("max_goals must be at least 1, got " + std::to_string(max_goals));
        }
        if (!std::isfinite(lambda_home) || !std::isfinite(lambda_away) || lambda_home <= 0.0 || lambda_away <= 0.0) {
            throw core::NumericalException("Goal rates must be finite and positive (home " +
                std::to_string(lambda_home) + ", away " + std::to_string(lambda_away) + ")");
        }

        const int size = max_goals + 1;
        std::vector<double> cells(static_cast<size_t>(size * size), 0.0);
        double mass = 0.0;
        for (int i = 0; i < size; ++i) {
            const double p_home = poissonPmf(i, lambda_home);
            for (int j = 0; j < size; ++j) {
                const double cell = p_home * poissonPmf(j, lambda_away) * tau(i, j, lambda_home, lambda_away, rho);
                if (!std::isfinite(cell) || cell < 0.0) {
                    throw core::NumericalException("Scoreline cell " + std::to_string(i) + "-" + std::to_string(j) +
                        " is invalid (" + std::to_string(cell) + ") for rho " + std::to_string(rho));
                }
                cells[static_cast<size_t>(i * size + j)] = cell;
                mass += cell;
            }
        }

        if (!std::isfinite(mass) || mass <= 0.0) {
            throw core::NumericalException("Scoreline matrix has no probability mass to normalize");
        }
        double total = 0.0;
        for (double& cell : cells) {
            cell /= mass;
            total += cell;
        }
        if (std::fabs(total - 1.0) > tolerance) {
            throw core::NumericalException("Scoreline matrix failed to normalize (sum " + std::to_string(total) + ")");
        }

        return ScorelineDistribution(std::move(cells), max_goals, lambda_home, lambda_away);
    }

    double ScorelineDistribution::at(int home_goals, int away_goals) const {
        if (home_goals < 0 || away_goals < 0 || home_goals > max_goals_ || away_goals > max_goals_) {
            return 0.0;
        }
        return cells_[static_cast<size_t>(home_goals * (max_goals_ + 1) + away_goals)];
    }

    double ScorelineDistribution::total() const {
        double sum = 0.0;
        for (double cell : cells_) sum += cell;
        return sum;
    }

    double ScorelineDistribution::marketProbability(const std::string& market_code) const {
        if (!core::markets::isKnownMarket(market_code)) {
            throw core::ValidationException("Unknown market code: " + market_code);
        }
        double p = 0.0;
        for (int i = 0; i <= max_goals_; ++i) {
            for (int j = 0; j <= max_goals_; ++j) {
                if (core::markets::isWinning(market_code, i, j)) {
                    p += at(i, j);
                }
            }
        }
        return p;
    }

    ScoreProbability ScorelineDistribution::mostLikelyScore() const {
        return topScores(1).front();
    }

    std::vector<ScoreProbability> ScorelineDistribution::topScores(size_t n) const {
        std::vector<ScoreProbability> scores;
        scores.reserve(cells_.size());
        for (int i = 0; i <= max_goals_; ++i) {
            for (int j = 0; j <= max_goals_; ++j) {
                scores.push_back({i, j, at(i, j)});
            }
        }
        // Ties keep the lower scoreline first
        std::stable_sort(scores.begin(), scores.end(),
            [](const ScoreProbability& a, const ScoreProbability& b) { return a.probability > b.probability; });
        if (scores.size() > n) scores.resize(n);
        return scores;
    }

    // --- FixturePrediction ---

    double FixturePrediction::probabilityOf(const std::string& market_code) const {
        if (market_code == "H") return home_win;
        if (market_code == "D") return draw;
        if (market_code == "A") return away_win;
        if (market_code == "1X") return home_or_draw;
        if (market_code == "12") return home_or_away;
        if (market_code == "X2") return draw_or_away;
        if (market_code == "O1.5") return over_15;
        if (market_code == "U1.5") return under_15;
        if (market_code == "O2.5") return over_25;
        if (market_code == "U2.5") return under_25;
        if (market_code == "O3.5") return over_35;
        if (market_code == "U3.5") return under_35;
        if (market_code == "BTTS") return btts_yes;
        if (market_code == "BTTS_NO") return btts_no;
        auto it = combos.find(market_code);
        if (it != combos.end()) return it->second;
        throw core::ValidationException("Unknown market code: " + market_code);
    }

    // --- PoissonModel ---

    PoissonModel::PoissonModel(const std::vector<core::Match>& history,
                               const std::vector<core::Team>& teams,
                               core::PoissonConfig config)
        : config_(config),
          avg_home_goals_(config.default_avg_home_goals),
          avg_away_goals_(config.default_avg_away_goals)
    {
        auto logger = core::logging::getLogger();

        for (const auto& team : teams) {
            known_teams_.insert(team.id);
        }

        std::unordered_map<core::TeamId, GoalTotals> totals;
        long long home_goals = 0;
        long long away_goals = 0;
        int finished = 0;
        for (const auto& match : history) {
            if (!match.isFinished()) continue;
            ++finished;
            home_goals += *match.home_goals;
            away_goals += *match.away_goals;

            GoalTotals& home = totals[match.home_team_id];
            home.scored_home += *match.home_goals;
            home.conceded_home += *match.away_goals;
            ++home.home_matches;

            GoalTotals& away = totals[match.away_team_id];
            away.scored_away += *match.away_goals;
            away.conceded_away += *match.home_goals;
            ++away.away_matches;

            known_teams_.insert(match.home_team_id);
            known_teams_.insert(match.away_team_id);
        }

        if (finished == 0) {
            logger->warn("PoissonModel: no finished matches, using default league averages {:.2f}/{:.2f}.",
                         avg_home_goals_, avg_away_goals_);
            return;
        }

        avg_home_goals_ = static_cast<double>(home_goals) / finished;
        avg_away_goals_ = static_cast<double>(away_goals) / finished;

        for (const auto& entry : totals) {
            const GoalTotals& t = entry.second;
            TeamStrengthProfile profile;
            profile.home_matches = t.home_matches;
            profile.away_matches = t.away_matches;

            // Average over the venues the team has actually played at
            double attack_sum = 0.0;
            double defense_sum = 0.0;
            int venues = 0;
            if (t.home_matches > 0) {
                attack_sum += ratio(static_cast<double>(t.scored_home) / t.home_matches, avg_home_goals_);
                defense_sum += ratio(static_cast<double>(t.conceded_home) / t.home_matches, avg_away_goals_);
                ++venues;
            }
            if (t.away_matches > 0) {
                attack_sum += ratio(static_cast<double>(t.scored_away) / t.away_matches, avg_away_goals_);
                defense_sum += ratio(static_cast<double>(t.conceded_away) / t.away_matches, avg_home_goals_);
                ++venues;
            }
            profile.attack = attack_sum / venues;
            profile.defense = defense_sum / venues;
            strengths_[entry.first] = profile;
        }

        logger->info("PoissonModel fitted on {} matches: league avg {:.3f} home / {:.3f} away, {} rated teams.",
                     finished, avg_home_goals_, avg_away_goals_, strengths_.size());
    }

    bool PoissonModel::hasTeam(core::TeamId team_id) const {
        return known_teams_.count(team_id) > 0;
    }

    void PoissonModel::requireTeam(core::TeamId team_id) const {
        if (!hasTeam(team_id)) {
            throw core::ValidationException("Unknown team id: " + std::to_string(team_id));
        }
    }

    const TeamStrengthProfile& PoissonModel::strength(core::TeamId team_id) const {
        requireTeam(team_id);
        auto it = strengths_.find(team_id);
        return it != strengths_.end() ? it->second : neutral_;
    }

    std::pair<double, double> PoissonModel::expectedGoals(core::TeamId home_team_id, core::TeamId away_team_id) const {
        const TeamStrengthProfile& home = strength(home_team_id);
        const TeamStrengthProfile& away = strength(away_team_id);

        double lambda_home = home.attack * away.defense * avg_home_goals_ + config_.home_advantage;
        double lambda_away = away.attack * home.defense * avg_away_goals_;

        lambda_home = std::max(config_.min_lambda_home, std::min(config_.max_lambda_home, lambda_home));
        lambda_away = std::max(config_.min_lambda_away, std::min(config_.max_lambda_away, lambda_away));
        return {lambda_home, lambda_away};
    }

    ScorelineDistribution PoissonModel::scorelineMatrix(core::TeamId home_team_id, core::TeamId away_team_id) const {
        const auto lambdas = expectedGoals(home_team_id, away_team_id);
        return ScorelineDistribution::build(lambdas.first, lambdas.second, config_.rho,
                                            config_.max_goals, config_.normalization_tolerance);
    }

    FixturePrediction PoissonModel::predict(core::TeamId home_team_id, core::TeamId away_team_id) const {
        const ScorelineDistribution matrix = scorelineMatrix(home_team_id, away_team_id);

        FixturePrediction p;
        p.home_team_id = home_team_id;
        p.away_team_id = away_team_id;
        p.expected_home_goals = matrix.lambdaHome();
        p.expected_away_goals = matrix.lambdaAway();

        p.home_win = matrix.marketProbability("H");
        p.draw = matrix.marketProbability("D");
        p.away_win = matrix.marketProbability("A");

        p.home_or_draw = p.home_win + p.draw;
        p.home_or_away = p.home_win + p.away_win;
        p.draw_or_away = p.draw + p.away_win;

        p.over_15 = matrix.marketProbability("O1.5");
        p.under_15 = 1.0 - p.over_15;
        p.over_25 = matrix.marketProbability("O2.5");
        p.under_25 = 1.0 - p.over_25;
        p.over_35 = matrix.marketProbability("O3.5");
        p.under_35 = 1.0 - p.over_35;

        p.btts_yes = matrix.marketProbability("BTTS");
        p.btts_no = 1.0 - p.btts_yes;

        for (const auto& code : core::markets::comboMarkets()) {
            p.combos[code] = matrix.marketProbability(code);
        }

        p.most_likely_score = matrix.mostLikelyScore();
        p.top_scores = matrix.topScores(5);
        return p;
    }

} // namespace models
