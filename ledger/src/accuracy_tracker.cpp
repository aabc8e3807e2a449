#include "accuracy_tracker.hpp"
#include "markets.hpp"
#include "exceptions.hpp"
#include <chrono>
#include <cmath>
#include <map>
#include <utility>

namespace ledger {

    AccuracyTracker::AccuracyTracker(data::DatabaseManager& db, std::string model_version)
        : db_(db), model_version_(std::move(model_version))
    {
        if (model_version_.empty()) {
            throw core::ValidationException("Model version must not be empty.");
        }
    }

    core::PredictionRecord AccuracyTracker::makeRecord(const models::FixturePrediction& prediction,
                                                       const std::string& model_version,
                                                       core::Timestamp predicted_at) {
        core::PredictionRecord record;
        record.match_id = prediction.match_id;
        record.model_version = model_version;
        record.home_win = prediction.home_win;
        record.draw = prediction.draw;
        record.away_win = prediction.away_win;
        record.predicted_at = predicted_at;

        // Ties go to the home side, then the draw
        record.predicted_result = "H";
        record.confidence = prediction.home_win;
        if (prediction.draw > record.confidence) {
            record.predicted_result = "D";
            record.confidence = prediction.draw;
        }
        if (prediction.away_win > record.confidence) {
            record.predicted_result = "A";
            record.confidence = prediction.away_win;
        }

        record.btts_pick = prediction.btts_yes > 0.5 ? "BTTS" : "BTTS_NO";
        record.over_15_pick = prediction.over_15 > 0.5 ? "O1.5" : "U1.5";
        record.over_25_pick = prediction.over_25 > 0.5 ? "O2.5" : "U2.5";
        record.over_35_pick = prediction.over_35 > 0.5 ? "O3.5" : "U3.5";
        return record;
    }

    core::PredictionRecord AccuracyTracker::evaluate(const core::PredictionRecord& record, int home_goals,
                                                     int away_goals, core::Timestamp evaluated_at) {
        core::PredictionRecord evaluated = record;
        evaluated.actual_result = core::toString(core::outcomeFromScore(home_goals, away_goals));
        evaluated.is_correct = core::markets::isWinning(record.predicted_result, home_goals, away_goals);
        evaluated.btts_correct = core::markets::isWinning(record.btts_pick, home_goals, away_goals);
        evaluated.over_15_correct = core::markets::isWinning(record.over_15_pick, home_goals, away_goals);
        evaluated.over_25_correct = core::markets::isWinning(record.over_25_pick, home_goals, away_goals);
        evaluated.over_35_correct = core::markets::isWinning(record.over_35_pick, home_goals, away_goals);
        evaluated.evaluated_at = evaluated_at;
        return evaluated;
    }

    bool AccuracyTracker::recordPredictions(const std::vector<models::FixturePrediction>& predictions) {
        auto logger = core::logging::getLogger();
        const core::Timestamp now = std::chrono::system_clock::now();

        std::vector<core::PredictionRecord> records;
        records.reserve(predictions.size());
        for (const auto& prediction : predictions) {
            if (prediction.match_id <= 0) {
                throw core::ValidationException("Cannot record a prediction without a match id.");
            }
            records.push_back(makeRecord(prediction, model_version_, now));
        }

        if (!db_.savePredictions(records)) {
            logger->error("Failed to record {} predictions for model {}.", records.size(), model_version_);
            return false;
        }
        logger->info("Recorded {} predictions for model {}.", records.size(), model_version_);
        return true;
    }

    EvaluationSummary AccuracyTracker::updateFinished() {
        auto logger = core::logging::getLogger();
        EvaluationSummary summary;

        const auto candidates = db_.queryEvaluablePredictions();
        logger->info("Evaluating {} predictions with finished matches...", candidates.size());

        const core::Timestamp now = std::chrono::system_clock::now();
        for (const auto& entry : candidates) {
            const core::PredictionRecord& record = entry.first;
            const core::Match& match = entry.second;

            core::PredictionRecord evaluated;
            try {
                evaluated = evaluate(record, *match.home_goals, *match.away_goals, now);
            } catch (const core::ValidationException& e) {
                logger->warn("Prediction {} cannot be evaluated, skipping: {}", record.id, e.what());
                ++summary.invalid;
                continue;
            }

            if (!db_.applyPredictionOutcome(evaluated)) {
                logger->debug("Prediction {} was already evaluated.", record.id);
                ++summary.already_evaluated;
                continue;
            }
            ++summary.evaluated;
        }

        logger->info("Evaluation complete: {} evaluated, {} already done, {} invalid.",
                     summary.evaluated, summary.already_evaluated, summary.invalid);
        return summary;
    }

    AccuracyStats AccuracyTracker::accuracyStats() {
        AccuracyStats stats;
        auto tally = [](MarketAccuracy& acc, const std::optional<bool>& correct) {
            if (!correct) return;
            ++acc.total;
            if (*correct) ++acc.correct;
        };

        for (const auto& p : db_.queryEvaluatedPredictions(model_version_)) {
            ++stats.total_predictions;
            tally(stats.result_1x2, p.is_correct);
            tally(stats.btts, p.btts_correct);
            tally(stats.over_15, p.over_15_correct);
            tally(stats.over_25, p.over_25_correct);
            tally(stats.over_35, p.over_35_correct);
        }
        return stats;
    }

    std::vector<ConfidenceBucket> AccuracyTracker::accuracyByConfidence() {
        std::vector<ConfidenceBucket> buckets = {
            {"<40%", 0.0, 0.4},
            {"40-50%", 0.4, 0.5},
            {"50-60%", 0.5, 0.6},
            {"60-70%", 0.6, 0.7},
            {"70%+", 0.7, 1.0 + 1e-9},
        };

        for (const auto& p : db_.queryEvaluatedPredictions(model_version_)) {
            if (!p.is_correct) continue;
            for (auto& bucket : buckets) {
                if (p.confidence >= bucket.lower && p.confidence < bucket.upper) {
                    ++bucket.total;
                    if (*p.is_correct) ++bucket.correct;
                    break;
                }
            }
        }
        return buckets;
    }

    std::vector<CalibrationPoint> AccuracyTracker::calibration() {
        // Keyed by confidence in tenths so buckets compare exactly
        std::map<int, std::pair<int, int>> tenths; // -> {correct, total}
        for (const auto& p : db_.queryEvaluatedPredictions(model_version_)) {
            if (!p.is_correct) continue;
            const int key = static_cast<int>(std::lround(p.confidence * 10.0));
            auto& counts = tenths[key];
            ++counts.second;
            if (*p.is_correct) ++counts.first;
        }

        std::vector<CalibrationPoint> points;
        for (const auto& entry : tenths) {
            CalibrationPoint point;
            point.expected = entry.first / 10.0;
            point.sample_size = entry.second.second;
            point.actual = static_cast<double>(entry.second.first) / entry.second.second;
            point.error = std::abs(point.expected - point.actual);
            points.push_back(point);
        }
        return points;
    }

} // namespace ledger
