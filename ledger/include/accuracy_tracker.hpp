#pragma once

#include <optional>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "logging.hpp"
#include "database_manager.hpp"
#include "poisson_model.hpp"

namespace ledger {

    constexpr const char* kDefaultModelVersion = "poisson-dc-v1";

    struct MarketAccuracy {
        int correct = 0;
        int total = 0;

        double rate() const { return total > 0 ? static_cast<double>(correct) / total : 0.0; }
    };

    struct AccuracyStats {
        int total_predictions = 0;
        MarketAccuracy result_1x2;
        MarketAccuracy btts;
        MarketAccuracy over_15;
        MarketAccuracy over_25;
        MarketAccuracy over_35;

        void logStats() const {
            auto logger = core::logging::getLogger();
            logger->info("--- Prediction Accuracy ({} evaluated) ---", total_predictions);
            logger->info("1X2:      {:.1f}% ({}/{})", result_1x2.rate() * 100.0, result_1x2.correct, result_1x2.total);
            logger->info("BTTS:     {:.1f}% ({}/{})", btts.rate() * 100.0, btts.correct, btts.total);
            logger->info("O/U 1.5:  {:.1f}% ({}/{})", over_15.rate() * 100.0, over_15.correct, over_15.total);
            logger->info("O/U 2.5:  {:.1f}% ({}/{})", over_25.rate() * 100.0, over_25.correct, over_25.total);
            logger->info("O/U 3.5:  {:.1f}% ({}/{})", over_35.rate() * 100.0, over_35.correct, over_35.total);
            logger->info("------------------------------------------");
        }
    };

    // 1X2 hit rate for predictions whose confidence falls in [lower, upper)
    struct ConfidenceBucket {
        std::string label;
        double lower = 0.0;
        double upper = 0.0;
        int correct = 0;
        int total = 0;

        double accuracy() const { return total > 0 ? static_cast<double>(correct) / total : 0.0; }
    };

    // Confidence rounded to the nearest 10% against the observed 1X2 hit rate
    struct CalibrationPoint {
        double expected = 0.0;
        double actual = 0.0;
        int sample_size = 0;
        double error = 0.0; // |expected - actual|
    };

    struct EvaluationSummary {
        int evaluated = 0;
        int already_evaluated = 0; // Scored by another run in the meantime
        int invalid = 0;           // Stored pick could not be evaluated
    };

    // --- Accuracy Tracker ---
    // Records the model's pre-match picks and scores them against final results.
    class AccuracyTracker {
    public:
        explicit AccuracyTracker(data::DatabaseManager& db, std::string model_version = kDefaultModelVersion);

        // Stores one record per fixture. A fixture without an id is rejected with ValidationException.
        // Returns false when the store write failed.
        bool recordPredictions(const std::vector<models::FixturePrediction>& predictions);

        // Scores every stored prediction whose match is now FT with a score
        EvaluationSummary updateFinished();

        AccuracyStats accuracyStats();

        // <40%, 40-50%, 50-60%, 60-70%, 70%+
        std::vector<ConfidenceBucket> accuracyByConfidence();

        // Ascending by expected confidence
        std::vector<CalibrationPoint> calibration();

        const std::string& modelVersion() const { return model_version_; }

        // Picks for 'prediction': most probable 1X2 outcome, and the likelier side of each binary market
        static core::PredictionRecord makeRecord(const models::FixturePrediction& prediction,
                                                 const std::string& model_version, core::Timestamp predicted_at);

        // Outcome fields for 'record' given the final score; does not touch storage.
        // Throws ValidationException for an unknown stored pick.
        static core::PredictionRecord evaluate(const core::PredictionRecord& record, int home_goals, int away_goals,
                                               core::Timestamp evaluated_at);

    private:
        data::DatabaseManager& db_;
        std::string model_version_;
    };

} // namespace ledger
