#pragma once

#include <memory>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "config.hpp"
#include "match_history_store.hpp"
#include "statistics_cache.hpp"
#include "match_features.hpp"
#include "poisson_model.hpp"
#include "elo_tracker.hpp"

namespace models {

    // Fixture that could not be priced, with the reason
    struct SkippedFixture {
        core::MatchId match_id = 0;
        std::string reason;
    };

    struct BatchPrediction {
        std::vector<FixturePrediction> predictions; // Input order, skipped fixtures removed
        std::vector<SkippedFixture> skipped;
    };

    // --- Model Snapshot ---
    // Immutable bundle of the statistics cache, the fitted Poisson model and the Elo
    // ratings, all built from one bulk read of the match history. Callers hold a
    // shared handle; a newer history means building a new snapshot.
    class ModelSnapshot {
        // Restricts construction to build()/fromHistory() while still allowing make_shared
        struct PrivateTag {
            explicit PrivateTag() = default;
        };

    public:
        ModelSnapshot(PrivateTag, std::vector<core::Match> history, const std::vector<core::Team>& teams,
                      const core::EngineConfig& config);

        static std::shared_ptr<const ModelSnapshot> build(data::MatchHistoryStore& store,
                                                          const core::EngineConfig& config);

        static std::shared_ptr<const ModelSnapshot> fromHistory(std::vector<core::Match> history,
                                                                const std::vector<core::Team>& teams,
                                                                const core::EngineConfig& config);

        ModelSnapshot(const ModelSnapshot&) = delete;
        ModelSnapshot& operator=(const ModelSnapshot&) = delete;

        // Markets for the fixture, with Elo ratings taken as of its kick-off.
        // Throws ValidationException (unknown team) or NumericalException.
        FixturePrediction predictFixture(const core::Match& fixture) const;

        // Shards fixtures across worker threads; numerical failures skip only that fixture
        BatchPrediction predictFixtures(const std::vector<core::Match>& fixtures, unsigned workers = 0) const;

        features::MatchFeatures features(const core::Match& fixture) const;

        const features::StatisticsCache& statistics() const { return statistics_; }
        const PoissonModel& poisson() const { return poisson_; }
        const EloTracker& elo() const { return elo_; }
        const core::EngineConfig& config() const { return config_; }
        core::Timestamp builtAt() const { return built_at_; }

    private:
        core::EngineConfig config_;
        EloTracker elo_;
        PoissonModel poisson_;
        features::StatisticsCache statistics_;
        core::Timestamp built_at_;
    };

} // namespace models
