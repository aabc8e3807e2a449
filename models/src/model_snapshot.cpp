#include "model_snapshot.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include <algorithm>
#include <future>
#include <iterator>
#include <thread>

namespace models {

    ModelSnapshot::ModelSnapshot(PrivateTag, std::vector<core::Match> history, const std::vector<core::Team>& teams,
                                 const core::EngineConfig& config)
        : config_(config),
          elo_(EloTracker::replayPartitioned(history, config.elo)),
          poisson_(history, teams, config.poisson),
          statistics_(std::move(history), teams, config.statistics),
          built_at_(std::chrono::system_clock::now())
    {
    }

    std::shared_ptr<const ModelSnapshot> ModelSnapshot::build(data::MatchHistoryStore& store,
                                                              const core::EngineConfig& config) {
        auto logger = core::logging::getLogger();
        logger->info("Building model snapshot from match store...");

        std::vector<core::Match> history = store.listFinishedMatches();
        std::vector<core::Team> teams = store.listAllTeams();
        logger->info("Loaded {} finished matches and {} teams.", history.size(), teams.size());

        return fromHistory(std::move(history), teams, config);
    }

    std::shared_ptr<const ModelSnapshot> ModelSnapshot::fromHistory(std::vector<core::Match> history,
                                                                    const std::vector<core::Team>& teams,
                                                                    const core::EngineConfig& config) {
        auto snapshot = std::make_shared<const ModelSnapshot>(PrivateTag{}, std::move(history), teams, config);
        core::logging::getLogger()->info("Model snapshot ready: {} matches, {} rated teams.",
                                         snapshot->statistics().matches().size(), snapshot->elo().teamCount());
        return snapshot;
    }

    FixturePrediction ModelSnapshot::predictFixture(const core::Match& fixture) const {
        FixturePrediction prediction = poisson_.predict(fixture.home_team_id, fixture.away_team_id);
        prediction.match_id = fixture.id;
        prediction.home_elo = elo_.ratingAsOf(fixture.home_team_id, fixture.match_date);
        prediction.away_elo = elo_.ratingAsOf(fixture.away_team_id, fixture.match_date);
        return prediction;
    }

    features::MatchFeatures ModelSnapshot::features(const core::Match& fixture) const {
        return features::buildMatchFeatures(statistics_, fixture,
                                            elo_.ratingAsOf(fixture.home_team_id, fixture.match_date),
                                            elo_.ratingAsOf(fixture.away_team_id, fixture.match_date));
    }

    BatchPrediction ModelSnapshot::predictFixtures(const std::vector<core::Match>& fixtures, unsigned workers) const {
        auto logger = core::logging::getLogger();
        BatchPrediction batch;
        if (fixtures.empty()) {
            return batch;
        }

        if (workers == 0) {
            workers = std::max(1u, std::thread::hardware_concurrency());
        }
        const size_t shard_count = std::min<size_t>(workers, fixtures.size());
        const size_t shard_size = (fixtures.size() + shard_count - 1) / shard_count;

        struct ShardResult {
            std::vector<std::pair<size_t, FixturePrediction>> predictions;
            std::vector<std::pair<size_t, SkippedFixture>> skipped;
        };

        std::vector<std::future<ShardResult>> futures;
        for (size_t begin = 0; begin < fixtures.size(); begin += shard_size) {
            const size_t end = std::min(begin + shard_size, fixtures.size());
            futures.push_back(std::async(std::launch::async, [this, &fixtures, begin, end]() {
                ShardResult result;
                for (size_t i = begin; i < end; ++i) {
                    try {
                        result.predictions.emplace_back(i, predictFixture(fixtures[i]));
                    } catch (const core::NumericalException& e) {
                        result.skipped.emplace_back(i, SkippedFixture{fixtures[i].id, e.what()});
                    }
                }
                return result;
            }));
        }

        std::vector<std::pair<size_t, FixturePrediction>> predictions;
        std::vector<std::pair<size_t, SkippedFixture>> skipped;
        for (auto& future : futures) {
            ShardResult result = future.get(); // Rethrows ValidationException from a worker
            std::move(result.predictions.begin(), result.predictions.end(), std::back_inserter(predictions));
            std::move(result.skipped.begin(), result.skipped.end(), std::back_inserter(skipped));
        }

        // Shards are contiguous and joined in order, so indices are already ascending
        batch.predictions.reserve(predictions.size());
        for (auto& entry : predictions) batch.predictions.push_back(std::move(entry.second));
        for (auto& entry : skipped) {
            logger->warn("Skipped fixture {}: {}", entry.second.match_id, entry.second.reason);
            batch.skipped.push_back(std::move(entry.second));
        }

        logger->info("Predicted {} fixtures across {} shards ({} skipped).",
                     batch.predictions.size(), futures.size(), batch.skipped.size());
        return batch;
    }

} // namespace models
