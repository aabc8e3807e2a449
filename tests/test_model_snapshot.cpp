// test_model_snapshot.cpp -- Snapshot assembly and batch fixture pricing.

#include <gtest/gtest.h>

#include "model_snapshot.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <type_traits>
#include <vector>

using test_helpers::day;
using test_helpers::makeFixture;

class ModelSnapshotTest : public ::testing::Test {
protected:
    void SetUp() override {
        snapshot = models::ModelSnapshot::fromHistory(test_helpers::fourTeamHistory(),
                                                      test_helpers::fourTeams(), config);
    }

    core::EngineConfig config;
    std::shared_ptr<const models::ModelSnapshot> snapshot;
};

TEST_F(ModelSnapshotTest, ComponentsShareOneHistory) {
    EXPECT_EQ(snapshot->statistics().matches().size(), 12u);
    EXPECT_EQ(snapshot->elo().matchesProcessed(), 12u);
    EXPECT_EQ(snapshot->elo().teamCount(), 4u);
    EXPECT_TRUE(snapshot->poisson().hasTeam(4));
}

TEST_F(ModelSnapshotTest, FactoryHandsOutSoleOwnership) {
    EXPECT_EQ(snapshot.use_count(), 1);
    const auto rebuilt = models::ModelSnapshot::fromHistory(test_helpers::fourTeamHistory(),
                                                            test_helpers::fourTeams(), config);
    EXPECT_NE(rebuilt.get(), snapshot.get());
    EXPECT_EQ(rebuilt.use_count(), 1);
    EXPECT_FALSE(std::is_copy_constructible<models::ModelSnapshot>::value);
}

TEST_F(ModelSnapshotTest, FixturePredictionCarriesPointInTimeElo) {
    const core::Match fixture = makeFixture(900, 1, 1, 4, day("2024-02-17"));
    const auto p = snapshot->predictFixture(fixture);

    EXPECT_EQ(p.match_id, 900);
    EXPECT_EQ(p.home_team_id, 1);
    EXPECT_DOUBLE_EQ(p.home_elo, snapshot->elo().ratingAsOf(1, fixture.match_date));
    EXPECT_GT(p.home_elo, p.away_elo);
    EXPECT_NEAR(p.home_win + p.draw + p.away_win, 1.0, 1e-6);

    // Before any match was played both sides are at the initial rating
    const auto early = snapshot->predictFixture(makeFixture(901, 1, 1, 4, day("2024-01-01")));
    EXPECT_DOUBLE_EQ(early.home_elo, config.elo.initial_rating);
    EXPECT_DOUBLE_EQ(early.away_elo, config.elo.initial_rating);
}

TEST_F(ModelSnapshotTest, FeaturesUseSameRatings) {
    const core::Match fixture = makeFixture(900, 1, 2, 3, day("2024-02-17"));
    const auto f = snapshot->features(fixture);
    const auto p = snapshot->predictFixture(fixture);
    EXPECT_DOUBLE_EQ(f.home_elo, p.home_elo);
    EXPECT_DOUBLE_EQ(f.away_elo, p.away_elo);
    EXPECT_EQ(f.match_id, 900);
}

TEST_F(ModelSnapshotTest, BatchKeepsInputOrder) {
    const std::vector<core::Match> fixtures = {
        makeFixture(901, 1, 1, 2, day("2024-02-17")),
        makeFixture(902, 1, 3, 4, day("2024-02-17")),
        makeFixture(903, 1, 2, 4, day("2024-02-24")),
        makeFixture(904, 1, 4, 1, day("2024-02-24")),
        makeFixture(905, 1, 3, 1, day("2024-03-02")),
    };
    const auto batch = snapshot->predictFixtures(fixtures, 2);

    ASSERT_EQ(batch.predictions.size(), fixtures.size());
    EXPECT_TRUE(batch.skipped.empty());
    for (size_t i = 0; i < fixtures.size(); ++i) {
        EXPECT_EQ(batch.predictions[i].match_id, fixtures[i].id);
    }
    // Same answer as the single-fixture path
    const auto single = snapshot->predictFixture(fixtures[3]);
    EXPECT_DOUBLE_EQ(batch.predictions[3].home_win, single.home_win);
}

TEST_F(ModelSnapshotTest, EmptyBatch) {
    const auto batch = snapshot->predictFixtures({});
    EXPECT_TRUE(batch.predictions.empty());
    EXPECT_TRUE(batch.skipped.empty());
}

TEST_F(ModelSnapshotTest, UnknownTeamAbortsBatch) {
    const std::vector<core::Match> fixtures = {
        makeFixture(901, 1, 1, 2, day("2024-02-17")),
        makeFixture(902, 1, 3, 99, day("2024-02-17")),
    };
    EXPECT_THROW(snapshot->predictFixtures(fixtures, 2), core::ValidationException);
}

TEST(ModelSnapshotNumericalTest, NumericalFailuresSkipOnlyThoseFixtures) {
    // A correlation this strong turns the low-score cells negative for every fixture
    core::EngineConfig config;
    config.poisson.rho = 20.0;
    const auto snapshot = models::ModelSnapshot::fromHistory(test_helpers::fourTeamHistory(),
                                                             test_helpers::fourTeams(), config);
    const std::vector<core::Match> fixtures = {
        makeFixture(901, 1, 1, 2, day("2024-02-17")),
        makeFixture(902, 1, 3, 4, day("2024-02-17")),
    };

    const auto batch = snapshot->predictFixtures(fixtures);
    EXPECT_TRUE(batch.predictions.empty());
    ASSERT_EQ(batch.skipped.size(), 2u);
    EXPECT_EQ(batch.skipped[0].match_id, 901);
    EXPECT_FALSE(batch.skipped[0].reason.empty());
    EXPECT_THROW(snapshot->predictFixture(fixtures[0]), core::NumericalException);
}

TEST(ModelSnapshotStoreTest, BuildFromStoreMatchesInMemoryHistory) {
    auto db = test_helpers::makeMemoryDb();
    ASSERT_NE(db, nullptr);
    core::League league;
    league.id = 1;
    league.name = "Test League";
    ASSERT_TRUE(db->saveLeagues({league}));
    ASSERT_TRUE(db->saveTeams(test_helpers::fourTeams()));
    ASSERT_TRUE(db->saveMatches(test_helpers::fourTeamHistory()));

    core::EngineConfig config;
    const auto from_store = models::ModelSnapshot::build(*db, config);
    const auto from_memory = models::ModelSnapshot::fromHistory(test_helpers::fourTeamHistory(),
                                                                test_helpers::fourTeams(), config);

    const core::Match fixture = makeFixture(900, 1, 2, 3, day("2024-02-17"));
    EXPECT_NEAR(from_store->predictFixture(fixture).home_win, from_memory->predictFixture(fixture).home_win, 1e-12);
    EXPECT_DOUBLE_EQ(from_store->elo().currentRating(1), from_memory->elo().currentRating(1));
}
