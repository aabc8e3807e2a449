// test_helpers.hpp -- Shared fixtures for building match histories in tests.

#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include "datatypes.hpp"
#include "utils.hpp"
#include "database_manager.hpp"

namespace test_helpers {

inline core::Timestamp day(const std::string& date) {
    return core::utils::parseDate(date);
}

inline core::Timestamp plusDays(core::Timestamp ts, int days) {
    return ts + std::chrono::hours(24 * days);
}

// Finished match with a final score
inline core::Match makeMatch(core::MatchId id, core::LeagueId league_id,
                             core::TeamId home, core::TeamId away,
                             core::Timestamp date, int home_goals, int away_goals) {
    core::Match m;
    m.id = id;
    m.league_id = league_id;
    m.season = 2024;
    m.home_team_id = home;
    m.away_team_id = away;
    m.match_date = date;
    m.status = core::MatchStatus::Finished;
    m.home_goals = home_goals;
    m.away_goals = away_goals;
    return m;
}

// Not-yet-played fixture
inline core::Match makeFixture(core::MatchId id, core::LeagueId league_id,
                               core::TeamId home, core::TeamId away, core::Timestamp date) {
    core::Match m;
    m.id = id;
    m.league_id = league_id;
    m.season = 2024;
    m.home_team_id = home;
    m.away_team_id = away;
    m.match_date = date;
    m.status = core::MatchStatus::NotStarted;
    return m;
}

inline core::Team makeTeam(core::TeamId id, core::LeagueId league_id, const std::string& name) {
    core::Team t;
    t.id = id;
    t.league_id = league_id;
    t.name = name;
    return t;
}

// Four-team league 1 (teams 1..4) where team 1 is clearly strongest and team 4 weakest.
// Two rounds of a double round robin, one match day per week from 2024-01-06.
inline std::vector<core::Match> fourTeamHistory() {
    const core::Timestamp start = day("2024-01-06");
    // {home, away, home_goals, away_goals}
    const int fixtures[][4] = {
        {1, 2, 2, 0}, {3, 4, 1, 1},
        {2, 3, 1, 0}, {4, 1, 0, 3},
        {1, 3, 3, 1}, {2, 4, 2, 1},
        {2, 1, 1, 2}, {4, 3, 0, 2},
        {3, 2, 1, 1}, {1, 4, 4, 0},
        {3, 1, 0, 1}, {4, 2, 1, 2},
    };
    std::vector<core::Match> history;
    core::MatchId id = 100;
    for (size_t i = 0; i < sizeof(fixtures) / sizeof(fixtures[0]); ++i) {
        const auto& f = fixtures[i];
        history.push_back(makeMatch(id++, 1, f[0], f[1], plusDays(start, static_cast<int>(i / 2) * 7), f[2], f[3]));
    }
    return history;
}

inline std::vector<core::Team> fourTeams() {
    return {
        makeTeam(1, 1, "Northside"),
        makeTeam(2, 1, "Riverside"),
        makeTeam(3, 1, "Hillcrest"),
        makeTeam(4, 1, "Lowfield"),
    };
}

// Connected in-memory database with the schema created
inline std::unique_ptr<data::DatabaseManager> makeMemoryDb() {
    auto db = std::make_unique<data::DatabaseManager>(":memory:");
    if (!db->connect() || !db->initializeSchema()) {
        return nullptr;
    }
    return db;
}

} // namespace test_helpers
