#pragma once

#include <vector>
#include <optional>

#include "datatypes.hpp"

namespace data {

    // --- Match History Store Interface ---
    // Read-only source of matches, teams and leagues consumed by the prediction core.
    // Batch jobs fetch once through this interface and then work from memory.
    class MatchHistoryStore {
    public:
        virtual ~MatchHistoryStore() = default;

        // Finished (FT, scored) matches ordered by date then id.
        // 'before' is exclusive; an empty league list means all leagues.
        virtual std::vector<core::Match> listFinishedMatches(
            std::optional<core::Timestamp> before = std::nullopt,
            const std::vector<core::LeagueId>& league_ids = {}) = 0;

        // Not-yet-played fixtures (NS) in [from, to), ordered by date
        virtual std::vector<core::Match> listScheduledMatches(
            std::optional<core::Timestamp> from = std::nullopt,
            std::optional<core::Timestamp> to = std::nullopt) = 0;

        virtual std::vector<core::Team> listTeams(core::LeagueId league_id) = 0;
        virtual std::vector<core::Team> listAllTeams() = 0;
        virtual std::vector<core::League> listLeagues() = 0;

        virtual std::optional<core::Match> getMatch(core::MatchId match_id) = 0;
    };

} // namespace data
