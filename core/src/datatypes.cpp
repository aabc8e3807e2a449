#include "datatypes.hpp"
#include "exceptions.hpp"
#include <algorithm>
#include <cctype>

namespace core {

    std::string toString(MatchStatus status) {
        switch (status) {
            case MatchStatus::NotStarted:     return "NS";
            case MatchStatus::Live:           return "LIVE";
            case MatchStatus::HalfTime:       return "HT";
            case MatchStatus::Finished:       return "FT";
            case MatchStatus::AfterExtraTime: return "AET";
            case MatchStatus::Penalties:      return "PEN";
            case MatchStatus::Postponed:      return "PST";
            case MatchStatus::Cancelled:      return "CANC";
            case MatchStatus::Abandoned:      return "ABD";
        }
        return "NS";
    }

    MatchStatus matchStatusFromString(const std::string& code) {
        std::string upper = code;
        std::transform(upper.begin(), upper.end(), upper.begin(),
            [](unsigned char c){ return static_cast<char>(std::toupper(c)); });

        if (upper == "NS" || upper == "TBD") return MatchStatus::NotStarted;
        if (upper == "LIVE" || upper == "1H" || upper == "2H" || upper == "ET") return MatchStatus::Live;
        if (upper == "HT") return MatchStatus::HalfTime;
        if (upper == "FT") return MatchStatus::Finished;
        if (upper == "AET") return MatchStatus::AfterExtraTime;
        if (upper == "PEN") return MatchStatus::Penalties;
        if (upper == "PST") return MatchStatus::Postponed;
        if (upper == "CANC") return MatchStatus::Cancelled;
        if (upper == "ABD") return MatchStatus::Abandoned;
        throw ValidationException("Unknown match status code: " + code);
    }

    std::string toString(Venue venue) {
        switch (venue) {
            case Venue::All:  return "all";
            case Venue::Home: return "home";
            case Venue::Away: return "away";
        }
        return "all";
    }

    std::string toString(Outcome outcome) {
        switch (outcome) {
            case Outcome::HomeWin: return "H";
            case Outcome::Draw:    return "D";
            case Outcome::AwayWin: return "A";
        }
        return "D";
    }

    Outcome outcomeFromScore(int home_goals, int away_goals) {
        if (home_goals > away_goals) return Outcome::HomeWin;
        if (home_goals < away_goals) return Outcome::AwayWin;
        return Outcome::Draw;
    }

    std::string toString(ValueTier tier) {
        switch (tier) {
            case ValueTier::High:    return "HIGH";
            case ValueTier::Medium:  return "MEDIUM";
            case ValueTier::Neutral: return "NEUTRAL";
        }
        return "NEUTRAL";
    }

    ValueTier valueTierFromString(const std::string& tier) {
        if (tier == "HIGH") return ValueTier::High;
        if (tier == "MEDIUM") return ValueTier::Medium;
        if (tier == "NEUTRAL") return ValueTier::Neutral;
        throw ValidationException("Unknown value tier: " + tier);
    }

    std::string toString(RiskTier tier) {
        switch (tier) {
            case RiskTier::None:   return "NONE";
            case RiskTier::Low:    return "LOW";
            case RiskTier::Medium: return "MEDIUM";
            case RiskTier::High:   return "HIGH";
        }
        return "NONE";
    }

    std::string toString(BetStatus status) {
        switch (status) {
            case BetStatus::Pending: return "PENDING";
            case BetStatus::Won:     return "WON";
            case BetStatus::Lost:    return "LOST";
        }
        return "PENDING";
    }

    BetStatus betStatusFromString(const std::string& status) {
        if (status == "PENDING") return BetStatus::Pending;
        if (status == "WON") return BetStatus::Won;
        if (status == "LOST") return BetStatus::Lost;
        throw ValidationException("Unknown bet status: " + status);
    }

} // namespace core
