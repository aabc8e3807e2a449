#pragma once

#include <string>
#include <vector>

namespace core {
namespace markets {

    // Market codes understood by the model, the value analyzer and the ledger:
    //   1X2:           H, D, A
    //   Double chance: 1X, 12, X2
    //   Totals:        O1.5, U1.5, O2.5, U2.5, O3.5, U3.5
    //   Both to score: BTTS, BTTS_NO
    //   Combos:        1_over_25, 2_over_25, x_under_25, 1_btts, 2_btts, x_btts, gg_over_25
    const std::vector<std::string>& allMarkets();
    const std::vector<std::string>& comboMarkets();

    bool isKnownMarket(const std::string& code);

    // Human readable name ("Home Win", "Home Win & Over 2.5", ...). Throws ValidationException.
    std::string marketName(const std::string& code);

    // Whether a bet on 'code' wins with this final score. Throws ValidationException.
    bool isWinning(const std::string& code, int home_goals, int away_goals);

} // namespace markets
} // namespace core
