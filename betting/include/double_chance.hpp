#pragma once

#include <string>

namespace betting {

    struct DoubleChanceRecommendation {
        double home_or_draw = 0.0; // 1X
        double home_or_away = 0.0; // 12
        double draw_or_away = 0.0; // X2
        std::string market;        // Most likely of 1X / 12 / X2
        double confidence = 0.0;
        bool recommended = false;
        std::string risk_level;    // "Low" or "Medium" when recommended
        std::string reasoning;
    };

    // Picks the strongest double-chance market from 1X2 probabilities.
    // Inputs are renormalized when they drift more than 1% from summing to 1.
    // Throws ValidationException for negative or all-zero probabilities.
    DoubleChanceRecommendation recommendDoubleChance(double home_win, double draw, double away_win,
                                                     double min_confidence = 0.70);

} // namespace betting
