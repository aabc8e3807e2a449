#include "double_chance.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

namespace betting {

    DoubleChanceRecommendation recommendDoubleChance(double home_win, double draw, double away_win,
                                                     double min_confidence) {
        if (home_win < 0.0 || draw < 0.0 || away_win < 0.0) {
            throw core::ValidationException("1X2 probabilities must be non-negative");
        }
        const double total = home_win + draw + away_win;
        if (total <= 0.0) {
            throw core::ValidationException("1X2 probabilities sum to zero");
        }
        if (total < 0.99 || total > 1.01) {
            home_win /= total;
            draw /= total;
            away_win /= total;
        }

        DoubleChanceRecommendation rec;
        rec.home_or_draw = home_win + draw;
        rec.home_or_away = home_win + away_win;
        rec.draw_or_away = draw + away_win;

        rec.market = "1X";
        rec.confidence = rec.home_or_draw;
        rec.reasoning = fmt::format("Home({:.2f}%) + Draw({:.2f}%) = {:.2f}%",
                                    home_win * 100.0, draw * 100.0, rec.home_or_draw * 100.0);
        if (rec.home_or_away > rec.confidence) {
            rec.market = "12";
            rec.confidence = rec.home_or_away;
            rec.reasoning = fmt::format("Home({:.2f}%) + Away({:.2f}%) = {:.2f}%",
                                        home_win * 100.0, away_win * 100.0, rec.home_or_away * 100.0);
        }
        if (rec.draw_or_away > rec.confidence) {
            rec.market = "X2";
            rec.confidence = rec.draw_or_away;
            rec.reasoning = fmt::format("Draw({:.2f}%) + Away({:.2f}%) = {:.2f}%",
                                        draw * 100.0, away_win * 100.0, rec.draw_or_away * 100.0);
        }

        if (rec.confidence >= min_confidence) {
            rec.recommended = true;
            rec.risk_level = rec.confidence >= 0.80 ? "Low" : "Medium";
        } else {
            rec.recommended = false;
            rec.reasoning = fmt::format("Confidence {:.1f}% below threshold {:.0f}%",
                                        rec.confidence * 100.0, min_confidence * 100.0);
        }
        return rec;
    }

} // namespace betting
