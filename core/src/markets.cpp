#include "markets.hpp"
#include "exceptions.hpp"
#include <functional>
#include <map>

namespace core {
namespace markets {

    namespace {

        using Rule = std::function<bool(int, int)>;

        struct MarketDef {
            std::string name;
            Rule wins;
        };

        const std::map<std::string, MarketDef>& registry() {
            static const std::map<std::string, MarketDef> defs = {
                {"H",          {"Home Win",             [](int h, int a) { return h > a; }}},
                {"D",          {"Draw",                 [](int h, int a) { return h == a; }}},
                {"A",          {"Away Win",             [](int h, int a) { return h < a; }}},
                {"1X",         {"Home or Draw",         [](int h, int a) { return h >= a; }}},
                {"12",         {"Home or Away",         [](int h, int a) { return h != a; }}},
                {"X2",         {"Draw or Away",         [](int h, int a) { return h <= a; }}},
                {"O1.5",       {"Over 1.5 Goals",       [](int h, int a) { return h + a >= 2; }}},
                {"U1.5",       {"Under 1.5 Goals",      [](int h, int a) { return h + a <= 1; }}},
                {"O2.5",       {"Over 2.5 Goals",       [](int h, int a) { return h + a >= 3; }}},
                {"U2.5",       {"Under 2.5 Goals",      [](int h, int a) { return h + a <= 2; }}},
                {"O3.5",       {"Over 3.5 Goals",       [](int h, int a) { return h + a >= 4; }}},
                {"U3.5",       {"Under 3.5 Goals",      [](int h, int a) { return h + a <= 3; }}},
                {"BTTS",       {"Both Teams To Score",  [](int h, int a) { return h > 0 && a > 0; }}},
                {"BTTS_NO",    {"Not Both Teams To Score", [](int h, int a) { return h == 0 || a == 0; }}},
                {"1_over_25",  {"Home Win & Over 2.5",  [](int h, int a) { return h > a && h + a >= 3; }}},
                {"2_over_25",  {"Away Win & Over 2.5",  [](int h, int a) { return h < a && h + a >= 3; }}},
                {"x_under_25", {"Draw & Under 2.5",     [](int h, int a) { return h == a && h + a <= 2; }}},
                {"1_btts",     {"Home Win & BTTS",      [](int h, int a) { return h > a && a > 0; }}},
                {"2_btts",     {"Away Win & BTTS",      [](int h, int a) { return h < a && h > 0; }}},
                {"x_btts",     {"Draw & BTTS",          [](int h, int a) { return h == a && h > 0; }}},
                {"gg_over_25", {"BTTS & Over 2.5",      [](int h, int a) { return h > 0 && a > 0 && h + a >= 3; }}},
            };
            return defs;
        }

        const MarketDef& lookup(const std::string& code) {
            auto it = registry().find(code);
            if (it == registry().end()) {
                throw ValidationException("Unknown market code: " + code);
            }
            return it->second;
        }

    } // end anonymous namespace

    const std::vector<std::string>& allMarkets() {
        static const std::vector<std::string> codes = {
            "H", "D", "A", "1X", "12", "X2",
            "O1.5", "U1.5", "O2.5", "U2.5", "O3.5", "U3.5",
            "BTTS", "BTTS_NO",
            "1_over_25", "2_over_25", "x_under_25", "1_btts", "2_btts", "x_btts", "gg_over_25"
        };
        return codes;
    }

    const std::vector<std::string>& comboMarkets() {
        static const std::vector<std::string> codes = {
            "1_over_25", "2_over_25", "x_under_25", "1_btts", "2_btts", "x_btts", "gg_over_25"
        };
        return codes;
    }

    bool isKnownMarket(const std::string& code) {
        return registry().count(code) > 0;
    }

    std::string marketName(const std::string& code) {
        return lookup(code).name;
    }

    bool isWinning(const std::string& code, int home_goals, int away_goals) {
        if (home_goals < 0 || away_goals < 0) {
            throw ValidationException("Negative score for market " + code);
        }
        return lookup(code).wins(home_goals, away_goals);
    }

} // namespace markets
} // namespace core
