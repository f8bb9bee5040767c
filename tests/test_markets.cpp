#include "engine_config.hpp"
#include "markets.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "markets_test failure: " << msg << std::endl;
    std::exit(1);
}

const ee::MarketDefinition& market(const std::string& id) {
    const ee::MarketDefinition* def = ee::findMarketDefinition(id);
    if (def == nullptr) {
        fail("missing whitelist entry " + id);
    }
    return *def;
}

} // namespace

int main() {
    using namespace ee;

    if (marketWhitelist().size() != 23) {
        fail("whitelist size");
    }
    if (findMarketDefinition("correct_score") != nullptr) {
        fail("correct score is not a priced market");
    }
    if (resolveMarketLabel(market("result_home"), "Arsenal", "Chelsea") != "Arsenal to Win" ||
        resolveMarketLabel(market("draw_no_bet_away"), "Arsenal", "Chelsea") != "Chelsea (DNB)") {
        fail("label placeholders");
    }

    std::vector<OddsEntry> odds{
        { 2, "Bet365", 80, "Over", "2.5", 1.95 },
        { 8, "Unibet", 80, "Over", "2.5", 2.02 },
        { 8, "Unibet", 81, "Over", "2.5", 1.99 },
        { 2, "Bet365", 80, "Under", "2.5", 1.90 },
        { 2, "Bet365", 80, "Over", "3.5", 3.40 },
        { 2, "Bet365", 14, "Yes", "", 1.80 },
        { 9, "Betway", 14, "No", "", 2.05 },
        { 2, "Bet365", 1, "Home", "", 2.10 },
        { 2, "Bet365", 1, "Draw", "", 3.30 },
        { 2, "Bet365", 1, "Away", "", 3.60 },
        { 2, "Bet365", 10, "Arsenal", "", 1.55 },
        { 2, "Bet365", 10, "Chelsea", "", 2.45 },
        { 4, "Ladbrokes", 82, "Over 2.5 & Yes", "", 2.30 },
        { 4, "Ladbrokes", 82, "Under 2.5 & Yes", "", 4.50 },
    };

    auto over = findOddsForMarket(odds, market("over_2.5"), "Arsenal", "Chelsea");
    if (!over || over->bestOdds != 2.02 || over->bestBookmaker != "Unibet") {
        fail("best price across bookmakers and provider ids");
    }
    if (over->bookmakerCount != 2 || !over->referenceOdds || *over->referenceOdds != 1.95) {
        fail("bookmaker count and reference price");
    }

    auto over35 = findOddsForMarket(odds, market("over_3.5"), "Arsenal", "Chelsea");
    if (!over35 || over35->bestOdds != 3.40) {
        fail("line filter");
    }
    if (findOddsForMarket(odds, market("under_3.5"), "Arsenal", "Chelsea")) {
        fail("unquoted line must not match");
    }

    auto bttsNo = findOddsForMarket(odds, market("btts_no"), "Arsenal", "Chelsea");
    if (!bttsNo || bttsNo->bestOdds != 2.05 || bttsNo->referenceOdds) {
        fail("btts no without a reference bookmaker");
    }

    auto home = findOddsForMarket(odds, market("result_home"), "Arsenal", "Chelsea");
    auto draw = findOddsForMarket(odds, market("result_draw"), "Arsenal", "Chelsea");
    if (!home || home->bestOdds != 2.10 || !draw || draw->bestOdds != 3.30) {
        fail("match winner outcomes");
    }

    auto dnbHome = findOddsForMarket(odds, market("draw_no_bet"), "Arsenal", "Chelsea");
    auto dnbAway = findOddsForMarket(odds, market("draw_no_bet_away"), "Arsenal", "Chelsea");
    if (!dnbHome || dnbHome->bestOdds != 1.55 || !dnbAway || dnbAway->bestOdds != 2.45) {
        fail("draw no bet by team name");
    }

    auto combo = findOddsForMarket(odds, market("btts_over_2.5"), "Arsenal", "Chelsea");
    if (!combo || combo->bestOdds != 2.30) {
        fail("combined label filter");
    }

    if (findOddsForMarket({}, market("over_2.5"), "Arsenal", "Chelsea")) {
        fail("empty feed");
    }

    EngineConfig cfg;
    auto value = evaluateMarket("over_2.5", 0.55, 2.02, 80, cfg);
    if (!value) {
        fail("valid market must evaluate");
    }
    if (std::abs(value->edge - (0.55 - 1.0 / 2.02)) > 1e-12 || std::abs(value->ev - (0.55 * 2.02 - 1.0)) > 1e-12) {
        fail("edge and EV");
    }
    if (std::abs(value->evAdjusted - value->ev * 0.8 * 0.95) > 1e-12) {
        fail("confidence and variance adjustment");
    }
    if (evaluateMarket("over_2.5", 0.55, 0.0, 80, cfg) || evaluateMarket("over_2.5", 0.0, 2.0, 80, cfg) ||
        evaluateMarket("over_2.5", 0.2, 10.5, 80, cfg)) {
        fail("invalid or out-of-range inputs must not evaluate");
    }

    if (std::abs(varianceMultiplierFor(cfg, "btts", 8.5) - 0.93 * 0.80) > 1e-12 ||
        std::abs(varianceMultiplierFor(cfg, "unknown", 2.0) - 0.95) > 1e-12) {
        fail("variance multiplier lookup");
    }

    if (!isGoalTotalMarket("1h_under_1.5") || isGoalTotalMarket("btts")) {
        fail("goal-total family");
    }
    if (!isResultFamilyMarket("draw_no_bet_away") || !isResultFamilyMarket("dnb_home") ||
        isResultFamilyMarket("btts_home_win")) {
        fail("result family");
    }
    if (!isWinMarket("result_away") || isWinMarket("result_draw")) {
        fail("win markets");
    }
    if (marketFamily("over_2.5") != "goals" || marketFamily("btts") != "btts" ||
        marketFamily("result_home") != "result") {
        fail("market family");
    }

    std::cout << "markets_test passed\n";
    return 0;
}
