#include "portfolio.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "portfolio_test failure: " << msg << std::endl;
    std::exit(1);
}

ee::MatchPrediction pick(std::int64_t fixtureId, std::int64_t leagueId, const std::string& marketId, int edgeScore,
                         double stake = 0.03) {
    ee::MatchPrediction p;
    p.fixtureId = fixtureId;
    p.leagueId = leagueId;
    p.leagueName = "League " + std::to_string(leagueId);
    p.marketId = marketId;
    p.edgeScore = edgeScore;
    p.suggestedStake = stake;
    p.evAdjusted = 0.1;
    return p;
}

} // namespace

int main() {
    using namespace ee;

    if (checkCorrelation(pick(1, 8, "btts", 70), pick(1, 8, "over_2.5", 60)).type != CorrelationType::SameMatch) {
        fail("same fixture");
    }
    if (checkCorrelation(pick(1, 8, "over_2.5", 70), pick(2, 8, "under_3.5", 60)).type !=
        CorrelationType::SameLeagueGoals) {
        fail("same league goal totals");
    }
    if (checkCorrelation(pick(1, 8, "over_2.5", 70), pick(2, 9, "over_2.5", 60)).correlated()) {
        fail("goal totals in different leagues are independent");
    }
    // Result-family markets correlate across leagues while goal totals only
    // correlate within one; the asymmetry is intentional.
    if (checkCorrelation(pick(1, 8, "result_home", 70), pick(2, 9, "draw_no_bet", 60)).type !=
        CorrelationType::ResultFamily) {
        fail("result family across leagues");
    }
    if (checkCorrelation(pick(1, 8, "btts", 70), pick(2, 8, "btts_no", 60)).correlated()) {
        fail("btts markets in one league are not grouped");
    }

    std::vector<MatchPrediction> picks{
        pick(1, 8, "over_2.5", 60),
        pick(2, 8, "under_3.5", 75),
        pick(3, 9, "result_home", 80),
        pick(4, 5, "draw_no_bet_away", 80),
        pick(5, 9, "btts", 65),
        pick(2, 8, "btts", 50),
    };
    auto kept = deduplicateCorrelatedPicks(picks);
    if (kept.size() != 3) {
        fail("expected three uncorrelated picks, got " + std::to_string(kept.size()));
    }
    if (kept[0].fixtureId != 3 || kept[1].fixtureId != 2 || kept[2].fixtureId != 5) {
        fail("greedy order by edge score with stable ties");
    }
    if (!deduplicateCorrelatedPicks({}).empty()) {
        fail("empty slate");
    }

    auto none = assessPortfolioImpact({});
    if (!none.approved || none.diversificationScore != 100) {
        fail("empty portfolio is trivially approved");
    }
    auto zero = assessPortfolioImpact(kept, 0.0);
    if (zero.approved) {
        fail("non-positive bankroll fraction must be rejected");
    }

    auto ok = assessPortfolioImpact(kept);
    if (!ok.approved || std::abs(ok.worstCaseDrawdown - 0.09) > 1e-12) {
        fail("three 3% stakes fit the drawdown limit");
    }
    if (std::abs(ok.expectedReturn - 0.009) > 1e-12) {
        fail("expected return");
    }
    // Two leagues and three families over three picks: 50 + 50.
    if (ok.diversificationScore != 100) {
        fail("diversification " + std::to_string(ok.diversificationScore));
    }

    std::vector<MatchPrediction> heavy{
        pick(10, 1, "over_2.5", 80, 0.05),
        pick(11, 2, "over_2.5", 80, 0.05),
        pick(12, 3, "over_2.5", 80, 0.05),
        pick(13, 4, "over_2.5", 80, 0.05),
    };
    auto tooMuch = assessPortfolioImpact(heavy);
    if (tooMuch.approved || tooMuch.reason.find("Worst-case drawdown") == std::string::npos) {
        fail("20% at risk must be rejected");
    }
    if (tooMuch.diversificationScore != 75) {
        fail("single family diversification " + std::to_string(tooMuch.diversificationScore));
    }

    std::cout << "portfolio_test passed\n";
    return 0;
}
