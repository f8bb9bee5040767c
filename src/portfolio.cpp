#include "portfolio.hpp"

#include "markets.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>

namespace ee {

CorrelationResult checkCorrelation(const MatchPrediction& a, const MatchPrediction& b) {
    CorrelationResult out;
    if (a.fixtureId == b.fixtureId) {
        out.type = CorrelationType::SameMatch;
        out.description = "Same match: only one bet per match allowed";
        return out;
    }
    if (a.leagueId == b.leagueId && isGoalTotalMarket(a.marketId) && isGoalTotalMarket(b.marketId)) {
        out.type = CorrelationType::SameLeagueGoals;
        out.description = "Same league (" + a.leagueName + ") with goal-total markets";
        return out;
    }
    if (isResultFamilyMarket(a.marketId) && isResultFamilyMarket(b.marketId)) {
        out.type = CorrelationType::ResultFamily;
        out.description = "Result-family markets " + a.marketId + " and " + b.marketId;
        return out;
    }
    return out;
}

std::vector<MatchPrediction> deduplicateCorrelatedPicks(const std::vector<MatchPrediction>& picks) {
    std::vector<MatchPrediction> sorted = picks;
    std::stable_sort(sorted.begin(), sorted.end(), [](const MatchPrediction& x, const MatchPrediction& y) {
        return x.edgeScore > y.edgeScore;
    });

    std::vector<MatchPrediction> kept;
    for (auto& pick : sorted) {
        bool clash = std::any_of(kept.begin(), kept.end(), [&pick](const MatchPrediction& existing) {
            return checkCorrelation(pick, existing).correlated();
        });
        if (!clash) {
            kept.push_back(std::move(pick));
        }
    }
    return kept;
}

PortfolioImpact assessPortfolioImpact(const std::vector<MatchPrediction>& picks,
                                      double bankrollFraction,
                                      const PortfolioConfig& cfg) {
    PortfolioImpact out;
    if (picks.empty()) {
        return out;
    }
    if (bankrollFraction <= 0.0) {
        out.approved = false;
        out.diversificationScore = 0;
        out.reason = "Bankroll fraction must be positive";
        return out;
    }

    double totalStake = 0.0;
    std::set<std::int64_t> leagues;
    std::set<std::string> families;
    for (const auto& p : picks) {
        totalStake += p.suggestedStake;
        out.expectedReturn += p.suggestedStake * p.evAdjusted;
        leagues.insert(p.leagueId);
        families.insert(marketFamily(p.marketId));
    }
    out.worstCaseDrawdown = totalStake / bankrollFraction;

    const double count = static_cast<double>(picks.size());
    double leagueDiversity = std::min(50.0, static_cast<double>(leagues.size()) / count * 100.0);
    double marketDiversity = std::min(50.0, static_cast<double>(families.size()) / count * 100.0);
    out.diversificationScore = static_cast<int>(std::round(leagueDiversity + marketDiversity));

    if (out.worstCaseDrawdown > cfg.maxWorstCaseDrawdown) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << "Worst-case drawdown " << out.worstCaseDrawdown * 100.0
            << "% exceeds " << cfg.maxWorstCaseDrawdown * 100.0 << "% limit";
        out.approved = false;
        out.reason = oss.str();
    }
    return out;
}

} // namespace ee
