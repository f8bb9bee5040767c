#pragma once

#include <string>
#include <vector>

#include "engine_config.hpp"
#include "prediction.hpp"

namespace ee {

enum class CorrelationType { None, SameMatch, SameLeagueGoals, ResultFamily };

struct CorrelationResult {
    CorrelationType type = CorrelationType::None;
    std::string description;

    bool correlated() const { return type != CorrelationType::None; }
};

// Same fixture; same league with both goal-total markets; or both
// result-family markets in any league.
CorrelationResult checkCorrelation(const MatchPrediction& a, const MatchPrediction& b);

// Greedy by edge score (stable for ties): keeps a pick only when it is not
// correlated with any pick already kept.
std::vector<MatchPrediction> deduplicateCorrelatedPicks(const std::vector<MatchPrediction>& picks);

struct PortfolioImpact {
    double worstCaseDrawdown = 0.0;
    double expectedReturn = 0.0;
    int diversificationScore = 100;
    bool approved = true;
    std::string reason;
};

PortfolioImpact assessPortfolioImpact(const std::vector<MatchPrediction>& picks,
                                      double bankrollFraction = 1.0,
                                      const PortfolioConfig& cfg = {});

} // namespace ee
