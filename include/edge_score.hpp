#pragma once

#include "clv.hpp"
#include "engine_config.hpp"
#include "risk.hpp"

namespace ee {

struct EdgeScoreComponents {
    double ev = 0.0;
    double edge = 0.0;
    double clv = 0.0;
    double volatility = 0.0;
    double liquidity = 0.0;
};

struct EdgeScoreResult {
    int edgeScore = 0;
    EdgeScoreComponents components;
    RiskTier tier = RiskTier::Reject;
    // Fraction of bankroll, 3 decimals; zero for a rejected tier.
    double suggestedStake = 0.0;
};

EdgeScoreResult computeEdgeScore(double ev,
                                 double edge,
                                 const ClvProjection& clv,
                                 const RiskAssessment& risk,
                                 int confidence,
                                 double probability,
                                 double odds,
                                 const EdgeScoreWeights& weights = {},
                                 const KellyConfig& kelly = {});

} // namespace ee
