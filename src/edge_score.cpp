#include "edge_score.hpp"

#include "kelly.hpp"

#include <algorithm>
#include <cmath>

namespace ee {

EdgeScoreResult computeEdgeScore(double ev,
                                 double edge,
                                 const ClvProjection& clv,
                                 const RiskAssessment& risk,
                                 int confidence,
                                 double probability,
                                 double odds,
                                 const EdgeScoreWeights& weights,
                                 const KellyConfig& kelly) {
    EdgeScoreResult out;
    out.components.ev = std::clamp(ev * 500.0, 0.0, 100.0);
    out.components.edge = std::clamp(edge * 666.0, 0.0, 100.0);
    out.components.clv = static_cast<double>(clv.clvScore);
    out.components.volatility = std::max(0.0, 100.0 - static_cast<double>(risk.volatilityScore));
    out.components.liquidity = static_cast<double>(risk.liquidityScore);

    double raw = weights.ev * out.components.ev + weights.edge * out.components.edge +
                 weights.clv * out.components.clv + weights.volatility * out.components.volatility +
                 weights.liquidity * out.components.liquidity;
    double confidenceFactor = 0.7 + (static_cast<double>(confidence) / 100.0) * 0.3;
    out.edgeScore = static_cast<int>(std::clamp(std::round(raw * confidenceFactor), 0.0, 100.0));
    out.tier = riskTierFromScore(static_cast<double>(out.edgeScore));

    if (out.tier != RiskTier::Reject) {
        double stake = computeKellyStake(probability, odds, kelly).suggestedStake;
        out.suggestedStake = std::round(stake * 1000.0) / 1000.0;
    }
    return out;
}

} // namespace ee
