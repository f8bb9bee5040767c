#include "clv.hpp"
#include "edge_score.hpp"
#include "risk.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "clv_risk_edge_test failure: " << msg << std::endl;
    std::exit(1);
}

bool mentions(const std::string& text, const std::string& fragment) {
    return text.find(fragment) != std::string::npos;
}

} // namespace

int main() {
    using namespace ee;

    // Closing line value.
    ClvProjection value = predictClv(2.10, 0.55, 0.55 - 1.0 / 2.10, 7);
    if (value.lineDirection != LineDirection::Shortening) {
        fail("large edge should shorten");
    }
    if (!(value.predictedClosingOdds < 2.10 && value.predictedClosingOdds > value.fairOdds)) {
        fail("closing price should sit between the current and fair price");
    }
    if (value.clvPercent <= 0.0 || value.clvScore != 87) {
        fail("clv score for a liquid value price: " + std::to_string(value.clvScore));
    }
    if (std::abs(value.fairOdds - 1.82) > 1e-9) {
        fail("fair odds rounding");
    }

    ClvProjection drift = predictClv(1.80, 0.56, 0.56 - 1.0 / 1.80, 1);
    if (drift.lineDirection != LineDirection::Drifting) {
        fail("thin edge should drift");
    }
    ClvProjection stable = predictClv(2.00, 0.54, 0.04, 3);
    if (stable.lineDirection != LineDirection::Stable) {
        fail("moderate edge should be stable");
    }
    ClvProjection invalid = predictClv(2.00, 0.0, 0.1, 5);
    if (invalid.clvScore != 0 || invalid.predictedClosingOdds != 0.0) {
        fail("zero probability must yield a neutral projection");
    }
    ClvProjection negative = predictClv(1.20, 0.30, -0.53, 0);
    if (negative.clvScore < 0 || negative.clvScore > 100) {
        fail("clv score must stay in [0, 100]");
    }

    // Tier steps.
    if (riskTierFromScore(85.0) != RiskTier::APlus || riskTierFromScore(84.99) != RiskTier::A ||
        riskTierFromScore(70.0) != RiskTier::A || riskTierFromScore(69.99) != RiskTier::B ||
        riskTierFromScore(55.0) != RiskTier::B || riskTierFromScore(54.99) != RiskTier::Reject) {
        fail("tier thresholds");
    }

    // Risk gates.
    ConfidenceInterval tight{ 0.52, 0.54 };
    RiskAssessment wide = assessRisk(0.1, 2.0, ConfidenceInterval{ 0.30, 0.60 }, 10, 7, 1.0);
    if (wide.approved() || !wide.tailRisk || !mentions(wide.rejectionReason, "CI width")) {
        fail("wide interval gate: " + wide.rejectionReason);
    }
    RiskAssessment longshot = assessRisk(0.2, 4.5, tight, 75, 7, 1.0);
    if (longshot.approved() || !mentions(longshot.rejectionReason, "High-odds volatility")) {
        fail("high-odds volatility gate: " + longshot.rejectionReason);
    }
    RiskAssessment illiquid = assessRisk(0.1, 2.0, tight, 10, 0, 1.0);
    if (illiquid.approved() || !mentions(illiquid.rejectionReason, "Low liquidity")) {
        fail("liquidity gate: " + illiquid.rejectionReason);
    }
    RiskAssessment thin = assessRisk(0.01, 2.0, tight, 10, 7, 1.0);
    if (thin.approved() || !mentions(thin.rejectionReason, "below threshold")) {
        fail("EV gate: " + thin.rejectionReason);
    }
    RiskAssessment good = assessRisk(0.1, 2.0, tight, 8, 7, 0.95);
    if (!good.approved() || good.tier != RiskTier::A || !good.rejectionReason.empty()) {
        fail("approved pick should be tier A, score " + std::to_string(good.riskScore));
    }
    if (std::abs(good.varianceAdjustedEv - 0.1 * 0.96 * 0.95) > 1e-12 || good.liquidityScore != 100) {
        fail("variance-adjusted EV or liquidity");
    }

    // Edge score bounds.
    ClvProjection bestClv;
    bestClv.clvScore = 100;
    RiskAssessment calm;
    calm.volatilityScore = 0;
    calm.liquidityScore = 100;
    EdgeScoreResult top = computeEdgeScore(1.0, 1.0, bestClv, calm, 100, 0.9, 2.0);
    if (top.edgeScore != 100 || top.tier != RiskTier::APlus) {
        fail("maximal inputs should score 100");
    }
    if (std::abs(top.suggestedStake - 0.05) > 1e-12) {
        fail("stake should be capped at the single-stake limit");
    }
    if (top.components.ev > 100.0 || top.components.edge > 100.0) {
        fail("components must be capped");
    }

    RiskAssessment stormy;
    stormy.volatilityScore = 100;
    stormy.liquidityScore = 0;
    EdgeScoreResult bottom = computeEdgeScore(-0.5, -0.2, ClvProjection{}, stormy, 40, 0.3, 2.0);
    if (bottom.edgeScore != 0 || bottom.tier != RiskTier::Reject || bottom.suggestedStake != 0.0) {
        fail("negative inputs should score 0 with no stake");
    }

    EdgeScoreResult mid = computeEdgeScore(0.08, 0.05, value, good, 70, 0.55, 2.10);
    if (mid.edgeScore < 0 || mid.edgeScore > 100) {
        fail("edge score out of range");
    }
    if (mid.tier != riskTierFromScore(static_cast<double>(mid.edgeScore))) {
        fail("tier must follow the edge score");
    }

    std::cout << "clv_risk_edge_test passed\n";
    return 0;
}
