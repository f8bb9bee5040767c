#pragma once

#include <string>

#include "engine_config.hpp"
#include "market_keys.hpp"

namespace ee {

enum class RiskTier { APlus, A, B, Reject };

const char* riskTierName(RiskTier tier);

// >= 85 A+, >= 70 A, >= 55 B, otherwise Reject.
RiskTier riskTierFromScore(double score);

struct RiskAssessment {
    double varianceAdjustedEv = 0.0;
    int volatilityScore = 0;
    bool tailRisk = false;
    int liquidityScore = 0;
    double riskScore = 0.0;
    RiskTier tier = RiskTier::Reject;
    // Empty when approved.
    std::string rejectionReason;

    bool approved() const { return tier != RiskTier::Reject; }
};

// Hard gates in order: interval width, high odds with high volatility,
// liquidity, variance-adjusted EV. Survivors are tiered by a stability,
// liquidity and EV composite.
RiskAssessment assessRisk(double ev,
                          double odds,
                          const ConfidenceInterval& interval,
                          int volatility,
                          int bookmakerCount,
                          double varianceMultiplier,
                          const RiskConfig& cfg = {});

} // namespace ee
