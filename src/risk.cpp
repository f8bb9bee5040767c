#include "risk.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ee {

namespace {

constexpr double kTierAPlus = 85.0;
constexpr double kTierA = 70.0;
constexpr double kTierB = 55.0;

RiskAssessment reject(RiskAssessment base, bool tailRisk, const std::string& reason) {
    base.tier = RiskTier::Reject;
    base.tailRisk = tailRisk;
    base.rejectionReason = reason;
    return base;
}

} // namespace

const char* riskTierName(RiskTier tier) {
    switch (tier) {
    case RiskTier::APlus:
        return "A+";
    case RiskTier::A:
        return "A";
    case RiskTier::B:
        return "B";
    case RiskTier::Reject:
        return "REJECT";
    }
    return "REJECT";
}

RiskTier riskTierFromScore(double score) {
    if (score >= kTierAPlus) {
        return RiskTier::APlus;
    }
    if (score >= kTierA) {
        return RiskTier::A;
    }
    if (score >= kTierB) {
        return RiskTier::B;
    }
    return RiskTier::Reject;
}

RiskAssessment assessRisk(double ev,
                          double odds,
                          const ConfidenceInterval& interval,
                          int volatility,
                          int bookmakerCount,
                          double varianceMultiplier,
                          const RiskConfig& cfg) {
    RiskAssessment out;
    out.volatilityScore = volatility;
    out.varianceAdjustedEv = ev * (1.0 - static_cast<double>(volatility) / 200.0) * varianceMultiplier;
    out.liquidityScore = static_cast<int>(
        std::min(100.0, std::round(static_cast<double>(bookmakerCount) / cfg.liquidityBookmakers * 100.0)));

    const double ciWidth = interval.width();
    const bool tailRisk = ciWidth > cfg.tailCiWidth && odds >= cfg.tailOdds &&
                          static_cast<double>(volatility) >= cfg.tailVolatility;

    std::ostringstream reason;
    reason << std::fixed << std::setprecision(1);

    if (ciWidth > cfg.maxCiWidth) {
        reason << "CI width " << ciWidth * 100.0 << "% exceeds max " << cfg.maxCiWidth * 100.0 << "%";
        return reject(out, true, reason.str());
    }
    if (odds >= cfg.highOddsThreshold && static_cast<double>(volatility) >= cfg.highOddsMaxVolatility) {
        reason << std::setprecision(2) << "High-odds volatility: odds " << odds << " with volatility "
               << volatility << "/100";
        return reject(out, true, reason.str());
    }
    if (bookmakerCount < cfg.minBookmakers) {
        reason << "Low liquidity: only " << bookmakerCount << " bookmaker(s)";
        return reject(out, false, reason.str());
    }
    if (out.varianceAdjustedEv < cfg.minEvThreshold * cfg.evTolerance) {
        reason << "Variance-adjusted EV " << out.varianceAdjustedEv * 100.0 << "% below threshold";
        return reject(out, tailRisk, reason.str());
    }

    double stability = std::max(0.0, 100.0 - static_cast<double>(volatility));
    double evComponent = std::min(100.0, out.varianceAdjustedEv * 500.0);
    out.riskScore = stability * 0.6 + static_cast<double>(out.liquidityScore) * 0.2 + evComponent * 0.2;
    out.tailRisk = tailRisk;
    out.tier = riskTierFromScore(out.riskScore);
    if (out.tier == RiskTier::Reject) {
        reason << std::setprecision(0) << "Risk score " << out.riskScore << " below minimum tier threshold";
        out.rejectionReason = reason.str();
    }
    return out;
}

} // namespace ee
