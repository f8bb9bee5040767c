#include "clv.hpp"

#include <algorithm>
#include <cmath>

namespace ee {

namespace {

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // namespace

const char* lineDirectionName(LineDirection direction) {
    switch (direction) {
    case LineDirection::Shortening:
        return "shortening";
    case LineDirection::Drifting:
        return "drifting";
    case LineDirection::Stable:
        return "stable";
    }
    return "stable";
}

ClvProjection predictClv(double currentOdds,
                         double modelProbability,
                         double edge,
                         int bookmakerCount,
                         const ClvConfig& cfg) {
    ClvProjection out;
    out.currentOdds = currentOdds;
    if (modelProbability <= 0.0 || currentOdds <= 0.0) {
        return out;
    }

    double fairOdds = 1.0 / modelProbability;
    double liquidity = std::min(1.0, static_cast<double>(std::max(0, bookmakerCount)) / cfg.liquidityBookmakers);
    double convergence = cfg.baseMovementRate + liquidity * cfg.liquidityMovementRate;
    double closing = currentOdds - (currentOdds - fairOdds) * convergence;
    double clvPercent = (currentOdds - closing) / closing * 100.0;

    if (edge > cfg.shorteningEdge) {
        out.lineDirection = LineDirection::Shortening;
    } else if (edge < cfg.driftingEdge) {
        out.lineDirection = LineDirection::Drifting;
    } else {
        out.lineDirection = LineDirection::Stable;
    }

    double edgeContribution = std::min(50.0, edge * 500.0);
    double liquidityContribution = liquidity * 30.0;
    double clvContribution = std::min(20.0, clvPercent * 5.0);
    double composite = std::round(edgeContribution + liquidityContribution + clvContribution);
    out.clvScore = static_cast<int>(std::clamp(composite, 0.0, 100.0));

    out.predictedClosingOdds = round2(closing);
    out.clvPercent = round2(clvPercent);
    out.fairOdds = round2(fairOdds);
    return out;
}

} // namespace ee
