#include "kelly.hpp"

#include <algorithm>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace ee {

namespace {

std::string percent(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << fraction * 100.0 << "%";
    return oss.str();
}

} // namespace

StakingSuggestion computeKellyStake(double probability, double odds, const KellyConfig& cfg) {
    StakingSuggestion out;
    if (odds <= 1.0 || probability <= 0.0 || probability >= 1.0) {
        out.reasoning = "Invalid inputs: no stake";
        return out;
    }

    const double b = odds - 1.0;
    const double q = 1.0 - probability;
    const double fullKelly = (probability * b - q) / b;
    if (fullKelly <= 0.0) {
        out.reasoning = "Negative Kelly: no edge detected";
        return out;
    }

    out.fullKelly = fullKelly;
    out.fractionalKelly = fullKelly * cfg.fraction;
    out.suggestedStake = std::min(out.fractionalKelly, cfg.maxSingleStake);
    if (out.fractionalKelly >= cfg.maxSingleStake) {
        out.reasoning = "Capped at " + percent(cfg.maxSingleStake) + " max single stake (Kelly suggested " +
                        percent(out.fractionalKelly) + ")";
    } else {
        out.reasoning = percent(cfg.fraction) + " Kelly: " + percent(fullKelly) + " full, " +
                        percent(out.suggestedStake) + " recommended";
    }
    return out;
}

ExposureCheck checkDailyExposure(const std::vector<double>& existingStakes,
                                 double newStake,
                                 const KellyConfig& cfg) {
    ExposureCheck out;
    out.currentExposure = std::accumulate(existingStakes.begin(), existingStakes.end(), 0.0);
    out.proposedExposure = out.currentExposure + newStake;
    out.maxExposure = cfg.maxDailyExposure;
    if (out.proposedExposure > out.maxExposure) {
        out.approved = false;
        out.reason = "Would exceed daily exposure: " + percent(out.proposedExposure) + " > " +
                     percent(out.maxExposure) + " limit";
    }
    return out;
}

DrawdownCheck checkDrawdown(double currentBankroll, double peakBankroll, const KellyConfig& cfg) {
    DrawdownCheck out;
    out.maxDrawdown = cfg.maxDrawdown;
    if (peakBankroll <= 0.0) {
        return out;
    }
    out.currentDrawdown = (peakBankroll - currentBankroll) / peakBankroll;
    if (out.currentDrawdown >= out.maxDrawdown) {
        out.approved = false;
        out.reason = "Drawdown " + percent(out.currentDrawdown) + " exceeds halt threshold " +
                     percent(out.maxDrawdown);
    }
    return out;
}

} // namespace ee
