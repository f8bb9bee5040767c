#pragma once

#include <string>
#include <vector>

#include "engine_config.hpp"

namespace ee {

struct StakingSuggestion {
    double fullKelly = 0.0;
    double fractionalKelly = 0.0;
    // Fraction of bankroll after the single-stake cap.
    double suggestedStake = 0.0;
    std::string reasoning;
};

struct ExposureCheck {
    bool approved = true;
    double currentExposure = 0.0;
    double proposedExposure = 0.0;
    double maxExposure = 0.0;
    std::string reason;
};

struct DrawdownCheck {
    bool approved = true;
    double currentDrawdown = 0.0;
    double maxDrawdown = 0.0;
    std::string reason;
};

// Odds <= 1 or probability outside (0, 1) yield a zero stake with a reason.
StakingSuggestion computeKellyStake(double probability, double odds, const KellyConfig& cfg = {});

ExposureCheck checkDailyExposure(const std::vector<double>& existingStakes,
                                 double newStake,
                                 const KellyConfig& cfg = {});

// Halts once (peak - current) / peak reaches the configured threshold.
DrawdownCheck checkDrawdown(double currentBankroll, double peakBankroll, const KellyConfig& cfg = {});

} // namespace ee
