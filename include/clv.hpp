#pragma once

#include "engine_config.hpp"

namespace ee {

enum class LineDirection { Shortening, Drifting, Stable };

const char* lineDirectionName(LineDirection direction);

struct ClvProjection {
    double currentOdds = 0.0;
    // Rounded to 2 decimals.
    double predictedClosingOdds = 0.0;
    double clvPercent = 0.0;
    double fairOdds = 0.0;
    int clvScore = 0;
    LineDirection lineDirection = LineDirection::Stable;
};

// Projects the closing price as the current price converging toward the
// model's fair price, faster when more bookmakers quote the market.
ClvProjection predictClv(double currentOdds,
                         double modelProbability,
                         double edge,
                         int bookmakerCount,
                         const ClvConfig& cfg = {});

} // namespace ee
