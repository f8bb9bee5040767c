#pragma once

#include <optional>
#include <vector>

#include "engine_config.hpp"
#include "market_keys.hpp"
#include "match_context.hpp"

namespace ee {

constexpr int kMaxFactorial = 10;

// Table lookup for 0!..10!; anything outside the table yields 0.
double factorial(int n);

// P(X = k) for X ~ Poisson(lambda). Zero for k outside [0, 10] or lambda < 0.
double poissonPmf(double lambda, int k);

// 1.0 at >= 5 rest days (or unknown), 0.97 at 3-4, 0.94 at 2, 0.90 at <= 1.
double fatigueFactor(std::optional<int> restDays);
double applyFatigue(double lambda, std::optional<int> restDays);
double applyInjury(double lambda, std::optional<double> injuryFactor, const PoissonConfig& cfg = {});

// 40/60 season/form blend with defaults for missing figures.
BlendedStats blendStats(const TeamStats& stats, const PoissonConfig& cfg = {});

struct StrengthFactors {
    double attackHome = 1.0;
    double defenseHome = 1.0;
    double attackAway = 1.0;
    double defenseAway = 1.0;
};

StrengthFactors computeStrength(const BlendedStats& home,
                                const BlendedStats& away,
                                const PoissonConfig& cfg = {});

struct LambdaPair {
    double home = 0.0;
    double away = 0.0;
};

LambdaPair clampLambdas(LambdaPair lambdas, const PoissonConfig& cfg = {});

// Expected goals from strength factors, clamped to the configured bounds.
LambdaPair computeLambdas(const StrengthFactors& strength,
                          double homeAdvantage,
                          const PoissonConfig& cfg = {});

struct ScoreMatrix {
    int maxGoals = 0;
    double lambdaHome = 0.0;
    double lambdaAway = 0.0;
    std::vector<double> homeDistribution;
    std::vector<double> awayDistribution;
    // Row-major (maxGoals + 1)^2 grid, cell(h, a) = P(home = h) * P(away = a).
    std::vector<double> cells;

    double cell(int home, int away) const {
        return cells[static_cast<std::size_t>(home) * static_cast<std::size_t>(maxGoals + 1) +
                     static_cast<std::size_t>(away)];
    }
    double total() const;
};

ScoreMatrix buildScoreMatrix(double lambdaHome, double lambdaAway, int maxGoals = 6);

MarketProbabilities deriveMarketProbabilities(const ScoreMatrix& matrix, const PoissonConfig& cfg = {});

} // namespace ee
