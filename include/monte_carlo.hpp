#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "engine_config.hpp"
#include "market_keys.hpp"

namespace ee {

class RandomSource;

struct SimulationResult {
    std::size_t iterations = 0;
    MarketProbabilities probabilities;
    std::array<ConfidenceInterval, kMarketKeyCount> intervals{};
    // Index = total goals, 0..maxTrackedGoals.
    std::vector<double> goalDistribution;
    std::vector<ScorelineProbability> topScorelines;
    double meanHomeGoals = 0.0;
    double meanAwayGoals = 0.0;
    int volatilityScore = 0;

    const ConfidenceInterval& interval(MarketKey key) const {
        return intervals[static_cast<std::size_t>(key)];
    }
};

// Knuth's multiplicative sampler; expNegLambda is e^(-lambda), computed once by the caller.
int samplePoisson(RandomSource& rng, double expNegLambda);

// Normal-approximation 95% interval for a proportion, clipped to [0, 1].
ConfidenceInterval proportionInterval(double p, std::size_t n, double z = 1.96);

// Seeds xorshift32 from the fixture id, so identical inputs replay bit-for-bit
// regardless of thread or call order.
SimulationResult runMonteCarlo(double lambdaHome,
                               double lambdaAway,
                               std::int64_t fixtureId,
                               const MonteCarloConfig& cfg = {},
                               const PoissonConfig& poissonCfg = {});

// Same draws as runMonteCarlo with a caller-owned generator.
SimulationResult runMonteCarlo(double lambdaHome,
                               double lambdaAway,
                               RandomSource& rng,
                               const MonteCarloConfig& cfg = {},
                               const PoissonConfig& poissonCfg = {});

// 0.4 analytical + 0.6 simulated, times the calibration factor, clamped.
double blendProbability(double analytical,
                        double simulated,
                        double calibrationFactor,
                        const SelectionConfig& cfg = {});

} // namespace ee
