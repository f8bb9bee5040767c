#include "monte_carlo.hpp"

#include "deterministic_math.hpp"
#include "rng.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>
#include <tuple>
#include <utility>

namespace ee {

namespace {

struct Tally {
    std::array<std::size_t, kMarketKeyCount> hits{};

    void hit(MarketKey key) { ++hits[static_cast<std::size_t>(key)]; }
    std::size_t count(MarketKey key) const { return hits[static_cast<std::size_t>(key)]; }
};

void tallyFullTime(Tally& t, int home, int away) {
    const int total = home + away;
    const bool btts = home > 0 && away > 0;

    if (total > 1) t.hit(MarketKey::Over15);
    if (total > 2) t.hit(MarketKey::Over25);
    if (total > 3) t.hit(MarketKey::Over35);
    if (total <= 1) t.hit(MarketKey::Under15);
    if (total <= 2) t.hit(MarketKey::Under25);
    if (total <= 3) t.hit(MarketKey::Under35);
    if (total <= 4) t.hit(MarketKey::Under45);

    if (btts) {
        t.hit(MarketKey::BttsYes);
        if (total > 2) t.hit(MarketKey::BttsOver25);
        if (total > 3) t.hit(MarketKey::BttsOver35);
        if (total <= 2) t.hit(MarketKey::BttsUnder25);
        if (home > away) t.hit(MarketKey::BttsHomeWin);
        if (away > home) t.hit(MarketKey::BttsAwayWin);
    } else {
        t.hit(MarketKey::BttsNo);
    }

    if (home >= 2) t.hit(MarketKey::HomeOver15);
    if (away >= 2) t.hit(MarketKey::AwayOver15);

    if (home > away) {
        t.hit(MarketKey::HomeWin);
    } else if (home == away) {
        t.hit(MarketKey::Draw);
    } else {
        t.hit(MarketKey::AwayWin);
    }
}

void tallyFirstHalf(Tally& t, int home, int away) {
    const int total = home + away;
    if (total > 0) t.hit(MarketKey::FirstHalfOver05);
    if (total > 1) t.hit(MarketKey::FirstHalfOver15);
    if (total > 2) t.hit(MarketKey::FirstHalfOver25);
    if (total == 0) t.hit(MarketKey::FirstHalfUnder05);
    if (total <= 1) t.hit(MarketKey::FirstHalfUnder15);
}

} // namespace

int samplePoisson(RandomSource& rng, double expNegLambda) {
    int k = 0;
    double p = 1.0;
    do {
        ++k;
        p *= rng.uniform01();
    } while (p > expNegLambda);
    return k - 1;
}

ConfidenceInterval proportionInterval(double p, std::size_t n, double z) {
    if (n == 0) {
        return ConfidenceInterval{ 0.0, 1.0 };
    }
    double margin = z * DeterministicMath::standardError(p, n);
    return ConfidenceInterval{ std::max(0.0, p - margin), std::min(1.0, p + margin) };
}

SimulationResult runMonteCarlo(double lambdaHome,
                               double lambdaAway,
                               std::int64_t fixtureId,
                               const MonteCarloConfig& cfg,
                               const PoissonConfig& poissonCfg) {
    Xorshift32Rng rng(fixtureSeed(fixtureId, cfg.seedBase));
    return runMonteCarlo(lambdaHome, lambdaAway, rng, cfg, poissonCfg);
}

SimulationResult runMonteCarlo(double lambdaHome,
                               double lambdaAway,
                               RandomSource& rng,
                               const MonteCarloConfig& cfg,
                               const PoissonConfig& poissonCfg) {
    if (cfg.iterations == 0) {
        throw std::invalid_argument("Monte Carlo requires at least one iteration");
    }
    if (lambdaHome < 0.0 || lambdaAway < 0.0) {
        throw std::invalid_argument("Monte Carlo expected goals must be non-negative");
    }

    const double thresholdHome = DeterministicMath::exp(-lambdaHome);
    const double thresholdAway = DeterministicMath::exp(-lambdaAway);
    const double thresholdHomeHalf = DeterministicMath::exp(-lambdaHome * poissonCfg.halfTimeFactor);
    const double thresholdAwayHalf = DeterministicMath::exp(-lambdaAway * poissonCfg.halfTimeFactor);

    const std::size_t n = cfg.iterations;
    Tally tally;
    std::vector<std::size_t> totals(static_cast<std::size_t>(cfg.maxTrackedGoals + 1), 0);
    std::map<std::pair<int, int>, std::size_t> scorelines;
    std::size_t homeGoalSum = 0;
    std::size_t awayGoalSum = 0;

    for (std::size_t i = 0; i < n; ++i) {
        int home = samplePoisson(rng, thresholdHome);
        int away = samplePoisson(rng, thresholdAway);
        int homeHalf = samplePoisson(rng, thresholdHomeHalf);
        int awayHalf = samplePoisson(rng, thresholdAwayHalf);

        tallyFullTime(tally, home, away);
        tallyFirstHalf(tally, homeHalf, awayHalf);

        int total = home + away;
        if (total <= cfg.maxTrackedGoals) {
            ++totals[static_cast<std::size_t>(total)];
        }
        ++scorelines[{ home, away }];
        homeGoalSum += static_cast<std::size_t>(home);
        awayGoalSum += static_cast<std::size_t>(away);
    }

    SimulationResult result;
    result.iterations = n;
    const double dn = static_cast<double>(n);
    for (std::size_t k = 0; k < kMarketKeyCount; ++k) {
        result.probabilities.values[k] = static_cast<double>(tally.hits[k]) / dn;
    }

    const std::size_t homeWins = tally.count(MarketKey::HomeWin);
    const std::size_t awayWins = tally.count(MarketKey::AwayWin);
    const std::size_t decisive = homeWins + awayWins;
    result.probabilities[MarketKey::DnbHome] =
        decisive > 0 ? static_cast<double>(homeWins) / static_cast<double>(decisive) : 0.5;
    result.probabilities[MarketKey::DnbAway] =
        decisive > 0 ? static_cast<double>(awayWins) / static_cast<double>(decisive) : 0.5;

    for (std::size_t k = 0; k < kMarketKeyCount; ++k) {
        result.intervals[k] = proportionInterval(result.probabilities.values[k], n, cfg.zScore);
    }

    result.goalDistribution.reserve(totals.size());
    for (std::size_t count : totals) {
        result.goalDistribution.push_back(static_cast<double>(count) / dn);
    }

    std::vector<std::pair<std::pair<int, int>, std::size_t>> ranked(scorelines.begin(), scorelines.end());
    std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });
    for (std::size_t i = 0; i < ranked.size() && i < cfg.topScorelines; ++i) {
        result.topScorelines.push_back(ScorelineProbability{
            ranked[i].first.first, ranked[i].first.second, static_cast<double>(ranked[i].second) / dn });
    }

    result.meanHomeGoals = static_cast<double>(homeGoalSum) / dn;
    result.meanAwayGoals = static_cast<double>(awayGoalSum) / dn;

    double meanWidth = (result.interval(MarketKey::Over25).width() +
                        result.interval(MarketKey::BttsYes).width() +
                        result.interval(MarketKey::DnbHome).width()) /
                       3.0;
    result.volatilityScore =
        static_cast<int>(std::min(100L, std::lround(meanWidth * cfg.volatilityScale)));
    return result;
}

double blendProbability(double analytical,
                        double simulated,
                        double calibrationFactor,
                        const SelectionConfig& cfg) {
    double blended = analytical * cfg.analyticalWeight + simulated * cfg.simulationWeight;
    return std::clamp(blended * calibrationFactor, cfg.minProbability, cfg.maxProbability);
}

} // namespace ee
