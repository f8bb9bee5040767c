#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace ee {

struct PoissonConfig {
    int maxGoals = 6;
    double leagueAvgHomeGoals = 1.50;
    double leagueAvgAwayGoals = 1.15;
    double defaultHomeAdvantage = 1.08;
    double halfTimeFactor = 0.45;

    double minLambdaHome = 0.3;
    double maxLambdaHome = 4.0;
    double minLambdaAway = 0.2;
    double maxLambdaAway = 3.5;

    double seasonWeight = 0.4;
    double formWeight = 0.6;
    double defaultScored = 1.3;
    double defaultConceded = 1.1;

    double minInjuryFactor = 0.80;

    int correctScoreMaxGoals = 4;
    std::size_t correctScoreCount = 5;

    std::map<std::int64_t, double> leagueHomeAdvantage{
        {2, 1.10},   {5, 1.08},   {8, 1.09},  {9, 1.12},  {564, 1.11},
        {567, 1.08}, {82, 1.10},  {384, 1.09}, {387, 1.08},
    };
};

struct EloConfig {
    double baseRating = 1500.0;
    double rankStep = 25.0;
    int leagueSize = 20;
    double drawFactor = 0.26;
    double formScale = 50.0;
    double formGamesSaturation = 15.0;

    int defaultRank = 10;
    int defaultGamesPlayed = 10;
    double defaultPpg = 1.0;

    double lambdaBlend = 0.15;

    double evidenceGames = 20.0;
    double maxEvidenceShift = 0.4;
    double homeLambdaScale = 4.0;
    double awayLambdaScale = 3.5;
    double ppgScale = 3.0;
    double minPosterior = 0.01;
    double maxPosterior = 0.99;
};

struct MonteCarloConfig {
    std::size_t iterations = 10'000;
    std::uint32_t seedBase = 42;
    double zScore = 1.96;
    double volatilityScale = 400.0;
    int maxTrackedGoals = 12;
    std::size_t topScorelines = 10;
};

struct SelectionConfig {
    double oddsMax = 10.20;
    double oddsDisplayMin = 1.80;
    double analyticalWeight = 0.4;
    double simulationWeight = 0.6;
    double minProbability = 0.01;
    double maxProbability = 0.95;
    std::size_t maxPicksPerDay = 20;
    int minConfidence = 40;
    int maxConfidence = 95;
    std::int64_t referenceBookmakerId = 2;
    double defaultVarianceMultiplier = 0.95;
};

struct ClvConfig {
    double liquidityBookmakers = 7.0;
    double baseMovementRate = 0.4;
    double liquidityMovementRate = 0.3;
    double shorteningEdge = 0.06;
    double driftingEdge = 0.02;
};

struct RiskConfig {
    double maxCiWidth = 0.25;
    double highOddsThreshold = 4.0;
    double highOddsMaxVolatility = 70.0;
    int minBookmakers = 1;
    double minEvThreshold = 0.02;
    double evTolerance = 0.8;
    double tailCiWidth = 0.20;
    double tailOdds = 3.5;
    double tailVolatility = 50.0;
    double liquidityBookmakers = 7.0;
};

struct EdgeScoreWeights {
    double ev = 0.30;
    double edge = 0.25;
    double clv = 0.20;
    double volatility = 0.15;
    double liquidity = 0.10;
};

struct KellyConfig {
    double fraction = 0.25;
    double maxSingleStake = 0.05;
    double maxDailyExposure = 0.10;
    double maxDrawdown = 0.15;
};

struct PortfolioConfig {
    double maxWorstCaseDrawdown = 0.15;
};

struct AccaConfig {
    double safeOddsMin = 1.20;
    double safeOddsMax = 2.00;
    double freezeOddsMin = 3.00;
    double freezeOddsMax = 22.50;
    int minEdgeScore = 5;
    std::size_t maxPerLeague = 2;
    std::size_t safeLegs = 4;
    std::size_t maxSafePool = 16;
    std::size_t maxFreezePool = 15;
    std::size_t freezeLegsPerCombination = 3;
    double defaultStake = 10.0;
    std::size_t defaultCount = 2;

    double minWinProbability = 0.10;
    double fallbackMargin = 1.05;
    int defaultConfidence = 65;
};

struct EngineConfig {
    PoissonConfig poisson;
    EloConfig elo;
    MonteCarloConfig monteCarlo;
    SelectionConfig selection;
    ClvConfig clv;
    RiskConfig risk;
    EdgeScoreWeights weights;
    KellyConfig kelly;
    PortfolioConfig portfolio;
    AccaConfig acca;
    std::size_t workers = 4;

    std::map<std::string, double> varianceMultipliers{
        {"over_2.5", 0.95},       {"over_3.5", 0.90},       {"under_1.5", 1.00},
        {"under_2.5", 1.00},      {"draw_no_bet", 0.93},    {"draw_no_bet_away", 0.93},
        {"btts_home_win", 0.88},  {"btts_away_win", 0.88},  {"btts", 0.93},
        {"btts_no", 0.93},        {"btts_over_2.5", 0.90},  {"btts_over_3.5", 0.88},
        {"btts_under_1.5", 0.88}, {"btts_under_2.5", 0.90}, {"1h_over_1.5", 0.92},
        {"1h_over_2.5", 0.88},    {"1h_under_0.5", 0.95},   {"1h_under_1.5", 0.95},
    };

    std::map<std::string, double> calibrationFactors{
        {"over_2.5", 1.15},       {"over_3.5", 1.22},       {"under_1.5", 0.82},
        {"under_2.5", 0.88},      {"btts", 1.15},           {"btts_no", 0.88},
        {"btts_over_2.5", 1.18},  {"btts_over_3.5", 1.22},  {"btts_under_1.5", 0.80},
        {"btts_under_2.5", 0.85}, {"btts_home_win", 1.15},  {"btts_away_win", 1.15},
        {"draw_no_bet", 0.92},    {"draw_no_bet_away", 0.92}, {"1h_over_1.5", 1.12},
        {"1h_over_2.5", 1.15},    {"1h_under_0.5", 0.85},   {"1h_under_1.5", 0.88},
    };
};

double homeAdvantageFor(const PoissonConfig& cfg, std::int64_t leagueId);
double calibrationFactorFor(const EngineConfig& cfg, const std::string& marketId);
// Table multiplier for the market, reduced further for long odds (>= 4, 6, 8).
double varianceMultiplierFor(const EngineConfig& cfg, const std::string& marketId, double odds);

// Throws std::invalid_argument naming the first offending field.
void validateConfig(const EngineConfig& cfg);

// Defaults overridden by EE_* environment variables. Malformed values throw
// std::runtime_error naming the variable.
EngineConfig loadConfigFromEnvironment();
EngineConfig applyEnvironmentOverrides(EngineConfig cfg);

} // namespace ee
