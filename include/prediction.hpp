#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "clv.hpp"
#include "market_keys.hpp"
#include "risk.hpp"

namespace ee {

struct EvaluatedMarket {
    std::string marketId;
    std::string label;
    MarketKey key = MarketKey::Over25;

    double analyticalProbability = 0.0;
    double simulatedProbability = 0.0;
    // Blended and calibrated.
    double probability = 0.0;
    double impliedProbability = 0.0;
    double odds = 0.0;
    std::optional<double> referenceOdds;
    std::string bestBookmaker;
    int bookmakerCount = 0;

    double edge = 0.0;
    double ev = 0.0;
    double evAdjusted = 0.0;
    double varianceMultiplier = 1.0;
    int confidence = 0;

    int edgeScore = 0;
    RiskTier tier = RiskTier::Reject;
    double suggestedStake = 0.0;

    ClvProjection clv;
    RiskAssessment risk;
    std::size_t simulatedWins = 0;
    ConfidenceInterval interval;
};

struct MatchPrediction {
    std::int64_t fixtureId = 0;
    std::string homeTeam;
    std::string awayTeam;
    std::int64_t leagueId = 0;
    std::string leagueName;
    std::string startTime;

    std::string market;
    std::string marketId;
    double probability = 0.0;
    double impliedProbability = 0.0;
    double odds = 0.0;
    std::optional<double> referenceOdds;
    std::string bestBookmaker;
    double edge = 0.0;
    double ev = 0.0;
    double evAdjusted = 0.0;
    int confidence = 0;

    int edgeScore = 0;
    RiskTier tier = RiskTier::Reject;
    double suggestedStake = 0.0;
    double clvPercent = 0.0;
    std::size_t simulatedWins = 0;
    ConfidenceInterval interval;

    double lambdaHome = 0.0;
    double lambdaAway = 0.0;
    bool locked = false;
    std::optional<std::string> checksum;

    std::vector<double> goalDistribution;
    std::vector<ScorelineProbability> scorelines;
};

} // namespace ee
