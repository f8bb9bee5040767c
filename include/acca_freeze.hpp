#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "engine_config.hpp"
#include "markets.hpp"
#include "match_context.hpp"
#include "poisson.hpp"
#include "prediction.hpp"

namespace ee {

enum class LegStatus { Pending, Won, Lost, Void };

enum class FreezeRecommendation { LetItRide, ConsiderFreezing, FreezeNow, AccaDead };

const char* legStatusName(LegStatus status);
const char* freezeRecommendationName(FreezeRecommendation recommendation);

struct AccaLeg {
    std::int64_t fixtureId = 0;
    std::string marketId;
    std::string team;
    std::string homeTeam;
    std::string awayTeam;
    double odds = 0.0;
    double probability = 0.0;
    int confidence = 0;
    std::string startTime;
    std::int64_t leagueId = 0;
    std::string leagueName;
    double lambdaHome = 0.0;
    double lambdaAway = 0.0;
    LegStatus status = LegStatus::Pending;
    bool freezeLeg = false;
};

struct AccaFreeze {
    std::string id;
    // Chronological; exactly one has freezeLeg set.
    std::vector<AccaLeg> legs;
    double combinedOdds = 0.0;
    double combinedProbability = 0.0;
    int compositeConfidence = 0;
    double freezeValue = 0.0;
    double fullPayout = 0.0;
    double safeOddsProduct = 0.0;
    double freezeLegOdds = 0.0;
    FreezeRecommendation recommendation = FreezeRecommendation::LetItRide;
};

struct AccaScore {
    double combinedOdds = 0.0;
    double combinedProbability = 0.0;
    int compositeConfidence = 0;
};

AccaLeg predictionToLeg(const MatchPrediction& pick, bool freezeLeg);

// Win-type picks priced 1.20-2.00 with a minimum edge score, best probability
// first under the per-league cap, returned in kick-off order.
std::vector<AccaLeg> filterSafeLegs(const std::vector<MatchPrediction>& picks, const AccaConfig& cfg = {});

// Win-type picks priced 3.00-22.50, one per fixture, ranked by the chance of
// the backed side scoring first weighted toward longer odds.
std::vector<AccaLeg> filterFreezeLegs(const std::vector<MatchPrediction>& picks, const AccaConfig& cfg = {});

// Share of total expected goals belonging to the backed side.
double scoreFirstProbability(const AccaLeg& leg);

AccaScore scoreAcca(const std::vector<AccaLeg>& legs);

// Four safe legs plus one freeze leg per accumulator, ranked by the safe legs'
// joint probability. Empty when fewer than four safe legs or no freeze leg.
std::vector<AccaFreeze> buildAccas(const std::vector<AccaLeg>& safeLegs,
                                   const std::vector<AccaLeg>& freezeLegs,
                                   std::size_t count = 2,
                                   double stake = 10.0,
                                   const AccaConfig& cfg = {});

// Zero once any leg is lost; otherwise stake x won odds x pending probabilities.
double calculateFreezeValue(const std::vector<AccaLeg>& legs, double stake = 10.0);

FreezeRecommendation getFreezeRecommendation(double freezeValue, double stake = 10.0);

struct WinDerivationInput {
    MatchContext match;
    LambdaPair lambdas;
    std::vector<OddsEntry> odds;
    std::optional<int> confidence;
};

// Result and draw-no-bet picks priced straight from the score matrix, used to
// stock accumulator pools beyond the one-pick-per-match slate. Unquoted markets
// fall back to fair odds plus a 5% margin.
std::vector<MatchPrediction> deriveWinPredictions(const std::vector<WinDerivationInput>& fixtures,
                                                  const EngineConfig& cfg = {});

} // namespace ee
