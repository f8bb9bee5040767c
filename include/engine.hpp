#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "elo.hpp"
#include "engine_config.hpp"
#include "engine_events.hpp"
#include "markets.hpp"
#include "match_context.hpp"
#include "monte_carlo.hpp"
#include "poisson.hpp"
#include "prediction.hpp"

namespace ee {

struct MatchModel {
    EloRating elo;
    StrengthFactors strength;
    double homeAdvantage = 1.0;
    LambdaPair lambdas;
};

// Stats -> strength -> lambdas -> Elo blend -> fatigue/injury -> Bayesian form,
// clamping after every adjustment.
MatchModel buildMatchModel(const MatchContext& match, const EngineConfig& cfg = {});

// Weighted sample, defence, rank, form, Elo and injury stability; clamped to
// [40, 95].
int calculateConfidence(const MatchContext& match, double eloStrengthDelta, const SelectionConfig& cfg = {});

struct ProcessedMatch {
    // Highest edge score among candidates at or above the display odds floor.
    std::optional<EvaluatedMarket> best;
    LambdaPair lambdas;
    int confidence = 0;
    EloRating elo;
    MarketProbabilities analytical;
    SimulationResult simulation;
    std::vector<EvaluatedMarket> candidates;
};

ProcessedMatch processMatch(const MatchContext& match,
                            const std::vector<OddsEntry>& odds,
                            const EngineConfig& cfg = {},
                            const EventSinkPtr& events = nullptr);

MatchPrediction toMatchPrediction(const MatchContext& match,
                                  const EvaluatedMarket& market,
                                  const ProcessedMatch& processed,
                                  bool locked = false,
                                  std::optional<std::string> checksum = std::nullopt);

struct SlateFixture {
    MatchContext match;
    std::vector<OddsEntry> odds;
};

struct EngineOutput {
    // One per fixture at most, edge score descending.
    std::vector<MatchPrediction> picks;
    std::size_t totalMatches = 0;
    std::size_t totalQualified = 0;
    std::string generatedAt;
};

// Fans fixtures out over cfg.workers tasks. Results are identical for any
// worker count.
EngineOutput runSlate(const std::vector<SlateFixture>& fixtures,
                      const std::string& generatedAt,
                      const EngineConfig& cfg = {},
                      const EventSinkPtr& events = nullptr);

} // namespace ee
