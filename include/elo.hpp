#pragma once

#include "engine_config.hpp"
#include "match_context.hpp"
#include "poisson.hpp"

namespace ee {

struct EloRating {
    double home = 0.0;
    double away = 0.0;
    // Win expectations already scaled by (1 - expectedDraw).
    double expectedHome = 0.0;
    double expectedAway = 0.0;
    double expectedDraw = 0.0;
    double strengthDelta = 0.0;
};

struct BayesianAdjustment {
    double adjustedProbability = 0.0;
    double priorWeight = 1.0;
    double evidenceWeight = 0.0;
};

EloRating computeEloRatings(int homeRank,
                            int awayRank,
                            int homeGamesPlayed,
                            int awayGamesPlayed,
                            double homeFormPpg,
                            double awayFormPpg,
                            const EloConfig& cfg = {});

// Ratings for a fixture, substituting defaults for missing rank, games or form.
EloRating computeEloRatings(const MatchContext& match, const EloConfig& cfg = {});

// Shrinks a prior toward a form signal; evidence never moves it by more than 40%.
BayesianAdjustment bayesianUpdate(double prior,
                                  double formSignal,
                                  int sampleSize,
                                  const EloConfig& cfg = {});

// Moves the home share of total goals 15% toward the Elo home share. The total
// is preserved before the result is re-clamped.
LambdaPair adjustLambdasWithElo(LambdaPair lambdas,
                                const EloRating& rating,
                                const EloConfig& eloCfg = {},
                                const PoissonConfig& poissonCfg = {});

// Bayesian pass over both expected-goal figures using points-per-game as the
// form signal and games played as the evidence count.
LambdaPair applyBayesianForm(LambdaPair lambdas,
                             const MatchContext& match,
                             const EloConfig& eloCfg = {},
                             const PoissonConfig& poissonCfg = {});

} // namespace ee
