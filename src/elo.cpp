#include "elo.hpp"

#include "deterministic_math.hpp"

#include <algorithm>
#include <cmath>

namespace ee {

namespace {

double ratingFor(int rank, int gamesPlayed, double formPpg, const EloConfig& cfg) {
    double base = cfg.baseRating + static_cast<double>(cfg.leagueSize - rank) * cfg.rankStep;
    double sampleFactor = std::min(1.0, static_cast<double>(gamesPlayed) / cfg.formGamesSaturation);
    return base + (formPpg - 1.0) * cfg.formScale * sampleFactor;
}

} // namespace

EloRating computeEloRatings(int homeRank,
                            int awayRank,
                            int homeGamesPlayed,
                            int awayGamesPlayed,
                            double homeFormPpg,
                            double awayFormPpg,
                            const EloConfig& cfg) {
    EloRating r;
    r.home = ratingFor(homeRank, homeGamesPlayed, homeFormPpg, cfg);
    r.away = ratingFor(awayRank, awayGamesPlayed, awayFormPpg, cfg);

    double diff = r.away - r.home;
    double expectedHome = 1.0 / (1.0 + DeterministicMath::pow10(diff / 400.0));
    double expectedAway = 1.0 / (1.0 + DeterministicMath::pow10(-diff / 400.0));

    r.expectedDraw = cfg.drawFactor * (1.0 - std::abs(expectedHome - expectedAway));
    r.expectedHome = expectedHome * (1.0 - r.expectedDraw);
    r.expectedAway = expectedAway * (1.0 - r.expectedDraw);
    r.strengthDelta = std::abs(r.home - r.away);
    return r;
}

EloRating computeEloRatings(const MatchContext& match, const EloConfig& cfg) {
    return computeEloRatings(match.home.leagueRank.value_or(cfg.defaultRank),
                             match.away.leagueRank.value_or(cfg.defaultRank),
                             match.home.gamesPlayed.value_or(cfg.defaultGamesPlayed),
                             match.away.gamesPlayed.value_or(cfg.defaultGamesPlayed),
                             match.home.formPpg.value_or(cfg.defaultPpg),
                             match.away.formPpg.value_or(cfg.defaultPpg),
                             cfg);
}

BayesianAdjustment bayesianUpdate(double prior, double formSignal, int sampleSize, const EloConfig& cfg) {
    BayesianAdjustment out;
    out.evidenceWeight = std::clamp(static_cast<double>(sampleSize) / cfg.evidenceGames, 0.0, 1.0);
    out.priorWeight = 1.0 - out.evidenceWeight * cfg.maxEvidenceShift;
    double posterior = prior * out.priorWeight + formSignal * (1.0 - out.priorWeight);
    out.adjustedProbability = std::clamp(posterior, cfg.minPosterior, cfg.maxPosterior);
    return out;
}

LambdaPair adjustLambdasWithElo(LambdaPair lambdas,
                                const EloRating& rating,
                                const EloConfig& eloCfg,
                                const PoissonConfig& poissonCfg) {
    double total = lambdas.home + lambdas.away;
    double eloSum = rating.expectedHome + rating.expectedAway;
    if (total <= 0.0 || eloSum <= 0.0) {
        return clampLambdas(lambdas, poissonCfg);
    }
    double eloHomeShare = rating.expectedHome / eloSum;
    double modelHomeShare = lambdas.home / total;
    double blendedHomeShare =
        modelHomeShare * (1.0 - eloCfg.lambdaBlend) + eloHomeShare * eloCfg.lambdaBlend;

    LambdaPair out;
    out.home = total * blendedHomeShare;
    out.away = total * (1.0 - blendedHomeShare);
    return clampLambdas(out, poissonCfg);
}

LambdaPair applyBayesianForm(LambdaPair lambdas,
                             const MatchContext& match,
                             const EloConfig& eloCfg,
                             const PoissonConfig& poissonCfg) {
    double homePpg = match.home.formPpg.value_or(eloCfg.defaultPpg);
    double awayPpg = match.away.formPpg.value_or(eloCfg.defaultPpg);
    int homeGames = match.home.gamesPlayed.value_or(eloCfg.defaultGamesPlayed);
    int awayGames = match.away.gamesPlayed.value_or(eloCfg.defaultGamesPlayed);

    auto home = bayesianUpdate(lambdas.home / eloCfg.homeLambdaScale, homePpg / eloCfg.ppgScale, homeGames, eloCfg);
    auto away = bayesianUpdate(lambdas.away / eloCfg.awayLambdaScale, awayPpg / eloCfg.ppgScale, awayGames, eloCfg);

    LambdaPair out;
    out.home = home.adjustedProbability * eloCfg.homeLambdaScale;
    out.away = away.adjustedProbability * eloCfg.awayLambdaScale;
    return clampLambdas(out, poissonCfg);
}

} // namespace ee
