#include "engine.hpp"

#include "clv.hpp"
#include "edge_score.hpp"
#include "risk.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <iomanip>
#include <sstream>

namespace ee {

namespace {

constexpr double kWeightSample = 0.20;
constexpr double kWeightDefence = 0.20;
constexpr double kWeightMarket = 0.15;
constexpr double kWeightForm = 0.20;
constexpr double kWeightElo = 0.15;
constexpr double kWeightInjury = 0.10;
constexpr double kNeutralInjuryStability = 75.0;
constexpr double kConfidenceDefaultConceded = 1.2;

const char* kComponent = "engine";

std::string describeCandidate(const EvaluatedMarket& m) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << m.marketId << ": odds=" << m.odds << " p=" << m.probability
        << " books=" << m.bookmakerCount << " edgeScore=" << m.edgeScore << " tier=" << riskTierName(m.tier);
    if (!m.risk.approved()) {
        oss << " (" << m.risk.rejectionReason << ")";
    }
    return oss.str();
}

} // namespace

MatchModel buildMatchModel(const MatchContext& match, const EngineConfig& cfg) {
    MatchModel model;
    BlendedStats home = blendStats(match.home, cfg.poisson);
    BlendedStats away = blendStats(match.away, cfg.poisson);

    model.elo = computeEloRatings(match, cfg.elo);
    model.strength = computeStrength(home, away, cfg.poisson);
    model.homeAdvantage = homeAdvantageFor(cfg.poisson, match.leagueId);

    LambdaPair lambdas = computeLambdas(model.strength, model.homeAdvantage, cfg.poisson);
    lambdas = adjustLambdasWithElo(lambdas, model.elo, cfg.elo, cfg.poisson);

    lambdas.home = applyFatigue(lambdas.home, match.home.restDays);
    lambdas.away = applyFatigue(lambdas.away, match.away.restDays);
    lambdas.home = applyInjury(lambdas.home, match.home.injuryFactor, cfg.poisson);
    lambdas.away = applyInjury(lambdas.away, match.away.injuryFactor, cfg.poisson);
    lambdas = clampLambdas(lambdas, cfg.poisson);

    model.lambdas = applyBayesianForm(lambdas, match, cfg.elo, cfg.poisson);
    return model;
}

int calculateConfidence(const MatchContext& match, double eloStrengthDelta, const SelectionConfig& cfg) {
    const EloConfig defaults;
    double homeGames = match.home.gamesPlayed.value_or(defaults.defaultGamesPlayed);
    double awayGames = match.away.gamesPlayed.value_or(defaults.defaultGamesPlayed);
    double sample = std::min(100.0, (homeGames + awayGames) / 40.0 * 100.0);

    double homeConceded = match.home.avgConceded.value_or(kConfidenceDefaultConceded);
    double awayConceded = match.away.avgConceded.value_or(kConfidenceDefaultConceded);
    double defence = std::min(100.0, 100.0 - std::abs(homeConceded - awayConceded) * 30.0);

    int rankGap = std::abs(match.home.leagueRank.value_or(defaults.defaultRank) -
                           match.away.leagueRank.value_or(defaults.defaultRank));
    double market = std::min(100.0, 90.0 - static_cast<double>(rankGap) * 2.0);

    double ppg = match.home.formPpg.value_or(defaults.defaultPpg) + match.away.formPpg.value_or(defaults.defaultPpg);
    double form = std::min(100.0, 80.0 + ppg * 5.0);

    double elo = std::min(100.0, 90.0 - eloStrengthDelta * 0.15);

    double raw = kWeightSample * sample + kWeightDefence * defence + kWeightMarket * market +
                 kWeightForm * form + kWeightElo * elo + kWeightInjury * kNeutralInjuryStability;
    double rounded = std::round(raw);
    return static_cast<int>(std::clamp(rounded, static_cast<double>(cfg.minConfidence),
                                       static_cast<double>(cfg.maxConfidence)));
}

ProcessedMatch processMatch(const MatchContext& match,
                            const std::vector<OddsEntry>& odds,
                            const EngineConfig& cfg,
                            const EventSinkPtr& events) {
    ProcessedMatch out;
    MatchModel model = buildMatchModel(match, cfg);
    out.lambdas = model.lambdas;
    out.elo = model.elo;

    ScoreMatrix matrix = buildScoreMatrix(out.lambdas.home, out.lambdas.away, cfg.poisson.maxGoals);
    out.analytical = deriveMarketProbabilities(matrix, cfg.poisson);
    out.simulation =
        runMonteCarlo(out.lambdas.home, out.lambdas.away, match.fixtureId, cfg.monteCarlo, cfg.poisson);
    out.confidence = calculateConfidence(match, model.elo.strengthDelta, cfg.selection);

    {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3) << match.homeTeam << " vs " << match.awayTeam
            << " lambda=" << out.lambdas.home << "/" << out.lambdas.away << " confidence=" << out.confidence
            << " oddsEntries=" << odds.size();
        emitEvent(events, EventLevel::Debug, kComponent, match.fixtureId, oss.str());
    }

    for (const auto& market : marketWhitelist()) {
        double analytical = out.analytical[market.key];
        if (analytical <= 0.0) {
            emitEvent(events, EventLevel::Debug, kComponent, match.fixtureId,
                      market.id + ": skipped, no analytical probability");
            continue;
        }
        double simulated = out.simulation.probabilities[market.key];
        double probability =
            blendProbability(analytical, simulated, calibrationFactorFor(cfg, market.id), cfg.selection);

        auto quote = findOddsForMarket(odds, market, match.homeTeam, match.awayTeam,
                                       cfg.selection.referenceBookmakerId);
        if (!quote) {
            emitEvent(events, EventLevel::Debug, kComponent, match.fixtureId, market.id + ": skipped, no odds matched");
            continue;
        }

        auto evaluation = evaluateMarket(market.id, probability, quote->bestOdds, out.confidence, cfg);
        if (!evaluation) {
            emitEvent(events, EventLevel::Debug, kComponent, match.fixtureId,
                      market.id + ": skipped, odds outside accepted range");
            continue;
        }

        EvaluatedMarket candidate;
        candidate.marketId = market.id;
        candidate.label = resolveMarketLabel(market, match.homeTeam, match.awayTeam);
        candidate.key = market.key;
        candidate.analyticalProbability = analytical;
        candidate.simulatedProbability = simulated;
        candidate.probability = evaluation->probability;
        candidate.impliedProbability = evaluation->impliedProbability;
        candidate.odds = evaluation->odds;
        candidate.referenceOdds = quote->referenceOdds;
        candidate.bestBookmaker = quote->bestBookmaker;
        candidate.bookmakerCount = quote->bookmakerCount;
        candidate.edge = evaluation->edge;
        candidate.ev = evaluation->ev;
        candidate.evAdjusted = evaluation->evAdjusted;
        candidate.varianceMultiplier = evaluation->varianceMultiplier;
        candidate.confidence = evaluation->confidence;
        candidate.interval = out.simulation.interval(market.key);
        candidate.simulatedWins = static_cast<std::size_t>(
            std::llround(simulated * static_cast<double>(out.simulation.iterations)));

        candidate.clv = predictClv(candidate.odds, candidate.probability, candidate.edge,
                                   candidate.bookmakerCount, cfg.clv);
        candidate.risk = assessRisk(candidate.ev, candidate.odds, candidate.interval,
                                    out.simulation.volatilityScore, candidate.bookmakerCount,
                                    candidate.varianceMultiplier, cfg.risk);
        if (candidate.risk.approved()) {
            candidate.evAdjusted = candidate.risk.varianceAdjustedEv;
        }

        EdgeScoreResult score = computeEdgeScore(candidate.evAdjusted, candidate.edge, candidate.clv,
                                                 candidate.risk, out.confidence, candidate.probability,
                                                 candidate.odds, cfg.weights, cfg.kelly);
        candidate.edgeScore = score.edgeScore;
        candidate.tier = score.tier;
        candidate.suggestedStake = score.suggestedStake;

        emitEvent(events, EventLevel::Debug, kComponent, match.fixtureId, describeCandidate(candidate));
        out.candidates.push_back(std::move(candidate));
    }

    const EvaluatedMarket* best = nullptr;
    for (const auto& candidate : out.candidates) {
        if (candidate.odds < cfg.selection.oddsDisplayMin) {
            continue;
        }
        if (best == nullptr || candidate.edgeScore > best->edgeScore) {
            best = &candidate;
        }
    }
    if (best != nullptr) {
        out.best = *best;
        emitEvent(events, EventLevel::Info, kComponent, match.fixtureId,
                  "selected " + best->marketId + " (" + best->label + ") edgeScore=" +
                      std::to_string(best->edgeScore));
    } else {
        emitEvent(events, EventLevel::Info, kComponent, match.fixtureId,
                  "no qualifying market among " + std::to_string(out.candidates.size()) + " candidates");
    }
    return out;
}

MatchPrediction toMatchPrediction(const MatchContext& match,
                                  const EvaluatedMarket& market,
                                  const ProcessedMatch& processed,
                                  bool locked,
                                  std::optional<std::string> checksum) {
    MatchPrediction p;
    p.fixtureId = match.fixtureId;
    p.homeTeam = match.homeTeam;
    p.awayTeam = match.awayTeam;
    p.leagueId = match.leagueId;
    p.leagueName = match.leagueName;
    p.startTime = match.startTime;

    p.market = market.label;
    p.marketId = market.marketId;
    p.probability = market.probability;
    p.impliedProbability = market.impliedProbability;
    p.odds = market.odds;
    p.referenceOdds = market.referenceOdds;
    p.bestBookmaker = market.bestBookmaker;
    p.edge = market.edge;
    p.ev = market.ev;
    p.evAdjusted = market.evAdjusted;
    p.confidence = market.confidence;
    p.edgeScore = market.edgeScore;
    p.tier = market.tier;
    p.suggestedStake = market.suggestedStake;
    p.clvPercent = market.clv.clvPercent;
    p.simulatedWins = market.simulatedWins;
    p.interval = market.interval;

    p.lambdaHome = processed.lambdas.home;
    p.lambdaAway = processed.lambdas.away;
    p.locked = locked;
    p.checksum = std::move(checksum);
    p.goalDistribution = processed.simulation.goalDistribution;
    p.scorelines = processed.simulation.topScorelines;
    return p;
}

EngineOutput runSlate(const std::vector<SlateFixture>& fixtures,
                      const std::string& generatedAt,
                      const EngineConfig& cfg,
                      const EventSinkPtr& events) {
    validateConfig(cfg);

    const std::size_t n = fixtures.size();
    std::vector<std::optional<MatchPrediction>> slots(n);
    const std::size_t workers = std::max<std::size_t>(1, std::min(cfg.workers, n));

    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
        futures.push_back(std::async(std::launch::async, [&, w]() {
            for (std::size_t i = w; i < n; i += workers) {
                const auto& fixture = fixtures[i];
                ProcessedMatch processed = processMatch(fixture.match, fixture.odds, cfg, events);
                if (processed.best) {
                    slots[i] = toMatchPrediction(fixture.match, *processed.best, processed);
                }
            }
        }));
    }
    for (auto& f : futures) {
        f.get();
    }

    EngineOutput out;
    out.totalMatches = n;
    out.generatedAt = generatedAt;
    for (auto& slot : slots) {
        if (slot) {
            out.picks.push_back(std::move(*slot));
        }
    }
    out.totalQualified = out.picks.size();
    std::stable_sort(out.picks.begin(), out.picks.end(), [](const MatchPrediction& a, const MatchPrediction& b) {
        return a.edgeScore > b.edgeScore;
    });
    if (out.picks.size() > cfg.selection.maxPicksPerDay) {
        out.picks.resize(cfg.selection.maxPicksPerDay);
    }

    emitEvent(events, EventLevel::Info, "slate", 0,
              std::to_string(out.totalQualified) + " of " + std::to_string(n) + " fixtures qualified, " +
                  std::to_string(out.picks.size()) + " picks published");
    return out;
}

} // namespace ee
