#include "acca_freeze.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <set>

namespace ee {

namespace {

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

double round4(double value) {
    return std::round(value * 10000.0) / 10000.0;
}

bool backsHomeSide(const std::string& marketId) {
    return marketId == "result_home" || marketId == "draw_no_bet";
}

bool chronological(const AccaLeg& a, const AccaLeg& b) {
    return a.startTime < b.startTime;
}

bool withinPrice(const MatchPrediction& p, double lo, double hi) {
    return p.odds >= lo && p.odds <= hi;
}

struct Candidate {
    std::size_t ordinal = 0;
    std::size_t safeOffset = 0;
    std::size_t freezeIndex = 0;
    double safeProbability = 0.0;
};

// Indices of the pool's best legs by probability, in their original order.
std::vector<std::size_t> capPool(const std::vector<AccaLeg>& legs, std::size_t cap) {
    std::vector<std::size_t> order(legs.size());
    std::iota(order.begin(), order.end(), 0);
    if (legs.size() <= cap) {
        return order;
    }
    std::stable_sort(order.begin(), order.end(), [&legs](std::size_t a, std::size_t b) {
        return legs[a].probability > legs[b].probability;
    });
    order.resize(cap);
    std::sort(order.begin(), order.end());
    return order;
}

} // namespace

const char* legStatusName(LegStatus status) {
    switch (status) {
    case LegStatus::Pending:
        return "pending";
    case LegStatus::Won:
        return "won";
    case LegStatus::Lost:
        return "lost";
    case LegStatus::Void:
        return "void";
    }
    return "pending";
}

const char* freezeRecommendationName(FreezeRecommendation recommendation) {
    switch (recommendation) {
    case FreezeRecommendation::LetItRide:
        return "LET_IT_RIDE";
    case FreezeRecommendation::ConsiderFreezing:
        return "CONSIDER_FREEZING";
    case FreezeRecommendation::FreezeNow:
        return "FREEZE_NOW";
    case FreezeRecommendation::AccaDead:
        return "ACCA_DEAD";
    }
    return "LET_IT_RIDE";
}

AccaLeg predictionToLeg(const MatchPrediction& pick, bool freezeLeg) {
    AccaLeg leg;
    leg.fixtureId = pick.fixtureId;
    leg.marketId = pick.marketId;
    leg.team = backsHomeSide(pick.marketId) ? pick.homeTeam : pick.awayTeam;
    leg.homeTeam = pick.homeTeam;
    leg.awayTeam = pick.awayTeam;
    leg.odds = pick.odds;
    leg.probability = pick.probability;
    leg.confidence = pick.confidence;
    leg.startTime = pick.startTime;
    leg.leagueId = pick.leagueId;
    leg.leagueName = pick.leagueName;
    leg.lambdaHome = pick.lambdaHome;
    leg.lambdaAway = pick.lambdaAway;
    leg.freezeLeg = freezeLeg;
    return leg;
}

std::vector<AccaLeg> filterSafeLegs(const std::vector<MatchPrediction>& picks, const AccaConfig& cfg) {
    std::vector<const MatchPrediction*> eligible;
    for (const auto& p : picks) {
        if (isWinMarket(p.marketId) && withinPrice(p, cfg.safeOddsMin, cfg.safeOddsMax) &&
            p.edgeScore >= cfg.minEdgeScore) {
            eligible.push_back(&p);
        }
    }
    std::stable_sort(eligible.begin(), eligible.end(), [](const MatchPrediction* a, const MatchPrediction* b) {
        return a->probability > b->probability;
    });

    std::map<std::int64_t, std::size_t> perLeague;
    std::vector<AccaLeg> legs;
    for (const auto* p : eligible) {
        if (legs.size() >= cfg.maxSafePool) {
            break;
        }
        auto& count = perLeague[p->leagueId];
        if (count < cfg.maxPerLeague) {
            legs.push_back(predictionToLeg(*p, false));
            ++count;
        }
    }
    std::stable_sort(legs.begin(), legs.end(), chronological);
    return legs;
}

double scoreFirstProbability(const AccaLeg& leg) {
    double total = leg.lambdaHome + leg.lambdaAway;
    if (total <= 0.0) {
        return 0.0;
    }
    return (backsHomeSide(leg.marketId) ? leg.lambdaHome : leg.lambdaAway) / total;
}

std::vector<AccaLeg> filterFreezeLegs(const std::vector<MatchPrediction>& picks, const AccaConfig& cfg) {
    std::vector<AccaLeg> unique;
    std::map<std::int64_t, std::size_t> byFixture;
    for (const auto& p : picks) {
        if (!isWinMarket(p.marketId) || !withinPrice(p, cfg.freezeOddsMin, cfg.freezeOddsMax)) {
            continue;
        }
        AccaLeg leg = predictionToLeg(p, true);
        auto it = byFixture.find(p.fixtureId);
        if (it == byFixture.end()) {
            byFixture.emplace(p.fixtureId, unique.size());
            unique.push_back(std::move(leg));
        } else if (scoreFirstProbability(leg) > scoreFirstProbability(unique[it->second])) {
            unique[it->second] = std::move(leg);
        }
    }

    auto potential = [](const AccaLeg& leg) { return scoreFirstProbability(leg) * (1.0 + leg.odds / 20.0); };
    std::stable_sort(unique.begin(), unique.end(), [&potential](const AccaLeg& a, const AccaLeg& b) {
        return potential(a) > potential(b);
    });
    if (unique.size() > cfg.maxFreezePool) {
        unique.resize(cfg.maxFreezePool);
    }
    std::stable_sort(unique.begin(), unique.end(), chronological);
    return unique;
}

AccaScore scoreAcca(const std::vector<AccaLeg>& legs) {
    double odds = 1.0;
    double probability = 1.0;
    double totalProbability = 0.0;
    for (const auto& leg : legs) {
        odds *= leg.odds;
        probability *= leg.probability;
        totalProbability += leg.probability;
    }

    AccaScore out;
    out.combinedOdds = round2(odds);
    out.combinedProbability = round4(probability);
    if (totalProbability > 0.0) {
        double weighted = 0.0;
        for (const auto& leg : legs) {
            weighted += static_cast<double>(leg.confidence) * (leg.probability / totalProbability);
        }
        out.compositeConfidence = static_cast<int>(std::round(weighted));
    }
    return out;
}

std::vector<AccaFreeze> buildAccas(const std::vector<AccaLeg>& safeLegs,
                                   const std::vector<AccaLeg>& freezeLegs,
                                   std::size_t count,
                                   double stake,
                                   const AccaConfig& cfg) {
    const std::size_t k = cfg.safeLegs;
    if (safeLegs.size() < k || freezeLegs.empty() || count == 0 || k == 0) {
        return {};
    }

    const std::vector<std::size_t> pool = capPool(safeLegs, cfg.maxSafePool);
    const std::size_t n = pool.size();
    if (n < k) {
        return {};
    }

    std::vector<std::size_t> comboIndices;
    std::vector<Candidate> candidates;
    std::vector<std::size_t> pick(k);
    std::iota(pick.begin(), pick.end(), 0);

    std::map<std::int64_t, std::size_t> leagueCounts;
    std::set<std::int64_t> fixtures;
    while (true) {
        leagueCounts.clear();
        fixtures.clear();
        bool diversified = true;
        double safeProbability = 1.0;
        for (std::size_t idx : pick) {
            const AccaLeg& leg = safeLegs[pool[idx]];
            if (++leagueCounts[leg.leagueId] > cfg.maxPerLeague) {
                diversified = false;
                break;
            }
            fixtures.insert(leg.fixtureId);
            safeProbability *= leg.probability;
        }

        if (diversified) {
            std::size_t paired = 0;
            for (std::size_t f = 0; f < freezeLegs.size() && paired < cfg.freezeLegsPerCombination; ++f) {
                const AccaLeg& freeze = freezeLegs[f];
                if (fixtures.count(freeze.fixtureId) != 0) {
                    continue;
                }
                auto league = leagueCounts.find(freeze.leagueId);
                if (league != leagueCounts.end() && league->second >= cfg.maxPerLeague) {
                    continue;
                }
                Candidate c;
                c.ordinal = candidates.size();
                c.safeOffset = comboIndices.size();
                c.freezeIndex = f;
                c.safeProbability = safeProbability;
                candidates.push_back(c);
                ++paired;
            }
            if (paired > 0) {
                for (std::size_t idx : pick) {
                    comboIndices.push_back(pool[idx]);
                }
            }
        }

        // Next k-subset in lexicographic order.
        std::size_t i = k;
        while (i > 0 && pick[i - 1] == n - k + (i - 1)) {
            --i;
        }
        if (i == 0) {
            break;
        }
        ++pick[i - 1];
        for (std::size_t j = i; j < k; ++j) {
            pick[j] = pick[j - 1] + 1;
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        return a.safeProbability > b.safeProbability;
    });

    std::vector<const Candidate*> selected;
    std::set<std::int64_t> usedFreezeFixtures;
    for (const auto& c : candidates) {
        if (selected.size() >= count) {
            break;
        }
        if (usedFreezeFixtures.insert(freezeLegs[c.freezeIndex].fixtureId).second) {
            selected.push_back(&c);
        }
    }
    if (selected.size() < count) {
        std::set<std::size_t> taken;
        for (const auto* c : selected) {
            taken.insert(c->ordinal);
        }
        for (const auto& c : candidates) {
            if (selected.size() >= count) {
                break;
            }
            if (taken.count(c.ordinal) == 0) {
                selected.push_back(&c);
            }
        }
    }

    std::vector<AccaFreeze> out;
    out.reserve(selected.size());
    for (const auto* c : selected) {
        AccaFreeze acca;
        acca.id = "acca_" + std::to_string(c->ordinal);
        double safeOdds = 1.0;
        for (std::size_t j = 0; j < k; ++j) {
            acca.legs.push_back(safeLegs[comboIndices[c->safeOffset + j]]);
            acca.legs.back().freezeLeg = false;
            safeOdds *= acca.legs.back().odds;
        }
        acca.legs.push_back(freezeLegs[c->freezeIndex]);
        acca.legs.back().freezeLeg = true;

        AccaScore score = scoreAcca(acca.legs);
        acca.combinedOdds = score.combinedOdds;
        acca.combinedProbability = score.combinedProbability;
        acca.compositeConfidence = score.compositeConfidence;
        acca.fullPayout = round2(stake * score.combinedOdds);
        acca.safeOddsProduct = round2(safeOdds);
        acca.freezeLegOdds = freezeLegs[c->freezeIndex].odds;
        acca.freezeValue = calculateFreezeValue(acca.legs, stake);
        acca.recommendation = getFreezeRecommendation(acca.freezeValue, stake);

        std::stable_sort(acca.legs.begin(), acca.legs.end(), chronological);
        out.push_back(std::move(acca));
    }
    return out;
}

double calculateFreezeValue(const std::vector<AccaLeg>& legs, double stake) {
    double wonOdds = 1.0;
    double pendingProbability = 1.0;
    for (const auto& leg : legs) {
        switch (leg.status) {
        case LegStatus::Lost:
            return 0.0;
        case LegStatus::Won:
            wonOdds *= leg.odds;
            break;
        case LegStatus::Pending:
            pendingProbability *= leg.probability;
            break;
        case LegStatus::Void:
            break;
        }
    }
    return round2(stake * wonOdds * pendingProbability);
}

FreezeRecommendation getFreezeRecommendation(double freezeValue, double stake) {
    if (freezeValue <= 0.0) {
        return FreezeRecommendation::AccaDead;
    }
    if (freezeValue < stake) {
        return FreezeRecommendation::LetItRide;
    }
    if (freezeValue >= stake * 2.0) {
        return FreezeRecommendation::FreezeNow;
    }
    return FreezeRecommendation::ConsiderFreezing;
}

std::vector<MatchPrediction> deriveWinPredictions(const std::vector<WinDerivationInput>& fixtures,
                                                  const EngineConfig& cfg) {
    struct WinMarket {
        const char* id;
        MarketKey key;
    };
    const WinMarket winMarkets[] = {
        { "result_home", MarketKey::HomeWin },
        { "result_away", MarketKey::AwayWin },
        { "draw_no_bet", MarketKey::DnbHome },
        { "draw_no_bet_away", MarketKey::DnbAway },
    };

    std::vector<MatchPrediction> out;
    for (const auto& fixture : fixtures) {
        if (fixture.lambdas.home <= 0.0 || fixture.lambdas.away <= 0.0) {
            continue;
        }
        ScoreMatrix matrix = buildScoreMatrix(fixture.lambdas.home, fixture.lambdas.away, cfg.poisson.maxGoals);
        MarketProbabilities probabilities = deriveMarketProbabilities(matrix, cfg.poisson);

        for (const auto& wm : winMarkets) {
            double probability = probabilities[wm.key];
            if (probability < cfg.acca.minWinProbability) {
                continue;
            }
            const MarketDefinition* market = findMarketDefinition(wm.id);
            if (market == nullptr) {
                continue;
            }

            MatchPrediction p;
            auto quote = findOddsForMarket(fixture.odds, *market, fixture.match.homeTeam, fixture.match.awayTeam,
                                           cfg.selection.referenceBookmakerId);
            if (quote) {
                p.odds = quote->bestOdds;
                p.referenceOdds = quote->referenceOdds;
                p.bestBookmaker = quote->bestBookmaker;
            } else {
                p.odds = std::round(1.0 / probability * cfg.acca.fallbackMargin * 100.0) / 100.0;
            }
            if (p.odds <= 0.0) {
                continue;
            }

            p.fixtureId = fixture.match.fixtureId;
            p.homeTeam = fixture.match.homeTeam;
            p.awayTeam = fixture.match.awayTeam;
            p.leagueId = fixture.match.leagueId;
            p.leagueName = fixture.match.leagueName;
            p.startTime = fixture.match.startTime;
            p.market = resolveMarketLabel(*market, fixture.match.homeTeam, fixture.match.awayTeam);
            p.marketId = market->id;
            p.probability = probability;
            p.impliedProbability = 1.0 / p.odds;
            p.edge = probability - p.impliedProbability;
            p.ev = probability * p.odds - 1.0;
            p.evAdjusted = p.ev;
            p.confidence = fixture.confidence.value_or(cfg.acca.defaultConfidence);
            p.edgeScore = p.edge > 0.0 ? static_cast<int>(std::round(p.edge * 100.0)) : cfg.acca.minEdgeScore;
            p.tier = riskTierFromScore(static_cast<double>(p.edgeScore));
            p.lambdaHome = fixture.lambdas.home;
            p.lambdaAway = fixture.lambdas.away;
            out.push_back(std::move(p));
        }
    }
    return out;
}

} // namespace ee
