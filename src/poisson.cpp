#include "poisson.hpp"

#include "deterministic_math.hpp"

#include <algorithm>
#include <array>
#include <tuple>

namespace ee {

namespace {

constexpr std::array<double, kMaxFactorial + 1> kFactorials = {
    1.0, 1.0, 2.0, 6.0, 24.0, 120.0, 720.0, 5040.0, 40320.0, 362880.0, 3628800.0,
};

std::vector<double> distribution(double lambda, int maxGoals) {
    std::vector<double> dist(static_cast<std::size_t>(maxGoals + 1), 0.0);
    for (int k = 0; k <= maxGoals; ++k) {
        dist[static_cast<std::size_t>(k)] = poissonPmf(lambda, k);
    }
    return dist;
}

} // namespace

double factorial(int n) {
    if (n < 0 || n > kMaxFactorial) {
        return 0.0;
    }
    return kFactorials[static_cast<std::size_t>(n)];
}

double poissonPmf(double lambda, int k) {
    if (k < 0 || k > kMaxFactorial || lambda < 0.0) {
        return 0.0;
    }
    return DeterministicMath::exp(-lambda) * DeterministicMath::powInt(lambda, k) / factorial(k);
}

double fatigueFactor(std::optional<int> restDays) {
    if (!restDays || *restDays >= 5) {
        return 1.0;
    }
    if (*restDays >= 3) {
        return 0.97;
    }
    if (*restDays >= 2) {
        return 0.94;
    }
    return 0.90;
}

double applyFatigue(double lambda, std::optional<int> restDays) {
    return lambda * fatigueFactor(restDays);
}

double applyInjury(double lambda, std::optional<double> injuryFactor, const PoissonConfig& cfg) {
    if (!injuryFactor) {
        return lambda;
    }
    return lambda * std::clamp(*injuryFactor, cfg.minInjuryFactor, 1.0);
}

BlendedStats blendStats(const TeamStats& stats, const PoissonConfig& cfg) {
    double seasonScored = stats.avgScored.value_or(cfg.defaultScored);
    double seasonConceded = stats.avgConceded.value_or(cfg.defaultConceded);
    double formScored = stats.formScored.value_or(seasonScored);
    double formConceded = stats.formConceded.value_or(seasonConceded);

    BlendedStats out;
    out.scored = seasonScored * cfg.seasonWeight + formScored * cfg.formWeight;
    out.conceded = seasonConceded * cfg.seasonWeight + formConceded * cfg.formWeight;
    return out;
}

StrengthFactors computeStrength(const BlendedStats& home,
                                const BlendedStats& away,
                                const PoissonConfig& cfg) {
    StrengthFactors s;
    s.attackHome = home.scored / cfg.leagueAvgHomeGoals;
    s.defenseHome = home.conceded / cfg.leagueAvgAwayGoals;
    s.attackAway = away.scored / cfg.leagueAvgAwayGoals;
    s.defenseAway = away.conceded / cfg.leagueAvgHomeGoals;
    return s;
}

LambdaPair clampLambdas(LambdaPair lambdas, const PoissonConfig& cfg) {
    lambdas.home = std::clamp(lambdas.home, cfg.minLambdaHome, cfg.maxLambdaHome);
    lambdas.away = std::clamp(lambdas.away, cfg.minLambdaAway, cfg.maxLambdaAway);
    return lambdas;
}

LambdaPair computeLambdas(const StrengthFactors& strength,
                          double homeAdvantage,
                          const PoissonConfig& cfg) {
    LambdaPair raw;
    raw.home = cfg.leagueAvgHomeGoals * strength.attackHome * strength.defenseAway * homeAdvantage;
    raw.away = cfg.leagueAvgAwayGoals * strength.attackAway * strength.defenseHome;
    return clampLambdas(raw, cfg);
}

double ScoreMatrix::total() const {
    double sum = 0.0;
    for (double c : cells) {
        sum += c;
    }
    return sum;
}

ScoreMatrix buildScoreMatrix(double lambdaHome, double lambdaAway, int maxGoals) {
    maxGoals = std::clamp(maxGoals, 0, kMaxFactorial);

    ScoreMatrix m;
    m.maxGoals = maxGoals;
    m.lambdaHome = lambdaHome;
    m.lambdaAway = lambdaAway;
    m.homeDistribution = distribution(lambdaHome, maxGoals);
    m.awayDistribution = distribution(lambdaAway, maxGoals);

    const auto side = static_cast<std::size_t>(maxGoals + 1);
    m.cells.assign(side * side, 0.0);
    for (std::size_t h = 0; h < side; ++h) {
        for (std::size_t a = 0; a < side; ++a) {
            m.cells[h * side + a] = m.homeDistribution[h] * m.awayDistribution[a];
        }
    }
    return m;
}

MarketProbabilities deriveMarketProbabilities(const ScoreMatrix& matrix, const PoissonConfig& cfg) {
    const int n = matrix.maxGoals;
    MarketProbabilities p;

    std::vector<double> totals(static_cast<std::size_t>(2 * n + 1), 0.0);
    for (int h = 0; h <= n; ++h) {
        for (int a = 0; a <= n; ++a) {
            totals[static_cast<std::size_t>(h + a)] += matrix.cell(h, a);
        }
    }
    auto cumulative = [&totals](int maxTotal) {
        double sum = 0.0;
        for (int k = 0; k <= maxTotal && k < static_cast<int>(totals.size()); ++k) {
            sum += totals[static_cast<std::size_t>(k)];
        }
        return sum;
    };

    p[MarketKey::Under15] = cumulative(1);
    p[MarketKey::Under25] = cumulative(2);
    p[MarketKey::Under35] = cumulative(3);
    p[MarketKey::Under45] = cumulative(4);
    p[MarketKey::Over15] = 1.0 - p[MarketKey::Under15];
    p[MarketKey::Over25] = 1.0 - p[MarketKey::Under25];
    p[MarketKey::Over35] = 1.0 - p[MarketKey::Under35];

    double homeScores = 1.0 - matrix.homeDistribution[0];
    double awayScores = 1.0 - matrix.awayDistribution[0];
    p[MarketKey::BttsYes] = homeScores * awayScores;
    p[MarketKey::BttsNo] = 1.0 - p[MarketKey::BttsYes];

    double homeWin = 0.0;
    double draw = 0.0;
    double awayWin = 0.0;
    for (int h = 0; h <= n; ++h) {
        for (int a = 0; a <= n; ++a) {
            double c = matrix.cell(h, a);
            if (h > a) {
                homeWin += c;
            } else if (h == a) {
                draw += c;
            } else {
                awayWin += c;
            }
            if (h >= 1 && a >= 1) {
                int total = h + a;
                if (total > 2) {
                    p[MarketKey::BttsOver25] += c;
                }
                if (total > 3) {
                    p[MarketKey::BttsOver35] += c;
                }
                // Both teams scoring means at least two goals, so this stays 0.
                if (total <= 1) {
                    p[MarketKey::BttsUnder15] += c;
                }
                if (total <= 2) {
                    p[MarketKey::BttsUnder25] += c;
                }
                if (h > a) {
                    p[MarketKey::BttsHomeWin] += c;
                } else if (a > h) {
                    p[MarketKey::BttsAwayWin] += c;
                }
            }
        }
    }
    p[MarketKey::HomeWin] = homeWin;
    p[MarketKey::Draw] = draw;
    p[MarketKey::AwayWin] = awayWin;
    double decisive = homeWin + awayWin;
    p[MarketKey::DnbHome] = decisive > 0.0 ? homeWin / decisive : 0.5;
    p[MarketKey::DnbAway] = decisive > 0.0 ? awayWin / decisive : 0.5;

    for (int k = 2; k <= n; ++k) {
        p[MarketKey::HomeOver15] += matrix.homeDistribution[static_cast<std::size_t>(k)];
        p[MarketKey::AwayOver15] += matrix.awayDistribution[static_cast<std::size_t>(k)];
    }

    double lambdaFirstHalf = (matrix.lambdaHome + matrix.lambdaAway) * cfg.halfTimeFactor;
    double e = DeterministicMath::exp(-lambdaFirstHalf);
    double p0 = e;
    double p1 = lambdaFirstHalf * e;
    double p2 = lambdaFirstHalf * lambdaFirstHalf / 2.0 * e;
    p[MarketKey::FirstHalfUnder05] = p0;
    p[MarketKey::FirstHalfOver05] = 1.0 - p0;
    p[MarketKey::FirstHalfUnder15] = p0 + p1;
    p[MarketKey::FirstHalfOver15] = 1.0 - (p0 + p1);
    p[MarketKey::FirstHalfOver25] = 1.0 - (p0 + p1 + p2);

    const int grid = std::min(cfg.correctScoreMaxGoals, n);
    std::vector<ScorelineProbability> scores;
    for (int h = 0; h <= grid; ++h) {
        for (int a = 0; a <= grid; ++a) {
            scores.push_back(ScorelineProbability{ h, a, matrix.cell(h, a) });
        }
    }
    std::stable_sort(scores.begin(), scores.end(),
                     [](const ScorelineProbability& x, const ScorelineProbability& y) {
                         if (x.probability != y.probability) {
                             return x.probability > y.probability;
                         }
                         return std::tie(x.home, x.away) < std::tie(y.home, y.away);
                     });
    if (scores.size() > cfg.correctScoreCount) {
        scores.resize(cfg.correctScoreCount);
    }
    p.correctScores = std::move(scores);
    return p;
}

} // namespace ee
