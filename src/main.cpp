#include "acca_freeze.hpp"
#include "engine.hpp"
#include "engine_config.hpp"
#include "engine_events.hpp"
#include "kelly.hpp"
#include "odds_cache.hpp"
#include "portfolio.hpp"
#include "prediction_repository.hpp"

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace ee;

namespace {

struct DemoPrices {
    double home;
    double draw;
    double away;
    double over25;
    double under25;
    double over35;
    double bttsYes;
    double bttsNo;
    double dnbHome;
    double dnbAway;
    double firstHalfOver15;
};

TeamStats makeStats(double scored, double conceded, double formScored, double formConceded,
                    int rank, int games, double ppg) {
    TeamStats s;
    s.avgScored = scored;
    s.avgConceded = conceded;
    s.formScored = formScored;
    s.formConceded = formConceded;
    s.leagueRank = rank;
    s.gamesPlayed = games;
    s.formPpg = ppg;
    return s;
}

void addBookmaker(std::vector<OddsEntry>& odds, std::int64_t bookmakerId, const std::string& bookmaker,
                  const DemoPrices& p, double shade) {
    auto add = [&](std::int64_t marketId, const std::string& label, const std::string& name, double price) {
        odds.push_back(OddsEntry{ bookmakerId, bookmaker, marketId, label, name, price * shade });
    };
    add(provider_markets::kMatchWinner, "Home", "", p.home);
    add(provider_markets::kMatchWinner, "Draw", "", p.draw);
    add(provider_markets::kMatchWinner, "Away", "", p.away);
    add(provider_markets::kOverUnder[0], "Over", "2.5", p.over25);
    add(provider_markets::kOverUnder[0], "Under", "2.5", p.under25);
    add(provider_markets::kOverUnder[0], "Over", "3.5", p.over35);
    add(provider_markets::kBtts, "Yes", "", p.bttsYes);
    add(provider_markets::kBtts, "No", "", p.bttsNo);
    add(provider_markets::kDrawNoBet, "Home", "", p.dnbHome);
    add(provider_markets::kDrawNoBet, "Away", "", p.dnbAway);
    add(provider_markets::kFirstHalfOverUnder[0], "Over", "1.5", p.firstHalfOver15);
}

std::vector<OddsEntry> demoOdds(const DemoPrices& prices) {
    std::vector<OddsEntry> odds;
    addBookmaker(odds, 2, "Bet365", prices, 1.00);
    addBookmaker(odds, 8, "Unibet", prices, 0.98);
    addBookmaker(odds, 11, "Pinnacle", prices, 1.02);
    return odds;
}

struct DemoFixture {
    MatchContext match;
    DemoPrices prices;
};

std::vector<DemoFixture> demoSlate() {
    std::vector<DemoFixture> slate;
    auto push = [&slate](std::int64_t id, const std::string& home, const std::string& away, std::int64_t leagueId,
                         const std::string& league, const std::string& kickoff, TeamStats homeStats,
                         TeamStats awayStats, DemoPrices prices) {
        MatchContext m;
        m.fixtureId = id;
        m.homeTeam = home;
        m.awayTeam = away;
        m.leagueId = leagueId;
        m.leagueName = league;
        m.startTime = kickoff;
        m.home = std::move(homeStats);
        m.away = std::move(awayStats);
        slate.push_back(DemoFixture{ std::move(m), prices });
    };

    push(190001, "Arsenal", "Brentford", 8, "Premier League", "2026-10-24T11:30:00Z",
         makeStats(2.1, 0.8, 2.4, 0.6, 2, 9, 2.3), makeStats(1.3, 1.6, 1.0, 1.8, 14, 9, 1.0),
         { 1.42, 4.80, 7.50, 1.72, 2.15, 2.80, 1.95, 1.85, 1.12, 5.40, 3.10 });
    push(190002, "Everton", "Fulham", 8, "Premier League", "2026-10-24T14:00:00Z",
         makeStats(1.0, 1.3, 0.9, 1.2, 15, 9, 1.1), makeStats(1.4, 1.4, 1.6, 1.2, 10, 9, 1.4),
         { 2.70, 3.20, 2.80, 2.30, 1.62, 4.50, 1.98, 1.80, 1.95, 2.00, 4.20 });
    push(190003, "Newcastle", "Wolves", 8, "Premier League", "2026-10-24T16:30:00Z",
         makeStats(1.9, 1.0, 2.0, 0.8, 5, 9, 2.0), makeStats(1.0, 1.9, 0.8, 2.2, 19, 9, 0.6),
         { 1.55, 4.20, 6.00, 1.65, 2.25, 2.60, 1.90, 1.90, 1.16, 4.90, 2.90 });
    push(290001, "Celtic", "Hibernian", 564, "Premiership", "2026-10-24T15:00:00Z",
         makeStats(2.6, 0.7, 2.8, 0.5, 1, 10, 2.6), makeStats(1.2, 1.5, 1.0, 1.6, 7, 10, 1.2),
         { 1.30, 5.60, 9.50, 1.55, 2.45, 2.30, 2.05, 1.75, 1.07, 7.00, 2.60 });
    push(390001, "Feyenoord", "Utrecht", 9, "Eredivisie", "2026-10-25T13:30:00Z",
         makeStats(2.3, 1.0, 2.2, 1.1, 3, 8, 2.1), makeStats(1.6, 1.3, 1.8, 1.2, 6, 8, 1.7),
         { 1.75, 4.00, 4.30, 1.50, 2.60, 2.20, 1.62, 2.25, 1.30, 3.30, 2.40 });
    push(490001, "Lazio", "Verona", 384, "Serie A", "2026-10-25T17:00:00Z",
         makeStats(1.6, 1.0, 1.5, 0.9, 6, 8, 1.8), makeStats(0.9, 1.7, 0.8, 1.9, 18, 8, 0.7),
         { 1.62, 3.90, 5.80, 2.05, 1.78, 3.70, 2.10, 1.70, 1.20, 4.40, 3.80 });
    push(490002, "Torino", "Atalanta", 384, "Serie A", "2026-10-25T19:45:00Z",
         makeStats(1.1, 1.2, 1.0, 1.3, 11, 8, 1.2), makeStats(1.9, 1.1, 2.1, 1.0, 4, 8, 2.0),
         { 3.60, 3.40, 2.05, 2.00, 1.80, 3.50, 1.85, 1.95, 2.70, 1.48, 3.60 });
    return slate;
}

std::string utcTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

void printPick(const MatchPrediction& p) {
    std::cout << "  [" << p.fixtureId << "] " << p.homeTeam << " v " << p.awayTeam << "  " << p.market
              << " @ " << p.odds << "  p=" << p.probability << "  edge=" << p.edge << "  score=" << p.edgeScore
              << " " << riskTierName(p.tier) << "  stake=" << p.suggestedStake * 100.0 << "%\n";
}

void printAcca(const AccaFreeze& acca) {
    std::cout << "  " << acca.id << "  odds=" << acca.combinedOdds << "  p=" << acca.combinedProbability
              << "  confidence=" << acca.compositeConfidence << "  payout=" << acca.fullPayout << "  "
              << freezeRecommendationName(acca.recommendation) << "\n";
    for (const auto& leg : acca.legs) {
        std::cout << "    " << (leg.freezeLeg ? "* " : "  ") << leg.startTime << "  " << leg.homeTeam << " v "
                  << leg.awayTeam << "  " << leg.team << " (" << leg.marketId << ") @ " << leg.odds << "\n";
    }
}

} // namespace

int main() {
    EngineConfig cfg;
    try {
        cfg = loadConfigFromEnvironment();
        validateConfig(cfg);
    } catch (const std::exception& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return 1;
    }

    auto events = std::make_shared<StreamEventSink>(std::cerr);
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Edge Engine demo slate (iterations=" << cfg.monteCarlo.iterations
              << ", workers=" << cfg.workers << ")\n";

    InMemoryOddsCache oddsCache;
    const auto slate = demoSlate();
    for (const auto& fixture : slate) {
        oddsCache.set(fixture.match.fixtureId, demoOdds(fixture.prices), kOddsTtl);
    }

    std::vector<SlateFixture> fixtures;
    std::vector<WinDerivationInput> winInputs;
    for (const auto& fixture : slate) {
        auto odds = oddsCache.get(fixture.match.fixtureId);
        if (!odds) {
            std::cerr << "No cached odds for fixture " << fixture.match.fixtureId << "\n";
            continue;
        }
        fixtures.push_back(SlateFixture{ fixture.match, *odds });

        WinDerivationInput win;
        win.match = fixture.match;
        win.lambdas = buildMatchModel(fixture.match, cfg).lambdas;
        win.odds = *odds;
        winInputs.push_back(std::move(win));
    }

    const std::string generatedAt = utcTimestamp();
    EngineOutput output = runSlate(fixtures, generatedAt, cfg, events);

    std::cout << "\n=== PICKS (" << output.totalQualified << " of " << output.totalMatches << " fixtures) ===\n";
    for (const auto& pick : output.picks) {
        printPick(pick);
    }

    auto portfolio = deduplicateCorrelatedPicks(output.picks);
    std::cout << "\n=== PORTFOLIO (" << portfolio.size() << " uncorrelated) ===\n";
    std::vector<double> stakes;
    for (const auto& pick : portfolio) {
        auto kelly = computeKellyStake(pick.probability, pick.odds, cfg.kelly);
        auto exposure = checkDailyExposure(stakes, kelly.suggestedStake, cfg.kelly);
        std::cout << "  [" << pick.fixtureId << "] " << pick.marketId << ": " << kelly.reasoning;
        if (exposure.approved) {
            stakes.push_back(kelly.suggestedStake);
            std::cout << "\n";
        } else {
            std::cout << "  (skipped: " << exposure.reason << ")\n";
        }
    }
    auto impact = assessPortfolioImpact(portfolio, 1.0, cfg.portfolio);
    std::cout << "  worst case " << impact.worstCaseDrawdown << ", expected " << impact.expectedReturn
              << ", diversification " << impact.diversificationScore << ": "
              << (impact.approved ? "approved" : impact.reason) << "\n";

    auto winPicks = deriveWinPredictions(winInputs, cfg);
    auto safe = filterSafeLegs(winPicks, cfg.acca);
    auto freeze = filterFreezeLegs(winPicks, cfg.acca);
    auto accas = buildAccas(safe, freeze, cfg.acca.defaultCount, cfg.acca.defaultStake, cfg.acca);
    std::cout << "\n=== ACCUMULATORS (" << safe.size() << " safe, " << freeze.size() << " freeze legs) ===\n";
    if (accas.empty()) {
        std::cout << "  none available\n";
    }
    for (const auto& acca : accas) {
        printAcca(acca);
    }

    InMemoryPredictionRepository repository;
    std::cout << "\n=== PUBLICATION ===\n";
    for (const auto& pick : portfolio) {
        auto checksum = publishPrediction(repository, pick, generatedAt, events);
        auto verified = getVerifiedPrediction(repository, pick.fixtureId, events);
        std::cout << "  [" << pick.fixtureId << "] " << (checksum ? *checksum : std::string("not published"))
                  << "  " << (verified ? "verified" : "INVALID") << "\n";
    }

    return 0;
}
