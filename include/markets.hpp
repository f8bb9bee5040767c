#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "engine_config.hpp"
#include "market_keys.hpp"

namespace ee {

// Provider market ids for the odds feed.
namespace provider_markets {
constexpr std::int64_t kMatchWinner = 1;
constexpr std::int64_t kDrawNoBet = 10;
constexpr std::int64_t kBtts = 14;
constexpr std::int64_t kOverUnder[] = { 80, 81, 105 };
constexpr std::int64_t kBttsGoals = 82;
constexpr std::int64_t kResultBtts = 97;
constexpr std::int64_t kFirstHalfOverUnder[] = { 28, 107 };
} // namespace provider_markets

struct OddsEntry {
    std::int64_t bookmakerId = 0;
    std::string bookmakerName;
    std::int64_t marketId = 0;
    std::string label;
    std::string name;
    double odds = 0.0;
};

enum class TeamSide { None, Home, Away };

struct MarketDefinition {
    std::string id;
    // "{home}" and "{away}" are replaced by team names.
    std::string label;
    MarketKey key = MarketKey::Over25;
    std::vector<std::int64_t> providerMarketIds;
    // '&'-separated parts, each required (case-insensitively) in "label name".
    std::string labelFilter;
    // Required as the exact entry name or inside the entry label.
    std::string nameFilter;
    TeamSide team = TeamSide::None;
};

// Evaluation order; earlier markets win edge-score ties.
const std::vector<MarketDefinition>& marketWhitelist();
const MarketDefinition* findMarketDefinition(const std::string& marketId);
std::string resolveMarketLabel(const MarketDefinition& market,
                               const std::string& homeTeam,
                               const std::string& awayTeam);

struct OddsQuote {
    double bestOdds = 0.0;
    std::string bestBookmaker;
    std::optional<double> referenceOdds;
    int bookmakerCount = 0;
};

// Matches feed entries to a market definition. Returns nullopt when the market
// id, label or name filters leave nothing; the team filter only narrows.
std::optional<OddsQuote> findOddsForMarket(const std::vector<OddsEntry>& odds,
                                           const MarketDefinition& market,
                                           const std::string& homeTeam,
                                           const std::string& awayTeam,
                                           std::int64_t referenceBookmakerId = 2);

struct MarketEvaluation {
    double probability = 0.0;
    double odds = 0.0;
    double impliedProbability = 0.0;
    double edge = 0.0;
    double ev = 0.0;
    double evAdjusted = 0.0;
    double varianceMultiplier = 1.0;
    int confidence = 0;
};

// Pricing of one market. Returns nullopt for non-positive odds or probability,
// or odds above the configured ceiling.
std::optional<MarketEvaluation> evaluateMarket(const std::string& marketId,
                                               double probability,
                                               double odds,
                                               int confidence,
                                               const EngineConfig& cfg = {});

bool isGoalTotalMarket(const std::string& marketId);
bool isResultFamilyMarket(const std::string& marketId);
bool isWinMarket(const std::string& marketId);
// goals, btts, result, or the market id itself.
std::string marketFamily(const std::string& marketId);

} // namespace ee
