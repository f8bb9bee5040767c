#include "markets.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>

namespace ee {

namespace {

std::vector<std::int64_t> overUnderIds() {
    return { std::begin(provider_markets::kOverUnder), std::end(provider_markets::kOverUnder) };
}

std::vector<std::int64_t> firstHalfIds() {
    return { std::begin(provider_markets::kFirstHalfOverUnder),
             std::end(provider_markets::kFirstHalfOverUnder) };
}

std::vector<MarketDefinition> buildWhitelist() {
    using P = std::vector<std::int64_t>;
    const P btts{ provider_markets::kBtts };
    const P bttsGoals{ provider_markets::kBttsGoals };
    const P resultBtts{ provider_markets::kResultBtts };
    const P winner{ provider_markets::kMatchWinner };
    const P dnb{ provider_markets::kDrawNoBet };

    return {
        { "over_2.5", "Over 2.5 Goals", MarketKey::Over25, overUnderIds(), "Over", "2.5", TeamSide::None },
        { "under_2.5", "Under 2.5 Goals", MarketKey::Under25, overUnderIds(), "Under", "2.5", TeamSide::None },
        { "over_3.5", "Over 3.5 Goals", MarketKey::Over35, overUnderIds(), "Over", "3.5", TeamSide::None },
        { "under_3.5", "Under 3.5 Goals", MarketKey::Under35, overUnderIds(), "Under", "3.5", TeamSide::None },
        { "btts", "Both Teams To Score", MarketKey::BttsYes, btts, "Yes", "", TeamSide::None },
        { "btts_over_2.5", "BTTS & Over 2.5", MarketKey::BttsOver25, bttsGoals, "Over 2.5 & Yes", "", TeamSide::None },
        { "btts_under_2.5", "BTTS & Under 2.5", MarketKey::BttsUnder25, bttsGoals, "Under 2.5 & Yes", "", TeamSide::None },
        { "btts_home_win", "{home} & BTTS", MarketKey::BttsHomeWin, resultBtts, "", "", TeamSide::Home },
        { "btts_away_win", "{away} & BTTS", MarketKey::BttsAwayWin, resultBtts, "", "", TeamSide::Away },
        { "home_over_1.5", "{home} Over 1.5", MarketKey::HomeOver15, overUnderIds(), "Over", "1.5", TeamSide::Home },
        { "away_over_1.5", "{away} Over 1.5", MarketKey::AwayOver15, overUnderIds(), "Over", "1.5", TeamSide::Away },
        { "draw_no_bet", "{home} (DNB)", MarketKey::DnbHome, dnb, "", "", TeamSide::Home },
        { "draw_no_bet_away", "{away} (DNB)", MarketKey::DnbAway, dnb, "", "", TeamSide::Away },
        { "result_home", "{home} to Win", MarketKey::HomeWin, winner, "Home", "", TeamSide::Home },
        { "result_draw", "Draw", MarketKey::Draw, winner, "Draw", "", TeamSide::None },
        { "result_away", "{away} to Win", MarketKey::AwayWin, winner, "Away", "", TeamSide::Away },
        { "over_1.5", "Over 1.5 Goals", MarketKey::Over15, overUnderIds(), "Over", "1.5", TeamSide::None },
        { "under_4.5", "Under 4.5 Goals", MarketKey::Under45, overUnderIds(), "Under", "4.5", TeamSide::None },
        { "1h_over_0.5", "1st Half Over 0.5", MarketKey::FirstHalfOver05, firstHalfIds(), "Over", "0.5", TeamSide::None },
        { "1h_over_1.5", "1st Half Over 1.5", MarketKey::FirstHalfOver15, firstHalfIds(), "Over", "1.5", TeamSide::None },
        { "1h_under_0.5", "1st Half Under 0.5", MarketKey::FirstHalfUnder05, firstHalfIds(), "Under", "0.5", TeamSide::None },
        { "1h_under_1.5", "1st Half Under 1.5", MarketKey::FirstHalfUnder15, firstHalfIds(), "Under", "1.5", TeamSide::None },
        { "btts_no", "BTTS: No", MarketKey::BttsNo, btts, "No", "", TeamSide::None },
    };
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::vector<std::string> splitFilter(const std::string& filter) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= filter.size()) {
        auto pos = filter.find('&', start);
        if (pos == std::string::npos) {
            pos = filter.size();
        }
        parts.push_back(toLower(trim(filter.substr(start, pos - start))));
        start = pos + 1;
    }
    return parts;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

void replaceFirst(std::string& text, const std::string& token, const std::string& value) {
    auto pos = text.find(token);
    if (pos != std::string::npos) {
        text.replace(pos, token.size(), value);
    }
}

} // namespace

const std::vector<MarketDefinition>& marketWhitelist() {
    static const std::vector<MarketDefinition> whitelist = buildWhitelist();
    return whitelist;
}

const MarketDefinition* findMarketDefinition(const std::string& marketId) {
    for (const auto& market : marketWhitelist()) {
        if (market.id == marketId) {
            return &market;
        }
    }
    return nullptr;
}

std::string resolveMarketLabel(const MarketDefinition& market,
                               const std::string& homeTeam,
                               const std::string& awayTeam) {
    std::string label = market.label;
    replaceFirst(label, "{home}", homeTeam);
    replaceFirst(label, "{away}", awayTeam);
    return label;
}

std::optional<OddsQuote> findOddsForMarket(const std::vector<OddsEntry>& odds,
                                           const MarketDefinition& market,
                                           const std::string& homeTeam,
                                           const std::string& awayTeam,
                                           std::int64_t referenceBookmakerId) {
    std::vector<const OddsEntry*> filtered;
    for (const auto& entry : odds) {
        if (std::find(market.providerMarketIds.begin(), market.providerMarketIds.end(), entry.marketId) !=
            market.providerMarketIds.end()) {
            filtered.push_back(&entry);
        }
    }
    if (filtered.empty()) {
        return std::nullopt;
    }

    if (!market.labelFilter.empty()) {
        const auto parts = splitFilter(market.labelFilter);
        std::vector<const OddsEntry*> kept;
        for (const auto* entry : filtered) {
            const std::string combined = toLower(entry->label) + " " + toLower(entry->name);
            bool all = std::all_of(parts.begin(), parts.end(),
                                   [&combined](const std::string& part) { return contains(combined, part); });
            if (all) {
                kept.push_back(entry);
            }
        }
        if (kept.empty()) {
            return std::nullopt;
        }
        filtered = std::move(kept);
    }

    if (!market.nameFilter.empty()) {
        std::vector<const OddsEntry*> kept;
        for (const auto* entry : filtered) {
            if (entry->name == market.nameFilter || contains(entry->label, market.nameFilter)) {
                kept.push_back(entry);
            }
        }
        if (kept.empty()) {
            return std::nullopt;
        }
        filtered = std::move(kept);
    }

    if (market.team != TeamSide::None) {
        const std::string& teamName = market.team == TeamSide::Home ? homeTeam : awayTeam;
        const std::string prefix = toLower(teamName.substr(0, 5));
        const std::string sideWord = market.team == TeamSide::Home ? "home" : "away";
        std::vector<const OddsEntry*> kept;
        for (const auto* entry : filtered) {
            const std::string label = toLower(entry->label);
            const std::string name = toLower(entry->name);
            bool byTeam = !prefix.empty() && (contains(label, prefix) || contains(name, prefix));
            if (byTeam || label == sideWord || name == sideWord) {
                kept.push_back(entry);
            }
        }
        if (!kept.empty()) {
            filtered = std::move(kept);
        }
    }

    std::set<std::int64_t> bookmakers;
    const OddsEntry* best = nullptr;
    OddsQuote quote;
    for (const auto* entry : filtered) {
        bookmakers.insert(entry->bookmakerId);
        if (best == nullptr || entry->odds > best->odds) {
            best = entry;
        }
        if (entry->bookmakerId == referenceBookmakerId &&
            (!quote.referenceOdds || entry->odds > *quote.referenceOdds)) {
            quote.referenceOdds = entry->odds;
        }
    }
    quote.bestOdds = best->odds;
    quote.bestBookmaker = best->bookmakerName;
    quote.bookmakerCount = static_cast<int>(bookmakers.size());
    return quote;
}

std::optional<MarketEvaluation> evaluateMarket(const std::string& marketId,
                                               double probability,
                                               double odds,
                                               int confidence,
                                               const EngineConfig& cfg) {
    if (odds <= 0.0 || probability <= 0.0 || odds > cfg.selection.oddsMax) {
        return std::nullopt;
    }

    MarketEvaluation ev;
    ev.probability = probability;
    ev.odds = odds;
    ev.confidence = confidence;
    ev.impliedProbability = 1.0 / odds;
    ev.edge = probability - ev.impliedProbability;
    ev.ev = probability * odds - 1.0;
    ev.varianceMultiplier = varianceMultiplierFor(cfg, marketId, odds);
    ev.evAdjusted = ev.ev * (static_cast<double>(confidence) / 100.0) * ev.varianceMultiplier;
    return ev;
}

bool isGoalTotalMarket(const std::string& marketId) {
    return contains(marketId, "over") || contains(marketId, "under");
}

bool isResultFamilyMarket(const std::string& marketId) {
    return marketId.rfind("result_", 0) == 0 || marketId.rfind("draw_no_bet", 0) == 0 ||
           marketId.rfind("dnb_", 0) == 0;
}

bool isWinMarket(const std::string& marketId) {
    return marketId == "result_home" || marketId == "result_away" || marketId == "draw_no_bet" ||
           marketId == "draw_no_bet_away";
}

std::string marketFamily(const std::string& marketId) {
    if (isGoalTotalMarket(marketId)) {
        return "goals";
    }
    if (contains(marketId, "btts")) {
        return "btts";
    }
    if (contains(marketId, "result") || contains(marketId, "draw")) {
        return "result";
    }
    return marketId;
}

} // namespace ee
