#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ee {

// Per-side statistics. Every field is optional; the model substitutes:
//   season scored / conceded  -> 1.3 / 1.1 goals per game
//   form scored / conceded    -> the season values
//   form points per game      -> 1.0
//   league rank               -> 10 (of 20)
//   games played              -> 10
//   rest days                 -> fully rested (no fatigue)
//   injury factor             -> 1.0 (clamped to [0.80, 1.0] when present)
struct TeamStats {
    std::optional<double> avgScored;
    std::optional<double> avgConceded;
    std::optional<double> formScored;
    std::optional<double> formConceded;
    std::optional<double> formPpg;
    std::optional<int> leagueRank;
    std::optional<int> gamesPlayed;
    std::optional<int> restDays;
    std::optional<double> injuryFactor;
};

struct MatchContext {
    std::int64_t fixtureId = 0;
    std::string homeTeam;
    std::string awayTeam;
    std::int64_t leagueId = 0;
    std::string leagueName;
    // ISO-8601; lexical order equals chronological order.
    std::string startTime;
    TeamStats home;
    TeamStats away;
};

struct BlendedStats {
    double scored = 0.0;
    double conceded = 0.0;
};

} // namespace ee
