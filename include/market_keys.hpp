#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace ee {

enum class MarketKey : std::size_t {
    Over15,
    Over25,
    Over35,
    Under15,
    Under25,
    Under35,
    Under45,
    BttsYes,
    BttsNo,
    BttsOver25,
    BttsOver35,
    BttsUnder15,
    BttsUnder25,
    HomeOver15,
    AwayOver15,
    HomeWin,
    Draw,
    AwayWin,
    DnbHome,
    DnbAway,
    BttsHomeWin,
    BttsAwayWin,
    FirstHalfOver05,
    FirstHalfOver15,
    FirstHalfOver25,
    FirstHalfUnder05,
    FirstHalfUnder15,
    Count
};

constexpr std::size_t kMarketKeyCount = static_cast<std::size_t>(MarketKey::Count);

const char* marketKeyName(MarketKey key);

struct ScorelineProbability {
    int home = 0;
    int away = 0;
    double probability = 0.0;
};

// One probability per market key, analytical or empirical.
struct MarketProbabilities {
    std::array<double, kMarketKeyCount> values{};
    std::vector<ScorelineProbability> correctScores;

    double& operator[](MarketKey key) { return values[static_cast<std::size_t>(key)]; }
    double operator[](MarketKey key) const { return values[static_cast<std::size_t>(key)]; }
};

struct ConfidenceInterval {
    double lower = 0.0;
    double upper = 0.0;

    double width() const { return upper - lower; }
};

} // namespace ee
