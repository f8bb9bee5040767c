#include "engine_config.hpp"

#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace ee {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::optional<std::string> readEnv(const char* name) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return std::nullopt;
    }
    std::string value = trim(env);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> envDouble(const char* name) {
    auto raw = readEnv(name);
    if (!raw) {
        return std::nullopt;
    }
    std::size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(*raw, &consumed);
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string(name) + " must be a number: " + ex.what());
    }
    if (consumed != raw->size()) {
        throw std::runtime_error(std::string(name) + " has trailing characters: \"" + *raw + "\"");
    }
    return value;
}

std::optional<std::uint64_t> envUnsigned(const char* name) {
    auto raw = readEnv(name);
    if (!raw) {
        return std::nullopt;
    }
    if (raw->front() == '-') {
        throw std::runtime_error(std::string(name) + " must be an unsigned integer");
    }
    std::size_t consumed = 0;
    std::uint64_t value = 0;
    try {
        value = std::stoull(*raw, &consumed);
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string(name) + " must be an unsigned integer: " + ex.what());
    }
    if (consumed != raw->size()) {
        throw std::runtime_error(std::string(name) + " has trailing characters: \"" + *raw + "\"");
    }
    return value;
}

void requirePositive(double value, const char* field) {
    if (!(value > 0.0)) {
        throw std::invalid_argument(std::string(field) + " must be positive");
    }
}

void requireUnitInterval(double value, const char* field) {
    if (!(value > 0.0 && value <= 1.0)) {
        throw std::invalid_argument(std::string(field) + " must lie in (0, 1]");
    }
}

} // namespace

double homeAdvantageFor(const PoissonConfig& cfg, std::int64_t leagueId) {
    auto it = cfg.leagueHomeAdvantage.find(leagueId);
    if (it == cfg.leagueHomeAdvantage.end()) {
        return cfg.defaultHomeAdvantage;
    }
    return it->second;
}

double calibrationFactorFor(const EngineConfig& cfg, const std::string& marketId) {
    auto it = cfg.calibrationFactors.find(marketId);
    if (it == cfg.calibrationFactors.end()) {
        return 1.0;
    }
    return it->second;
}

double varianceMultiplierFor(const EngineConfig& cfg, const std::string& marketId, double odds) {
    double multiplier = cfg.selection.defaultVarianceMultiplier;
    auto it = cfg.varianceMultipliers.find(marketId);
    if (it != cfg.varianceMultipliers.end()) {
        multiplier = it->second;
    }
    if (odds >= 8.0) {
        multiplier *= 0.80;
    } else if (odds >= 6.0) {
        multiplier *= 0.85;
    } else if (odds >= 4.0) {
        multiplier *= 0.90;
    }
    return multiplier;
}

void validateConfig(const EngineConfig& cfg) {
    if (cfg.poisson.maxGoals < 1 || cfg.poisson.maxGoals > 10) {
        throw std::invalid_argument("poisson.maxGoals must lie in [1, 10]");
    }
    if (cfg.poisson.correctScoreMaxGoals > cfg.poisson.maxGoals) {
        throw std::invalid_argument("poisson.correctScoreMaxGoals exceeds poisson.maxGoals");
    }
    if (cfg.poisson.minLambdaHome > cfg.poisson.maxLambdaHome ||
        cfg.poisson.minLambdaAway > cfg.poisson.maxLambdaAway) {
        throw std::invalid_argument("lambda clamp bounds are inverted");
    }
    if (cfg.monteCarlo.iterations == 0) {
        throw std::invalid_argument("monteCarlo.iterations must be at least 1");
    }
    requirePositive(cfg.selection.oddsMax, "selection.oddsMax");
    requirePositive(cfg.selection.oddsDisplayMin, "selection.oddsDisplayMin");
    if (cfg.selection.minProbability >= cfg.selection.maxProbability) {
        throw std::invalid_argument("selection probability clamp bounds are inverted");
    }
    requireUnitInterval(cfg.kelly.fraction, "kelly.fraction");
    requireUnitInterval(cfg.kelly.maxSingleStake, "kelly.maxSingleStake");
    requireUnitInterval(cfg.kelly.maxDailyExposure, "kelly.maxDailyExposure");
    requireUnitInterval(cfg.kelly.maxDrawdown, "kelly.maxDrawdown");
    if (cfg.risk.minBookmakers < 0) {
        throw std::invalid_argument("risk.minBookmakers must not be negative");
    }
    if (cfg.acca.safeLegs == 0 || cfg.acca.maxSafePool < cfg.acca.safeLegs) {
        throw std::invalid_argument("acca.maxSafePool must hold at least acca.safeLegs legs");
    }
    if (cfg.workers == 0) {
        throw std::invalid_argument("workers must be at least 1");
    }
}

EngineConfig applyEnvironmentOverrides(EngineConfig cfg) {
    if (auto v = envUnsigned("EE_MC_ITERATIONS")) {
        cfg.monteCarlo.iterations = static_cast<std::size_t>(*v);
    }
    if (auto v = envUnsigned("EE_MC_SEED_BASE")) {
        if (*v > std::numeric_limits<std::uint32_t>::max()) {
            throw std::runtime_error("EE_MC_SEED_BASE must fit in 32 bits");
        }
        cfg.monteCarlo.seedBase = static_cast<std::uint32_t>(*v);
    }
    if (auto v = envDouble("EE_ODDS_DISPLAY_MIN")) {
        cfg.selection.oddsDisplayMin = *v;
    }
    if (auto v = envDouble("EE_ODDS_MAX")) {
        cfg.selection.oddsMax = *v;
    }
    if (auto v = envDouble("EE_KELLY_FRACTION")) {
        cfg.kelly.fraction = *v;
    }
    if (auto v = envDouble("EE_MAX_SINGLE_STAKE")) {
        cfg.kelly.maxSingleStake = *v;
    }
    if (auto v = envDouble("EE_MAX_DAILY_EXPOSURE")) {
        cfg.kelly.maxDailyExposure = *v;
    }
    if (auto v = envUnsigned("EE_MIN_BOOKMAKERS")) {
        cfg.risk.minBookmakers = static_cast<int>(*v);
    }
    if (auto v = envUnsigned("EE_WORKERS")) {
        cfg.workers = static_cast<std::size_t>(*v);
    }
    try {
        validateConfig(cfg);
    } catch (const std::invalid_argument& ex) {
        throw std::runtime_error(std::string("Environment configuration rejected: ") + ex.what());
    }
    return cfg;
}

EngineConfig loadConfigFromEnvironment() {
    return applyEnvironmentOverrides(EngineConfig{});
}

} // namespace ee
