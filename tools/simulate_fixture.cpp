#include "engine_config.hpp"
#include "market_keys.hpp"
#include "monte_carlo.hpp"
#include "poisson.hpp"
#include "rng.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "Usage: simulate_fixture <lambdaHome> <lambdaAway> <fixtureId> [iterations]\n";
        return 1;
    }

    double lambdaHome = 0.0;
    double lambdaAway = 0.0;
    std::int64_t fixtureId = 0;
    ee::EngineConfig cfg;
    try {
        cfg = ee::loadConfigFromEnvironment();
        lambdaHome = std::stod(argv[1]);
        lambdaAway = std::stod(argv[2]);
        fixtureId = std::stoll(argv[3]);
        if (argc > 4) {
            cfg.monteCarlo.iterations = static_cast<std::size_t>(std::stoull(argv[4]));
        }
    } catch (const std::exception& ex) {
        std::cerr << "Invalid argument: " << ex.what() << '\n';
        return 1;
    }

    ee::SimulationResult sim;
    try {
        sim = ee::runMonteCarlo(lambdaHome, lambdaAway, fixtureId, cfg.monteCarlo, cfg.poisson);
    } catch (const std::exception& ex) {
        std::cerr << "Simulation rejected: " << ex.what() << '\n';
        return 1;
    }
    auto matrix = ee::buildScoreMatrix(lambdaHome, lambdaAway, cfg.poisson.maxGoals);
    auto analytical = ee::deriveMarketProbabilities(matrix, cfg.poisson);

    std::cout << std::fixed << std::setprecision(4);
    std::cout << "Fixture " << fixtureId << "  seed " << ee::fixtureSeed(fixtureId, cfg.monteCarlo.seedBase)
              << "  iterations " << sim.iterations << '\n';
    std::cout << "Mean goals " << sim.meanHomeGoals << " - " << sim.meanAwayGoals << "  volatility "
              << sim.volatilityScore << "\n\n";

    std::cout << std::left << std::setw(14) << "market" << std::right << std::setw(11) << "analytical"
              << std::setw(11) << "simulated" << std::setw(20) << "95% interval" << '\n';
    for (std::size_t i = 0; i < ee::kMarketKeyCount; ++i) {
        auto key = static_cast<ee::MarketKey>(i);
        const auto& ci = sim.interval(key);
        std::cout << std::left << std::setw(14) << ee::marketKeyName(key) << std::right << std::setw(11)
                  << analytical[key] << std::setw(11) << sim.probabilities[key] << "   [" << ci.lower << ", "
                  << ci.upper << "]\n";
    }

    std::cout << "\nTotal goals:\n";
    for (std::size_t g = 0; g < sim.goalDistribution.size(); ++g) {
        int bar = static_cast<int>(sim.goalDistribution[g] * 100.0);
        std::cout << "  " << std::setw(2) << g << "  " << sim.goalDistribution[g] << "  " << std::string(bar, '#')
                  << '\n';
    }

    std::cout << "\nTop scorelines:\n";
    for (const auto& s : sim.topScorelines) {
        std::cout << "  " << s.home << "-" << s.away << "  " << s.probability << '\n';
    }
    return 0;
}
