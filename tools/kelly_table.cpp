#include "engine_config.hpp"
#include "kelly.hpp"

#include <exception>
#include <iomanip>
#include <iostream>
#include <vector>

int main(int argc, char* argv[]) {
    ee::KellyConfig cfg;
    try {
        cfg = ee::loadConfigFromEnvironment().kelly;
        if (argc > 1) {
            cfg.fraction = std::stod(argv[1]);
        }
    } catch (const std::exception& ex) {
        std::cerr << "Invalid configuration: " << ex.what() << '\n';
        return 1;
    }

    const std::vector<double> probabilities{ 0.30, 0.40, 0.50, 0.55, 0.60, 0.65, 0.70 };
    const std::vector<double> odds{ 1.50, 1.80, 2.00, 2.50, 3.00, 4.00 };

    std::cout << "=== KELLY STAKES (fraction " << cfg.fraction << ", cap " << cfg.maxSingleStake * 100.0
              << "% of bankroll) ===\n";
    std::cout << std::setw(6) << "p";
    for (double o : odds) {
        std::cout << std::setw(9) << std::fixed << std::setprecision(2) << o;
    }
    std::cout << '\n';

    for (double p : probabilities) {
        std::cout << std::setw(6) << std::fixed << std::setprecision(2) << p;
        for (double o : odds) {
            auto stake = ee::computeKellyStake(p, o, cfg);
            std::cout << std::setw(8) << std::setprecision(2) << stake.suggestedStake * 100.0 << '%';
        }
        std::cout << '\n';
    }

    std::cout << "\n=== DRAWDOWN GATE ===\n";
    for (double bankroll : { 1000.0, 900.0, 850.0, 800.0 }) {
        auto check = ee::checkDrawdown(bankroll, 1000.0, cfg);
        std::cout << "  bankroll " << std::setprecision(0) << bankroll << ": "
                  << (check.approved ? "continue" : check.reason) << '\n';
    }
    return 0;
}
