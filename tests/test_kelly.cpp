#include "kelly.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "kelly_test failure: " << msg << std::endl;
    std::exit(1);
}

bool mentions(const std::string& text, const std::string& fragment) {
    return text.find(fragment) != std::string::npos;
}

} // namespace

int main() {
    using namespace ee;

    auto noEdge = computeKellyStake(0.4, 2.0);
    if (noEdge.suggestedStake != 0.0 || noEdge.fullKelly != 0.0 || !mentions(noEdge.reasoning, "Negative Kelly")) {
        fail("no edge must stake nothing: " + noEdge.reasoning);
    }

    auto capped = computeKellyStake(0.6, 2.0);
    if (std::abs(capped.fullKelly - 0.2) > 1e-12) {
        fail("full Kelly at p=0.6, odds 2.0");
    }
    if (capped.fractionalKelly != capped.fullKelly * 0.25) {
        fail("fractional Kelly must be a quarter of full Kelly");
    }
    if (std::abs(capped.suggestedStake - 0.05) > 1e-12 || !mentions(capped.reasoning, "Capped")) {
        fail("stake must respect the single-stake cap: " + capped.reasoning);
    }

    auto modest = computeKellyStake(0.55, 2.0);
    if (std::abs(modest.suggestedStake - 0.025) > 1e-12 || !mentions(modest.reasoning, "recommended")) {
        fail("quarter Kelly below the cap: " + modest.reasoning);
    }

    KellyConfig half;
    half.fraction = 0.5;
    half.maxSingleStake = 1.0;
    auto halfKelly = computeKellyStake(0.6, 2.0, half);
    if (std::abs(halfKelly.suggestedStake - 0.1) > 1e-12) {
        fail("configured fraction");
    }

    for (auto bad : { std::make_pair(0.0, 2.0), std::make_pair(1.0, 2.0), std::make_pair(0.5, 1.0),
                      std::make_pair(0.5, 0.0), std::make_pair(-0.1, 3.0) }) {
        auto out = computeKellyStake(bad.first, bad.second);
        if (out.suggestedStake != 0.0 || !mentions(out.reasoning, "Invalid inputs")) {
            fail("invalid inputs must stake nothing");
        }
    }

    auto within = checkDailyExposure({ 0.04, 0.03 }, 0.02);
    if (!within.approved || std::abs(within.proposedExposure - 0.09) > 1e-12) {
        fail("exposure within the daily limit");
    }
    auto over = checkDailyExposure({ 0.04, 0.03 }, 0.04);
    if (over.approved || !mentions(over.reason, "daily exposure")) {
        fail("exposure over the daily limit");
    }

    if (!checkDrawdown(900.0, 1000.0).approved) {
        fail("10% drawdown should continue");
    }
    auto halt = checkDrawdown(850.0, 1000.0);
    if (halt.approved || std::abs(halt.currentDrawdown - 0.15) > 1e-12) {
        fail("drawdown at the threshold must halt");
    }
    if (!checkDrawdown(500.0, 0.0).approved) {
        fail("no peak means no drawdown");
    }

    std::cout << "kelly_test passed\n";
    return 0;
}
