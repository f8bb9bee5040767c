#include "elo.hpp"
#include "match_context.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "elo_test failure: " << msg << std::endl;
    std::exit(1);
}

} // namespace

int main() {
    using namespace ee;

    // Equal sides: even expectations, full draw factor.
    EloRating even = computeEloRatings(10, 10, 10, 10, 1.0, 1.0);
    if (std::abs(even.home - 1750.0) > 1e-9) {
        fail("rank 10 of 20 should rate 1750, got " + std::to_string(even.home));
    }
    if (std::abs(even.expectedHome - even.expectedAway) > 1e-12) {
        fail("equal ratings must give equal expectations");
    }
    if (std::abs(even.expectedDraw - 0.26) > 1e-12) {
        fail("even match draw expectation");
    }
    if (std::abs(even.expectedHome + even.expectedAway + even.expectedDraw - 1.0) > 1e-9) {
        fail("expectations must sum to one");
    }

    EloRating strong = computeEloRatings(1, 18, 12, 12, 2.5, 0.8);
    if (strong.expectedHome <= strong.expectedAway) {
        fail("higher ranked side must be favoured");
    }
    if (strong.expectedDraw >= even.expectedDraw) {
        fail("mismatch should lower the draw expectation");
    }
    if (strong.strengthDelta <= 0.0) {
        fail("strength delta");
    }

    // Missing data falls back to rank 10, 10 games, 1.0 ppg.
    MatchContext bare;
    EloRating defaults = computeEloRatings(bare);
    if (std::abs(defaults.home - even.home) > 1e-9 || std::abs(defaults.away - even.away) > 1e-9) {
        fail("defaults must match the neutral rating");
    }

    BayesianAdjustment none = bayesianUpdate(0.4, 0.9, 0);
    if (std::abs(none.adjustedProbability - 0.4) > 1e-12 || none.priorWeight != 1.0) {
        fail("no evidence must keep the prior");
    }
    BayesianAdjustment full = bayesianUpdate(0.4, 0.9, 40);
    if (std::abs(full.priorWeight - 0.6) > 1e-12) {
        fail("evidence shift must cap at 40%");
    }
    if (std::abs(full.adjustedProbability - (0.4 * 0.6 + 0.9 * 0.4)) > 1e-12) {
        fail("posterior blend");
    }
    if (bayesianUpdate(0.995, 1.0, 20).adjustedProbability > 0.99) {
        fail("posterior upper clamp");
    }

    LambdaPair base{ 1.2, 1.2 };
    LambdaPair shifted = adjustLambdasWithElo(base, strong);
    if (shifted.home <= base.home || shifted.away >= base.away) {
        fail("Elo blend must move goals toward the favourite");
    }
    if (std::abs(shifted.home + shifted.away - 2.4) > 1e-9) {
        fail("Elo blend must keep the total");
    }

    MatchContext form;
    form.home.formPpg = 3.0;
    form.home.gamesPlayed = 20;
    form.away.formPpg = 0.0;
    form.away.gamesPlayed = 20;
    LambdaPair adjusted = applyBayesianForm(base, form);
    if (adjusted.home <= base.home || adjusted.away >= base.away) {
        fail("form should lift the in-form side and trim the other");
    }

    std::cout << "elo_test passed\n";
    return 0;
}
