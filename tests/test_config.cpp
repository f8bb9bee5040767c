#include "engine_config.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "config_test failure: " << msg << std::endl;
    std::exit(1);
}

bool rejectsEnvironment(const char* name, const char* value) {
    ::setenv(name, value, 1);
    bool threw = false;
    try {
        ee::loadConfigFromEnvironment();
    } catch (const std::runtime_error& ex) {
        threw = std::string(ex.what()).find(name) != std::string::npos ||
                std::string(ex.what()).find("rejected") != std::string::npos;
    }
    ::unsetenv(name);
    return threw;
}

} // namespace

int main() {
    using namespace ee;

    const char* vars[] = { "EE_MC_ITERATIONS", "EE_MC_SEED_BASE", "EE_ODDS_DISPLAY_MIN", "EE_ODDS_MAX",
                           "EE_KELLY_FRACTION", "EE_MAX_SINGLE_STAKE", "EE_MAX_DAILY_EXPOSURE",
                           "EE_MIN_BOOKMAKERS", "EE_WORKERS" };
    for (const char* v : vars) {
        ::unsetenv(v);
    }

    EngineConfig defaults = loadConfigFromEnvironment();
    if (defaults.monteCarlo.iterations != 10'000 || defaults.monteCarlo.seedBase != 42 ||
        defaults.selection.oddsDisplayMin != 1.80 || defaults.kelly.fraction != 0.25 || defaults.workers != 4) {
        fail("defaults");
    }
    if (homeAdvantageFor(defaults.poisson, 9) != 1.12 || homeAdvantageFor(defaults.poisson, 777) != 1.08) {
        fail("home advantage lookup");
    }
    if (calibrationFactorFor(defaults, "over_2.5") != 1.15 || calibrationFactorFor(defaults, "result_home") != 1.0) {
        fail("calibration lookup");
    }

    ::setenv("EE_MC_ITERATIONS", " 2500 ", 1);
    ::setenv("EE_KELLY_FRACTION", "0.5", 1);
    ::setenv("EE_WORKERS", "2", 1);
    ::setenv("EE_ODDS_MAX", "", 1);
    EngineConfig tuned = loadConfigFromEnvironment();
    if (tuned.monteCarlo.iterations != 2500 || tuned.kelly.fraction != 0.5 || tuned.workers != 2 ||
        tuned.selection.oddsMax != defaults.selection.oddsMax) {
        fail("environment overrides");
    }
    for (const char* v : vars) {
        ::unsetenv(v);
    }

    if (!rejectsEnvironment("EE_MC_ITERATIONS", "ten")) {
        fail("non-numeric iterations");
    }
    if (!rejectsEnvironment("EE_MC_ITERATIONS", "-5")) {
        fail("negative iterations");
    }
    if (!rejectsEnvironment("EE_MC_ITERATIONS", "0")) {
        fail("zero iterations");
    }
    if (!rejectsEnvironment("EE_KELLY_FRACTION", "0.25x")) {
        fail("trailing characters");
    }
    if (!rejectsEnvironment("EE_KELLY_FRACTION", "1.5")) {
        fail("fraction above one");
    }
    if (!rejectsEnvironment("EE_MC_SEED_BASE", "4294967296")) {
        fail("seed base wider than 32 bits");
    }

    EngineConfig bad;
    bad.poisson.maxGoals = 11;
    bool threw = false;
    try {
        validateConfig(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        fail("max goals beyond the factorial table");
    }
    validateConfig(defaults);

    std::cout << "config_test passed\n";
    return 0;
}
