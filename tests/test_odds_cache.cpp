#include "odds_cache.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "odds_cache_test failure: " << msg << std::endl;
    std::exit(1);
}

} // namespace

int main() {
    using namespace ee;
    using Clock = std::chrono::steady_clock;

    auto now = std::make_shared<Clock::time_point>(Clock::time_point{});
    InMemoryOddsCache cache([now] { return *now; });

    std::vector<OddsEntry> odds{ { 2, "Bet365", 80, "Over", "2.5", 1.95 } };
    if (cache.get(1)) {
        fail("empty cache must miss");
    }
    cache.set(1, odds, std::chrono::seconds(60));
    auto hit = cache.get(1);
    if (!hit || hit->size() != 1 || (*hit)[0].odds != 1.95) {
        fail("fresh entry must hit");
    }

    *now += std::chrono::seconds(59);
    if (!cache.get(1)) {
        fail("entry must live until its TTL");
    }
    *now += std::chrono::seconds(1);
    if (cache.get(1)) {
        fail("entry must expire at its TTL");
    }
    if (cache.size() != 0) {
        fail("expired entry should be evicted on read");
    }

    cache.set(1, odds, kOddsTtl);
    cache.set(2, {}, kOddsTtl);
    if (cache.size() != 2) {
        fail("two entries expected");
    }
    cache.set(1, {}, kOddsTtl);
    auto replaced = cache.get(1);
    if (!replaced || !replaced->empty()) {
        fail("set must overwrite");
    }
    cache.expire(2);
    if (cache.get(2) || cache.size() != 1) {
        fail("explicit expiry");
    }
    cache.clear();
    if (cache.size() != 0) {
        fail("clear");
    }

    // Keys cached once and never read again are evicted by later writes.
    cache.set(10, odds, std::chrono::seconds(60));
    *now += std::chrono::seconds(61);
    cache.set(11, odds, std::chrono::seconds(60));
    if (cache.size() != 1 || !cache.get(11)) {
        fail("set must sweep expired entries");
    }

    // Used through the interface the engine's callers hold.
    OddsCachePtr shared = std::make_shared<InMemoryOddsCache>();
    shared->set(5, odds, kOddsTtl);
    if (!shared->get(5)) {
        fail("default clock");
    }

    std::cout << "odds_cache_test passed\n";
    return 0;
}
