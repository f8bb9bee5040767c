#include "rng.hpp"

namespace ee {

Xorshift32Rng::Xorshift32Rng(std::uint32_t seed)
    : state_(seed == 0 ? kZeroSeedReplacement : seed) {}

std::uint32_t Xorshift32Rng::nextU32() {
    std::uint32_t x = state_;
    x ^= x << 13;
    // Logical shift on the unsigned state; the sequence is defined this way, not with a sign-extending shift.
    x ^= x >> 17;
    x ^= x << 5;
    state_ = x;
    return x;
}

double Xorshift32Rng::uniform01() {
    constexpr double kTwoPow32 = 4294967296.0;
    return static_cast<double>(nextU32()) / kTwoPow32;
}

std::uint32_t fixtureSeed(std::int64_t fixtureId, std::uint32_t seedBase) {
    auto low = static_cast<std::uint32_t>(static_cast<std::uint64_t>(fixtureId) & 0xFFFFFFFFull);
    return low ^ seedBase;
}

} // namespace ee
