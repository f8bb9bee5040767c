#pragma once

#include <cstdint>

namespace ee {

class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual double uniform01() = 0;
};

// Marsaglia xorshift32 (13, 17, 5). uniform01() returns state / 2^32, so the
// sequence is identical on every platform for a given seed.
class Xorshift32Rng : public RandomSource {
public:
    static constexpr std::uint32_t kZeroSeedReplacement = 0x9E3779B9u;

    explicit Xorshift32Rng(std::uint32_t seed);

    double uniform01() override;
    std::uint32_t nextU32();
    std::uint32_t state() const { return state_; }

private:
    std::uint32_t state_;
};

// Seed for a fixture: low 32 bits of the fixture id XOR the configured base.
std::uint32_t fixtureSeed(std::int64_t fixtureId, std::uint32_t seedBase);

} // namespace ee
