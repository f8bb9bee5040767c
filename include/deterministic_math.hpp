#pragma once

#include <cstddef>

#include <boost/multiprecision/cpp_dec_float.hpp>

namespace ee {

// Transcendental helpers evaluated in 50-digit decimal arithmetic and rounded
// once to double, so model outputs do not depend on the platform libm.
class DeterministicMath {
public:
    using HighPrecision = boost::multiprecision::cpp_dec_float_50;

    static double exp(double value);
    static double pow10(double exponent);
    // sqrt(p(1 - p) / n) for a simulated frequency p over n iterations, rounded
    // once to double. Degenerate p (0, 1 or outside) and n == 0 give 0.
    static double standardError(double p, std::size_t n);
    static double powInt(double base, int exponent);
};

} // namespace ee
