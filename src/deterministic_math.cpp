#include "deterministic_math.hpp"

#include <cstddef>
#include <stdexcept>

#include <boost/math/constants/constants.hpp>

namespace ee {

double DeterministicMath::exp(double value) {
    HighPrecision hpValue = HighPrecision(value);
    if (hpValue == HighPrecision(0)) {
        return 1.0;
    }
    HighPrecision result = boost::multiprecision::exp(hpValue);
    return static_cast<double>(result);
}

double DeterministicMath::pow10(double exponent) {
    HighPrecision ln10 = boost::math::constants::ln_ten<HighPrecision>();
    HighPrecision result = boost::multiprecision::exp(HighPrecision(exponent) * ln10);
    return static_cast<double>(result);
}

double DeterministicMath::standardError(double p, std::size_t n) {
    if (n == 0 || !(p > 0.0 && p < 1.0)) {
        return 0.0;
    }
    HighPrecision hpP = HighPrecision(p);
    HighPrecision variance = hpP * (HighPrecision(1) - hpP) / HighPrecision(static_cast<unsigned long long>(n));
    return static_cast<double>(boost::multiprecision::sqrt(variance));
}

double DeterministicMath::powInt(double base, int exponent) {
    if (exponent < 0) {
        throw std::domain_error("powInt expects a non-negative exponent");
    }
    HighPrecision hpBase = HighPrecision(base);
    HighPrecision result = HighPrecision(1);
    for (int i = 0; i < exponent; ++i) {
        result *= hpBase;
    }
    return static_cast<double>(result);
}

} // namespace ee
