#include "math_util.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace aera::core {

double MathHelper::machine_precision() noexcept { return std::numeric_limits<double>::epsilon(); }

double MathHelper::default_numerical_precision() noexcept {
    static const double precision = std::sqrt(machine_precision());
    return precision;
}

double MathHelper::round_to(double value, int decimals) noexcept {
    if (!std::isfinite(value)) {
        return value;
    }

    auto scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

double MathHelper::round_published(double value) noexcept {
    return round_to(value, published_decimals);
}

bool MathHelper::equal(double left, double right) noexcept {
    return equal(left, right, default_numerical_precision());
}

bool MathHelper::equal(double left, double right, double precision) noexcept {
    double norm = std::max(std::abs(left), std::abs(right));
    return norm < precision || std::abs(left - right) < precision * norm;
}

bool MathHelper::is_negligible_scale(double std_deviation, double average) noexcept {
    auto tolerance = 10.0 * machine_precision() * std::max(1.0, std::abs(average));
    return !(std_deviation > tolerance);
}

} // namespace aera::core
