/// @file src/reinforcement/development_length.cpp
/// @brief DetailingCalculator implementation.

#include "rcde/detailing.hpp"
#include "rcde/constants.hpp"

#include <algorithm>
#include <cmath>

namespace rcde::detailing {

using namespace rcde::constants;

DevelopmentLengths
DetailingCalculator::development_lengths(double bar_diameter, double fc,
                                         double fy) noexcept {
    const double db      = bar_diameter;
    const double root_fc = LAMBDA_NORMAL_WEIGHT * std::sqrt(fc);

    // ψt = ψe = 1.0: bottom bars, uncoated.
    const double k       = db <= 19.0 ? 2.1 : 1.7;
    const double tension = std::max(fy / (k * root_fc) * db, 300.0);

    const double compression = std::max({0.24 * fy * db / root_fc, 0.043 * fy * db, 200.0});
    const double hook        = std::max({0.24 * fy * db / root_fc, 8.0 * db, 150.0});

    return DevelopmentLengths{
        .tension     = std::round(tension),
        .compression = std::round(compression),
        .hook        = std::round(hook),
        .splice      = std::round(1.3 * tension),
    };
}

}  // namespace rcde::detailing
