/// @file src/serviceability/serviceability_checker.cpp
/// @brief ServiceabilityChecker implementation.

#include "rcde/serviceability.hpp"
#include "rcde/constants.hpp"
#include "rcde/material.hpp"

#include <algorithm>
#include <cmath>

namespace rcde::serviceability {

using namespace rcde::constants;
using material::MaterialModel;

// ─── Deflection ───────────────────────────────────────────────────────────────

DeflectionResult ServiceabilityChecker::deflection(const DeflectionInput& input) noexcept {
    const double b  = input.width;
    const double h  = input.height;
    const double d  = input.effective_depth;
    const double as = input.tension_area;
    const double ec = MaterialModel::elastic_modulus(input.fc);
    const double n  = MaterialModel::modular_ratio(input.fc);
    const double fr = MaterialModel::modulus_of_rupture(input.fc);

    const double ig  = b * h * h * h / 12.0;
    const double mcr = fr * ig / (h / 2.0);

    const double rho_n = as / (b * d) * n;
    const double k     = std::sqrt(2.0 * rho_n + rho_n * rho_n) - rho_n;
    const double kd    = k * d;
    const double icr   = b * kd * kd * kd / 3.0 + n * as * (d - kd) * (d - kd);

    const double ma = std::abs(input.service_moment);
    double ie = ig;
    if (ma > mcr) {
        const double r = mcr / ma;
        ie = std::min(icr + (ig - icr) * r * r * r, ig);
    }

    const double span      = input.span;
    const double delta     = 5.0 * ma * span * span / (48.0 * ec * ie);
    const double allowable = span / input.limit_denominator;

    return DeflectionResult{
        .gross_inertia       = ig,
        .cracking_moment     = mcr,
        .neutral_axis_factor = k,
        .cracked_inertia     = icr,
        .effective_inertia   = ie,
        .deflection          = delta,
        .allowable           = allowable,
        .check               = CheckResult::capacity(delta, allowable),
    };
}

double ServiceabilityChecker::service_moment(const Loads& loads, std::optional<double> span,
                                             double factored_moment) noexcept {
    const double w = loads.dead + loads.live;  // kN/m == N/mm
    if (w > 0.0 && span && *span > 0.0) {
        return w * (*span) * (*span) / 8.0;
    }
    return std::abs(factored_moment) / SERVICE_LOAD_FACTOR;
}

// ─── Crack Width ──────────────────────────────────────────────────────────────

CrackResult ServiceabilityChecker::crack_width(const CrackInput& input) noexcept {
    const double dc = input.cover_to_bar_center;
    const double fs = 0.6 * input.fy;
    const double a  = 2.0 * dc * input.width / std::max(input.bar_count, 1);
    const double root = std::cbrt(dc * a);
    const double w = input.model == CrackWidthModel::GergelyLutz
        ? 2.2 * input.strain_gradient * (fs / STEEL_MODULUS) * root
        : 11.0 * fs * input.strain_gradient * root / STEEL_MODULUS;

    return CrackResult{
        .steel_stress   = fs,
        .effective_area = a,
        .crack_width    = w,
        .limit          = input.limit,
        .check          = CheckResult::capacity(w, input.limit),
    };
}

double ServiceabilityChecker::exposure_limit(ExposureClass exposure) noexcept {
    switch (exposure) {
        case ExposureClass::Mild:       return 0.40;
        case ExposureClass::Moderate:   return 0.30;
        case ExposureClass::Severe:     return 0.20;
        case ExposureClass::VerySevere: return 0.15;
        case ExposureClass::Extreme:    return 0.10;
    }
    return 0.30;
}

double ServiceabilityChecker::crack_limit(const Constraints& constraints,
                                          double fallback) noexcept {
    if (constraints.crack_width_limit) {
        return *constraints.crack_width_limit;
    }
    if (constraints.exposure) {
        return exposure_limit(*constraints.exposure);
    }
    return fallback;
}

}  // namespace rcde::serviceability
