/// @file src/capacity/capacity_verifier.cpp
/// @brief CapacityVerifier implementation.

#include "rcde/capacity.hpp"
#include "rcde/constants.hpp"
#include "rcde/material.hpp"
#include "rcde/shear.hpp"

#include <algorithm>
#include <cmath>

namespace rcde::capacity {

using namespace rcde::constants;
using material::MaterialModel;

// ─── Flexure ──────────────────────────────────────────────────────────────────

FlexuralCapacity CapacityVerifier::flexural_capacity(const FlexuralSection& section) noexcept {
    const double b     = section.width;
    const double d     = section.effective_depth;
    const double dp    = section.compression_depth;
    const double fc    = section.fc;
    const double fy    = section.fy;
    const double as    = section.tension_area;
    const double as_c  = section.compression_area;
    const double beta1 = MaterialModel::beta1(fc);
    const double block = 0.85 * fc * beta1 * b;  // concrete force per mm of c

    double c  = 0.0;
    double fs = 0.0;

    if (as_c <= 0.0) {
        c = as * fy / block;
    } else {
        // Compression steel yielding.
        c = (as - as_c) * fy / block;
        const double yield = fy / STEEL_MODULUS;
        if (c > dp && CONCRETE_ULTIMATE_STRAIN * (c - dp) / c >= yield) {
            fs = fy;
        } else {
            const double qa = block;
            const double qb = STRAIN_STRESS_LIMIT * as_c - as * fy;
            const double qc = -STRAIN_STRESS_LIMIT * as_c * dp;
            c  = (-qb + std::sqrt(qb * qb - 4.0 * qa * qc)) / (2.0 * qa);
            fs = std::clamp(STRAIN_STRESS_LIMIT * (c - dp) / c, -fy, fy);
        }
    }

    const double a  = beta1 * c;
    const double mn = block * c * (d - a / 2.0) + as_c * fs * (d - dp);
    const double tc = CONCRETE_ULTIMATE_STRAIN
                    / (CONCRETE_ULTIMATE_STRAIN + TENSION_CONTROLLED_STRAIN) * d;

    return FlexuralCapacity{
        .neutral_axis             = c,
        .block_depth              = a,
        .nominal_moment           = mn,
        .design_moment            = PHI_FLEXURE * mn,
        .tension_controlled_limit = tc,
        .compression_steel_stress = fs,
        .tension_controlled       = c <= tc + FLOAT_EPSILON,
    };
}

CheckResult CapacityVerifier::verify_flexure(const FlexuralSection& section,
                                             double moment) noexcept {
    const auto cap = flexural_capacity(section);
    return CheckResult::capacity(std::abs(moment), cap.design_moment, cap.tension_controlled);
}

// ─── Shear ────────────────────────────────────────────────────────────────────

double CapacityVerifier::shear_capacity(const ShearSection& section) noexcept {
    const double b  = section.width;
    const double d  = section.effective_depth;
    const double vc = shear::ShearDesigner::concrete_capacity(
        b, d, section.fc, section.axial, section.gross_area);

    double vs = 0.0;
    if (section.stirrup_area > 0.0 && section.spacing > 0.0) {
        const double vs_max = (2.0 / 3.0) * std::sqrt(section.fc) * b * d;
        vs = std::min(section.stirrup_area * section.fy * d / section.spacing, vs_max);
    }
    return PHI_SHEAR * (vc + vs);
}

CheckResult CapacityVerifier::verify_shear(const ShearSection& section, double shear) noexcept {
    return CheckResult::capacity(std::abs(shear), shear_capacity(section));
}

// ─── Ratio Limits ─────────────────────────────────────────────────────────────

CheckResult CapacityVerifier::verify_min_steel(double provided_area, double min_area) noexcept {
    return CheckResult::capacity(min_area, provided_area);
}

CheckResult CapacityVerifier::verify_max_steel(double provided_area, double max_area) noexcept {
    return CheckResult::capacity(provided_area, max_area);
}

}  // namespace rcde::capacity
