/// @file src/material/material_model.cpp
/// @brief MaterialModel implementation.

#include "rcde/material.hpp"
#include "rcde/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace rcde::material {

using namespace rcde::constants;

// ─── Stress Block ─────────────────────────────────────────────────────────────

double MaterialModel::beta1(double fc) noexcept {
    if (fc <= BETA1_FC_LOWER) {
        return BETA1_MAX;
    }
    if (fc > BETA1_FC_UPPER) {
        return BETA1_MIN;
    }
    // 0.05 per 7 MPa between 28 and 55 MPa.
    return BETA1_MAX - 0.05 * (fc - BETA1_FC_LOWER) / BETA1_SLOPE_STEP;
}

// ─── Elastic Properties ───────────────────────────────────────────────────────

double MaterialModel::elastic_modulus(double fc) noexcept {
    return EC_COEFFICIENT * std::sqrt(fc);
}

double MaterialModel::modular_ratio(double fc) noexcept {
    return STEEL_MODULUS / elastic_modulus(fc);
}

double MaterialModel::modulus_of_rupture(double fc) noexcept {
    return RUPTURE_COEFFICIENT * LAMBDA_NORMAL_WEIGHT * std::sqrt(fc);
}

// ─── Reinforcement Ratios ─────────────────────────────────────────────────────

double MaterialModel::rho_balanced(double fc, double fy) noexcept {
    return 0.85 * beta1(fc) * fc / fy * (STRAIN_STRESS_LIMIT / (STRAIN_STRESS_LIMIT + fy));
}

double MaterialModel::rho_max(double fc, double fy) noexcept {
    return RHO_MAX_FRACTION * rho_balanced(fc, fy);
}

double MaterialModel::rho_min(double fc, double fy) noexcept {
    return std::max(1.4 / fy, std::sqrt(fc) / (4.0 * fy));
}

MaterialProperties MaterialModel::derive(const Material& material) noexcept {
    const double fc = material.fc;
    const double fy = material.fy;
    return MaterialProperties{
        .fc                 = fc,
        .fy                 = fy,
        .beta1              = beta1(fc),
        .ec                 = elastic_modulus(fc),
        .es                 = STEEL_MODULUS,
        .modular_ratio      = modular_ratio(fc),
        .modulus_of_rupture = modulus_of_rupture(fc),
        .rho_balanced       = rho_balanced(fc, fy),
        .rho_max            = rho_max(fc, fy),
        .rho_min            = rho_min(fc, fy),
    };
}

// ─── Labels ───────────────────────────────────────────────────────────────────

std::string MaterialModel::concrete_grade(double fc) {
    return fmt::format("fc{}", fc);
}

std::string MaterialModel::steel_grade(double fy) {
    return fmt::format("fy{}", fy);
}

}  // namespace rcde::material
