/// @file src/flexure/flexural_designer.cpp
/// @brief FlexuralDesigner implementation.

#include "rcde/flexure.hpp"
#include "rcde/constants.hpp"
#include "rcde/logging.hpp"
#include "rcde/material.hpp"

#include <algorithm>
#include <cmath>

namespace rcde::flexure {

using namespace rcde::constants;
using material::MaterialModel;

// ─── Coefficients ─────────────────────────────────────────────────────────────

double FlexuralDesigner::resistance_coefficient(double moment, double width,
                                                double depth) noexcept {
    return std::abs(moment) / (PHI_FLEXURE * width * depth * depth);
}

double FlexuralDesigner::rn_max(double fc, double fy) noexcept {
    const double rho = MaterialModel::rho_max(fc, fy);
    return rho * fy * (1.0 - 0.59 * rho * fy / fc);
}

std::optional<double>
FlexuralDesigner::required_ratio(double rn, double fc, double fy) noexcept {
    const double discriminant = 1.0 - 2.0 * rn / (0.85 * fc);
    if (discriminant < 0.0) {
        return std::nullopt;
    }
    return (0.85 * fc / fy) * (1.0 - std::sqrt(discriminant));
}

// ─── FlexuralDesigner::design ─────────────────────────────────────────────────

FlexuralDesign FlexuralDesigner::design(const FlexureDemand& demand) noexcept {
    const double b  = demand.width;
    const double d  = demand.effective_depth;
    const double fc = demand.fc;
    const double fy = demand.fy;
    const double bd = b * d;

    const double rho_min  = MaterialModel::rho_min(fc, fy);
    const double rho_max  = MaterialModel::rho_max(fc, fy);
    const double min_area = demand.min_area_override.value_or(rho_min * bd);
    const double max_area = rho_max * bd;
    const double rn       = resistance_coefficient(demand.moment, b, d);
    const double rn_limit = rn_max(fc, fy);

    FlexuralDesign out{
        .mode             = ReinforcementMode::Singly,
        .tension_area     = min_area,
        .compression_area = 0.0,
        .rho              = 0.0,
        .rn               = rn,
        .rn_max           = rn_limit,
        .rho_min          = rho_min,
        .rho_max          = rho_max,
        .min_area         = min_area,
        .max_area         = max_area,
        .clamped          = false,
    };

    if (rn <= 0.0) {
        return out;
    }

    if (rn <= rn_limit) {
        const auto rho = required_ratio(rn, fc, fy);
        if (!rho) {
            log::logger().warn(
                "flexure: negative discriminant at Rn={:.4f} MPa, clamping to rho_max={:.5f}",
                rn, rho_max);
            out.rho          = rho_max;
            out.tension_area = std::max(max_area, min_area);
            out.clamped      = true;
            return out;
        }
        out.rho          = *rho;
        out.tension_area = std::max(*rho * bd, min_area);
        return out;
    }

    // Over-reinforced demand: ρmax carries RnMax·b·d², a steel couple the rest.
    const double lever = d - demand.compression_depth;
    if (!demand.allow_compression_steel || lever <= 0.0) {
        log::logger().warn(
            "flexure: Rn={:.4f} MPa exceeds RnMax={:.4f} MPa and compression steel "
            "is unavailable (lever {:.1f} mm), clamping to rho_max",
            rn, rn_limit, lever);
        out.rho          = rho_max;
        out.tension_area = std::max(max_area, min_area);
        out.clamped      = true;
        return out;
    }

    const double nominal_moment = std::abs(demand.moment) / PHI_FLEXURE;
    const double delta_moment   = nominal_moment - rn_limit * b * d * d;
    const double compression    = delta_moment / (fy * lever);

    out.mode             = ReinforcementMode::Doubly;
    out.rho              = rho_max;
    out.compression_area = compression;
    out.tension_area     = std::max(max_area + compression, min_area);
    return out;
}

}  // namespace rcde::flexure
