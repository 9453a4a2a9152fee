/// @file src/shear/shear_designer.cpp
/// @brief ShearDesigner implementation.

#include "rcde/shear.hpp"
#include "rcde/constants.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace rcde::shear {

using namespace rcde::constants;

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();

constexpr double NORMAL_MAX_SPACING = 600.0;
constexpr double HIGH_SHEAR_MAX_SPACING = 300.0;

}  // anonymous namespace

// ─── SpacingLimits ────────────────────────────────────────────────────────────

double SpacingLimits::governing() const noexcept {
    return std::min({strength, minimum, geometric, absolute});
}

// ─── Capacities ───────────────────────────────────────────────────────────────

double ShearDesigner::concrete_capacity(double width, double depth, double fc,
                                        double axial, double gross_area) noexcept {
    const double vc = (LAMBDA_NORMAL_WEIGHT / 6.0) * std::sqrt(fc) * width * depth;
    if (axial == 0.0 || gross_area <= 0.0) {
        return vc;
    }
    if (axial > 0.0) {
        return vc * (1.0 + axial / (14.0 * gross_area));
    }
    // Axial tension erodes the concrete contribution, never below zero.
    return vc * std::max(0.0, 1.0 + axial / (3.5 * gross_area));
}

double ShearDesigner::min_reinforcement_per_length(double width, double fc,
                                                   double fy) noexcept {
    return std::max(0.062 * std::sqrt(fc) * width / fy, 0.35 * width / fy);
}

double ShearDesigner::round_down(double spacing, double step) noexcept {
    if (!std::isfinite(spacing) || step <= 0.0 || spacing < step) {
        return spacing;
    }
    return std::floor(spacing / step) * step;
}

// ─── ShearDesigner::design ────────────────────────────────────────────────────

ShearDesign ShearDesigner::design(const ShearDemand& demand) noexcept {
    const double b  = demand.width;
    const double d  = demand.effective_depth;
    const double fc = demand.fc;
    const double fy = demand.fy;
    const double av = demand.stirrup_area;

    const double vc          = concrete_capacity(b, d, fc, demand.axial, demand.gross_area);
    const double vn_required = std::abs(demand.shear) / PHI_SHEAR;
    const double vs_required = std::max(0.0, vn_required - vc);
    const double vs_max      = (2.0 / 3.0) * std::sqrt(fc) * b * d;
    const bool   high_shear  = vs_required > (1.0 / 3.0) * std::sqrt(fc) * b * d;

    const double av_min      = min_reinforcement_per_length(b, fc, fy);
    const double av_strength = vs_required / (fy * d);

    SpacingLimits limits{
        .strength  = vs_required > 0.0 ? av / av_strength : INF,
        .minimum   = av / av_min,
        .geometric = high_shear ? d / 4.0 : d / 2.0,
        .absolute  = high_shear ? HIGH_SHEAR_MAX_SPACING : NORMAL_MAX_SPACING,
    };

    return ShearDesign{
        .vc                 = vc,
        .vn_required        = vn_required,
        .vs_required        = vs_required,
        .vs_max             = vs_max,
        .av_min_per_mm      = av_min,
        .av_required_per_mm = std::max(av_strength, av_min),
        .spacing_cap        = std::min(limits.geometric, limits.absolute),
        .high_shear         = high_shear,
        .section_adequate   = vs_required <= vs_max,
        .limits             = limits,
        .spacing            = round_down(limits.governing(), demand.spacing_step),
    };
}

double ShearDesigner::spacing_for(const ShearDesign& design, double stirrup_area,
                                  double spacing_step) noexcept {
    const double from_area = stirrup_area / design.av_required_per_mm;
    return round_down(std::min(from_area, design.spacing_cap), spacing_step);
}

}  // namespace rcde::shear
