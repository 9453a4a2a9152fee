/// @file src/engine/design_engine.cpp
/// @brief DesignEngine: validation and per-kind design pipelines.

#include "rcde/engine.hpp"
#include "rcde/capacity.hpp"
#include "rcde/column.hpp"
#include "rcde/constants.hpp"
#include "rcde/logging.hpp"
#include "rcde/material.hpp"
#include "rcde/serviceability.hpp"
#include "rcde/shear.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <new>
#include <numbers>
#include <utility>

namespace rcde::core {

using namespace rcde::constants;
using capacity::CapacityVerifier;
using flexure::FlexuralDesigner;
using reinforcement::ReinforcementSelector;
using section::SectionGeometry;
using serviceability::ServiceabilityChecker;
using shear::ShearDesigner;

namespace {

/// Bar and stirrup diameters feed back into d; the pipeline is re-run until
/// the selection stops changing.
constexpr int MAX_PASSES = 4;

constexpr int STIRRUP_LEGS = 2;

/// Largest bars each kind may select; used to check the cover leaves room.
constexpr double LARGEST_BAR     = BAR_CATALOG.back().diameter;
constexpr double LARGEST_STIRRUP = STIRRUP_CATALOG.back().diameter;
constexpr double LARGEST_SLAB_BAR = BAR_CATALOG[SLAB_CATALOG_SIZE - 1].diameter;

double stirrup_bar_area(double diameter) noexcept {
    for (const auto& bar : STIRRUP_CATALOG) {
        if (bar.diameter == diameter) {
            return bar.area;
        }
    }
    return std::numbers::pi * diameter * diameter / 4.0;
}

/// Re-express a check in other units; the ratio and verdict are unchanged.
CheckResult scaled(CheckResult check, double factor) noexcept {
    check.required *= factor;
    check.provided *= factor;
    return check;
}

std::optional<InputViolation> require_positive(const char* field, double value) {
    if (!std::isfinite(value)) {
        return InputViolation{field, value, "must be finite"};
    }
    if (value <= 0.0) {
        return InputViolation{field, value, "must be positive"};
    }
    return std::nullopt;
}

std::optional<InputViolation> require_finite(const char* field, double value) {
    if (!std::isfinite(value)) {
        return InputViolation{field, value, "must be finite"};
    }
    return std::nullopt;
}

ShearReinforcement to_shear(const reinforcement::StirrupSelection& s) noexcept {
    return ShearReinforcement{
        .diameter       = s.diameter,
        .legs           = s.legs,
        .spacing        = s.spacing,
        .area_per_metre = s.area_per_mm * 1000.0,
        .provided       = true,
        .constructible  = s.constructible,
    };
}

/// A stirrup layout tighter than the minimum spacing cannot be built.
CheckResult require_constructible(CheckResult check, const ShearReinforcement& shear) noexcept {
    if (shear.constructible) {
        return check;
    }
    return CheckResult::capacity(check.required, check.provided, false);
}

}  // anonymous namespace

// ─── DesignChecks ─────────────────────────────────────────────────────────────

bool DesignChecks::all_pass() const noexcept {
    return flexural_strength.passed() && shear_strength.passed()
        && axial_strength.passed()    && deflection.passed()
        && cracking.passed()          && min_reinforcement.passed()
        && max_reinforcement.passed();
}

// ─── DesignEngine ─────────────────────────────────────────────────────────────

DesignEngine::DesignEngine(DesignConfig config) : config_(std::move(config)) {}

std::optional<InputViolation> DesignEngine::validate(const DesignInput& input) const noexcept {
    try {
        const auto& g = input.geometry;
        const auto& m = input.material;

        for (auto check : {require_positive("geometry.width", g.width),
                           require_positive("geometry.height", g.height),
                           require_finite("geometry.clear_cover", g.clear_cover),
                           require_positive("material.fc", m.fc),
                           require_positive("material.fy", m.fy),
                           require_finite("forces.moment_x", input.forces.moment_x),
                           require_finite("forces.moment_y", input.forces.moment_y),
                           require_finite("forces.shear", input.forces.shear),
                           require_finite("forces.axial", input.forces.axial),
                           require_finite("forces.torsion", input.forces.torsion),
                           require_finite("loads.dead", input.loads.dead),
                           require_finite("loads.live", input.loads.live),
                           require_finite("loads.wind", input.loads.wind),
                           require_finite("loads.seismic", input.loads.seismic)}) {
            if (check) {
                return check;
            }
        }
        if (g.clear_cover < 0.0) {
            return InputViolation{"geometry.clear_cover", g.clear_cover, "must not be negative"};
        }
        if (g.span) {
            if (auto v = require_positive("geometry.span", *g.span)) return v;
        }
        if (input.constraints.deflection_limit) {
            if (auto v = require_positive("constraints.deflection_limit",
                                          *input.constraints.deflection_limit)) return v;
        }
        if (input.constraints.crack_width_limit) {
            if (auto v = require_positive("constraints.crack_width_limit",
                                          *input.constraints.crack_width_limit)) return v;
        }

        const double d = input.kind == ElementKind::Slab
            ? SectionGeometry::effective_depth(g.height, g.clear_cover, 0.0, LARGEST_SLAB_BAR)
            : SectionGeometry::effective_depth(g.height, g.clear_cover,
                                               LARGEST_STIRRUP, LARGEST_BAR);
        if (d <= 0.0) {
            return InputViolation{"geometry.clear_cover", g.clear_cover,
                                  fmt::format("leaves no effective depth in a {} mm section",
                                              g.height)};
        }
        return std::nullopt;
    } catch (const std::bad_alloc&) {
        return InputViolation{"input", 0.0, "out of memory during validation"};
    }
}

DesignResult DesignEngine::design(const DesignInput& input) const {
    if (auto violation = validate(input)) {
        throw InvalidInputError(std::move(*violation));
    }

    switch (input.kind) {
        case ElementKind::Beam:   return design_beam(input);
        case ElementKind::Column: return design_column(input);
        case ElementKind::Slab:   return design_slab(input);
    }
    return design_beam(input);
}

double DesignEngine::span_or(const DesignInput& input, double fallback) const noexcept {
    return input.geometry.span.value_or(fallback);
}

ElementSummary DesignEngine::summarize(const DesignInput& input,
                                       const section::SectionProperties& section) const {
    return ElementSummary{
        .kind            = input.kind,
        .width           = section.width,
        .height          = section.height,
        .span            = input.geometry.span,
        .effective_depth = section.effective_depth,
        .concrete_grade  = material::MaterialModel::concrete_grade(input.material.fc),
        .steel_grade     = material::MaterialModel::steel_grade(input.material.fy),
    };
}

cost::CostEstimate DesignEngine::estimate_cost(const DesignInput& input,
                                               double longitudinal_area,
                                               const ShearReinforcement& shear) const noexcept {
    const auto& g = input.geometry;
    cost::CostInput quantities{
        .kind              = input.kind,
        .width             = g.width,
        .height            = g.height,
        .length            = span_or(input, config_.cost_length),
        .fc                = input.material.fc,
        .longitudinal_area = longitudinal_area,
    };
    if (shear.provided && shear.spacing > 0.0) {
        // Closed hoop along the tie centreline plus two 135° hooks.
        const double dt = shear.diameter;
        const double inner_b = std::max(g.width - 2.0 * g.clear_cover - dt, 0.0);
        const double inner_h = std::max(g.height - 2.0 * g.clear_cover - dt, 0.0);
        quantities.tie_area    = stirrup_bar_area(dt);
        quantities.tie_length  = 2.0 * (inner_b + inner_h) + 12.0 * dt;
        quantities.tie_spacing = shear.spacing;
    }
    return cost::CostEstimator::estimate(quantities, config_.rates);
}

// ─── Beam ─────────────────────────────────────────────────────────────────────

DesignResult DesignEngine::design_beam(const DesignInput& input) const {
    const auto& g  = input.geometry;
    const double fc = input.material.fc;
    const double fy = input.material.fy;
    const double mu = std::abs(input.forces.moment_x) * KNM_TO_NMM;
    const double vu = std::abs(input.forces.shear) * KN_TO_N;

    double bar = config_.assumed_bar_diameter;
    double tie = config_.assumed_stirrup_diameter;

    section::SectionProperties       sec{};
    flexure::FlexuralDesign          flex{};
    ReinforcementSelection           main{};
    reinforcement::StirrupSelection  stirrup{};

    const reinforcement::StirrupOptions tie_options{
        .legs         = STIRRUP_LEGS,
        .min_spacing  = config_.min_stirrup_spacing,
        .spacing_step = config_.spacing_step,
        .leg_length   = std::max(g.height - 2.0 * g.clear_cover, 0.0),
        .weights      = config_.selector,
    };

    for (int pass = 0; pass < MAX_PASSES; ++pass) {
        sec  = SectionGeometry::resolve(ElementKind::Beam, g, bar, tie);
        flex = FlexuralDesigner::design(flexure::FlexureDemand{
            .moment                  = mu,
            .width                   = sec.width,
            .effective_depth         = sec.effective_depth,
            .compression_depth       = sec.compression_depth,
            .fc                      = fc,
            .fy                      = fy,
            .allow_compression_steel = true,
            .min_area_override       = std::nullopt,
        });
        main = ReinforcementSelector::select(flex.tension_area, {}, config_.selector);

        const auto shear_design = ShearDesigner::design(shear::ShearDemand{
            .shear           = vu,
            .width           = sec.width,
            .effective_depth = sec.effective_depth,
            .fc              = fc,
            .fy              = fy,
            .stirrup_area    = STIRRUP_LEGS * stirrup_bar_area(tie),
            .spacing_step    = config_.spacing_step,
        });
        stirrup = ReinforcementSelector::select_stirrup(
            shear_design.av_required_per_mm, shear_design.spacing_cap, tie_options);

        if (main.diameter == bar && stirrup.diameter == tie) {
            break;
        }
        log::logger().debug("beam: pass {} reselected D{} / stirrup D{}",
                            pass + 1, main.diameter, stirrup.diameter);
        bar = main.diameter;
        tie = stirrup.diameter;
    }

    sec = SectionGeometry::resolve(ElementKind::Beam, g, main.diameter, stirrup.diameter);
    const double b = sec.width;
    const double d = sec.effective_depth;

    std::optional<CompressionSteel> compression;
    if (flex.compression_area > 0.0) {
        const double raw = std::min(std::ceil(flex.compression_area / main.bar_area),
                                    static_cast<double>(BEAM_MAX_BAR_COUNT));
        const int count = std::max(MIN_BAR_COUNT, static_cast<int>(raw));
        compression = CompressionSteel{
            .diameter      = main.diameter,
            .count         = count,
            .required_area = flex.compression_area,
            .provided_area = count * main.bar_area,
        };
    }
    const double as_c = compression ? compression->provided_area : 0.0;

    const capacity::FlexuralSection flexural_section{
        .width             = b,
        .effective_depth   = d,
        .compression_depth = sec.compression_depth,
        .fc                = fc,
        .fy                = fy,
        .tension_area      = main.provided_area,
        .compression_area  = as_c,
    };
    const auto flexural_capacity = CapacityVerifier::flexural_capacity(flexural_section);

    const auto shear = to_shear(stirrup);
    const capacity::ShearSection shear_section{
        .width           = b,
        .effective_depth = d,
        .fc              = fc,
        .fy              = fy,
        .stirrup_area    = STIRRUP_LEGS * stirrup.bar_area,
        .spacing         = stirrup.spacing,
    };

    const auto deflection = ServiceabilityChecker::deflection(serviceability::DeflectionInput{
        .width             = b,
        .height            = sec.height,
        .effective_depth   = d,
        .tension_area      = main.provided_area,
        .fc                = fc,
        .span              = span_or(input, config_.serviceability_span),
        .service_moment    = ServiceabilityChecker::service_moment(input.loads, g.span, mu),
        .limit_denominator = input.constraints.deflection_limit.value_or(config_.deflection_limit),
    });
    const auto crack = ServiceabilityChecker::crack_width(serviceability::CrackInput{
        .width               = b,
        .cover_to_bar_center = sec.tension_cover_to_bar_center,
        .bar_count           = main.count,
        .fy                  = fy,
        .strain_gradient     = serviceability::BEAM_STRAIN_GRADIENT,
        .limit               = ServiceabilityChecker::crack_limit(input.constraints,
                                                                  config_.crack_width_limit),
        .model               = config_.crack_model,
    });

    DesignChecks checks{
        .flexural_strength = scaled(CapacityVerifier::verify_flexure(flexural_section, mu),
                                    1.0 / KNM_TO_NMM),
        .shear_strength    = require_constructible(
                                 scaled(CapacityVerifier::verify_shear(shear_section, vu),
                                        1.0 / KN_TO_N),
                                 shear),
        .axial_strength    = CheckResult::not_applicable(),
        .deflection        = deflection.check,
        .cracking          = crack.check,
        .min_reinforcement = CapacityVerifier::verify_min_steel(main.provided_area,
                                                                flex.rho_min * b * d),
        .max_reinforcement = CapacityVerifier::verify_max_steel(main.provided_area - as_c,
                                                                flex.rho_max * b * d),
    };

    DesignResult result{
        .element       = summarize(input, sec),
        .reinforcement = ReinforcementDetail{
            .main          = main,
            .required_area = flex.tension_area,
            .compression   = compression,
            .shear         = shear,
            .development   = detailing::DetailingCalculator::development_lengths(
                                 main.diameter, fc, fy),
            .bar_spacing   = std::nullopt,
        },
        .checks  = checks,
        .cost    = estimate_cost(input, main.provided_area + as_c, shear),
        .flexure = FlexureSummary{
            .mode                     = flex.mode,
            .rn                       = flex.rn,
            .rn_max                   = flex.rn_max,
            .neutral_axis             = flexural_capacity.neutral_axis,
            .tension_controlled_limit = flexural_capacity.tension_controlled_limit,
            .tension_controlled       = flexural_capacity.tension_controlled,
            .clamped                  = flex.clamped,
        },
        .column   = std::nullopt,
        .is_valid = checks.all_pass(),
    };

    log::logger().debug("beam {}x{} {} {}: As={:.0f} mm2 -> {}D{}{}, stirrup D{}@{:.0f}, valid={}",
                        g.width, g.height, result.element.concrete_grade,
                        result.element.steel_grade, flex.tension_area, main.count, main.diameter,
                        compression ? fmt::format(" + {}D{} top", compression->count,
                                                  compression->diameter)
                                    : std::string{},
                        stirrup.diameter, stirrup.spacing, result.is_valid);
    return result;
}

// ─── Slab ─────────────────────────────────────────────────────────────────────

DesignResult DesignEngine::design_slab(const DesignInput& input) const {
    const auto& g  = input.geometry;
    const double fc = input.material.fc;
    const double fy = input.material.fy;
    const double mu = std::abs(input.forces.moment_x) * KNM_TO_NMM;
    const double vu = std::abs(input.forces.shear) * KN_TO_N;

    const auto limits = ReinforcementSelector::slab_limits(g.height);

    double bar = config_.slab_bar_diameter;
    section::SectionProperties sec{};
    flexure::FlexuralDesign    flex{};
    ReinforcementSelection     main{};

    for (int pass = 0; pass < MAX_PASSES; ++pass) {
        sec  = SectionGeometry::resolve(ElementKind::Slab, g, bar, 0.0);
        flex = FlexuralDesigner::design(flexure::FlexureDemand{
            .moment                  = mu,
            .width                   = sec.width,
            .effective_depth         = sec.effective_depth,
            .compression_depth       = sec.compression_depth,
            .fc                      = fc,
            .fy                      = fy,
            .allow_compression_steel = false,
            .min_area_override       = SLAB_RHO_MIN * sec.width * sec.height,
        });
        main = ReinforcementSelector::select(flex.tension_area, limits, config_.selector);
        if (main.diameter == bar) {
            break;
        }
        bar = main.diameter;
    }

    sec = SectionGeometry::resolve(ElementKind::Slab, g, main.diameter, 0.0);
    const double b = sec.width;
    const double d = sec.effective_depth;

    const capacity::FlexuralSection flexural_section{
        .width             = b,
        .effective_depth   = d,
        .compression_depth = sec.compression_depth,
        .fc                = fc,
        .fy                = fy,
        .tension_area      = main.provided_area,
    };
    const auto flexural_capacity = CapacityVerifier::flexural_capacity(flexural_section);

    const capacity::ShearSection shear_section{
        .width           = b,
        .effective_depth = d,
        .fc              = fc,
        .fy              = fy,
    };

    const auto deflection = ServiceabilityChecker::deflection(serviceability::DeflectionInput{
        .width             = b,
        .height            = sec.height,
        .effective_depth   = d,
        .tension_area      = main.provided_area,
        .fc                = fc,
        .span              = span_or(input, config_.serviceability_span),
        .service_moment    = ServiceabilityChecker::service_moment(input.loads, g.span, mu),
        .limit_denominator = input.constraints.deflection_limit.value_or(config_.deflection_limit),
    });
    const auto crack = ServiceabilityChecker::crack_width(serviceability::CrackInput{
        .width               = b,
        .cover_to_bar_center = sec.tension_cover_to_bar_center,
        .bar_count           = main.count,
        .fy                  = fy,
        .strain_gradient     = serviceability::SLAB_STRAIN_GRADIENT,
        .limit               = ServiceabilityChecker::crack_limit(input.constraints,
                                                                  config_.crack_width_limit),
        .model               = config_.crack_model,
    });

    DesignChecks checks{
        .flexural_strength = scaled(CapacityVerifier::verify_flexure(flexural_section, mu),
                                    1.0 / KNM_TO_NMM),
        .shear_strength    = scaled(CapacityVerifier::verify_shear(shear_section, vu),
                                    1.0 / KN_TO_N),
        .axial_strength    = CheckResult::not_applicable(),
        .deflection        = deflection.check,
        .cracking          = crack.check,
        .min_reinforcement = CapacityVerifier::verify_min_steel(main.provided_area, flex.min_area),
        .max_reinforcement = CapacityVerifier::verify_max_steel(main.provided_area, flex.max_area),
    };

    const ShearReinforcement no_stirrups{
        .diameter = 0.0, .legs = 0, .spacing = 0.0, .area_per_metre = 0.0, .provided = false,
        .constructible = true,
    };

    // Strip steel scaled to the full slab width for pricing.
    const double priced_area = main.provided_area * g.width / SLAB_STRIP_WIDTH;

    DesignResult result{
        .element       = summarize(input, sec),
        .reinforcement = ReinforcementDetail{
            .main          = main,
            .required_area = flex.tension_area,
            .compression   = std::nullopt,
            .shear         = no_stirrups,
            .development   = detailing::DetailingCalculator::development_lengths(
                                 main.diameter, fc, fy),
            .bar_spacing   = SLAB_STRIP_WIDTH / main.count,
        },
        .checks  = checks,
        .cost    = estimate_cost(input, priced_area, no_stirrups),
        .flexure = FlexureSummary{
            .mode                     = flex.mode,
            .rn                       = flex.rn,
            .rn_max                   = flex.rn_max,
            .neutral_axis             = flexural_capacity.neutral_axis,
            .tension_controlled_limit = flexural_capacity.tension_controlled_limit,
            .tension_controlled       = flexural_capacity.tension_controlled,
            .clamped                  = flex.clamped,
        },
        .column   = std::nullopt,
        .is_valid = checks.all_pass(),
    };

    log::logger().debug("slab h={} {} {}: As={:.0f} mm2/m -> D{}@{:.0f}, valid={}",
                        g.height, result.element.concrete_grade, result.element.steel_grade,
                        flex.tension_area, main.diameter, *result.reinforcement.bar_spacing,
                        result.is_valid);
    return result;
}

// ─── Column ───────────────────────────────────────────────────────────────────

DesignResult DesignEngine::design_column(const DesignInput& input) const {
    const auto& g  = input.geometry;
    const double fc = input.material.fc;
    const double fy = input.material.fy;
    const double b  = g.width;
    const double h  = g.height;
    const double ag = b * h;
    const double pu = input.forces.axial * KN_TO_N;
    const double mu = std::abs(input.forces.moment_x) * KNM_TO_NMM;
    const double vu = std::abs(input.forces.shear) * KN_TO_N;

    const auto limits = ReinforcementSelector::column_limits(b, h);

    double bar = config_.assumed_bar_diameter;
    double tie = config_.assumed_stirrup_diameter;

    section::SectionProperties      sec{};
    column::ColumnSteelDesign       steel{};
    ReinforcementSelection          main{};
    reinforcement::StirrupSelection stirrup{};

    for (int pass = 0; pass < MAX_PASSES; ++pass) {
        sec = SectionGeometry::resolve(ElementKind::Column, g, bar, tie);
        const column::ColumnSection trial{
            .width     = b,
            .height    = h,
            .fc        = fc,
            .fy        = fy,
            .bar_inset = sec.compression_depth,
            .bar_count = limits.min_count,
            .bar_area  = 0.0,
        };
        steel = column::ColumnDesigner::required_steel(trial, pu, mu);
        main  = ReinforcementSelector::select(steel.required_area, limits, config_.selector);

        const auto shear_design = ShearDesigner::design(shear::ShearDemand{
            .shear           = vu,
            .width           = b,
            .effective_depth = sec.effective_depth,
            .fc              = fc,
            .fy              = fy,
            .stirrup_area    = STIRRUP_LEGS * stirrup_bar_area(tie),
            .axial           = pu,
            .gross_area      = ag,
            .spacing_step    = config_.spacing_step,
        });
        // Ties are sized by detailing unless the concrete alone cannot carry Vu.
        const double av_required = shear_design.vs_required > 0.0
            ? shear_design.av_required_per_mm
            : 0.0;
        const double cap = std::min({shear_design.spacing_cap, 16.0 * main.diameter,
                                     std::min(b, h)});
        stirrup = ReinforcementSelector::select_stirrup(
            av_required, cap,
            reinforcement::StirrupOptions{
                .legs         = STIRRUP_LEGS,
                .min_diameter = std::max(8.0, main.diameter / 4.0),
                .min_spacing  = config_.min_stirrup_spacing,
                .spacing_step = config_.spacing_step,
                .leg_length   = std::max(b - 2.0 * g.clear_cover, 0.0),
                .weights      = config_.selector,
            });

        const double by_tie = shear::ShearDesigner::round_down(48.0 * stirrup.diameter,
                                                                config_.spacing_step);
        if (stirrup.spacing > by_tie) {
            stirrup.spacing     = by_tie;
            stirrup.area_per_mm = stirrup.legs * stirrup.bar_area / by_tie;
        }

        if (main.diameter == bar && stirrup.diameter == tie) {
            break;
        }
        bar = main.diameter;
        tie = stirrup.diameter;
    }

    sec = SectionGeometry::resolve(ElementKind::Column, g, main.diameter, stirrup.diameter);

    const column::ColumnSection provided{
        .width     = b,
        .height    = h,
        .fc        = fc,
        .fy        = fy,
        .bar_inset = sec.compression_depth,
        .bar_count = main.count,
        .bar_area  = main.bar_area,
    };
    const auto interaction = column::ColumnInteraction::verify(provided, pu, mu);

    const auto shear = to_shear(stirrup);
    const capacity::ShearSection shear_section{
        .width           = b,
        .effective_depth = sec.effective_depth,
        .fc              = fc,
        .fy              = fy,
        .stirrup_area    = STIRRUP_LEGS * stirrup.bar_area,
        .spacing         = stirrup.spacing,
        .axial           = pu,
        .gross_area      = ag,
    };

    DesignChecks checks{
        .flexural_strength = interaction,
        .shear_strength    = require_constructible(
                                 scaled(CapacityVerifier::verify_shear(shear_section, vu),
                                        1.0 / KN_TO_N),
                                 shear),
        .axial_strength    = scaled(column::ColumnInteraction::verify_axial(provided, pu),
                                    1.0 / KN_TO_N),
        .deflection        = CheckResult::not_applicable(),
        .cracking          = CheckResult::not_applicable(),
        .min_reinforcement = CapacityVerifier::verify_min_steel(main.provided_area,
                                                                COLUMN_RHO_MIN * ag),
        .max_reinforcement = CapacityVerifier::verify_max_steel(main.provided_area,
                                                                COLUMN_RHO_MAX * ag),
    };

    DesignResult result{
        .element       = summarize(input, sec),
        .reinforcement = ReinforcementDetail{
            .main          = main,
            .required_area = steel.required_area,
            .compression   = std::nullopt,
            .shear         = shear,
            .development   = detailing::DetailingCalculator::development_lengths(
                                 main.diameter, fc, fy),
            .bar_spacing   = std::nullopt,
        },
        .checks  = checks,
        .cost    = estimate_cost(input, main.provided_area, shear),
        .flexure = std::nullopt,
        .column  = ColumnSummary{
            .rho            = steel.rho,
            .capacity_ratio = interaction.ratio,
            .axial_cap      = column::ColumnInteraction::axial_cap(provided) / KN_TO_N,
            .clamped        = steel.clamped,
        },
        .is_valid = checks.all_pass(),
    };

    log::logger().debug("column {}x{} {} {}: Pu={} kN Mu={} kN.m, rho={:.4f} -> {}D{}, ties D{}@{:.0f}, valid={}",
                        b, h, result.element.concrete_grade, result.element.steel_grade,
                        input.forces.axial, input.forces.moment_x, steel.rho, main.count,
                        main.diameter, stirrup.diameter, stirrup.spacing, result.is_valid);
    return result;
}

}  // namespace rcde::core
