#pragma once

/// @file include/rcde/engine.hpp
/// @brief Design Orchestrator public API.
///
/// # Module: Design Orchestrator
///
/// ## Responsibility
/// Run the shared design pipeline for one element:
///   DesignInput → SectionGeometry → FlexuralDesigner / ColumnDesigner →
///   ReinforcementSelector → ShearDesigner → CapacityVerifier →
///   ServiceabilityChecker → DetailingCalculator → CostEstimator → DesignResult
///
/// The element kind selects a profile (section width, minimum steel, bar
/// catalog and count range, shear treatment, applicable checks); the
/// sub-components are shared.
///
/// ## Usage
/// ```cpp
/// rcde::core::DesignEngine engine;
/// auto result = engine.design(input);
/// if (!result.is_valid) fmt::print("{}\n", result.to_string());
/// ```
///
/// ## Guarantees
/// - `design` is const and touches no shared mutable state; concurrent calls
///   on one engine are safe
/// - Identical inputs give identical results
/// - Only precondition violations throw (`InvalidInputError`)
///
/// ## NOT Responsible For
/// - Code-range advice (fc′ below a code minimum is designed as given)
/// - Biaxial bending and torsion; `moment_y` and `torsion` are informational

#include "rcde/cost.hpp"
#include "rcde/detailing.hpp"
#include "rcde/errors.hpp"
#include "rcde/flexure.hpp"
#include "rcde/reinforcement.hpp"
#include "rcde/section.hpp"
#include "rcde/serviceability.hpp"
#include "rcde/types.hpp"

#include <optional>
#include <string>

namespace rcde::core {

// ─── DesignConfig ─────────────────────────────────────────────────────────────

/// Engine-wide defaults. Per-element `Constraints` override the limits.
struct DesignConfig {
    /// Longitudinal bar diameter assumed before selection (mm).
    double assumed_bar_diameter = 16.0;

    /// Stirrup or tie diameter assumed before selection (mm).
    double assumed_stirrup_diameter = 8.0;

    /// Slab bar diameter assumed before selection (mm).
    double slab_bar_diameter = 10.0;

    /// Deflection limit denominator N in L/N.
    double deflection_limit = 360.0;

    /// Crack-width limit when neither an explicit limit nor an exposure class
    /// is given (mm).
    double crack_width_limit = 0.33;

    /// Crack-width expression used for beams and slabs.
    serviceability::CrackWidthModel crack_model = serviceability::CrackWidthModel::Direct;

    /// Span assumed for serviceability when the input carries none (mm).
    double serviceability_span = 6000.0;

    /// Length priced when the input carries no span (mm).
    double cost_length = 1000.0;

    /// Smallest constructible stirrup spacing (mm).
    double min_stirrup_spacing = 50.0;

    /// Stirrup spacings are rounded down to this step (mm).
    double spacing_step = 5.0;

    reinforcement::SelectorWeights selector{};
    cost::CostRates                rates{};
};

// ─── DesignResult ─────────────────────────────────────────────────────────────

/// Resolved element echo.
struct ElementSummary {
    ElementKind           kind;
    double                width;             ///< Design width (1000 for slabs)
    double                height;
    std::optional<double> span;
    double                effective_depth;   ///< Final d with the selected bars
    std::string           concrete_grade;    ///< e.g. "fc30"
    std::string           steel_grade;       ///< e.g. "fy400"
};

struct CompressionSteel {
    double diameter;
    int    count;
    double required_area;   ///< As′ (mm²)
    double provided_area;   ///< mm²
};

struct ShearReinforcement {
    double diameter;        ///< 0 when none
    int    legs;
    double spacing;         ///< mm; 0 when none
    double area_per_metre;  ///< Av/s × 1000 (mm²/m)
    bool   provided;        ///< false for slabs (concrete carries the shear)
    bool   constructible;   ///< spacing >= the minimum constructible spacing
};

struct ReinforcementDetail {
    ReinforcementSelection          main;
    double                          required_area;  ///< Continuous As or Ast (mm²)
    std::optional<CompressionSteel> compression;
    ShearReinforcement              shear;
    detailing::DevelopmentLengths   development;
    std::optional<double>           bar_spacing;    ///< Slab bar spacing (mm)
};

/// Fixed set of named checks. Forces are reported in kN and kN·m, areas in
/// mm², deflection and crack width in mm. The column interaction check is
/// reported as a utilisation against 1.
struct DesignChecks {
    CheckResult flexural_strength;
    CheckResult shear_strength;
    CheckResult axial_strength;
    CheckResult deflection;
    CheckResult cracking;
    CheckResult min_reinforcement;
    CheckResult max_reinforcement;

    [[nodiscard]] bool all_pass() const noexcept;
};

/// Beam and slab flexural solve summary.
struct FlexureSummary {
    flexure::ReinforcementMode mode;
    double rn;                        ///< MPa
    double rn_max;                    ///< MPa
    double neutral_axis;              ///< c with the provided bars (mm)
    double tension_controlled_limit;  ///< mm
    bool   tension_controlled;
    bool   clamped;
};

/// Column steel solve summary.
struct ColumnSummary {
    double rho;             ///< Required Ast / Ag
    double capacity_ratio;  ///< Radial interaction ratio with the provided bars
    double axial_cap;       ///< φPn,max (kN)
    bool   clamped;         ///< Demand exceeded the ρmax diagram
};

struct DesignResult {
    ElementSummary                element;
    ReinforcementDetail           reinforcement;
    DesignChecks                  checks;
    cost::CostEstimate            cost;
    std::optional<FlexureSummary> flexure;  ///< Beams and slabs
    std::optional<ColumnSummary>  column;   ///< Columns
    bool                          is_valid;

    /// Fixed-layout text report.
    [[nodiscard]] std::string to_string() const;
};

// ─── DesignEngine ─────────────────────────────────────────────────────────────

class DesignEngine {
public:
    explicit DesignEngine(DesignConfig config = DesignConfig{});

    /// First violated precondition, or `nullopt` for a designable input.
    ///
    /// Dimensions and strengths must be finite and positive, cover finite and
    /// non-negative, every force and load finite, optional span and limits
    /// positive, and the cover must leave a positive effective depth with the
    /// largest bar the element kind may select.
    [[nodiscard]] std::optional<InputViolation>
    validate(const DesignInput& input) const noexcept;

    /// Design one element.
    ///
    /// # Errors
    /// Throws `InvalidInputError` when `validate` reports a violation.
    [[nodiscard]] DesignResult design(const DesignInput& input) const;

    [[nodiscard]] const DesignConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] DesignResult design_beam(const DesignInput& input) const;
    [[nodiscard]] DesignResult design_slab(const DesignInput& input) const;
    [[nodiscard]] DesignResult design_column(const DesignInput& input) const;

    [[nodiscard]] double span_or(const DesignInput& input, double fallback) const noexcept;

    [[nodiscard]] ElementSummary
    summarize(const DesignInput& input, const section::SectionProperties& section) const;

    [[nodiscard]] cost::CostEstimate
    estimate_cost(const DesignInput& input, double longitudinal_area,
                  const ShearReinforcement& shear) const noexcept;

    DesignConfig config_;
};

}  // namespace rcde::core
