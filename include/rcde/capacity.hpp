#pragma once

/// @file include/rcde/capacity.hpp
/// @brief Capacity Verifier public API.
///
/// # Module: Capacity Verifier
///
/// ## Responsibility
/// Recompute nominal and design capacities from the *selected* (discrete)
/// reinforcement and compare them against the factored demand.
///
/// ## Flexure
/// Rectangular stress block of depth a = β1 c. Without compression steel
///
///     a = As fy / (0.85 fc′ b),   Mn = As fy (d − a/2)
///
/// With compression steel, yielding of As′ is assumed first; when the
/// resulting strain 0.003 (c − d′)/c is below fy/Es, c is solved from
/// equilibrium with fs′ = 600 (c − d′)/c:
///
///     0.85 fc′ β1 b c² + (600 As′ − As fy) c − 600 As′ d′ = 0
///
/// The section is tension-controlled when c ≤ 0.003/(0.003 + 0.004) · d.
/// A compression-controlled section fails the flexural check regardless of
/// its moment capacity.
///
/// ## Guarantees
/// - Pure functions; all inputs in N, N·mm, mm and MPa
/// - `ratio = provided / required` on every returned check
///
/// ## NOT Responsible For
/// - Column interaction (see `rcde/column.hpp`)
/// - Serviceability (see `rcde/serviceability.hpp`)

#include "rcde/types.hpp"

namespace rcde::capacity {

/// Rectangular section with its provided bars.
struct FlexuralSection {
    double width;              ///< b (mm)
    double effective_depth;    ///< d (mm)
    double compression_depth;  ///< d′ (mm)
    double fc;                 ///< MPa
    double fy;                 ///< MPa
    double tension_area;       ///< As provided (mm²)
    double compression_area = 0.0;  ///< As′ provided (mm²)
};

struct FlexuralCapacity {
    double neutral_axis;              ///< c (mm)
    double block_depth;               ///< a (mm)
    double nominal_moment;            ///< Mn (N·mm)
    double design_moment;             ///< φ Mn (N·mm)
    double tension_controlled_limit;  ///< c at εt = 0.004 (mm)
    double compression_steel_stress;  ///< fs′ (MPa); 0 without As′
    bool   tension_controlled;
};

/// Provided shear reinforcement for verification.
struct ShearSection {
    double width;             ///< b (mm)
    double effective_depth;   ///< d (mm)
    double fc;                ///< MPa
    double fy;                ///< Stirrup yield strength (MPa)
    double stirrup_area = 0.0;     ///< Av of one stirrup set (mm²); 0 for none
    double spacing      = 0.0;     ///< s (mm); ignored when Av = 0
    double axial        = 0.0;     ///< Nu (N), compression positive
    double gross_area   = 0.0;     ///< Ag (mm²)
};

class CapacityVerifier {
public:
    CapacityVerifier() = delete;

    [[nodiscard]] static FlexuralCapacity
    flexural_capacity(const FlexuralSection& section) noexcept;

    /// required = |Mu|, provided = φMn (N·mm); fails when the section is not
    /// tension-controlled.
    [[nodiscard]] static CheckResult
    verify_flexure(const FlexuralSection& section, double moment) noexcept;

    /// φ (Vc + min(Av fy d / s, ⅔ √fc′ b d)) in N.
    [[nodiscard]] static double shear_capacity(const ShearSection& section) noexcept;

    /// required = |Vu|, provided = φVn (N).
    [[nodiscard]] static CheckResult
    verify_shear(const ShearSection& section, double shear) noexcept;

    /// required = minimum area, provided = provided area.
    [[nodiscard]] static CheckResult
    verify_min_steel(double provided_area, double min_area) noexcept;

    /// required = provided area, provided = maximum area; passes while the
    /// provided steel stays within the limit.
    [[nodiscard]] static CheckResult
    verify_max_steel(double provided_area, double max_area) noexcept;
};

}  // namespace rcde::capacity
