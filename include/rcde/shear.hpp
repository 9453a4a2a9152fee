#pragma once

/// @file include/rcde/shear.hpp
/// @brief Shear Designer public API.
///
/// # Module: Shear Designer
///
/// ## Responsibility
/// Compute the concrete shear capacity Vc, the steel contribution Vs the
/// stirrups must supply, and a constructible stirrup spacing.
///
/// ## Formulas
///   Vc      = (λ/6) · √fc′ · b · d · axial factor
///   Vn,req  = Vu / φ,  φ = 0.75
///   Vs,req  = max(0, Vn,req − Vc)
///   Av,min  = max(0.062 √fc′ b / fy, 0.35 b / fy)    (per mm of length)
///
/// ## Spacing Rule
/// The spacing is the minimum of every applicable limit at once:
///   (a) Av / Av,min
///   (b) Av · fy · d / Vs,req               (only when Vs,req > 0)
///   (c) d/2, or d/4 when Vs,req > ⅓ √fc′ b d
///   (d) 600 mm, or 300 mm when Vs,req > ⅓ √fc′ b d
/// It is then rounded down to the spacing step, so it never exceeds any of
/// the individual limits.

#include "rcde/types.hpp"

namespace rcde::shear {

/// Shear demand on one section.
struct ShearDemand {
    double shear;             ///< Vu (N); sign is ignored
    double width;             ///< b (mm)
    double effective_depth;   ///< d (mm)
    double fc;                ///< MPa
    double fy;                ///< Stirrup yield strength (MPa)
    double stirrup_area;      ///< Av = legs × one-bar area (mm²)
    double axial = 0.0;       ///< Nu (N), compression positive
    double gross_area = 0.0;  ///< Ag (mm²); required when axial ≠ 0
    double spacing_step = 5.0;
};

/// Each individual spacing limit (mm); +∞ where a limit does not apply.
struct SpacingLimits {
    double strength;   ///< (b) from Vs,req
    double minimum;    ///< (a) from Av,min
    double geometric;  ///< (c) d/2 or d/4
    double absolute;   ///< (d) 600 or 300 mm

    /// min over all four limits.
    [[nodiscard]] double governing() const noexcept;
};

/// Shear design for one stirrup arrangement.
struct ShearDesign {
    double vc;                  ///< Concrete capacity Vc (N)
    double vn_required;         ///< Vu / φ (N)
    double vs_required;         ///< max(0, Vn,req − Vc) (N)
    double vs_max;              ///< ⅔ √fc′ b d, the cap on stirrup contribution (N)
    double av_min_per_mm;       ///< Av,min / s (mm²/mm)
    double av_required_per_mm;  ///< max(Vs,req/(fy d), Av,min/s) (mm²/mm)
    double spacing_cap;         ///< min of the geometric and absolute limits (mm)
    bool   high_shear;          ///< Vs,req > ⅓ √fc′ b d
    bool   section_adequate;    ///< Vs,req ≤ vs_max
    SpacingLimits limits;       ///< Limits for the demand's stirrup area
    double spacing;             ///< Governing limit rounded down to the step (mm)
};

/// Stateless shear designer.
class ShearDesigner {
public:
    ShearDesigner() = delete;

    /// Design stirrups for the demand.
    [[nodiscard]] static ShearDesign design(const ShearDemand& demand) noexcept;

    /// Vc = (λ/6) √fc′ b d, scaled by (1 + Nu/(14 Ag)) under compression and
    /// by max(0, 1 + Nu/(3.5 Ag)) under tension.
    [[nodiscard]] static double
    concrete_capacity(double width, double depth, double fc,
                      double axial = 0.0, double gross_area = 0.0) noexcept;

    /// Av,min per unit length (mm²/mm).
    [[nodiscard]] static double
    min_reinforcement_per_length(double width, double fc, double fy) noexcept;

    /// Spacing for a different stirrup area under the same demand.
    [[nodiscard]] static double
    spacing_for(const ShearDesign& design, double stirrup_area,
                double spacing_step) noexcept;

    /// Round a spacing down to a multiple of `step`. Spacings smaller than
    /// one step are returned unchanged.
    [[nodiscard]] static double round_down(double spacing, double step) noexcept;
};

}  // namespace rcde::shear
