#pragma once

/// @file include/rcde/flexure.hpp
/// @brief Flexural Designer public API.
///
/// # Module: Flexural Designer
///
/// ## Responsibility
/// Size the continuous tension steel area As (and, when the section cannot
/// carry the moment below ρmax, the compression steel As′) for a factored
/// moment on a rectangular section.
///
/// ## The Core Idea
/// The demand is expressed as a flexural resistance coefficient
///
///     Rn = Mu / (φ · b · d²)
///
/// and compared with the largest coefficient a singly reinforced section can
/// develop at ρmax:
///
///     RnMax = ρmax · fy · (1 − 0.59 · ρmax · fy / fc′)
///
/// Below RnMax the rectangular stress block gives ρ in closed form:
///
///     ρ = (0.85 fc′/fy) · (1 − √(1 − 2 Rn / (0.85 fc′)))
///
/// Above it the section is doubly reinforced: ρmax carries RnMax·b·d², and the
/// remaining nominal moment ΔMn is carried by a steel couple over (d − d′).
///
/// ## Degeneracy Policy
/// A negative discriminant, or a doubly reinforced demand on a section with
/// d − d′ ≤ 0 (or one that may not carry compression steel), is clamped to
/// ρmax and flagged with `clamped = true`. No exception is thrown; capacity
/// verification downstream reports the shortfall.

#include "rcde/types.hpp"

#include <optional>

namespace rcde::flexure {

/// Singly or doubly reinforced outcome.
enum class ReinforcementMode {
    Singly,
    Doubly,
};

/// Flexural demand on one section.
struct FlexureDemand {
    double moment;             ///< Mu (N·mm); sign is ignored
    double width;              ///< b (mm)
    double effective_depth;    ///< d (mm)
    double compression_depth;  ///< d′ (mm)
    double fc;                 ///< MPa
    double fy;                 ///< MPa
    bool   allow_compression_steel = true;   ///< false for slabs
    std::optional<double> min_area_override; ///< replaces ρmin·b·d when set
};

/// Continuous steel requirement.
struct FlexuralDesign {
    ReinforcementMode mode;
    double tension_area;      ///< Required As (mm²)
    double compression_area;  ///< Required As′ (mm²); 0 when singly reinforced
    double rho;               ///< Tension ratio from the closed form (or ρmax)
    double rn;                ///< Mu / (φ b d²) (MPa)
    double rn_max;            ///< RnMax (MPa)
    double rho_min;
    double rho_max;
    double min_area;          ///< Minimum tension steel applied (mm²)
    double max_area;          ///< ρmax · b · d (mm²)
    bool   clamped;           ///< A degenerate solve was clamped to ρmax
};

/// Stateless flexural designer.
class FlexuralDesigner {
public:
    FlexuralDesigner() = delete;

    /// Size As (and As′ when needed) for the demand.
    ///
    /// # Returns
    /// - Mu = 0 → As = minimum area, As′ = 0, Singly
    /// - Rn ≤ RnMax → closed-form ρ, As = max(ρ b d, minimum area)
    /// - Rn > RnMax → As = ρmax b d + As′, As′ = ΔMn / (fy (d − d′))
    [[nodiscard]] static FlexuralDesign design(const FlexureDemand& demand) noexcept;

    /// Rn = Mu / (φ b d²).
    [[nodiscard]] static double
    resistance_coefficient(double moment, double width, double depth) noexcept;

    /// RnMax at ρmax for the given strengths.
    [[nodiscard]] static double rn_max(double fc, double fy) noexcept;

    /// Closed-form ρ for a coefficient Rn, or `nullopt` when the discriminant
    /// 1 − 2Rn/(0.85 fc′) is negative.
    [[nodiscard]] static std::optional<double>
    required_ratio(double rn, double fc, double fy) noexcept;
};

}  // namespace rcde::flexure
