#pragma once

/// @file include/rcde/column.hpp
/// @brief Column Interaction public API.
///
/// # Module: Column Interaction
///
/// ## Responsibility
/// Compute the axial-force / moment capacity of a tied rectangular column by
/// strain compatibility, and size the longitudinal steel that brings a
/// factored (Pu, Mu) demand inside the φ-reduced interaction diagram.
///
/// ## The Core Idea
/// For a neutral-axis depth c measured from the compression face, every bar
/// layer i at depth dᵢ carries
///
///     εᵢ = εcu · (c − dᵢ) / c,    fᵢ = clamp(Es εᵢ, −fy, fy)
///
/// (less 0.85 fc′ inside the stress block), and the concrete block carries
/// 0.85 fc′ · a · b with a = min(β1 c, h). Summing forces and moments about
/// the gross centroid gives one (Mn, Pn) point; sweeping c traces the
/// diagram. Bar layers are held in Eigen arrays so each point is a handful
/// of vectorised expressions.
///
/// φ varies from 0.65 (compression-controlled, εt ≤ fy/Es) to 0.90
/// (εt ≥ fy/Es + 0.003), and φPn is capped at
///
///     φPn,max = 0.80 · 0.65 · (0.85 fc′ (Ag − Ast) + fy Ast)
///
/// ## Capacity Ratio
/// The demand point is projected radially: the diagram point with the same
/// P/M direction is found by bisection on c, and the ratio is the distance of
/// that point from the origin over the distance of the demand.

#include "rcde/types.hpp"

#include <Eigen/Dense>

#include <vector>

namespace rcde::column {

/// Tied rectangular column with a symmetric perimeter bar arrangement.
struct ColumnSection {
    double width;        ///< b, parallel to the neutral axis (mm)
    double height;       ///< h, in the bending direction (mm)
    double fc;           ///< MPa
    double fy;           ///< MPa
    double bar_inset;    ///< Face to longitudinal bar centre: cover + tie + db/2 (mm)
    int    bar_count;    ///< Even, >= 4
    double bar_area;     ///< One bar (mm²)

    [[nodiscard]] double gross_area() const noexcept { return width * height; }
    [[nodiscard]] double steel_area() const noexcept { return bar_count * bar_area; }
};

/// Bars lumped into layers parallel to the neutral axis.
struct BarLayers {
    Eigen::ArrayXd depth;  ///< From the compression face (mm)
    Eigen::ArrayXd area;   ///< Total bar area in the layer (mm²)
};

/// One point of the interaction diagram.
struct InteractionPoint {
    double neutral_axis;  ///< c (mm)
    double pn;            ///< Nominal axial force (N), compression positive
    double mn;            ///< Nominal moment about the centroid (N·mm)
    double phi;           ///< Strength-reduction factor at this strain state
    double phi_pn;        ///< min(φ Pn, φPn,max) (N)
    double phi_mn;        ///< φ Mn (N·mm)
    double net_tensile_strain;  ///< εt at the extreme tension layer
};

/// Stateless interaction-diagram calculator.
class ColumnInteraction {
public:
    ColumnInteraction() = delete;

    /// Four corner bars plus the remaining pairs shared between the faces in
    /// proportion to their lengths.
    [[nodiscard]] static BarLayers layers(const ColumnSection& section);

    /// Diagram point at neutral-axis depth c > 0.
    [[nodiscard]] static InteractionPoint
    point_at(const ColumnSection& section, const BarLayers& layers, double c);

    /// φPn,max (N).
    [[nodiscard]] static double axial_cap(const ColumnSection& section) noexcept;

    /// Strength-reduction factor for a net tensile strain.
    [[nodiscard]] static double phi_for_strain(double net_tensile_strain, double fy) noexcept;

    /// Sample the diagram at `samples` neutral-axis depths from near-pure
    /// tension to near-pure compression, ordered by increasing c.
    [[nodiscard]] static std::vector<InteractionPoint>
    diagram(const ColumnSection& section, int samples = 40);

    /// Radial capacity ratio for a demand (Pu in N, compression positive;
    /// Mu in N·mm, magnitude). +∞ for a zero demand.
    [[nodiscard]] static double
    capacity_ratio(const ColumnSection& section, double pu, double mu);

    /// Interaction check: required = utilisation (demand over capacity radius),
    /// provided = 1.
    [[nodiscard]] static CheckResult
    verify(const ColumnSection& section, double pu, double mu);

    /// Axial check against φPn,max.
    [[nodiscard]] static CheckResult
    verify_axial(const ColumnSection& section, double pu) noexcept;
};

/// Result of sizing longitudinal column steel.
struct ColumnSteelDesign {
    double required_area;  ///< Ast (mm²)
    double rho;            ///< Ast / Ag
    bool   clamped;        ///< Demand needs more than ρmax; Ast = ρmax Ag
};

/// Stateless column steel designer.
class ColumnDesigner {
public:
    ColumnDesigner() = delete;

    /// Smallest Ast in [ρmin Ag, ρmax Ag] whose interaction ratio reaches 1,
    /// found by bisection with the bar count held fixed and the area smeared
    /// over the bars.
    [[nodiscard]] static ColumnSteelDesign
    required_steel(const ColumnSection& trial, double pu, double mu);
};

}  // namespace rcde::column
