#pragma once

/// @file include/rcde/serviceability.hpp
/// @brief Serviceability Checker public API.
///
/// # Module: Serviceability Checker
///
/// ## Responsibility
/// Immediate deflection of a simply supported member under uniform load,
/// using the effective moment of inertia, and the flexural crack width at the
/// tension face.
///
/// ## Deflection
///
///     Mcr = fr Ig / yt
///     k   = √(2ρn + (ρn)²) − ρn
///     Icr = b (kd)³ / 3 + n As (d − kd)²
///     Ie  = Icr + (Ig − Icr)(Mcr/Ma)³   for Ma > Mcr, else Ig
///     δ   = 5 Ma L² / (48 Ec Ie)
///
/// ## Crack Width
///
///     Direct:       w = 11 fs β ∛(dc A) / Es
///     GergelyLutz:  w = 2.2 β (fs/Es) ∛(dc A)
///
/// with fs = 0.6 fy and A = 2 dc b / n_bars. `Direct` is the default.
///
/// ## Guarantees
/// - More tension steel never increases δ (strictly decreases once cracked)
/// - More bars never increase w
/// - Both checks report required = computed response, provided = allowable

#include "rcde/types.hpp"

#include <optional>

namespace rcde::serviceability {

/// Strain-gradient factor β for beams and for slabs.
inline constexpr double BEAM_STRAIN_GRADIENT = 1.20;
inline constexpr double SLAB_STRAIN_GRADIENT = 1.35;

/// Crack-width expression.
enum class CrackWidthModel {
    Direct,       ///< 11 fs β ∛(dc A) / Es
    GergelyLutz,  ///< 2.2 β (fs/Es) ∛(dc A)
};

struct DeflectionInput {
    double width;              ///< b (mm)
    double height;             ///< h (mm)
    double effective_depth;    ///< d (mm)
    double tension_area;       ///< As provided (mm²)
    double fc;                 ///< MPa
    double span;               ///< L (mm)
    double service_moment;     ///< Ma (N·mm)
    double limit_denominator;  ///< N in L/N
};

struct DeflectionResult {
    double gross_inertia;        ///< Ig (mm⁴)
    double cracking_moment;      ///< Mcr (N·mm)
    double neutral_axis_factor;  ///< k
    double cracked_inertia;      ///< Icr (mm⁴)
    double effective_inertia;    ///< Ie (mm⁴)
    double deflection;           ///< δ (mm)
    double allowable;            ///< L/N (mm)
    CheckResult check;
};

struct CrackInput {
    double width;                ///< b (mm)
    double cover_to_bar_center;  ///< dc (mm)
    int    bar_count;
    double fy;                   ///< MPa
    double strain_gradient = BEAM_STRAIN_GRADIENT;
    double limit;                ///< Allowable width (mm)
    CrackWidthModel model = CrackWidthModel::Direct;
};

struct CrackResult {
    double steel_stress;    ///< fs (MPa)
    double effective_area;  ///< A per bar (mm²)
    double crack_width;     ///< w (mm)
    double limit;           ///< mm
    CheckResult check;
};

class ServiceabilityChecker {
public:
    ServiceabilityChecker() = delete;

    [[nodiscard]] static DeflectionResult deflection(const DeflectionInput& input) noexcept;

    [[nodiscard]] static CrackResult crack_width(const CrackInput& input) noexcept;

    /// Service moment: (dead + live) L²/8 when line loads and a span are
    /// given, otherwise the factored moment over 1.4 (N·mm).
    [[nodiscard]] static double
    service_moment(const Loads& loads, std::optional<double> span,
                   double factored_moment) noexcept;

    /// Allowable crack width for an exposure class (mm).
    [[nodiscard]] static double exposure_limit(ExposureClass exposure) noexcept;

    /// Explicit limit, else the exposure-class limit, else `fallback`.
    [[nodiscard]] static double
    crack_limit(const Constraints& constraints, double fallback) noexcept;
};

}  // namespace rcde::serviceability
