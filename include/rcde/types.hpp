#pragma once

/// @file include/rcde/types.hpp
/// @brief Shared value types for the Reinforced Concrete Design Engine (RCDE).
///
/// Every module includes this file. It defines the caller-constructed
/// `DesignInput`, the check verdict type shared by the capacity and
/// serviceability modules, and the discrete bar selection produced by the
/// reinforcement selector.
///
/// Units used throughout: lengths in mm, stresses in MPa, forces in kN and
/// moments in kN·m at the API boundary. Internal computations use N and N·mm.

#include <optional>
#include <string_view>

namespace rcde {

// ─── Enumerations ─────────────────────────────────────────────────────────────

/// Structural element family; selects the design profile.
enum class ElementKind {
    Beam,
    Column,
    Slab,
};

/// Environmental exposure, ordered from least to most aggressive.
enum class ExposureClass {
    Mild,
    Moderate,
    Severe,
    VerySevere,
    Extreme,
};

[[nodiscard]] std::string_view to_string(ElementKind kind) noexcept;
[[nodiscard]] std::string_view to_string(ExposureClass exposure) noexcept;

/// Parse "beam" / "column" / "slab" (case-insensitive).
[[nodiscard]] std::optional<ElementKind> parse_element_kind(std::string_view text) noexcept;

/// Parse "mild" ... "extreme"; accepts "very_severe" and "very-severe".
[[nodiscard]] std::optional<ExposureClass> parse_exposure(std::string_view text) noexcept;

// ─── Design Input ─────────────────────────────────────────────────────────────

/// Rectangular cross-section and member length.
struct Geometry {
    double width;                 ///< b (mm) > 0
    double height;                ///< h (mm) > 0; slab thickness for slabs
    std::optional<double> span;   ///< Member length L (mm), > 0 when present
    double clear_cover;           ///< Clear cover to stirrups/ties (mm) >= 0
};

/// Specified material strengths.
struct Material {
    double fc;  ///< Concrete compressive strength fc′ (MPa) > 0
    double fy;  ///< Steel yield strength (MPa) > 0
};

/// Unfactored line loads (kN/m). Used only for the service moment estimate.
struct Loads {
    double dead    = 0.0;
    double live    = 0.0;
    double wind    = 0.0;
    double seismic = 0.0;
};

/// Factored design actions. Signed; moments and shear are used by magnitude,
/// axial force is compression-positive.
struct Forces {
    double moment_x = 0.0;  ///< Mu about the strong axis (kN·m)
    double moment_y = 0.0;  ///< Weak-axis moment (kN·m), informational
    double shear    = 0.0;  ///< Vu (kN)
    double axial    = 0.0;  ///< Pu (kN), compression positive
    double torsion  = 0.0;  ///< Tu (kN·m), informational
};

/// Optional serviceability and durability constraints.
struct Constraints {
    std::optional<double>        deflection_limit;   ///< N in L/N
    std::optional<double>        crack_width_limit;  ///< mm
    std::optional<ExposureClass> exposure;
};

/// Immutable, caller-constructed request for one element design.
struct DesignInput {
    ElementKind kind;
    Geometry    geometry;
    Material    material;
    Loads       loads{};
    Forces      forces{};
    Constraints constraints{};
};

// ─── Checks ───────────────────────────────────────────────────────────────────

enum class CheckStatus {
    Pass,
    Fail,
};

[[nodiscard]] std::string_view to_string(CheckStatus status) noexcept;

/// Outcome of one capacity or serviceability check.
///
/// `required` is the demand (or, for serviceability, the computed response)
/// and `provided` is the capacity (or the allowable limit). `ratio` is
/// provided / required, so ratio >= 1 means adequate; it is +∞ when nothing
/// is required. Checks that do not apply to an element kind are reported as
/// passing with `applicable = false`.
struct CheckResult {
    double      required;
    double      provided;
    double      ratio;
    CheckStatus status;
    bool        applicable = true;

    [[nodiscard]] bool passed() const noexcept { return status == CheckStatus::Pass; }

    /// Build a check whose verdict is `provided >= required` (and `extra_ok`).
    [[nodiscard]] static CheckResult
    capacity(double required, double provided, bool extra_ok = true) noexcept;

    /// Build a passing placeholder for a check that does not apply.
    [[nodiscard]] static CheckResult not_applicable() noexcept;
};

// ─── Reinforcement Selection ──────────────────────────────────────────────────

/// Drawing hint derived purely from bar count.
enum class BarLayout {
    SingleRow,   ///< count <= 4
    DoubleRow,   ///< count <= 8
    MultiRow,    ///< count > 8
};

[[nodiscard]] std::string_view to_string(BarLayout layout) noexcept;
[[nodiscard]] BarLayout layout_for_count(int count) noexcept;

/// A constructible bar configuration: `count` bars of one catalog diameter.
struct ReinforcementSelection {
    double    diameter;       ///< Catalog bar diameter (mm)
    int       count;          ///< Number of bars (>= 2 for primary steel)
    double    bar_area;       ///< Area of one bar (mm²)
    double    provided_area;  ///< count × bar_area (mm²)
    BarLayout layout;
    bool      adequate;       ///< provided_area >= required area
};

}  // namespace rcde
