#pragma once

/// @file include/rcde/section.hpp
/// @brief Section Geometry public API.
///
/// # Module: Section Geometry
///
/// ## Responsibility
/// Resolve a rectangular cross-section into the depths and section
/// properties the designers need: design width (one-metre strip for slabs),
/// effective depth d to the tension steel, depth d′ to compression steel,
/// gross inertia and the tension-face distance to the bar centroid.
///
/// ## Depth Conventions
///   beam / column:  d  = h − cover − stirrup − db/2
///                   d′ = cover + stirrup + db/2
///   slab:           d  = h − cover − db/2   (no stirrups)

#include "rcde/types.hpp"

namespace rcde::section {

/// Resolved section used by every downstream designer.
struct SectionProperties {
    ElementKind kind;
    double width;             ///< Design width b (mm); 1000 for slabs
    double height;            ///< h (mm)
    double clear_cover;       ///< mm
    double stirrup_diameter;  ///< 0 for slabs
    double bar_diameter;      ///< Longitudinal bar diameter assumed (mm)
    double effective_depth;   ///< d (mm)
    double compression_depth; ///< d′ (mm)
    double gross_area;        ///< b·h (mm²)
    double gross_inertia;     ///< b·h³/12 (mm⁴)
    double centroid_to_tension_face;  ///< yt = h/2 (mm)
    double tension_cover_to_bar_center; ///< dc (mm)
};

/// Stateless section geometry calculator.
class SectionGeometry {
public:
    SectionGeometry() = delete;

    /// Resolve the section for an element kind.
    ///
    /// # Arguments
    /// * `kind`            : Element family (slabs use a 1000 mm strip)
    /// * `geometry`        : Caller geometry
    /// * `bar_diameter`    : Longitudinal bar diameter (assumed or selected)
    /// * `stirrup_diameter`: Stirrup/tie diameter; ignored for slabs
    [[nodiscard]] static SectionProperties
    resolve(ElementKind kind,
            const Geometry& geometry,
            double bar_diameter,
            double stirrup_diameter) noexcept;

    /// d = h − cover − stirrup − db/2.
    [[nodiscard]] static double
    effective_depth(double height, double cover,
                    double stirrup_diameter, double bar_diameter) noexcept;

    /// d′ = cover + stirrup + db/2.
    [[nodiscard]] static double
    compression_depth(double cover, double stirrup_diameter,
                      double bar_diameter) noexcept;

    /// Ig = b·h³/12.
    [[nodiscard]] static double gross_inertia(double width, double height) noexcept;

    /// Design width: the strip width for slabs, the section width otherwise.
    [[nodiscard]] static double design_width(ElementKind kind, double width) noexcept;

    /// Classify a section from its proportions and axial demand.
    ///
    /// Column when the factored compression exceeds 0.1·fc′·Ag, slab when the
    /// section is at least four times wider than it is deep, beam otherwise.
    [[nodiscard]] static ElementKind
    classify(const Geometry& geometry, const Material& material,
             const Forces& forces) noexcept;
};

}  // namespace rcde::section
