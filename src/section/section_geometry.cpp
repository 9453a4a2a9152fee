/// @file src/section/section_geometry.cpp
/// @brief SectionGeometry implementation.

#include "rcde/section.hpp"
#include "rcde/constants.hpp"

namespace rcde::section {

double SectionGeometry::effective_depth(double height, double cover,
                                        double stirrup_diameter,
                                        double bar_diameter) noexcept {
    return height - cover - stirrup_diameter - bar_diameter / 2.0;
}

double SectionGeometry::compression_depth(double cover, double stirrup_diameter,
                                          double bar_diameter) noexcept {
    return cover + stirrup_diameter + bar_diameter / 2.0;
}

double SectionGeometry::gross_inertia(double width, double height) noexcept {
    return width * height * height * height / 12.0;
}

double SectionGeometry::design_width(ElementKind kind, double width) noexcept {
    return kind == ElementKind::Slab ? constants::SLAB_STRIP_WIDTH : width;
}

ElementKind SectionGeometry::classify(const Geometry& geometry,
                                      const Material& material,
                                      const Forces& forces) noexcept {
    const double gross_area = geometry.width * geometry.height;
    const double axial_n    = forces.axial * 1e3;
    if (axial_n > 0.1 * material.fc * gross_area) {
        return ElementKind::Column;
    }
    if (geometry.width >= 4.0 * geometry.height) {
        return ElementKind::Slab;
    }
    return ElementKind::Beam;
}

SectionProperties SectionGeometry::resolve(ElementKind kind,
                                           const Geometry& geometry,
                                           double bar_diameter,
                                           double stirrup_diameter) noexcept {
    // Slabs carry no stirrups; the bar sits directly on the cover.
    const double stirrup = kind == ElementKind::Slab ? 0.0 : stirrup_diameter;
    const double b = design_width(kind, geometry.width);
    const double h = geometry.height;

    return SectionProperties{
        .kind               = kind,
        .width              = b,
        .height             = h,
        .clear_cover        = geometry.clear_cover,
        .stirrup_diameter   = stirrup,
        .bar_diameter       = bar_diameter,
        .effective_depth    = effective_depth(h, geometry.clear_cover, stirrup, bar_diameter),
        .compression_depth  = compression_depth(geometry.clear_cover, stirrup, bar_diameter),
        .gross_area         = b * h,
        .gross_inertia      = gross_inertia(b, h),
        .centroid_to_tension_face    = h / 2.0,
        .tension_cover_to_bar_center = compression_depth(geometry.clear_cover, stirrup, bar_diameter),
    };
}

}  // namespace rcde::section
