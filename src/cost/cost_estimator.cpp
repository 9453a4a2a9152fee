/// @file src/cost/cost_estimator.cpp
/// @brief CostEstimator implementation.

#include "rcde/cost.hpp"
#include "rcde/constants.hpp"

#include <cmath>

namespace rcde::cost {

using namespace rcde::constants;

double CostEstimator::round_to(double value, double step) noexcept {
    return std::round(value / step) * step;
}

double CostEstimator::contact_perimeter(ElementKind kind, double width, double height) noexcept {
    switch (kind) {
        case ElementKind::Beam:   return width + 2.0 * height;
        case ElementKind::Column: return 2.0 * (width + height);
        case ElementKind::Slab:   return width;
    }
    return width + 2.0 * height;
}

CostEstimate CostEstimator::estimate(const CostInput& input, const CostRates& rates) noexcept {
    const double length = input.length;
    const double volume = input.width * input.height * length / 1e9;

    // mm³ of steel → kg (7.85 kg/dm³, 1 dm³ = 1e6 mm³)
    double steel_mm3 = input.longitudinal_area * length;
    if (input.tie_spacing > 0.0 && input.tie_area > 0.0) {
        const double sets = std::floor(length / input.tie_spacing) + 1.0;
        steel_mm3 += sets * input.tie_area * input.tie_length;
    }
    const double steel_weight = steel_mm3 / 1e6 * STEEL_DENSITY_KG_PER_DM3;

    const double contact_area =
        contact_perimeter(input.kind, input.width, input.height) * length / 1e6;

    const double concrete_price = input.fc >= rates.high_grade_fc
        ? rates.concrete_high
        : rates.concrete_standard;

    const double concrete     = volume * concrete_price;
    const double steel        = steel_weight * rates.steel;
    const double formwork     = contact_area * rates.formwork;
    const double labor        = volume * rates.labor_concrete + steel_weight * rates.labor_steel;
    const double material     = concrete + steel + formwork;
    const double construction = material + labor;
    const double total        = construction * rates.overhead;
    const double steel_ratio  = volume > 0.0 ? steel_weight / volume : 0.0;

    return CostEstimate{
        .concrete = std::round(concrete),
        .steel    = std::round(steel),
        .formwork = std::round(formwork),
        .labor    = std::round(labor),
        .total    = std::round(total),
        .breakdown = CostBreakdown{
            .steel_ratio       = round_to(steel_ratio, 0.1),
            .material_cost     = std::round(material),
            .construction_cost = std::round(construction),
            .volume            = round_to(volume, 0.001),
            .steel_weight      = round_to(steel_weight, 0.1),
            .contact_area      = round_to(contact_area, 0.1),
        },
    };
}

}  // namespace rcde::cost
