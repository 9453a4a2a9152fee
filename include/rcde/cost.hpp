#pragma once

/// @file include/rcde/cost.hpp
/// @brief Material, formwork and labour cost estimate for one element.
///
/// A reporting transform only: quantities come from the geometry and the
/// selected reinforcement, prices from `CostRates`. Field names and rounding
/// are part of the result contract:
///
/// | Field                  | Rounding |
/// |------------------------|----------|
/// | currency fields        | integer  |
/// | steel_ratio (kg/m³)    | 0.1      |
/// | volume (m³)            | 0.001    |
/// | steel_weight (kg)      | 0.1      |
/// | contact_area (m²)      | 0.1      |

#include "rcde/types.hpp"

namespace rcde::cost {

/// Unit prices (currency per unit).
struct CostRates {
    double concrete_standard = 950000.0;   ///< per m³, fc′ below the high grade
    double concrete_high     = 1050000.0;  ///< per m³, fc′ >= high_grade_fc
    double high_grade_fc     = 35.0;       ///< MPa
    double steel             = 16800.0;    ///< per kg
    double formwork          = 120000.0;   ///< per m² contact area
    double labor_concrete    = 280000.0;   ///< per m³
    double labor_steel       = 8500.0;     ///< per kg
    double overhead          = 1.18;       ///< multiplier on construction cost
};

/// Quantities for one element.
struct CostInput {
    ElementKind kind;
    double width;                   ///< mm
    double height;                  ///< mm
    double length;                  ///< mm
    double fc;                      ///< MPa, selects the concrete price
    double longitudinal_area;       ///< Tension + compression steel (mm²)
    double tie_area     = 0.0;      ///< Av of one stirrup set (all legs, mm²)
    double tie_length   = 0.0;      ///< Developed length of one leg set (mm)
    double tie_spacing  = 0.0;      ///< mm; no ties when 0
};

struct CostBreakdown {
    double steel_ratio;        ///< kg of steel per m³ of concrete
    double material_cost;
    double construction_cost;
    double volume;             ///< m³
    double steel_weight;       ///< kg
    double contact_area;       ///< m²
};

struct CostEstimate {
    double concrete;
    double steel;
    double formwork;
    double labor;
    double total;
    CostBreakdown breakdown;
};

class CostEstimator {
public:
    CostEstimator() = delete;

    [[nodiscard]] static CostEstimate
    estimate(const CostInput& input, const CostRates& rates = {}) noexcept;

    /// Formwork contact area per mm of length: b + 2h (beam), 2(b + h)
    /// (column), b (slab soffit).
    [[nodiscard]] static double contact_perimeter(ElementKind kind, double width,
                                                  double height) noexcept;

    /// Round to `step` (e.g. 0.1, 0.001, 1).
    [[nodiscard]] static double round_to(double value, double step) noexcept;
};

}  // namespace rcde::cost
