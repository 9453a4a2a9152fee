#pragma once

/// @file include/rcde/reinforcement.hpp
/// @brief Reinforcement Selector public API.
///
/// # Module: Reinforcement Selector
///
/// ## Responsibility
/// Map a continuous steel requirement to a constructible bar configuration
/// by exhaustive search over a standard catalog.
///
/// ## Algorithm
/// For every catalog diameter:
///   1. count = max(min_count, ⌈required / bar_area⌉), rounded up to even
///      when the profile needs symmetric bars
///   2. reject the candidate when count > max_count
///   3. cost = count · area · unit_weight · steel_price
///           + count · complexity · placement_rate
/// The cheapest candidate wins; ties keep the smaller diameter.
///
/// ## Guarantees
/// - Deterministic and exhaustive; the catalog has at most eight entries
/// - Never returns zero bars
/// - provided_area >= required whenever any candidate is feasible; otherwise
///   the largest bar at max_count is returned with `adequate = false`

#include "rcde/constants.hpp"
#include "rcde/types.hpp"

#include <span>
#include <vector>

namespace rcde::reinforcement {

/// Practical range and catalog for one element profile.
struct SelectionLimits {
    int  min_count  = constants::MIN_BAR_COUNT;
    int  max_count  = constants::BEAM_MAX_BAR_COUNT;
    bool even_count = false;
    std::span<const constants::BarSize> catalog = constants::BAR_CATALOG;
};

/// Cost proxy coefficients.
struct SelectorWeights {
    double unit_weight    = 0.0078;   ///< kg per m run per mm² of bar area
    double steel_price    = 16500.0;  ///< currency per kg
    double complexity     = 0.1;      ///< placement complexity per bar
    double placement_rate = 50000.0;  ///< currency per unit complexity
};

/// One feasible (diameter, count) pair with its score.
struct Candidate {
    constants::BarSize bar;
    int    count;
    double provided_area;
    double cost;
};

/// Stirrup or tie arrangement.
struct StirrupSelection {
    double diameter;       ///< mm
    int    legs;
    double bar_area;       ///< One leg (mm²)
    double spacing;        ///< Centre-to-centre (mm)
    double area_per_mm;    ///< legs · bar_area / spacing (mm²/mm)
    bool   constructible;  ///< spacing >= the minimum constructible spacing
};

/// Options for stirrup and tie selection.
struct StirrupOptions {
    int    legs          = 2;
    double min_diameter  = 0.0;    ///< e.g. db/4 for column ties
    double min_spacing   = 50.0;   ///< mm
    double spacing_step  = 5.0;    ///< mm
    double leg_length    = 400.0;  ///< mm, used only for the cost proxy
    std::span<const constants::BarSize> catalog = constants::STIRRUP_CATALOG;
    SelectorWeights weights{};
};

/// Stateless reinforcement selector.
class ReinforcementSelector {
public:
    ReinforcementSelector() = delete;

    /// Every feasible candidate, in catalog order.
    [[nodiscard]] static std::vector<Candidate>
    candidates(double required_area,
               const SelectionLimits& limits,
               const SelectorWeights& weights = {});

    /// Lowest-cost bar configuration covering `required_area`.
    [[nodiscard]] static ReinforcementSelection
    select(double required_area,
           const SelectionLimits& limits = {},
           const SelectorWeights& weights = {});

    /// Cheapest constructible stirrup per metre of member.
    ///
    /// # Arguments
    /// * `av_required_per_mm`: Required Av/s (mm²/mm), already including Av,min
    /// * `spacing_cap`       : min of the non-strength spacing limits (mm)
    /// * `options`           : Legs, catalog, minimum spacing and cost inputs
    [[nodiscard]] static StirrupSelection
    select_stirrup(double av_required_per_mm,
                   double spacing_cap,
                   const StirrupOptions& options = {});

    /// Minimum longitudinal bar count for a column of the given section.
    /// max(4, ⌈2(b + h)/150⌉), capped at the column maximum.
    [[nodiscard]] static int column_min_bars(double width, double height) noexcept;

    /// Slab bar-count range per metre strip for a thickness h.
    [[nodiscard]] static SelectionLimits slab_limits(double thickness) noexcept;

    /// Column selection limits for a section.
    [[nodiscard]] static SelectionLimits column_limits(double width, double height) noexcept;
};

}  // namespace rcde::reinforcement
