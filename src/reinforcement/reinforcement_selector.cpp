/// @file src/reinforcement/reinforcement_selector.cpp
/// @brief ReinforcementSelector implementation.

#include "rcde/reinforcement.hpp"
#include "rcde/logging.hpp"
#include "rcde/shear.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

namespace rcde::reinforcement {

using namespace rcde::constants;

namespace {

int required_count(double required_area, double bar_area, const SelectionLimits& limits) noexcept {
    const double raw = required_area > 0.0 ? std::ceil(required_area / bar_area) : 0.0;
    int count = std::max(limits.min_count, static_cast<int>(raw));
    if (limits.even_count && count % 2 != 0) {
        ++count;
    }
    return count;
}

}  // anonymous namespace

// ─── Longitudinal Bars ────────────────────────────────────────────────────────

std::vector<Candidate>
ReinforcementSelector::candidates(double required_area,
                                  const SelectionLimits& limits,
                                  const SelectorWeights& weights) {
    std::vector<Candidate> out;
    out.reserve(limits.catalog.size());

    for (const auto& bar : limits.catalog) {
        // Counts beyond the practical range cannot be placed in one section.
        if (required_area / bar.area > static_cast<double>(limits.max_count)) {
            continue;
        }
        const int count = required_count(required_area, bar.area, limits);
        if (count > limits.max_count) {
            continue;
        }
        const double area       = count * bar.area;
        const double steel_cost = area * weights.unit_weight * weights.steel_price;
        const double labor_cost = count * weights.complexity * weights.placement_rate;
        out.push_back(Candidate{
            .bar           = bar,
            .count         = count,
            .provided_area = area,
            .cost          = steel_cost + labor_cost,
        });
    }
    return out;
}

ReinforcementSelection
ReinforcementSelector::select(double required_area,
                              const SelectionLimits& limits,
                              const SelectorWeights& weights) {
    const auto options = candidates(required_area, limits, weights);

    const Candidate* best = nullptr;
    for (const auto& c : options) {
        // Strict comparison keeps the smaller diameter on ties.
        if (best == nullptr || c.cost < best->cost) {
            best = &c;
        }
    }

    if (best != nullptr) {
        return ReinforcementSelection{
            .diameter      = best->bar.diameter,
            .count         = best->count,
            .bar_area      = best->bar.area,
            .provided_area = best->provided_area,
            .layout        = layout_for_count(best->count),
            .adequate      = true,
        };
    }

    const BarSize largest = limits.catalog.empty() ? BAR_CATALOG.back() : limits.catalog.back();
    const int count = std::max(limits.min_count, limits.max_count);
    const double area = count * largest.area;
    log::logger().warn(
        "selector: {:.1f} mm2 exceeds {} x D{} ({:.1f} mm2), returning under-provided layout",
        required_area, count, largest.diameter, area);
    return ReinforcementSelection{
        .diameter      = largest.diameter,
        .count         = count,
        .bar_area      = largest.area,
        .provided_area = area,
        .layout        = layout_for_count(count),
        .adequate      = area >= required_area,
    };
}

// ─── Stirrups ─────────────────────────────────────────────────────────────────

StirrupSelection
ReinforcementSelector::select_stirrup(double av_required_per_mm,
                                      double spacing_cap,
                                      const StirrupOptions& options) {
    const auto& w = options.weights;
    const auto catalog = options.catalog.empty()
        ? std::span<const BarSize>(STIRRUP_CATALOG)
        : options.catalog;

    auto arrange = [&](const BarSize& bar) {
        const double av  = options.legs * bar.area;
        const double raw = av_required_per_mm > 0.0
            ? std::min(av / av_required_per_mm, spacing_cap)
            : spacing_cap;
        const double spacing = shear::ShearDesigner::round_down(raw, options.spacing_step);
        return StirrupSelection{
            .diameter      = bar.diameter,
            .legs          = options.legs,
            .bar_area      = bar.area,
            .spacing       = spacing,
            .area_per_mm   = av / spacing,
            .constructible = spacing >= options.min_spacing,
        };
    };

    std::optional<StirrupSelection> best;
    double best_cost = std::numeric_limits<double>::infinity();

    for (const auto& bar : catalog) {
        if (bar.diameter < options.min_diameter) {
            continue;
        }
        const StirrupSelection sel = arrange(bar);
        if (!sel.constructible) {
            continue;
        }
        const double per_metre  = 1000.0 / sel.spacing;
        const double leg_weight = options.legs * bar.area * options.leg_length * 1e-3 * w.unit_weight;
        const double cost = per_metre * (leg_weight * w.steel_price
                                         + w.complexity * w.placement_rate);
        if (cost < best_cost) {
            best_cost = cost;
            best      = sel;
        }
    }

    if (best) {
        return *best;
    }

    const StirrupSelection largest = arrange(catalog.back());
    log::logger().warn(
        "selector: no stirrup reaches {:.0f} mm spacing for Av/s={:.4f} mm2/mm, using D{} @ {:.1f} mm",
        options.min_spacing, av_required_per_mm, largest.diameter, largest.spacing);
    return largest;
}

// ─── Profiles ─────────────────────────────────────────────────────────────────

int ReinforcementSelector::column_min_bars(double width, double height) noexcept {
    const double perimeter = 2.0 * (width + height);
    const double by_perimeter = std::min(std::ceil(perimeter / COLUMN_PERIMETER_PER_BAR),
                                         static_cast<double>(COLUMN_MAX_BAR_COUNT));
    int count = std::max(COLUMN_MIN_BAR_COUNT, static_cast<int>(by_perimeter));
    if (count % 2 != 0) {
        ++count;
    }
    return std::min(count, COLUMN_MAX_BAR_COUNT);
}

SelectionLimits ReinforcementSelector::column_limits(double width, double height) noexcept {
    return SelectionLimits{
        .min_count  = column_min_bars(width, height),
        .max_count  = COLUMN_MAX_BAR_COUNT,
        .even_count = true,
        .catalog    = std::span<const BarSize>(BAR_CATALOG).subspan(COLUMN_CATALOG_OFFSET),
    };
}

SelectionLimits ReinforcementSelector::slab_limits(double thickness) noexcept {
    const double max_spacing = std::min(3.0 * thickness, SLAB_MAX_SPACING);
    const double by_spacing = std::min(std::ceil(SLAB_STRIP_WIDTH / max_spacing),
                                       static_cast<double>(SLAB_MAX_BAR_COUNT));
    return SelectionLimits{
        .min_count  = std::max(MIN_BAR_COUNT, static_cast<int>(by_spacing)),
        .max_count  = SLAB_MAX_BAR_COUNT,
        .even_count = false,
        .catalog    = std::span<const BarSize>(BAR_CATALOG).first(SLAB_CATALOG_SIZE),
    };
}

}  // namespace rcde::reinforcement
