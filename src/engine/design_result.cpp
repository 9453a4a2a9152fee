/// @file src/engine/design_result.cpp
/// @brief DesignResult text report.

#include "rcde/engine.hpp"

#include <fmt/format.h>

#include <cmath>
#include <iterator>
#include <string>

namespace rcde::core {

namespace {

std::string check_row(const char* name, const CheckResult& check) {
    if (!check.applicable) {
        return fmt::format("│ {:<18} │ {:>12} │ {:>12} │ {:>8} │ {:<6} │\n",
                           name, "-", "-", "-", "n/a");
    }
    const std::string ratio = std::isfinite(check.ratio)
        ? fmt::format("{:.3f}", check.ratio)
        : std::string("inf");
    return fmt::format("│ {:<18} │ {:>12.3f} │ {:>12.3f} │ {:>8} │ {:<6} │\n",
                       name, check.required, check.provided, ratio,
                       rcde::to_string(check.status));
}

}  // anonymous namespace

std::string DesignResult::to_string() const {
    std::string out;
    auto it = std::back_inserter(out);

    fmt::format_to(it,
        "┌──────────────────────────────────────────────────────────────────────┐\n"
        "│ {} {:.0f} x {:.0f} mm, d = {:.1f} mm, {} {}, valid: {}\n"
        "├──────────────────────────────────────────────────────────────────────┤\n",
        rcde::to_string(element.kind), element.width, element.height,
        element.effective_depth, element.concrete_grade, element.steel_grade,
        is_valid ? "yes" : "no");

    const auto& main = reinforcement.main;
    fmt::format_to(it, "│ main      {}D{:<4.0f} As = {:.0f} mm² (required {:.0f}), {}\n",
                   main.count, main.diameter, main.provided_area,
                   reinforcement.required_area, rcde::to_string(main.layout));
    if (reinforcement.compression) {
        const auto& c = *reinforcement.compression;
        fmt::format_to(it, "│ top       {}D{:<4.0f} As′ = {:.0f} mm² (required {:.0f})\n",
                       c.count, c.diameter, c.provided_area, c.required_area);
    }
    if (reinforcement.bar_spacing) {
        fmt::format_to(it, "│ spacing   {:.0f} mm\n", *reinforcement.bar_spacing);
    }
    const auto& shear = reinforcement.shear;
    if (shear.provided) {
        fmt::format_to(it, "│ {:<9} {}-leg D{:.0f} @ {:.0f} mm ({:.0f} mm²/m)\n",
                       element.kind == ElementKind::Column ? "ties" : "stirrups",
                       shear.legs, shear.diameter, shear.spacing, shear.area_per_metre);
        if (!shear.constructible) {
            fmt::format_to(it, "│           spacing below the constructible minimum\n");
        }
    } else {
        fmt::format_to(it, "│ shear     concrete only\n");
    }
    const auto& dev = reinforcement.development;
    fmt::format_to(it, "│ lengths   ld {:.0f}  ldc {:.0f}  ldh {:.0f}  splice {:.0f} mm\n",
                   dev.tension, dev.compression, dev.hook, dev.splice);

    if (flexure) {
        fmt::format_to(it, "│ flexure   {} Rn {:.3f} / {:.3f} MPa, c {:.1f} ≤ {:.1f} mm{}\n",
                       flexure->mode == flexure::ReinforcementMode::Doubly ? "doubly" : "singly",
                       flexure->rn, flexure->rn_max, flexure->neutral_axis,
                       flexure->tension_controlled_limit,
                       flexure->clamped ? "  [clamped]" : "");
    }
    if (column) {
        fmt::format_to(it, "│ column    ρ {:.4f}, P-M ratio {:.3f}, φPn,max {:.0f} kN{}\n",
                       column->rho, column->capacity_ratio, column->axial_cap,
                       column->clamped ? "  [clamped]" : "");
    }

    out += "├────────────────────┬──────────────┬──────────────┬──────────┬────────┤\n";
    out += "│ Check              │     Required │     Provided │    Ratio │ Status │\n";
    out += "├────────────────────┼──────────────┼──────────────┼──────────┼────────┤\n";
    out += check_row("flexural strength", checks.flexural_strength);
    out += check_row("shear strength",    checks.shear_strength);
    out += check_row("axial strength",    checks.axial_strength);
    out += check_row("deflection",        checks.deflection);
    out += check_row("cracking",          checks.cracking);
    out += check_row("min reinforcement", checks.min_reinforcement);
    out += check_row("max reinforcement", checks.max_reinforcement);
    out += "├────────────────────┴──────────────┴──────────────┴──────────┴────────┤\n";

    fmt::format_to(it,
        "│ cost  concrete {:.0f}  steel {:.0f}  formwork {:.0f}  labor {:.0f}\n"
        "│       total {:.0f}  ({:.3f} m³, {:.1f} kg, {:.1f} kg/m³, {:.1f} m²)\n"
        "└──────────────────────────────────────────────────────────────────────┘\n",
        cost.concrete, cost.steel, cost.formwork, cost.labor, cost.total,
        cost.breakdown.volume, cost.breakdown.steel_weight,
        cost.breakdown.steel_ratio, cost.breakdown.contact_area);
    return out;
}

}  // namespace rcde::core
