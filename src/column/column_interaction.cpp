/// @file src/column/column_interaction.cpp
/// @brief ColumnInteraction and ColumnDesigner implementation.

#include "rcde/column.hpp"
#include "rcde/constants.hpp"
#include "rcde/logging.hpp"
#include "rcde/material.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace rcde::column {

using namespace rcde::constants;

namespace {

/// Bisection depth for both the diagram projection and steel sizing.
constexpr int BISECTION_STEPS = 80;

/// Neutral-axis search range as multiples of the section height.
constexpr double C_MIN_FACTOR = 1e-4;
constexpr double C_MAX_FACTOR = 1e3;

double direction(const InteractionPoint& p) noexcept {
    return std::atan2(p.phi_pn, p.phi_mn);
}

/// Diagram point whose (φMn, φPn) direction matches `theta`.
InteractionPoint project(const ColumnSection& section, const BarLayers& layers, double theta) {
    double lo = C_MIN_FACTOR * section.height;
    double hi = C_MAX_FACTOR * section.height;

    const auto p_lo = ColumnInteraction::point_at(section, layers, lo);
    if (theta <= direction(p_lo)) {
        return p_lo;
    }
    const auto p_hi = ColumnInteraction::point_at(section, layers, hi);
    if (theta >= direction(p_hi)) {
        return p_hi;
    }

    // The direction rises monotonically with c for a symmetric layout.
    for (int i = 0; i < BISECTION_STEPS; ++i) {
        const double mid = 0.5 * (lo + hi);
        if (direction(ColumnInteraction::point_at(section, layers, mid)) < theta) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return ColumnInteraction::point_at(section, layers, 0.5 * (lo + hi));
}

}  // anonymous namespace

// ─── Layout ───────────────────────────────────────────────────────────────────

BarLayers ColumnInteraction::layers(const ColumnSection& section) {
    const int    n     = std::max(COLUMN_MIN_BAR_COUNT, section.bar_count);
    const int    pairs = (n - COLUMN_MIN_BAR_COUNT) / 2;
    const bool   odd   = (n - COLUMN_MIN_BAR_COUNT) % 2 != 0;
    const double ds    = section.bar_inset;
    const double bc    = std::max(section.width - 2.0 * ds, 0.0);
    const double hc    = std::max(section.height - 2.0 * ds, 0.0);

    const int face_pairs = (bc + hc) > 0.0
        ? static_cast<int>(std::lround(pairs * bc / (bc + hc)))
        : pairs;
    const int side_pairs = pairs - face_pairs;
    const int rows = 2 + side_pairs + (odd ? 1 : 0);

    BarLayers out{Eigen::ArrayXd(rows), Eigen::ArrayXd(rows)};
    const double a = section.bar_area;

    out.depth(0) = ds;
    out.area(0)  = (2 + face_pairs) * a;
    out.depth(1) = section.height - ds;
    out.area(1)  = (2 + face_pairs) * a;
    for (int j = 1; j <= side_pairs; ++j) {
        out.depth(1 + j) = ds + j * hc / (side_pairs + 1);
        out.area(1 + j)  = 2.0 * a;
    }
    if (odd) {
        out.depth(rows - 1) = section.height / 2.0;
        out.area(rows - 1)  = a;
    }
    return out;
}

// ─── Diagram ──────────────────────────────────────────────────────────────────

double ColumnInteraction::axial_cap(const ColumnSection& section) noexcept {
    const double ag  = section.gross_area();
    const double ast = section.steel_area();
    const double p0  = 0.85 * section.fc * (ag - ast) + section.fy * ast;
    return AXIAL_CAP_FACTOR * PHI_COMPRESSION * p0;
}

double ColumnInteraction::phi_for_strain(double net_tensile_strain, double fy) noexcept {
    const double yield = fy / STEEL_MODULUS;
    if (net_tensile_strain <= yield) {
        return PHI_COMPRESSION;
    }
    if (net_tensile_strain >= yield + 0.003) {
        return PHI_FLEXURE;
    }
    return PHI_COMPRESSION
         + (PHI_FLEXURE - PHI_COMPRESSION) * (net_tensile_strain - yield) / 0.003;
}

InteractionPoint ColumnInteraction::point_at(const ColumnSection& section,
                                             const BarLayers& layers,
                                             double c) {
    const double b     = section.width;
    const double h     = section.height;
    const double fc    = section.fc;
    const double fy    = section.fy;
    const double beta1 = material::MaterialModel::beta1(fc);
    const double a     = std::min(beta1 * c, h);

    const double concrete = 0.85 * fc * a * b;

    const Eigen::ArrayXd strain = CONCRETE_ULTIMATE_STRAIN * (c - layers.depth) / c;
    const Eigen::ArrayXd stress = (STEEL_MODULUS * strain).max(-fy).min(fy);
    // Bars inside the stress block displace concrete already counted above.
    const Eigen::ArrayXd net    = (layers.depth < a).select(stress - 0.85 * fc, stress);
    const Eigen::ArrayXd force  = layers.area * net;
    const Eigen::ArrayXd arm    = h / 2.0 - layers.depth;

    const double pn = concrete + force.sum();
    const double mn = concrete * (h / 2.0 - a / 2.0) + (force * arm).sum();

    const double dt  = layers.depth.maxCoeff();
    const double eps = CONCRETE_ULTIMATE_STRAIN * (dt - c) / c;
    const double phi = phi_for_strain(eps, fy);

    return InteractionPoint{
        .neutral_axis       = c,
        .pn                 = pn,
        .mn                 = mn,
        .phi                = phi,
        .phi_pn             = std::min(phi * pn, axial_cap(section)),
        .phi_mn             = phi * mn,
        .net_tensile_strain = eps,
    };
}

std::vector<InteractionPoint>
ColumnInteraction::diagram(const ColumnSection& section, int samples) {
    const auto bars = layers(section);
    const int n = std::max(samples, 2);

    // Logarithmic sweep: most of the diagram's curvature sits at small c.
    const double lo = std::log(C_MIN_FACTOR * 10.0 * section.height);
    const double hi = std::log(10.0 * section.height);

    std::vector<InteractionPoint> out;
    out.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) {
        const double c = std::exp(lo + (hi - lo) * i / (n - 1));
        out.push_back(point_at(section, bars, c));
    }
    return out;
}

// ─── Verification ─────────────────────────────────────────────────────────────

double ColumnInteraction::capacity_ratio(const ColumnSection& section, double pu, double mu) {
    const double m = std::abs(mu);
    const double demand = std::hypot(m, pu);
    if (demand <= 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    const auto bars  = layers(section);
    const auto point = project(section, bars, std::atan2(pu, m));
    return std::hypot(point.phi_mn, point.phi_pn) / demand;
}

CheckResult ColumnInteraction::verify(const ColumnSection& section, double pu, double mu) {
    const double ratio = capacity_ratio(section, pu, mu);
    // Reported as utilisation against unity, like a classic interaction check.
    const double utilisation = std::isfinite(ratio) ? 1.0 / ratio : 0.0;
    return CheckResult::capacity(utilisation, 1.0);
}

CheckResult ColumnInteraction::verify_axial(const ColumnSection& section, double pu) noexcept {
    return CheckResult::capacity(std::max(pu, 0.0), axial_cap(section));
}

// ─── ColumnDesigner ───────────────────────────────────────────────────────────

ColumnSteelDesign ColumnDesigner::required_steel(const ColumnSection& trial,
                                                 double pu, double mu) {
    const double ag = trial.gross_area();
    const int    n  = std::max(COLUMN_MIN_BAR_COUNT, trial.bar_count);

    auto ratio_at = [&](double area) {
        ColumnSection s = trial;
        s.bar_count = n;
        s.bar_area  = area / n;
        return ColumnInteraction::capacity_ratio(s, pu, mu);
    };

    double lo = COLUMN_RHO_MIN * ag;
    double hi = COLUMN_RHO_MAX * ag;

    if (ratio_at(lo) >= 1.0) {
        return ColumnSteelDesign{.required_area = lo, .rho = COLUMN_RHO_MIN, .clamped = false};
    }
    if (ratio_at(hi) < 1.0) {
        log::logger().warn(
            "column: demand Pu={:.1f} kN, Mu={:.1f} kN.m exceeds capacity at rho_max={:.3f}, clamping",
            pu / KN_TO_N, std::abs(mu) / KNM_TO_NMM, COLUMN_RHO_MAX);
        return ColumnSteelDesign{.required_area = hi, .rho = COLUMN_RHO_MAX, .clamped = true};
    }

    for (int i = 0; i < BISECTION_STEPS / 2; ++i) {
        const double mid = 0.5 * (lo + hi);
        if (ratio_at(mid) >= 1.0) {
            hi = mid;
        } else {
            lo = mid;
        }
    }
    return ColumnSteelDesign{.required_area = hi, .rho = hi / ag, .clamped = false};
}

}  // namespace rcde::column
