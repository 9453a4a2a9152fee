/// @file tests/column/test_column_interaction.cpp
/// @brief Tests for ColumnInteraction and ColumnDesigner.

#include "rcde/column.hpp"

#include <gtest/gtest.h>
#include <cmath>

using namespace rcde::column;

namespace {

/// 400 × 400 column, cover 40, 8 mm ties, D16 bars.
ColumnSection square_column(int bars, double bar_area = 201.0) {
    return ColumnSection{
        .width     = 400.0,
        .height    = 400.0,
        .fc        = 30.0,
        .fy        = 400.0,
        .bar_inset = 56.0,
        .bar_count = bars,
        .bar_area  = bar_area,
    };
}

}  // anonymous namespace

// ─── Layout ───────────────────────────────────────────────────────────────────

TEST(ColumnInteractionLayers, EightBarsThreeRows) {
    const auto bars = ColumnInteraction::layers(square_column(8));
    ASSERT_EQ(bars.depth.size(), 3);
    EXPECT_DOUBLE_EQ(bars.depth(0), 56.0);
    EXPECT_DOUBLE_EQ(bars.depth(1), 344.0);
    EXPECT_DOUBLE_EQ(bars.depth(2), 200.0);
    EXPECT_DOUBLE_EQ(bars.area(0), 603.0);
    EXPECT_DOUBLE_EQ(bars.area(1), 603.0);
    EXPECT_DOUBLE_EQ(bars.area(2), 402.0);
}

TEST(ColumnInteractionLayers, TotalAreaPreserved) {
    for (int n : {4, 5, 6, 8, 10, 12, 16, 20}) {
        const auto section = square_column(n);
        const auto bars = ColumnInteraction::layers(section);
        EXPECT_NEAR(bars.area.sum(), section.steel_area(), 1e-9) << "n=" << n;
        EXPECT_GE(bars.depth.minCoeff(), 56.0);
        EXPECT_LE(bars.depth.maxCoeff(), 344.0);
    }
}

// ─── Diagram ──────────────────────────────────────────────────────────────────

TEST(ColumnInteractionDiagram, AxialCap) {
    EXPECT_NEAR(ColumnInteraction::axial_cap(square_column(8)), 2434742.0, 1.0);
}

TEST(ColumnInteractionDiagram, PhiTransition) {
    EXPECT_DOUBLE_EQ(ColumnInteraction::phi_for_strain(0.001, 400.0), 0.65);
    EXPECT_NEAR(ColumnInteraction::phi_for_strain(0.0035, 400.0), 0.775, 1e-12);
    EXPECT_DOUBLE_EQ(ColumnInteraction::phi_for_strain(0.006, 400.0), 0.90);
}

TEST(ColumnInteractionDiagram, SweepsFromTensionToCappedCompression) {
    const auto section = square_column(8);
    const auto points = ColumnInteraction::diagram(section, 40);
    ASSERT_EQ(points.size(), 40u);
    EXPECT_LT(points.front().pn, 0.0);
    EXPECT_NEAR(points.back().phi_pn, ColumnInteraction::axial_cap(section), 1e-6);
    for (std::size_t i = 1; i < points.size(); ++i) {
        EXPECT_GT(points[i].neutral_axis, points[i - 1].neutral_axis);
    }
}

TEST(ColumnInteractionDiagram, DeepNeutralAxisIsCompressionControlled) {
    const auto section = square_column(8);
    const auto bars = ColumnInteraction::layers(section);
    const auto p = ColumnInteraction::point_at(section, bars, 400.0);
    EXPECT_DOUBLE_EQ(p.phi, 0.65);
    EXPECT_GT(p.pn, 0.0);
}

// ─── Verification ─────────────────────────────────────────────────────────────

TEST(ColumnInteractionVerify, PureAxialRatio) {
    const auto section = square_column(8);
    const double cap = ColumnInteraction::axial_cap(section);
    EXPECT_NEAR(ColumnInteraction::capacity_ratio(section, cap / 2.0, 0.0), 2.0, 1e-3);
}

TEST(ColumnInteractionVerify, ZeroDemandIsInfinite) {
    const auto section = square_column(8);
    EXPECT_TRUE(std::isinf(ColumnInteraction::capacity_ratio(section, 0.0, 0.0)));
    const auto check = ColumnInteraction::verify(section, 0.0, 0.0);
    EXPECT_TRUE(check.passed());
    EXPECT_DOUBLE_EQ(check.required, 0.0);
}

TEST(ColumnInteractionVerify, ModerateDemandPasses) {
    const auto section = square_column(12, 133.4);
    const auto check = ColumnInteraction::verify(section, 1500e3, 120e6);
    EXPECT_TRUE(check.passed());
    EXPECT_LT(check.required, 1.0);
    EXPECT_DOUBLE_EQ(check.provided, 1.0);
}

TEST(ColumnInteractionVerify, HeavyMomentFails) {
    const auto check = ColumnInteraction::verify(square_column(8), 1500e3, 600e6);
    EXPECT_FALSE(check.passed());
    EXPECT_GT(check.required, 1.0);
}

TEST(ColumnInteractionVerify, AxialCheckIgnoresTension) {
    const auto section = square_column(8);
    EXPECT_DOUBLE_EQ(ColumnInteraction::verify_axial(section, -200e3).required, 0.0);
    EXPECT_FALSE(ColumnInteraction::verify_axial(section, 3000e3).passed());
}

TEST(ColumnInteractionVerify, MoreSteelMoreCapacity) {
    const double small = ColumnInteraction::capacity_ratio(square_column(12, 133.4), 1500e3, 200e6);
    const double large = ColumnInteraction::capacity_ratio(square_column(12, 400.0), 1500e3, 200e6);
    EXPECT_GT(large, small);
}

// ─── ColumnDesigner ───────────────────────────────────────────────────────────

TEST(ColumnDesignerTest, LightDemandUsesMinimumRatio) {
    const auto r = ColumnDesigner::required_steel(square_column(12), 500e3, 20e6);
    EXPECT_DOUBLE_EQ(r.rho, 0.01);
    EXPECT_DOUBLE_EQ(r.required_area, 1600.0);
    EXPECT_FALSE(r.clamped);
}

TEST(ColumnDesignerTest, IntermediateDemandReachesUnity) {
    const auto trial = square_column(12);
    const auto r = ColumnDesigner::required_steel(trial, 1500e3, 250e6);
    ASSERT_FALSE(r.clamped);
    EXPECT_GT(r.rho, 0.01);
    EXPECT_LT(r.rho, 0.06);

    auto sized = trial;
    sized.bar_area = r.required_area / 12.0;
    EXPECT_NEAR(ColumnInteraction::capacity_ratio(sized, 1500e3, 250e6), 1.0, 1e-3);
}

TEST(ColumnDesignerTest, ExcessiveDemandClamps) {
    const auto r = ColumnDesigner::required_steel(square_column(12), 1500e3, 2000e6);
    EXPECT_TRUE(r.clamped);
    EXPECT_DOUBLE_EQ(r.rho, 0.06);
    EXPECT_DOUBLE_EQ(r.required_area, 9600.0);
}
