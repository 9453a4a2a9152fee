/// @file tests/shear/test_shear_designer.cpp
/// @brief Tests for ShearDesigner.

#include "rcde/shear.hpp"

#include <gtest/gtest.h>
#include <cmath>

using namespace rcde::shear;

namespace {

/// 300 × 500 beam, d = 444, fc′ 30, fy 400, two 8 mm legs.
ShearDemand beam_demand(double shear_kn) {
    return ShearDemand{
        .shear           = shear_kn * 1e3,
        .width           = 300.0,
        .effective_depth = 444.0,
        .fc              = 30.0,
        .fy              = 400.0,
        .stirrup_area    = 2.0 * 50.3,
    };
}

}  // anonymous namespace

// ─── Concrete capacity ────────────────────────────────────────────────────────

TEST(ShearDesignerConcrete, BasicFormula) {
    const double vc = ShearDesigner::concrete_capacity(300.0, 444.0, 30.0);
    EXPECT_NEAR(vc, std::sqrt(30.0) / 6.0 * 300.0 * 444.0, 1e-6);
}

TEST(ShearDesignerConcrete, CompressionIncreasesTensionDecreases) {
    const double base = ShearDesigner::concrete_capacity(400.0, 344.0, 30.0);
    const double comp = ShearDesigner::concrete_capacity(400.0, 344.0, 30.0, 1.5e6, 160000.0);
    const double tens = ShearDesigner::concrete_capacity(400.0, 344.0, 30.0, -0.2e6, 160000.0);
    EXPECT_NEAR(comp, base * (1.0 + 1.5e6 / (14.0 * 160000.0)), 1e-6);
    EXPECT_LT(tens, base);
    EXPECT_GE(ShearDesigner::concrete_capacity(400.0, 344.0, 30.0, -1e9, 160000.0), 0.0);
}

TEST(ShearDesignerConcrete, MinimumReinforcement) {
    // 0.35 b / fy governs below fc′ ≈ 31.9 MPa
    EXPECT_NEAR(ShearDesigner::min_reinforcement_per_length(300.0, 30.0, 400.0),
                0.35 * 300.0 / 400.0, 1e-12);
    EXPECT_NEAR(ShearDesigner::min_reinforcement_per_length(300.0, 49.0, 400.0),
                0.062 * 7.0 * 300.0 / 400.0, 1e-12);
}

// ─── design ───────────────────────────────────────────────────────────────────

TEST(ShearDesignerDesign, ModerateShearUsesHalfDepth) {
    const auto r = ShearDesigner::design(beam_demand(120.0));
    EXPECT_FALSE(r.high_shear);
    EXPECT_TRUE(r.section_adequate);
    EXPECT_NEAR(r.vn_required, 160000.0, 1e-6);
    EXPECT_NEAR(r.vs_required, 160000.0 - r.vc, 1e-6);
    EXPECT_DOUBLE_EQ(r.limits.geometric, 222.0);
    EXPECT_DOUBLE_EQ(r.limits.absolute, 600.0);
    EXPECT_DOUBLE_EQ(r.spacing, 220.0);
}

TEST(ShearDesignerDesign, HighShearHalvesLimits) {
    const auto r = ShearDesigner::design(beam_demand(400.0));
    EXPECT_TRUE(r.high_shear);
    EXPECT_DOUBLE_EQ(r.limits.geometric, 111.0);
    EXPECT_DOUBLE_EQ(r.limits.absolute, 300.0);
    // The strength limit (≈ 43 mm for two 8 mm legs) governs.
    EXPECT_LT(r.limits.strength, r.limits.geometric);
    EXPECT_DOUBLE_EQ(r.spacing, 40.0);
}

TEST(ShearDesignerDesign, SpacingNeverExceedsAnyLimit) {
    for (double vu = 0.0; vu <= 600.0; vu += 7.5) {
        const auto r = ShearDesigner::design(beam_demand(vu));
        EXPECT_LE(r.spacing, r.limits.strength + 1e-9)  << "Vu=" << vu;
        EXPECT_LE(r.spacing, r.limits.minimum + 1e-9)   << "Vu=" << vu;
        EXPECT_LE(r.spacing, r.limits.geometric + 1e-9) << "Vu=" << vu;
        EXPECT_LE(r.spacing, r.limits.absolute + 1e-9)  << "Vu=" << vu;
    }
}

TEST(ShearDesignerDesign, MinimumAreaGovernsWhenItIsTightest) {
    // Narrow legs on a shallow-demand deep beam: Av,min gives the tightest limit.
    auto demand = beam_demand(10.0);
    demand.width           = 600.0;
    demand.effective_depth = 1400.0;
    demand.stirrup_area    = 2.0 * 50.3;
    const auto r = ShearDesigner::design(demand);
    EXPECT_DOUBLE_EQ(r.limits.governing(), r.limits.minimum);
    EXPECT_LE(r.spacing, r.limits.minimum);
}

TEST(ShearDesignerDesign, ExcessiveShearFlagsSection) {
    const auto r = ShearDesigner::design(beam_demand(1200.0));
    EXPECT_FALSE(r.section_adequate);
    EXPECT_GT(r.vs_required, r.vs_max);
}

TEST(ShearDesignerDesign, RequiredAreaNeverBelowMinimum) {
    const auto r = ShearDesigner::design(beam_demand(0.0));
    EXPECT_DOUBLE_EQ(r.vs_required, 0.0);
    EXPECT_DOUBLE_EQ(r.av_required_per_mm, r.av_min_per_mm);
}

// ─── Rounding helpers ─────────────────────────────────────────────────────────

TEST(ShearDesignerRounding, RoundsDownToStep) {
    EXPECT_DOUBLE_EQ(ShearDesigner::round_down(223.7, 5.0), 220.0);
    EXPECT_DOUBLE_EQ(ShearDesigner::round_down(220.0, 5.0), 220.0);
    EXPECT_DOUBLE_EQ(ShearDesigner::round_down(3.0, 5.0), 3.0);
}

TEST(ShearDesignerRounding, SpacingForLargerStirrup) {
    const auto r = ShearDesigner::design(beam_demand(400.0));
    const double s10 = ShearDesigner::spacing_for(r, 2.0 * 78.5, 5.0);
    EXPECT_GT(s10, r.spacing);
    EXPECT_LE(s10, r.spacing_cap);
    EXPECT_DOUBLE_EQ(std::fmod(s10, 5.0), 0.0);
}
