/// @file tests/material/test_material_model.cpp
/// @brief Tests for MaterialModel.

#include "rcde/material.hpp"
#include "rcde/constants.hpp"

#include <gtest/gtest.h>
#include <cmath>

using namespace rcde;
using namespace rcde::material;
using namespace rcde::constants;

// ─── beta1 ────────────────────────────────────────────────────────────────────

TEST(MaterialModelBeta1, ConstantUpTo28MPa) {
    EXPECT_DOUBLE_EQ(MaterialModel::beta1(17.0), 0.85);
    EXPECT_DOUBLE_EQ(MaterialModel::beta1(25.0), 0.85);
    EXPECT_DOUBLE_EQ(MaterialModel::beta1(28.0), 0.85);
}

TEST(MaterialModelBeta1, FloorAtHighStrength) {
    EXPECT_DOUBLE_EQ(MaterialModel::beta1(60.0), 0.65);
    EXPECT_DOUBLE_EQ(MaterialModel::beta1(100.0), 0.65);
}

TEST(MaterialModelBeta1, ClampedJustAbove55MPa) {
    EXPECT_NEAR(MaterialModel::beta1(55.0), 0.85 - 0.05 * 27.0 / 7.0, 1e-12);
    EXPECT_DOUBLE_EQ(MaterialModel::beta1(55.5), 0.65);
    EXPECT_DOUBLE_EQ(MaterialModel::beta1(55.9), 0.65);
}

TEST(MaterialModelBeta1, MidRangeNearPointSevenFive) {
    // 0.85 − 0.05 · 13.5 / 7
    EXPECT_NEAR(MaterialModel::beta1(41.5), 0.75, 0.005);
    EXPECT_NEAR(MaterialModel::beta1(41.5), 0.85 - 0.05 * 13.5 / 7.0, 1e-12);
}

TEST(MaterialModelBeta1, LinearBetweenBreakpoints) {
    // Equal steps in fc′ give equal drops in β1.
    const double a = MaterialModel::beta1(30.0);
    const double b = MaterialModel::beta1(37.0);
    const double c = MaterialModel::beta1(44.0);
    EXPECT_NEAR(a - b, 0.05, 1e-12);
    EXPECT_NEAR(b - c, 0.05, 1e-12);
}

TEST(MaterialModelBeta1, NonIncreasingInStrength) {
    double prev = MaterialModel::beta1(10.0);
    for (double fc = 10.5; fc <= 90.0; fc += 0.5) {
        const double cur = MaterialModel::beta1(fc);
        EXPECT_LE(cur, prev + 1e-15) << "fc=" << fc;
        prev = cur;
    }
}

// ─── Elastic properties ───────────────────────────────────────────────────────

TEST(MaterialModelElastic, ModulusFromSquareRoot) {
    EXPECT_NEAR(MaterialModel::elastic_modulus(25.0), 23500.0, 1e-9);
    EXPECT_NEAR(MaterialModel::modular_ratio(25.0), 200000.0 / 23500.0, 1e-12);
}

TEST(MaterialModelElastic, RuptureModulus) {
    EXPECT_NEAR(MaterialModel::modulus_of_rupture(25.0), 0.62 * 5.0, 1e-12);
}

// ─── Ratios ───────────────────────────────────────────────────────────────────

TEST(MaterialModelRatios, BalancedRatioFc30Fy400) {
    const double beta1 = MaterialModel::beta1(30.0);
    const double expected = 0.85 * beta1 * 30.0 / 400.0 * 600.0 / 1000.0;
    EXPECT_NEAR(MaterialModel::rho_balanced(30.0, 400.0), expected, 1e-12);
    EXPECT_NEAR(MaterialModel::rho_max(30.0, 400.0), 0.75 * expected, 1e-12);
}

TEST(MaterialModelRatios, MinimumRatioTakesLargerTerm) {
    // 1.4/fy governs at normal strengths
    EXPECT_NEAR(MaterialModel::rho_min(30.0, 400.0), 1.4 / 400.0, 1e-12);
    // √fc′/(4fy) governs above 31.36 MPa
    EXPECT_NEAR(MaterialModel::rho_min(49.0, 400.0), 7.0 / 1600.0, 1e-12);
}

TEST(MaterialModelRatios, MaxAboveMinForUsualGrades) {
    for (double fc : {20.0, 25.0, 30.0, 40.0, 50.0}) {
        for (double fy : {280.0, 400.0, 500.0}) {
            EXPECT_GT(MaterialModel::rho_max(fc, fy), MaterialModel::rho_min(fc, fy));
        }
    }
}

// ─── derive / labels ──────────────────────────────────────────────────────────

TEST(MaterialModelDerive, MatchesIndividualFunctions) {
    const auto p = MaterialModel::derive(Material{.fc = 35.0, .fy = 420.0});
    EXPECT_DOUBLE_EQ(p.beta1, MaterialModel::beta1(35.0));
    EXPECT_DOUBLE_EQ(p.ec, MaterialModel::elastic_modulus(35.0));
    EXPECT_DOUBLE_EQ(p.es, STEEL_MODULUS);
    EXPECT_DOUBLE_EQ(p.rho_max, MaterialModel::rho_max(35.0, 420.0));
    EXPECT_DOUBLE_EQ(p.rho_min, MaterialModel::rho_min(35.0, 420.0));
}

TEST(MaterialModelLabels, GradeStrings) {
    EXPECT_EQ(MaterialModel::concrete_grade(30.0), "fc30");
    EXPECT_EQ(MaterialModel::steel_grade(400.0), "fy400");
    EXPECT_EQ(MaterialModel::concrete_grade(27.5), "fc27.5");
}
