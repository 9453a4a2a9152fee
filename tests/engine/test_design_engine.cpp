/// @file tests/engine/test_design_engine.cpp
/// @brief End-to-end tests for DesignEngine on beams, slabs and columns.
///
/// These tests exercise the complete design path:
///   DesignInput → validate → SectionGeometry → Flexural/Column designer →
///   ReinforcementSelector → ShearDesigner → CapacityVerifier →
///   ServiceabilityChecker → CostEstimator → DesignResult

#include "rcde/engine.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <thread>
#include <vector>

using namespace rcde;
using namespace rcde::core;

// ─── Reference elements ───────────────────────────────────────────────────────

namespace {

DesignInput reference_beam() {
    return DesignInput{
        .kind     = ElementKind::Beam,
        .geometry = Geometry{.width = 300.0, .height = 500.0, .span = 6000.0,
                             .clear_cover = 40.0},
        .material = Material{.fc = 30.0, .fy = 400.0},
        .forces   = Forces{.moment_x = 180.0, .shear = 120.0},
    };
}

DesignInput reference_slab() {
    return DesignInput{
        .kind     = ElementKind::Slab,
        .geometry = Geometry{.width = 1000.0, .height = 150.0, .span = 4000.0,
                             .clear_cover = 20.0},
        .material = Material{.fc = 25.0, .fy = 400.0},
        .forces   = Forces{.moment_x = 20.0, .shear = 30.0},
    };
}

DesignInput reference_column() {
    return DesignInput{
        .kind     = ElementKind::Column,
        .geometry = Geometry{.width = 400.0, .height = 400.0, .span = std::nullopt,
                             .clear_cover = 40.0},
        .material = Material{.fc = 30.0, .fy = 400.0},
        .forces   = Forces{.moment_x = 120.0, .shear = 40.0, .axial = 1500.0},
    };
}

DesignConfig gergely_lutz() {
    DesignConfig config{};
    config.crack_model = serviceability::CrackWidthModel::GergelyLutz;
    return config;
}

}  // anonymous namespace

// ─── Beam ─────────────────────────────────────────────────────────────────────

TEST(DesignEngineBeam, ReferenceBeamSelection) {
    const DesignEngine engine;
    const auto r = engine.design(reference_beam());

    EXPECT_EQ(r.element.kind, ElementKind::Beam);
    EXPECT_EQ(r.element.concrete_grade, "fc30");
    EXPECT_EQ(r.element.steel_grade, "fy400");
    EXPECT_DOUBLE_EQ(r.element.effective_depth, 437.5);

    EXPECT_DOUBLE_EQ(r.reinforcement.main.diameter, 29.0);
    EXPECT_EQ(r.reinforcement.main.count, 2);
    EXPECT_GE(r.reinforcement.main.provided_area, r.reinforcement.required_area);
    EXPECT_FALSE(r.reinforcement.compression.has_value());
    EXPECT_FALSE(r.reinforcement.bar_spacing.has_value());

    EXPECT_TRUE(r.reinforcement.shear.provided);
    EXPECT_DOUBLE_EQ(r.reinforcement.shear.diameter, 8.0);
    EXPECT_EQ(r.reinforcement.shear.legs, 2);
    EXPECT_DOUBLE_EQ(r.reinforcement.shear.spacing, 215.0);

    ASSERT_TRUE(r.flexure.has_value());
    EXPECT_EQ(r.flexure->mode, flexure::ReinforcementMode::Singly);
    EXPECT_TRUE(r.flexure->tension_controlled);
    EXPECT_FALSE(r.column.has_value());
}

TEST(DesignEngineBeam, ReferenceBeamChecks) {
    const auto r = DesignEngine{}.design(reference_beam());

    EXPECT_TRUE(r.checks.flexural_strength.passed());
    EXPECT_DOUBLE_EQ(r.checks.flexural_strength.required, 180.0);
    EXPECT_NEAR(r.checks.flexural_strength.provided, 191.8, 0.5);
    EXPECT_TRUE(r.checks.shear_strength.passed());
    EXPECT_DOUBLE_EQ(r.checks.shear_strength.required, 120.0);
    EXPECT_FALSE(r.checks.axial_strength.applicable);
    EXPECT_TRUE(r.checks.deflection.passed());
    EXPECT_TRUE(r.checks.min_reinforcement.passed());
    EXPECT_TRUE(r.checks.max_reinforcement.passed());

    // dc = 62.5 mm, A = 18750 mm² per bar: 11 · 240 · 1.2 · ∛(dc A) / Es.
    EXPECT_FALSE(r.checks.cracking.passed());
    EXPECT_NEAR(r.checks.cracking.required,
                11.0 * 240.0 * 1.2 * std::cbrt(62.5 * 18750.0) / 200000.0, 1e-9);
    EXPECT_NEAR(r.checks.cracking.required, 1.670, 0.005);
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.is_valid, r.checks.all_pass());
}

TEST(DesignEngineBeam, ExplicitCrackLimitMakesDesignValid) {
    auto input = reference_beam();
    input.constraints.crack_width_limit = 2.0;
    const auto r = DesignEngine{}.design(input);
    EXPECT_TRUE(r.checks.cracking.passed());
    EXPECT_TRUE(r.is_valid);
}

TEST(DesignEngineBeam, ConfiguredCrackLimitMakesDesignValid) {
    DesignConfig config{};
    config.crack_width_limit = 2.0;
    const DesignEngine engine(config);
    EXPECT_DOUBLE_EQ(engine.config().crack_width_limit, 2.0);
    EXPECT_TRUE(engine.design(reference_beam()).is_valid);
}

TEST(DesignEngineBeam, GergelyLutzCrackModel) {
    const DesignEngine engine(gergely_lutz());
    const auto r = engine.design(reference_beam());
    // Two D29 bars crack just past the 0.33 mm default.
    EXPECT_FALSE(r.checks.cracking.passed());
    EXPECT_NEAR(r.checks.cracking.required, 0.334, 0.002);

    auto input = reference_beam();
    input.constraints.crack_width_limit = 0.40;
    EXPECT_TRUE(engine.design(input).is_valid);
}

TEST(DesignEngineBeam, SevereExposureTightensCracking) {
    auto input = reference_beam();
    input.constraints.exposure = ExposureClass::Extreme;
    const auto r = DesignEngine{}.design(input);
    EXPECT_FALSE(r.checks.cracking.passed());
    EXPECT_DOUBLE_EQ(r.checks.cracking.provided, 0.10);
}

TEST(DesignEngineBeam, DeflectionLimitOverride) {
    auto input = reference_beam();
    input.constraints.deflection_limit = 1000.0;
    const auto r = DesignEngine{}.design(input);
    EXPECT_FALSE(r.checks.deflection.passed());
    EXPECT_DOUBLE_EQ(r.checks.deflection.provided, 6.0);
}

TEST(DesignEngineBeam, ZeroForcesGiveMinimumSteel) {
    auto input = reference_beam();
    input.forces = Forces{};
    const auto r = DesignEngine{gergely_lutz()}.design(input);
    EXPECT_TRUE(r.checks.min_reinforcement.passed());
    EXPECT_TRUE(r.checks.flexural_strength.passed());
    EXPECT_TRUE(r.checks.shear_strength.passed());
    EXPECT_GE(r.reinforcement.main.count, 2);
    EXPECT_TRUE(r.is_valid);
}

TEST(DesignEngineBeam, HeavyMomentAddsCompressionSteel) {
    auto input = reference_beam();
    input.forces.moment_x = 600.0;
    const auto r = DesignEngine{}.design(input);
    ASSERT_TRUE(r.flexure.has_value());
    EXPECT_EQ(r.flexure->mode, flexure::ReinforcementMode::Doubly);
    ASSERT_TRUE(r.reinforcement.compression.has_value());
    EXPECT_GE(r.reinforcement.compression->count, 2);
    EXPECT_GE(r.reinforcement.compression->provided_area,
              r.reinforcement.compression->required_area);
    EXPECT_GT(r.cost.total, DesignEngine{}.design(reference_beam()).cost.total);
}

TEST(DesignEngineBeam, VeryHeavyMomentTriggersDoublyReinforcedPath) {
    auto input = reference_beam();
    input.forces.moment_x = 900.0;
    const auto r = DesignEngine{}.design(input);
    ASSERT_TRUE(r.reinforcement.compression.has_value());
    EXPECT_GT(r.reinforcement.compression->required_area, 0.0);
    EXPECT_EQ(r.flexure->mode, flexure::ReinforcementMode::Doubly);
    EXPECT_FALSE(r.is_valid);
}

TEST(DesignEngineBeam, LowStrengthConcreteStillDesigned) {
    auto input = reference_beam();
    input.material.fc = 15.0;
    const DesignEngine engine;
    EXPECT_FALSE(engine.validate(input).has_value());
    const auto r = engine.design(input);
    EXPECT_EQ(r.element.concrete_grade, "fc15");
    EXPECT_GT(r.reinforcement.main.provided_area, 0.0);
    EXPECT_TRUE(std::isfinite(r.checks.flexural_strength.provided));
    EXPECT_TRUE(std::isfinite(r.cost.total));
}

TEST(DesignEngineBeam, NegativeMomentDesignedOnMagnitude) {
    auto input = reference_beam();
    input.forces.moment_x = -180.0;
    input.forces.shear    = -120.0;
    const auto r = DesignEngine{}.design(input);
    EXPECT_DOUBLE_EQ(r.reinforcement.main.diameter, 29.0);
    EXPECT_DOUBLE_EQ(r.checks.flexural_strength.required, 180.0);
}

TEST(DesignEngineBeam, UnbuildableStirrupSpacingFailsShear) {
    auto input = reference_beam();
    input.geometry.height      = 200.0;
    input.geometry.clear_cover = 20.0;
    input.forces.moment_x      = 5.0;
    input.forces.shear         = 150.0;
    const auto r = DesignEngine{}.design(input);

    const auto& stirrups = r.reinforcement.shear;
    EXPECT_TRUE(stirrups.provided);
    EXPECT_FALSE(stirrups.constructible);
    EXPECT_LT(stirrups.spacing, 50.0);
    EXPECT_FALSE(r.checks.shear_strength.passed());
    EXPECT_FALSE(r.is_valid);
    EXPECT_NE(r.to_string().find("below the constructible minimum"), std::string::npos);
}

TEST(DesignEngineBeam, ConstructibleStirrupsRespectMinimumSpacing) {
    const DesignEngine engine;
    for (double vu = 0.0; vu <= 400.0; vu += 25.0) {
        auto input = reference_beam();
        input.forces.shear = vu;
        const auto r = engine.design(input);
        const auto& stirrups = r.reinforcement.shear;
        if (stirrups.constructible) {
            EXPECT_GE(stirrups.spacing, 50.0) << "Vu=" << vu;
        } else {
            EXPECT_FALSE(r.checks.shear_strength.passed()) << "Vu=" << vu;
        }
    }
}

// ─── Slab ─────────────────────────────────────────────────────────────────────

TEST(DesignEngineSlab, ReferenceSlab) {
    const auto r = DesignEngine{gergely_lutz()}.design(reference_slab());

    EXPECT_EQ(r.element.kind, ElementKind::Slab);
    EXPECT_DOUBLE_EQ(r.element.width, 1000.0);
    EXPECT_DOUBLE_EQ(r.element.effective_depth, 125.0);
    EXPECT_DOUBLE_EQ(r.reinforcement.main.diameter, 10.0);
    EXPECT_EQ(r.reinforcement.main.count, 6);
    ASSERT_TRUE(r.reinforcement.bar_spacing.has_value());
    EXPECT_NEAR(*r.reinforcement.bar_spacing, 166.67, 0.01);

    EXPECT_FALSE(r.reinforcement.shear.provided);
    EXPECT_TRUE(r.reinforcement.shear.constructible);
    EXPECT_TRUE(r.checks.shear_strength.passed());
    EXPECT_FALSE(r.checks.axial_strength.applicable);
    EXPECT_TRUE(r.is_valid);
}

TEST(DesignEngineSlab, TemperatureSteelFloor) {
    auto input = reference_slab();
    input.forces = Forces{};
    const auto r = DesignEngine{}.design(input);
    EXPECT_DOUBLE_EQ(r.reinforcement.required_area, 0.0018 * 1000.0 * 150.0);
    EXPECT_GE(r.reinforcement.main.count, 3);
}

TEST(DesignEngineSlab, NeverUsesCompressionSteel) {
    auto input = reference_slab();
    input.forces.moment_x = 200.0;
    const auto r = DesignEngine{}.design(input);
    EXPECT_FALSE(r.reinforcement.compression.has_value());
    ASSERT_TRUE(r.flexure.has_value());
    EXPECT_TRUE(r.flexure->clamped);
    EXPECT_FALSE(r.is_valid);
}

// ─── Column ───────────────────────────────────────────────────────────────────

TEST(DesignEngineColumn, ReferenceColumn) {
    const auto r = DesignEngine{}.design(reference_column());

    EXPECT_EQ(r.element.kind, ElementKind::Column);
    EXPECT_EQ(r.reinforcement.main.count, 12);
    EXPECT_DOUBLE_EQ(r.reinforcement.main.diameter, 16.0);
    EXPECT_EQ(r.reinforcement.main.count % 2, 0);

    EXPECT_TRUE(r.reinforcement.shear.provided);
    EXPECT_DOUBLE_EQ(r.reinforcement.shear.diameter, 8.0);
    EXPECT_DOUBLE_EQ(r.reinforcement.shear.spacing, 170.0);
    EXPECT_TRUE(r.reinforcement.shear.constructible);

    ASSERT_TRUE(r.column.has_value());
    EXPECT_FALSE(r.column->clamped);
    EXPECT_GE(r.column->rho, 0.01);
    EXPECT_GT(r.column->capacity_ratio, 1.0);
    EXPECT_FALSE(r.flexure.has_value());

    EXPECT_TRUE(r.checks.flexural_strength.passed());
    EXPECT_TRUE(r.checks.axial_strength.passed());
    EXPECT_DOUBLE_EQ(r.checks.axial_strength.required, 1500.0);
    EXPECT_FALSE(r.checks.deflection.applicable);
    EXPECT_FALSE(r.checks.cracking.applicable);
    EXPECT_TRUE(r.is_valid);
}

TEST(DesignEngineColumn, UnbuildableTieSpacingFailsShear) {
    const DesignEngine engine;
    for (double vu = 0.0; vu <= 1200.0; vu += 100.0) {
        auto input = reference_column();
        input.geometry.width  = 250.0;
        input.geometry.height = 250.0;
        input.forces.axial    = 300.0;
        input.forces.shear    = vu;
        const auto r = engine.design(input);
        const auto& ties = r.reinforcement.shear;
        if (ties.constructible) {
            EXPECT_GE(ties.spacing, 50.0) << "Vu=" << vu;
        } else {
            EXPECT_LT(ties.spacing, 50.0) << "Vu=" << vu;
            EXPECT_FALSE(r.checks.shear_strength.passed()) << "Vu=" << vu;
            EXPECT_FALSE(r.is_valid) << "Vu=" << vu;
        }
    }
}

TEST(DesignEngineColumn, TieSpacingWithinDetailingLimits) {
    const auto r = DesignEngine{}.design(reference_column());
    const auto& ties = r.reinforcement.shear;
    EXPECT_LE(ties.spacing, 16.0 * r.reinforcement.main.diameter);
    EXPECT_LE(ties.spacing, 48.0 * ties.diameter);
    EXPECT_LE(ties.spacing, 400.0);
    EXPECT_GE(ties.diameter, r.reinforcement.main.diameter / 4.0);
}

TEST(DesignEngineColumn, OverloadedColumnClamps) {
    auto input = reference_column();
    input.forces.axial    = 6000.0;
    input.forces.moment_x = 800.0;
    const auto r = DesignEngine{}.design(input);
    ASSERT_TRUE(r.column.has_value());
    EXPECT_TRUE(r.column->clamped);
    EXPECT_FALSE(r.is_valid);
}

// ─── Validation ───────────────────────────────────────────────────────────────

TEST(DesignEngineValidation, AcceptsReferenceInputs) {
    const DesignEngine engine;
    EXPECT_FALSE(engine.validate(reference_beam()).has_value());
    EXPECT_FALSE(engine.validate(reference_slab()).has_value());
    EXPECT_FALSE(engine.validate(reference_column()).has_value());
}

TEST(DesignEngineValidation, NonPositiveWidth) {
    auto input = reference_beam();
    input.geometry.width = 0.0;
    const auto v = DesignEngine{}.validate(input);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->field, "geometry.width");
    EXPECT_EQ(v->reason, "must be positive");
}

TEST(DesignEngineValidation, NonFiniteStrength) {
    auto input = reference_beam();
    input.material.fc = std::numeric_limits<double>::quiet_NaN();
    const auto v = DesignEngine{}.validate(input);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->field, "material.fc");
    EXPECT_EQ(v->reason, "must be finite");
}

TEST(DesignEngineValidation, NegativeCover) {
    auto input = reference_beam();
    input.geometry.clear_cover = -5.0;
    const auto v = DesignEngine{}.validate(input);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->field, "geometry.clear_cover");
    EXPECT_DOUBLE_EQ(v->value, -5.0);
}

TEST(DesignEngineValidation, CoverConsumesSection) {
    auto input = reference_beam();
    input.geometry.clear_cover = 480.0;
    const auto v = DesignEngine{}.validate(input);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->field, "geometry.clear_cover");
}

TEST(DesignEngineValidation, NonFiniteForceAndBadSpan) {
    auto input = reference_beam();
    input.forces.shear = std::numeric_limits<double>::infinity();
    auto v = DesignEngine{}.validate(input);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->field, "forces.shear");

    input = reference_beam();
    input.geometry.span = -1.0;
    v = DesignEngine{}.validate(input);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->field, "geometry.span");

    input = reference_beam();
    input.constraints.crack_width_limit = 0.0;
    v = DesignEngine{}.validate(input);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->field, "constraints.crack_width_limit");
}

TEST(DesignEngineValidation, DesignThrowsInvalidInputError) {
    auto input = reference_beam();
    input.geometry.height = -500.0;
    const DesignEngine engine;
    try {
        (void)engine.design(input);
        FAIL() << "expected InvalidInputError";
    } catch (const InvalidInputError& e) {
        EXPECT_EQ(e.field(), "geometry.height");
        EXPECT_DOUBLE_EQ(e.value(), -500.0);
        EXPECT_NE(std::string(e.what()).find("geometry.height"), std::string::npos);
    }
    EXPECT_THROW((void)engine.design(input), std::invalid_argument);
}

// ─── Determinism & Concurrency ────────────────────────────────────────────────

TEST(DesignEngineDeterminism, RepeatedDesignIdentical) {
    const DesignEngine engine;
    for (const auto& input : {reference_beam(), reference_slab(), reference_column()}) {
        EXPECT_EQ(engine.design(input).to_string(), engine.design(input).to_string());
    }
}

TEST(DesignEngineDeterminism, ConcurrentDesignsAgree) {
    const DesignEngine engine;
    const std::string expected = engine.design(reference_column()).to_string();

    std::vector<std::string> reports(8);
    std::vector<std::thread> workers;
    workers.reserve(reports.size());
    for (std::size_t i = 0; i < reports.size(); ++i) {
        workers.emplace_back([&engine, &reports, i] {
            reports[i] = engine.design(reference_column()).to_string();
        });
    }
    for (auto& t : workers) {
        t.join();
    }
    for (const auto& report : reports) {
        EXPECT_EQ(report, expected);
    }
}

// ─── Report ───────────────────────────────────────────────────────────────────

TEST(DesignResultReport, BeamReportContents) {
    const auto text = DesignEngine{}.design(reference_beam()).to_string();
    EXPECT_NE(text.find("beam 300 x 500 mm"), std::string::npos);
    EXPECT_NE(text.find("2D29"), std::string::npos);
    EXPECT_NE(text.find("stirrups"), std::string::npos);
    EXPECT_NE(text.find("valid: no"), std::string::npos);
    EXPECT_NE(text.find("flexural strength"), std::string::npos);
    EXPECT_NE(text.find("n/a"), std::string::npos);
}

TEST(DesignResultReport, SlabAndColumnSections) {
    const DesignEngine engine;
    const auto slab = engine.design(reference_slab()).to_string();
    EXPECT_NE(slab.find("concrete only"), std::string::npos);
    EXPECT_NE(slab.find("spacing"), std::string::npos);

    const auto column = engine.design(reference_column()).to_string();
    EXPECT_NE(column.find("ties"), std::string::npos);
    EXPECT_NE(column.find("P-M ratio"), std::string::npos);
    EXPECT_NE(column.find("valid: yes"), std::string::npos);
}

// ─── Cost ─────────────────────────────────────────────────────────────────────

TEST(DesignEngineCost, PricedOverSpanOrConfiguredLength) {
    const DesignEngine engine;
    const auto beam = engine.design(reference_beam());
    EXPECT_DOUBLE_EQ(beam.cost.breakdown.volume, 0.9);
    EXPECT_GT(beam.cost.steel, 0.0);

    // Columns carry no span: one metre is priced.
    const auto column = engine.design(reference_column());
    EXPECT_NEAR(column.cost.breakdown.volume, 0.16, 1e-9);
    EXPECT_NEAR(column.cost.breakdown.contact_area, 1.6, 1e-9);
}
