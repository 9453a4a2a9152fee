/// @file tests/core/test_element_loader.cpp
/// @brief Tests for ElementLoader CSV parsing.

#include "rcde/element_loader.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

using namespace rcde;
using namespace rcde::core;

namespace {

const std::string HEADER =
    "kind,width,height,span,cover,fc,fy,moment,shear,axial\n";

}  // anonymous namespace

// ─── parse_row ────────────────────────────────────────────────────────────────

TEST(ElementLoaderRow, FullBeamRow) {
    const auto input = ElementLoader::parse_row("beam,300,500,6000,40,30,400,180,120,0");
    ASSERT_TRUE(input.has_value());
    EXPECT_EQ(input->kind, ElementKind::Beam);
    EXPECT_DOUBLE_EQ(input->geometry.width, 300.0);
    EXPECT_DOUBLE_EQ(input->geometry.height, 500.0);
    ASSERT_TRUE(input->geometry.span.has_value());
    EXPECT_DOUBLE_EQ(*input->geometry.span, 6000.0);
    EXPECT_DOUBLE_EQ(input->geometry.clear_cover, 40.0);
    EXPECT_DOUBLE_EQ(input->material.fc, 30.0);
    EXPECT_DOUBLE_EQ(input->material.fy, 400.0);
    EXPECT_DOUBLE_EQ(input->forces.moment_x, 180.0);
    EXPECT_DOUBLE_EQ(input->forces.shear, 120.0);
    EXPECT_DOUBLE_EQ(input->forces.axial, 0.0);
    EXPECT_FALSE(input->constraints.exposure.has_value());
}

TEST(ElementLoaderRow, EmptySpanAndWhitespace) {
    const auto input = ElementLoader::parse_row(" column , 400, 400, , 40, 30, 400, 120, 40, 1500");
    ASSERT_TRUE(input.has_value());
    EXPECT_EQ(input->kind, ElementKind::Column);
    EXPECT_FALSE(input->geometry.span.has_value());
    EXPECT_DOUBLE_EQ(input->forces.axial, 1500.0);
}

TEST(ElementLoaderRow, OptionalConstraintColumns) {
    const auto input = ElementLoader::parse_row("slab,1000,150,4000,20,25,400,20,30,0,250,,severe");
    ASSERT_TRUE(input.has_value());
    ASSERT_TRUE(input->constraints.deflection_limit.has_value());
    EXPECT_DOUBLE_EQ(*input->constraints.deflection_limit, 250.0);
    EXPECT_FALSE(input->constraints.crack_width_limit.has_value());
    EXPECT_EQ(input->constraints.exposure, ExposureClass::Severe);
}

TEST(ElementLoaderRow, TrailingCommaAccepted) {
    EXPECT_TRUE(ElementLoader::parse_row("beam,300,500,6000,40,30,400,180,120,0,").has_value());
}

TEST(ElementLoaderRow, MalformedRowsRejected) {
    EXPECT_FALSE(ElementLoader::parse_row("").has_value());
    EXPECT_FALSE(ElementLoader::parse_row("# comment").has_value());
    EXPECT_FALSE(ElementLoader::parse_row("wall,300,500,6000,40,30,400,180,120,0").has_value());
    EXPECT_FALSE(ElementLoader::parse_row("beam,300,500,6000,40,30,400,180,120").has_value());
    EXPECT_FALSE(ElementLoader::parse_row("beam,abc,500,6000,40,30,400,180,120,0").has_value());
    EXPECT_FALSE(ElementLoader::parse_row("beam,300x,500,6000,40,30,400,180,120,0").has_value());
    EXPECT_FALSE(ElementLoader::parse_row("beam,300,500,6000,40,30,400,180,120,0,,,salty").has_value());
    EXPECT_FALSE(ElementLoader::parse_row("beam,300,500,6000,40,30,400,180,120,0,1,2,mild,9").has_value());
    EXPECT_FALSE(ElementLoader::parse_row("beam,nan,500,6000,40,30,400,180,120,0").has_value());
}

TEST(ElementLoaderRow, OutOfRangeValuesLeftToValidation) {
    // Parsing accepts negative numbers; DesignEngine::validate rejects them.
    const auto input = ElementLoader::parse_row("beam,-300,500,6000,40,30,400,180,120,0");
    ASSERT_TRUE(input.has_value());
    EXPECT_DOUBLE_EQ(input->geometry.width, -300.0);
}

// ─── parse_csv_string ─────────────────────────────────────────────────────────

TEST(ElementLoaderCsv, SkipsHeaderCommentsAndBadRows) {
    const std::string csv =
        "# batch 1\n" + HEADER +
        "beam,300,500,6000,40,30,400,180,120,0\r\n"
        "\n"
        "# columns\n"
        "column,400,400,,40,30,400,120,40,1500\n"
        "beam,broken\n"
        "slab,1000,150,4000,20,25,400,20,30,0\n";
    const auto inputs = ElementLoader::parse_csv_string(csv);
    ASSERT_EQ(inputs.size(), 3u);
    EXPECT_EQ(inputs[0].kind, ElementKind::Beam);
    EXPECT_EQ(inputs[1].kind, ElementKind::Column);
    EXPECT_EQ(inputs[2].kind, ElementKind::Slab);
}

TEST(ElementLoaderCsv, HeaderOnlyGivesEmpty) {
    EXPECT_TRUE(ElementLoader::parse_csv_string(HEADER).empty());
    EXPECT_TRUE(ElementLoader::parse_csv_string("").empty());
}

// ─── load_csv ─────────────────────────────────────────────────────────────────

TEST(ElementLoaderFile, MissingFileIsNullopt) {
    EXPECT_FALSE(ElementLoader::load_csv("/nonexistent/rcde_elements.csv").has_value());
}

TEST(ElementLoaderFile, ReadsFromDisk) {
    const std::string path = ::testing::TempDir() + "rcde_loader_test.csv";
    {
        std::ofstream out(path);
        out << HEADER << "beam,300,500,6000,40,30,400,180,120,0\n";
    }
    const auto inputs = ElementLoader::load_csv(path);
    std::remove(path.c_str());
    ASSERT_TRUE(inputs.has_value());
    ASSERT_EQ(inputs->size(), 1u);
    EXPECT_DOUBLE_EQ((*inputs)[0].geometry.width, 300.0);
}
