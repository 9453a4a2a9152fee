#pragma once

#include <array>
#include <cstddef>

/// @file include/rcde/constants.hpp
/// @brief Code constants and standard catalogs for the RCDE design engine.
///
/// All values are process-wide immutable data. Units: mm, MPa, N unless the
/// name says otherwise.

namespace rcde::constants {

// ─── Unit Conversion ──────────────────────────────────────────────────────────

static constexpr double KN_TO_N    = 1e3;  ///< kN → N
static constexpr double KNM_TO_NMM = 1e6;  ///< kN·m → N·mm

// ─── Materials ────────────────────────────────────────────────────────────────

/// Elastic modulus of reinforcing steel (MPa).
static constexpr double STEEL_MODULUS = 200000.0;

/// Ec = EC_COEFFICIENT · √fc′ for normal-weight concrete (MPa).
static constexpr double EC_COEFFICIENT = 4700.0;

/// Modulus of rupture fr = RUPTURE_COEFFICIENT · λ · √fc′.
static constexpr double RUPTURE_COEFFICIENT = 0.62;

/// Lightweight-concrete modification factor λ (normal weight).
static constexpr double LAMBDA_NORMAL_WEIGHT = 1.0;

/// Ultimate concrete compressive strain εcu.
static constexpr double CONCRETE_ULTIMATE_STRAIN = 0.003;

/// Es · εcu = 600 MPa, the strain-compatibility stress constant.
static constexpr double STRAIN_STRESS_LIMIT = STEEL_MODULUS * CONCRETE_ULTIMATE_STRAIN;

/// Density of reinforcing steel (kg per dm³).
static constexpr double STEEL_DENSITY_KG_PER_DM3 = 7.85;

// ─── Stress Block ─────────────────────────────────────────────────────────────

static constexpr double BETA1_MAX        = 0.85;
static constexpr double BETA1_MIN        = 0.65;
static constexpr double BETA1_FC_LOWER   = 28.0;   ///< β1 = 0.85 up to here
static constexpr double BETA1_SLOPE_STEP = 7.0;    ///< 0.05 drop per 7 MPa
static constexpr double BETA1_FC_UPPER   = 55.0;   ///< β1 = 0.65 above here

// ─── Strength Reduction Factors ───────────────────────────────────────────────

static constexpr double PHI_FLEXURE       = 0.90;
static constexpr double PHI_SHEAR         = 0.75;
static constexpr double PHI_COMPRESSION   = 0.65;  ///< tied columns
static constexpr double AXIAL_CAP_FACTOR  = 0.80;  ///< φPn,max = 0.80 φ P0

/// Net tensile strain at the tension-controlled limit used for beams.
static constexpr double TENSION_CONTROLLED_STRAIN = 0.004;

// ─── Reinforcement Ratios ─────────────────────────────────────────────────────

/// ρmax = RHO_MAX_FRACTION · ρb.
static constexpr double RHO_MAX_FRACTION = 0.75;

/// Slab shrinkage and temperature steel ratio on gross section.
static constexpr double SLAB_RHO_MIN = 0.0018;

static constexpr double COLUMN_RHO_MIN = 0.01;
static constexpr double COLUMN_RHO_MAX = 0.06;

// ─── Geometry ─────────────────────────────────────────────────────────────────

/// Slabs are designed per one-metre strip.
static constexpr double SLAB_STRIP_WIDTH = 1000.0;

/// Maximum slab bar spacing = min(3h, SLAB_MAX_SPACING).
static constexpr double SLAB_MAX_SPACING = 450.0;

/// Column perimeter length served by one longitudinal bar.
static constexpr double COLUMN_PERIMETER_PER_BAR = 150.0;

static constexpr double SERVICE_LOAD_FACTOR = 1.4;

// ─── Bar Catalog ──────────────────────────────────────────────────────────────

/// One standard deformed bar size.
struct BarSize {
    double diameter;  ///< Nominal diameter (mm)
    double area;      ///< Nominal cross-sectional area (mm²)
};

/// Longitudinal bar catalog, ascending by diameter.
static constexpr std::array<BarSize, 8> BAR_CATALOG{{
    {10.0,  78.5},
    {12.0, 113.0},
    {16.0, 201.0},
    {19.0, 284.0},
    {22.0, 380.0},
    {25.0, 491.0},
    {29.0, 661.0},
    {32.0, 804.0},
}};

/// Stirrup and tie catalog, ascending by diameter.
static constexpr std::array<BarSize, 4> STIRRUP_CATALOG{{
    { 8.0,  50.3},
    {10.0,  78.5},
    {12.0, 113.0},
    {16.0, 201.0},
}};

/// Index of the first column-eligible bar (16 mm) in BAR_CATALOG.
static constexpr std::size_t COLUMN_CATALOG_OFFSET = 2;

/// Slabs use bars up to 16 mm.
static constexpr std::size_t SLAB_CATALOG_SIZE = 3;

// ─── Practical Bar Counts ─────────────────────────────────────────────────────

static constexpr int MIN_BAR_COUNT        = 2;
static constexpr int BEAM_MAX_BAR_COUNT   = 12;
static constexpr int COLUMN_MIN_BAR_COUNT = 4;
static constexpr int COLUMN_MAX_BAR_COUNT = 20;
static constexpr int SLAB_MAX_BAR_COUNT   = 20;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

static constexpr double FLOAT_EPSILON = 1e-9;

}  // namespace rcde::constants
