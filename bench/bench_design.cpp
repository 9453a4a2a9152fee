/**
 * @file  bench/bench_design.cpp
 * @brief Google Benchmark suite for the RCDE design pipeline.
 *
 * Benchmarks
 * ----------
 *   BM_FlexuralDesign          closed-form Rn solve
 *   BM_SelectBars              catalog scan for a range of demands
 *   BM_ColumnCapacityRatio     interaction projection (Eigen layer sums)
 *   BM_DesignBeam / Slab / Column   full DesignEngine::design
 *   BM_ParseCsv                ElementLoader over N generated rows
 *
 * Build (CMake):
 *   cmake -DRCDE_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_design
 *   ./build/bench_design --benchmark_format=json
 *
 * Throughput units: items/second (elements designed or rows parsed).
 */

#include "benchmark/benchmark.h"

#include "rcde/column.hpp"
#include "rcde/element_loader.hpp"
#include "rcde/engine.hpp"
#include "rcde/flexure.hpp"
#include "rcde/reinforcement.hpp"

#include <cstdint>
#include <string>

using namespace rcde;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static DesignInput make_input(ElementKind kind) {
    switch (kind) {
        case ElementKind::Slab:
            return DesignInput{
                .kind     = ElementKind::Slab,
                .geometry = Geometry{.width = 1000.0, .height = 150.0, .span = 4000.0,
                                     .clear_cover = 20.0},
                .material = Material{.fc = 25.0, .fy = 400.0},
                .forces   = Forces{.moment_x = 20.0, .shear = 30.0},
            };
        case ElementKind::Column:
            return DesignInput{
                .kind     = ElementKind::Column,
                .geometry = Geometry{.width = 400.0, .height = 400.0, .span = std::nullopt,
                                     .clear_cover = 40.0},
                .material = Material{.fc = 30.0, .fy = 400.0},
                .forces   = Forces{.moment_x = 120.0, .shear = 40.0, .axial = 1500.0},
            };
        case ElementKind::Beam:
            break;
    }
    return DesignInput{
        .kind     = ElementKind::Beam,
        .geometry = Geometry{.width = 300.0, .height = 500.0, .span = 6000.0,
                             .clear_cover = 40.0},
        .material = Material{.fc = 30.0, .fy = 400.0},
        .forces   = Forces{.moment_x = 180.0, .shear = 120.0},
    };
}

/// N data rows cycling through the three element kinds.
static std::string make_csv(std::size_t n) {
    std::string csv = "kind,width,height,span,cover,fc,fy,moment,shear,axial\n";
    for (std::size_t i = 0; i < n; ++i) {
        switch (i % 3) {
            case 0:  csv += "beam,300,500,6000,40,30,400,180,120,0\n"; break;
            case 1:  csv += "column,400,400,,40,30,400,120,40,1500\n"; break;
            default: csv += "slab,1000,150,4000,20,25,400,20,30,0\n"; break;
        }
    }
    return csv;
}

// ── Components ─────────────────────────────────────────────────────────────────

static void BM_FlexuralDesign(benchmark::State& state) {
    const flexure::FlexureDemand demand{
        .moment = 180e6, .width = 300.0, .effective_depth = 444.0,
        .compression_depth = 56.0, .fc = 30.0, .fy = 400.0,
    };
    for (auto _ : state) {
        benchmark::DoNotOptimize(flexure::FlexuralDesigner::design(demand));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_FlexuralDesign);

static void BM_SelectBars(benchmark::State& state) {
    const double required = static_cast<double>(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(reinforcement::ReinforcementSelector::select(required));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_SelectBars)->Arg(500)->Arg(1500)->Arg(6000);

static void BM_ColumnCapacityRatio(benchmark::State& state) {
    const column::ColumnSection section{
        .width = 400.0, .height = 400.0, .fc = 30.0, .fy = 400.0,
        .bar_inset = 56.0, .bar_count = static_cast<int>(state.range(0)), .bar_area = 201.0,
    };
    for (auto _ : state) {
        benchmark::DoNotOptimize(
            column::ColumnInteraction::capacity_ratio(section, 1500e3, 120e6));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_ColumnCapacityRatio)->Arg(4)->Arg(12)->Arg(20)->Unit(benchmark::kMicrosecond);

// ── Full pipeline ──────────────────────────────────────────────────────────────

static void BM_Design(benchmark::State& state, ElementKind kind) {
    const core::DesignEngine engine;
    const auto input = make_input(kind);
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.design(input));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK_CAPTURE(BM_Design, Beam,   ElementKind::Beam)->Unit(benchmark::kMicrosecond);
BENCHMARK_CAPTURE(BM_Design, Slab,   ElementKind::Slab)->Unit(benchmark::kMicrosecond);
BENCHMARK_CAPTURE(BM_Design, Column, ElementKind::Column)->Unit(benchmark::kMillisecond);

static void BM_ParseCsv(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const std::string csv = make_csv(n);
    for (auto _ : state) {
        benchmark::DoNotOptimize(core::ElementLoader::parse_csv_string(csv));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_ParseCsv)->RangeMultiplier(8)->Range(8, 4096)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
