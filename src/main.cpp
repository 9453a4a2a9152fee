/// @file src/main.cpp
/// @brief rcde CLI entry point.
///
/// Usage:
///   rcde --design <csv_file>   Design every element listed in a CSV file
///   rcde --verbose ...         Enable debug logging on stderr
///   rcde --help                Print usage

#include "rcde/element_loader.hpp"
#include "rcde/engine.hpp"
#include "rcde/logging.hpp"

#include <fmt/core.h>

#include <string>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  rcde [--verbose] --design <csv_file>   Design elements from CSV\n"
        "  rcde --help                            Show this help\n"
        "\n"
        "CSV format (header required; forces in kN and kN.m, lengths in mm):\n"
        "  kind,width,height,span,cover,fc,fy,moment,shear,axial"
        "[,deflection_limit,crack_width,exposure]\n"
        "  kind: beam | column | slab; exposure: mild .. extreme\n"
    );
}

/// Design every row of the CSV file and print one report per element.
/// Returns 0 when every element was designed and passed, 2 when at least one
/// design failed its checks, 1 on input errors.
int run_design(const std::string& filepath) {
    auto inputs = rcde::core::ElementLoader::load_csv(filepath);
    if (!inputs) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return 1;
    }

    if (inputs->empty()) {
        fmt::print(stderr, "Error: no valid elements loaded from '{}'\n", filepath);
        return 1;
    }

    fmt::print("Loaded {} elements from '{}'\n", inputs->size(), filepath);

    const rcde::core::DesignEngine engine;
    std::size_t designed = 0;
    std::size_t failed   = 0;
    std::size_t rejected = 0;

    for (std::size_t i = 0; i < inputs->size(); ++i) {
        try {
            const auto result = engine.design((*inputs)[i]);
            ++designed;
            if (!result.is_valid) {
                ++failed;
            }
            fmt::print("Element {}:\n{}\n", i + 1, result.to_string());
        } catch (const rcde::InvalidInputError& e) {
            ++rejected;
            fmt::print(stderr, "Element {}: rejected, {} = {} ({})\n",
                       i + 1, e.field(), e.value(), e.violation().reason);
        }
    }

    fmt::print("Designed {} elements: {} passed, {} failed, {} rejected.\n",
               designed, designed - failed, failed, rejected);
    if (rejected > 0) {
        return 1;
    }
    return failed > 0 ? 2 : 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    int arg = 1;
    std::string mode(argv[arg]);

    if (mode == "--verbose" || mode == "-v") {
        rcde::log::set_level(rcde::log::Level::Debug);
        if (++arg >= argc) {
            print_usage();
            return 1;
        }
        mode = argv[arg];
    }

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--design") {
        if (arg + 1 >= argc) {
            fmt::print(stderr, "Error: --design requires a CSV file path\n");
            print_usage();
            return 1;
        }
        return run_design(std::string(argv[arg + 1]));
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
