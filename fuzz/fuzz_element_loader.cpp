/**
 * @file  fuzz_element_loader.cpp
 * @brief libFuzzer target for ElementLoader and DesignEngine (end-to-end)
 *
 * Build:
 *   cmake -DRCDE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_element_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_element_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every parsed row either:
 *      a. passes validate() and designs to a result with
 *         is_valid == checks.all_pass(), d > 0, a finite cost and a
 *         failed shear check whenever the stirrup spacing is unbuildable, or
 *      b. fails validate() and design() throws InvalidInputError naming the
 *         same field.
 *   3. For empty input: no rows.
 *
 * Fuzzer strategy:
 *   Input is parsed as a CSV document.  The loader must handle:
 *     • Binary garbage (null bytes, high bytes)
 *     • "NaN", "inf", "-inf" text tokens
 *     • Missing, extra and empty fields
 *     • Mixed line endings (LF, CRLF)
 *     • Exponential notation: "1e308", "1e-308"
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "rcde/element_loader.hpp"
#include "rcde/engine.hpp"
#include "rcde/logging.hpp"

using namespace rcde;
using namespace rcde::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const bool quiet = [] {
        log::set_level(log::Level::Off);
        return true;
    }();
    (void)quiet;

    const std::string csv(reinterpret_cast<const char*>(data), size);
    const auto inputs = ElementLoader::parse_csv_string(csv);

    // Invariant 3
    if (size == 0) {
        assert(inputs.empty());
    }

    const DesignEngine engine;
    for (const auto& input : inputs) {
        const auto violation = engine.validate(input);
        if (violation) {
            // Invariant 2b
            bool thrown = false;
            try {
                (void)engine.design(input);
            } catch (const InvalidInputError& e) {
                thrown = true;
                assert(e.field() == violation->field);
            }
            assert(thrown);
            (void)thrown;
            continue;
        }

        // Invariant 2a
        const auto result = engine.design(input);
        assert(result.is_valid == result.checks.all_pass());
        assert(result.element.effective_depth > 0.0);
        assert(std::isfinite(result.cost.total));
        assert(result.reinforcement.main.count >= 2);
        assert(result.reinforcement.shear.constructible
               || !result.checks.shear_strength.passed());
        (void)result;
    }

    return 0;
}
