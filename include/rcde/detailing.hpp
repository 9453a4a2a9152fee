#pragma once

/// @file include/rcde/detailing.hpp
/// @brief Development-length detailing for selected bars.
///
/// Lengths follow the simplified metric provisions for deformed bars in
/// normal-weight concrete with uncoated bars and no top-bar effect:
///
///   tension      ld  = max(fy/(k λ √fc′) · db, 300),  k = 2.1 (db ≤ 19), 1.7
///   compression  ldc = max(0.24 fy db/(λ √fc′), 0.043 fy db, 200)
///   hook         ldh = max(0.24 fy db/(λ √fc′), 8 db, 150)
///   splice       1.3 · ld   (class B lap)
///
/// All lengths are rounded to whole millimetres.

namespace rcde::detailing {

struct DevelopmentLengths {
    double tension;      ///< ld (mm)
    double compression;  ///< ldc (mm)
    double hook;         ///< ldh (mm)
    double splice;       ///< Class B lap splice (mm)
};

class DetailingCalculator {
public:
    DetailingCalculator() = delete;

    [[nodiscard]] static DevelopmentLengths
    development_lengths(double bar_diameter, double fc, double fy) noexcept;
};

}  // namespace rcde::detailing
