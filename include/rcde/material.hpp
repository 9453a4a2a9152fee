#pragma once

/// @file include/rcde/material.hpp
/// @brief Material Model public API.
///
/// # Module: Material Model
///
/// ## Responsibility
/// Derive the code-prescribed properties of a concrete/steel pair: the
/// stress-block factor β1, elastic moduli, modulus of rupture and the
/// reinforcement-ratio bounds used by the flexural designer.
///
/// ## Guarantees
/// - Pure functions of fc′ and fy; no state, safe to call concurrently
/// - No range judgement: fc′ = 15 MPa is computed like any other value
///
/// ## NOT Responsible For
/// - Rejecting non-positive strengths (see DesignEngine::validate)

#include "rcde/types.hpp"

#include <string>

namespace rcde::material {

/// All derived properties of one material pair.
struct MaterialProperties {
    double fc;                  ///< fc′ (MPa)
    double fy;                  ///< fy (MPa)
    double beta1;               ///< Stress-block depth factor
    double ec;                  ///< Concrete modulus Ec (MPa)
    double es;                  ///< Steel modulus Es (MPa)
    double modular_ratio;       ///< n = Es / Ec
    double modulus_of_rupture;  ///< fr (MPa)
    double rho_balanced;        ///< ρb
    double rho_max;             ///< 0.75 ρb
    double rho_min;             ///< max(1.4/fy, √fc′/(4 fy))
};

/// Stateless material property calculator.
class MaterialModel {
public:
    MaterialModel() = delete;

    /// β1(fc′): 0.85 up to 28 MPa, 0.05 lower per 7 MPa up to 55 MPa, 0.65 above.
    [[nodiscard]] static double beta1(double fc) noexcept;

    /// Ec = 4700 √fc′.
    [[nodiscard]] static double elastic_modulus(double fc) noexcept;

    /// n = Es / Ec.
    [[nodiscard]] static double modular_ratio(double fc) noexcept;

    /// fr = 0.62 λ √fc′.
    [[nodiscard]] static double modulus_of_rupture(double fc) noexcept;

    /// ρb = 0.85 β1 fc′/fy · 600/(600 + fy).
    [[nodiscard]] static double rho_balanced(double fc, double fy) noexcept;

    [[nodiscard]] static double rho_max(double fc, double fy) noexcept;

    [[nodiscard]] static double rho_min(double fc, double fy) noexcept;

    /// Compute every derived property at once.
    [[nodiscard]] static MaterialProperties derive(const Material& material) noexcept;

    /// Grade labels echoed in results, e.g. "fc30" and "fy400".
    [[nodiscard]] static std::string concrete_grade(double fc);
    [[nodiscard]] static std::string steel_grade(double fy);
};

}  // namespace rcde::material
