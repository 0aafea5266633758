#pragma once

/// @file include/beamvib/modulus.hpp
/// @brief ModulusCalculator — Young's modulus from a cantilever's fundamental.
///
/// # Module: Modulus Calculator
///
/// ## Physical Model
/// Euler–Bernoulli cantilever (clamped-free), first transverse mode:
///
///     ω₁ = λ₁² · √(E·I / (ρ·A·L⁴)),   λ₁ = 1.875104
///
/// Solving for E with ω₁ = 2π·f:
///
///     E = [ (2π·f·L²) / λ₁² ]² · ρ·A / I
///
/// with A = w·t (cross-section) and I = w·t³/12 (second moment of area about
/// the bending axis).
///
/// ## Guarantees
/// - Pure functions: identical inputs give bit-identical outputs
/// - Any non-positive or non-finite input → `nullopt`

#include "beamvib/types.hpp"
#include "beamvib/constants.hpp"

#include <optional>

namespace beamvib::physics {

class ModulusCalculator {
public:
    ModulusCalculator() = delete;

    /// Young's modulus in Pa for a cantilever of free length `length_m`
    /// vibrating at `frequency_hz`.
    [[nodiscard]] static std::optional<double>
    compute_modulus(double frequency_hz,
                    double length_m,
                    const BeamGeometry& geometry) noexcept;

    /// Fundamental frequency in Hz of a cantilever with modulus `modulus_pa`.
    /// Inverse of `compute_modulus`.
    [[nodiscard]] static std::optional<double>
    natural_frequency(double modulus_pa,
                      double length_m,
                      const BeamGeometry& geometry) noexcept;

    /// True if width, thickness and density are all positive and finite.
    [[nodiscard]] static bool is_valid(const BeamGeometry& geometry) noexcept;

    /// I = w·t³ / 12, m⁴.
    [[nodiscard]] static double
    second_moment_of_area(const BeamGeometry& geometry) noexcept;

    /// A = w·t, m².
    [[nodiscard]] static double
    cross_section_area(const BeamGeometry& geometry) noexcept;

    [[nodiscard]] static constexpr double to_gigapascals(double pa) noexcept {
        return pa / constants::PA_PER_GPA;
    }
};

}  // namespace beamvib::physics
