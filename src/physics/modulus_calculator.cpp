/// @file src/physics/modulus_calculator.cpp
/// @brief Cantilever first-mode relation between frequency and Young's modulus.

#include "beamvib/modulus.hpp"
#include "beamvib/constants.hpp"

#include <cmath>

namespace beamvib::physics {

namespace {

[[nodiscard]] bool positive_finite(double v) noexcept {
    return std::isfinite(v) && v > 0.0;
}

}  // namespace

// ─── Geometry ─────────────────────────────────────────────────────────────────

bool ModulusCalculator::is_valid(const BeamGeometry& geometry) noexcept {
    return positive_finite(geometry.width_m)
        && positive_finite(geometry.thickness_m)
        && positive_finite(geometry.density_kg_m3);
}

double ModulusCalculator::second_moment_of_area(const BeamGeometry& geometry) noexcept {
    const double t = geometry.thickness_m;
    return geometry.width_m * t * t * t / 12.0;
}

double ModulusCalculator::cross_section_area(const BeamGeometry& geometry) noexcept {
    return geometry.width_m * geometry.thickness_m;
}

// ─── ModulusCalculator::compute_modulus ───────────────────────────────────────

std::optional<double>
ModulusCalculator::compute_modulus(double frequency_hz,
                                   double length_m,
                                   const BeamGeometry& geometry) noexcept {
    if (!positive_finite(frequency_hz)) return std::nullopt;
    if (!positive_finite(length_m))     return std::nullopt;
    if (!is_valid(geometry))            return std::nullopt;

    constexpr double lambda_sq = constants::CANTILEVER_LAMBDA_1 * constants::CANTILEVER_LAMBDA_1;

    const double I = second_moment_of_area(geometry);
    const double A = cross_section_area(geometry);

    // E = [ (2π·f·L²) / λ₁² ]² · ρ·A / I
    const double root = (2.0 * constants::PI * frequency_hz * length_m * length_m) / lambda_sq;
    const double E = root * root * geometry.density_kg_m3 * A / I;

    if (!std::isfinite(E)) return std::nullopt;
    return E;
}

// ─── ModulusCalculator::natural_frequency ─────────────────────────────────────

std::optional<double>
ModulusCalculator::natural_frequency(double modulus_pa,
                                     double length_m,
                                     const BeamGeometry& geometry) noexcept {
    if (!positive_finite(modulus_pa)) return std::nullopt;
    if (!positive_finite(length_m))   return std::nullopt;
    if (!is_valid(geometry))          return std::nullopt;

    constexpr double lambda_sq = constants::CANTILEVER_LAMBDA_1 * constants::CANTILEVER_LAMBDA_1;

    const double I = second_moment_of_area(geometry);
    const double A = cross_section_area(geometry);

    // f = λ₁² / (2π·L²) · √(E·I / (ρ·A))
    const double f = lambda_sq / (2.0 * constants::PI * length_m * length_m)
                     * std::sqrt(modulus_pa * I / (geometry.density_kg_m3 * A));

    if (!std::isfinite(f)) return std::nullopt;
    return f;
}

}  // namespace beamvib::physics
