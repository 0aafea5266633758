#pragma once

#include <cstddef>

/// @file include/beamvib/constants.hpp
/// @brief Physical constants, numerical tolerances and run defaults.
///
/// The defaults reproduce the values the bench-top rig was calibrated with:
/// 5 kHz acquisition, 4th-order 70 Hz low-pass, 10 % crop threshold and a
/// 25.5 mm × 0.8 mm steel strip.

namespace beamvib::constants {

// ─── Beam Physics ─────────────────────────────────────────────────────────────

/// First eigenvalue λ₁ of the clamped-free (cantilever) Euler–Bernoulli beam,
/// root of cos(λ)·cosh(λ) = −1.
static constexpr double CANTILEVER_LAMBDA_1 = 1.875104;

static constexpr double PI = 3.14159265358979323846;

/// Pascals per gigapascal (reporting unit).
static constexpr double PA_PER_GPA = 1e9;

/// Millimetres per metre (beam lengths are named in mm).
static constexpr double MM_PER_M = 1000.0;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

/// Highest Butterworth order accepted.
static constexpr int MAX_FILTER_ORDER = 12;

/// Minimum number of samples in an analyzable crop window.
static constexpr std::size_t MIN_WINDOW_SAMPLES = 2;

/// Minimum number of same-direction zero crossings (one full period).
static constexpr std::size_t MIN_SAME_DIRECTION_CROSSINGS = 2;

// ─── Run Defaults ─────────────────────────────────────────────────────────────

static constexpr double DEFAULT_CUTOFF_HZ      = 70.0;
static constexpr double DEFAULT_SAMPLE_RATE_HZ = 5000.0;
static constexpr int    DEFAULT_FILTER_ORDER   = 4;
static constexpr double DEFAULT_CROP_FRACTION  = 0.1;

static constexpr double DEFAULT_WIDTH_M       = 0.0255;
static constexpr double DEFAULT_THICKNESS_M   = 0.0008;
static constexpr double DEFAULT_DENSITY_KG_M3 = 7700.0;

static constexpr int DEFAULT_TRIALS_PER_LENGTH = 3;

}  // namespace beamvib::constants
