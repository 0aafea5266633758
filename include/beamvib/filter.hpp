#pragma once

/// @file include/beamvib/filter.hpp
/// @brief Butterworth low-pass design and zero-phase IIR filtering.
///
/// # Module: Butterworth Filter
///
/// ## Responsibility
/// Design a digital Butterworth low-pass filter of arbitrary order and apply
/// it forward and backward over a finite signal (zero-phase filtering).
///
/// ## Design Procedure
///   1. Analog prototype poles  p_k = −exp(jπ·m/(2N)),  m = −N+1, −N+3, …, N−1
///   2. Pre-warp the cutoff      Ω_c = 4·tan(π·W_n / 2)     (fs normalised to 2)
///   3. Scale poles              p_k ← Ω_c · p_k
///   4. Bilinear transform       z_k = (4 + p_k) / (4 − p_k),  N zeros at z = −1
///   5. Pair conjugate poles into second-order sections, each with unit DC
///      gain; an odd order adds one first-order section for the real pole
///
/// `W_n` is the cutoff relative to Nyquist, so W_n ∈ (0, 1).
///
/// The cascade stays well conditioned at every accepted order. Expanding it
/// into a single b/a polynomial (`to_transfer_function`) does not: with poles
/// clustered near z = 1 the expanded form loses its DC gain from around
/// order 8 at low cutoffs, so filtering always runs section by section.
///
/// ## Zero-phase Filtering
/// `sosfiltfilt` pads both ends with an odd reflection of 3·(N + 1)
/// samples, seeds every section with its steady-state response to the first
/// padded sample, runs forward, then backward. The result has no phase lag
/// and an effective magnitude response |H|².
///
/// ## Guarantees
/// - All methods are static and `noexcept`
/// - Invalid designs return `nullopt`; nothing throws

#include <array>
#include <optional>
#include <span>
#include <vector>

namespace beamvib::signal {

/// Transfer-function coefficients, normalised so that a[0] == 1.
struct FilterCoefficients {
    std::vector<double> b;  ///< Numerator (feed-forward)
    std::vector<double> a;  ///< Denominator (feedback)

    /// Filter order = len(a) − 1.
    [[nodiscard]] int order() const noexcept {
        return a.empty() ? 0 : static_cast<int>(a.size()) - 1;
    }
};

/// One second-order section, b0 + b1·z⁻¹ + b2·z⁻² over 1 + a1·z⁻¹ + a2·z⁻².
/// A first-order section has b2 == a2 == 0.
struct Biquad {
    std::array<double, 3> b{0.0, 0.0, 0.0};
    std::array<double, 3> a{1.0, 0.0, 0.0};

    [[nodiscard]] bool first_order() const noexcept {
        return b[2] == 0.0 && a[2] == 0.0;
    }
};

/// Direct-form II transposed state of one section.
using SectionState = std::array<double, 2>;

/// Cascade of sections applied in order.
struct SecondOrderSections {
    std::vector<Biquad> sections;

    /// Overall filter order: 2 per section, 1 per first-order section.
    [[nodiscard]] int order() const noexcept {
        int n = 0;
        for (const auto& s : sections) n += s.first_order() ? 1 : 2;
        return n;
    }
};

class ButterworthFilter {
public:
    ButterworthFilter() = delete;

    /// Design an order-N digital low-pass Butterworth filter.
    ///
    /// # Arguments
    /// * `order`             — N ≥ 1, at most MAX_FILTER_ORDER
    /// * `normalized_cutoff` — cutoff / Nyquist, strictly inside (0, 1)
    ///
    /// # Returns
    /// ⌈N/2⌉ sections, each with unit DC gain, or `nullopt` when either
    /// argument is out of range or non-finite.
    [[nodiscard]] static std::optional<SecondOrderSections>
    design_lowpass(int order, double normalized_cutoff) noexcept;

    /// Multiply the sections out into a single b/a pair.
    [[nodiscard]] static FilterCoefficients
    to_transfer_function(const SecondOrderSections& sos) noexcept;

    /// Single-pass IIR filter, direct form II transposed.
    ///
    /// `zi` is the initial state (length order()); pass an empty span for a
    /// zero initial state.
    [[nodiscard]] static std::vector<double>
    lfilter(const FilterCoefficients& coeffs,
            std::span<const double> x,
            std::span<const double> zi = {}) noexcept;

    /// Steady-state filter state for a unit step input.
    ///
    /// Solves (I − Aᵀ)·zi = b[1:] − a[1:]·b[0], where A is the companion
    /// matrix of `a`. Scale by the first input sample to start the filter
    /// without a transient.
    ///
    /// # Returns
    /// `nullopt` if the system is singular (filter has a pole at z = 1).
    [[nodiscard]] static std::optional<std::vector<double>>
    lfilter_zi(const FilterCoefficients& coeffs) noexcept;

    /// Zero-phase forward-backward filtering of a b/a filter.
    ///
    /// Pads 3·max(len a, len b) samples at each end; signals shorter than
    /// that are padded with n − 1 samples instead. An empty input yields an
    /// empty output.
    ///
    /// # Returns
    /// Filtered signal of the same length, or `nullopt` if the initial
    /// conditions cannot be computed.
    [[nodiscard]] static std::optional<std::vector<double>>
    filtfilt(const FilterCoefficients& coeffs,
             std::span<const double> x) noexcept;

    /// Run the cascade once over `x`. `zi` holds one state per section;
    /// an empty span starts every section at rest.
    [[nodiscard]] static std::vector<double>
    sosfilt(const SecondOrderSections& sos,
            std::span<const double> x,
            std::span<const SectionState> zi = {}) noexcept;

    /// Per-section steady state for a unit step into the cascade. Each
    /// section's state is scaled by the DC gain of the sections before it.
    ///
    /// # Returns
    /// `nullopt` if any section has a pole at z = 1.
    [[nodiscard]] static std::optional<std::vector<SectionState>>
    sosfilt_zi(const SecondOrderSections& sos) noexcept;

    /// Zero-phase forward-backward filtering of the cascade.
    ///
    /// Pads 3·(order + 1) samples at each end, shrunk to n − 1 for short
    /// signals. An empty input yields an empty output.
    [[nodiscard]] static std::optional<std::vector<double>>
    sosfiltfilt(const SecondOrderSections& sos,
                std::span<const double> x) noexcept;

    /// |H(e^{jω})| at ω = π·normalized_frequency (0 = DC, 1 = Nyquist).
    [[nodiscard]] static double
    gain_at(const FilterCoefficients& coeffs,
            double normalized_frequency) noexcept;

    /// Cascade gain, the product of the section gains.
    [[nodiscard]] static double
    gain_at(const SecondOrderSections& sos,
            double normalized_frequency) noexcept;
};

}  // namespace beamvib::signal
