#pragma once

/// @file include/beamvib/frequency.hpp
/// @brief FrequencyEstimator — fundamental frequency from zero-crossing timing.
///
/// # Module: Frequency Estimator
///
/// ## Responsibility
/// Measure the oscillation frequency of a cropped decay window without a
/// spectral transform, from the instants at which the signal crosses zero.
///
/// ## Crossing Detection
/// A crossing lies between two consecutive non-zero samples of opposite sign.
/// Samples that are exactly zero are skipped, so a sample landing on the
/// axis yields one crossing, not two. The crossing instant is interpolated
/// linearly between the bracketing samples:
///
///     t* = t_a + (0 − y_a) · (t_b − t_a) / (y_b − y_a)
///
/// ## Period Averaging (default)
/// Rising crossings are paired with the next rising crossing, falling with
/// the next falling crossing. Each pair spans one full period; the periods of
/// both directions are pooled and
///
///     f = 1 / mean(periods)
///
/// ## Crossing Count (alternate)
/// The legacy rig estimator: n crossings over span T hold (n − 1)/2 cycles,
///
///     f = ((n − 1) / 2) / (t_last − t_first)
///
/// ## Edge Cases
/// - fewer than 2 same-direction crossings → `nullopt`
/// - non-finite samples are treated like zeros (skipped)

#include "beamvib/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace beamvib::frequency {

/// Sign change direction of a zero crossing.
enum class CrossingDirection {
    Rising,   ///< negative → positive
    Falling,  ///< positive → negative
};

/// One interpolated zero crossing.
struct ZeroCrossing {
    double            time;       ///< Interpolated crossing instant (s)
    std::size_t       index;      ///< Window index of the sample after the crossing
    CrossingDirection direction;
};

/// Frequency estimation strategy.
enum class FrequencyMethod {
    PeriodAverage,  ///< Mean of same-direction crossing intervals
    CrossingCount,  ///< (n − 1)/2 cycles over the first-to-last crossing span
};

[[nodiscard]] const char* to_string(FrequencyMethod m) noexcept;

/// Parse "period" or "count". Returns `nullopt` for anything else.
[[nodiscard]] std::optional<FrequencyMethod>
parse_frequency_method(std::string_view name) noexcept;

class FrequencyEstimator {
public:
    FrequencyEstimator() = delete;

    /// Estimate the dominant frequency of `window` in Hz.
    ///
    /// # Returns
    /// Positive finite frequency, or `nullopt` if the window contains fewer
    /// than 2 same-direction zero crossings.
    [[nodiscard]] static std::optional<double>
    estimate(const CroppedWindow& window,
             FrequencyMethod method = FrequencyMethod::PeriodAverage) noexcept;

    /// All zero crossings of the window in time order.
    [[nodiscard]] static std::vector<ZeroCrossing>
    detect_crossings(const CroppedWindow& window) noexcept;

    /// Full-period intervals: consecutive rising pairs followed by consecutive
    /// falling pairs.
    [[nodiscard]] static std::vector<double>
    period_intervals(std::span<const ZeroCrossing> crossings) noexcept;

private:
    [[nodiscard]] static std::optional<double>
    from_periods(std::span<const ZeroCrossing> crossings) noexcept;

    [[nodiscard]] static std::optional<double>
    from_count(std::span<const ZeroCrossing> crossings) noexcept;
};

}  // namespace beamvib::frequency
