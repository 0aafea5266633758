#pragma once

/// @file include/beamvib/conditioner.hpp
/// @brief SignalConditioner — de-bias and low-pass a raw trial recording.
///
/// # Module: Signal Conditioner
///
/// ## Responsibility
/// Turn the sensor's quantisation levels into a zero-mean amplitude signal in
/// which the fundamental bending mode dominates:
///   1. subtract the arithmetic mean (static sensor bias)
///   2. zero-phase Butterworth low-pass at `cutoff_hz`
///
/// ## Edge Cases
/// - cutoff ≥ Nyquist, cutoff ≤ 0, order < 1, order > MAX_FILTER_ORDER,
///   non-positive sample rate, any non-finite parameter → `nullopt`
/// - empty trial → empty ConditionedSignal (the cropper rejects it)
///
/// ## Guarantees
/// - Sample count and timestamps are preserved
/// - Stateless; safe to call concurrently

#include "beamvib/types.hpp"
#include "beamvib/constants.hpp"

#include <optional>
#include <span>
#include <vector>

namespace beamvib::signal {

/// Low-pass filter parameters.
struct FilterSpec {
    double cutoff_hz      = constants::DEFAULT_CUTOFF_HZ;
    double sample_rate_hz = constants::DEFAULT_SAMPLE_RATE_HZ;
    int    order          = constants::DEFAULT_FILTER_ORDER;
};

class SignalConditioner {
public:
    SignalConditioner() = delete;

    /// Center and filter a raw trial.
    ///
    /// # Returns
    /// ConditionedSignal with the raw timestamps, or `nullopt` when `spec`
    /// is invalid (see `is_valid`).
    [[nodiscard]] static std::optional<ConditionedSignal>
    condition(const RawTrial& raw, const FilterSpec& spec) noexcept;

    /// True if the filter spec can be realised: finite values,
    /// 0 < cutoff < sample_rate/2 and 1 ≤ order ≤ MAX_FILTER_ORDER.
    [[nodiscard]] static bool is_valid(const FilterSpec& spec) noexcept;

    /// Subtract the arithmetic mean from every value.
    /// Empty input returns an empty vector.
    [[nodiscard]] static std::vector<double>
    center(std::span<const double> values) noexcept;
};

}  // namespace beamvib::signal
