#pragma once

/// @file include/beamvib/cropper.hpp
/// @brief WindowCropper — isolate the free-decay segment of a trial.
///
/// # Module: Window Cropper
///
/// ## Responsibility
/// Keep only the part of the conditioned signal that follows the impact and
/// still carries usable oscillation:
///   - start at the sample of maximum |amplitude| (the excitation peak)
///   - end at the last later sample with |amplitude| > crop_fraction·|peak|
///
/// Samples before the peak (settling, hand contact) are always discarded.
///
/// ## Edge Cases
/// - crop_fraction = 1: nothing exceeds the peak, so the bounds collapse to
///   the peak sample and `crop` reports an empty window
/// - signal that stays above threshold: window runs to the last sample
/// - empty or all-zero signal, crop_fraction ∉ (0, 1]: `nullopt`
///
/// An empty crop is a normal outcome (a barely-excited beam), not an error.

#include "beamvib/types.hpp"

#include <cstddef>
#include <optional>

namespace beamvib::signal {

/// Inclusive index range of a crop inside a ConditionedSignal.
struct CropBounds {
    std::size_t peak_index;
    std::size_t end_index;

    [[nodiscard]] std::size_t length() const noexcept { return end_index - peak_index + 1; }
};

class WindowCropper {
public:
    WindowCropper() = delete;

    /// Crop `signal` to its decay window.
    ///
    /// # Returns
    /// CroppedWindow with ≥ MIN_WINDOW_SAMPLES samples, or `nullopt`.
    [[nodiscard]] static std::optional<CroppedWindow>
    crop(const ConditionedSignal& signal, double crop_fraction) noexcept;

    /// Locate the crop bounds without copying samples.
    ///
    /// Unlike `crop`, a single-sample range (peak only) is returned as is.
    ///
    /// # Returns
    /// `nullopt` for an empty or all-zero signal or an invalid fraction.
    [[nodiscard]] static std::optional<CropBounds>
    locate(const ConditionedSignal& signal, double crop_fraction) noexcept;
};

}  // namespace beamvib::signal
