/// @file src/signal/window_cropper.cpp
/// @brief WindowCropper — peak-to-threshold decay window.

#include "beamvib/cropper.hpp"
#include "beamvib/constants.hpp"

#include <cmath>
#include <cstddef>

namespace beamvib::signal {

// ─── WindowCropper::locate ────────────────────────────────────────────────────

std::optional<CropBounds>
WindowCropper::locate(const ConditionedSignal& signal, double crop_fraction) noexcept {
    if (!std::isfinite(crop_fraction) || crop_fraction <= 0.0 || crop_fraction > 1.0) {
        return std::nullopt;
    }
    if (signal.empty() || signal.time.size() != signal.amplitude.size()) {
        return std::nullopt;
    }

    // First index of maximum |amplitude|.
    std::size_t peak = 0;
    double peak_abs = std::abs(signal.amplitude[0]);
    for (std::size_t i = 1; i < signal.size(); ++i) {
        const double a = std::abs(signal.amplitude[i]);
        if (a > peak_abs) {
            peak_abs = a;
            peak = i;
        }
    }
    if (!std::isfinite(peak_abs) || peak_abs <= 0.0) {
        return std::nullopt;
    }

    const double threshold = crop_fraction * peak_abs;

    std::size_t end = peak;
    for (std::size_t i = peak + 1; i < signal.size(); ++i) {
        if (std::abs(signal.amplitude[i]) > threshold) {
            end = i;
        }
    }

    return CropBounds{.peak_index = peak, .end_index = end};
}

// ─── WindowCropper::crop ──────────────────────────────────────────────────────

std::optional<CroppedWindow>
WindowCropper::crop(const ConditionedSignal& signal, double crop_fraction) noexcept {
    const auto bounds = locate(signal, crop_fraction);
    if (!bounds || bounds->length() < constants::MIN_WINDOW_SAMPLES) {
        return std::nullopt;
    }

    const auto first = static_cast<std::ptrdiff_t>(bounds->peak_index);
    const auto last  = static_cast<std::ptrdiff_t>(bounds->end_index) + 1;

    return CroppedWindow{
        .amplitude      = std::vector<double>(signal.amplitude.begin() + first,
                                              signal.amplitude.begin() + last),
        .time           = std::vector<double>(signal.time.begin() + first,
                                              signal.time.begin() + last),
        .start_index    = bounds->peak_index,
        .peak_amplitude = std::abs(signal.amplitude[bounds->peak_index]),
    };
}

}  // namespace beamvib::signal
