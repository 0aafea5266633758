/// @file src/core/trial_analyzer.cpp
/// @brief TrialAnalyzer — condition, crop, estimate, convert.

#include "beamvib/analyzer.hpp"
#include "beamvib/cropper.hpp"
#include "beamvib/modulus.hpp"

#include <utility>

namespace beamvib {

// ─── TrialStatus ──────────────────────────────────────────────────────────────

const char* to_string(TrialStatus s) noexcept {
    switch (s) {
        case TrialStatus::Ok:                    return "ok";
        case TrialStatus::InvalidFilterSpec:     return "invalid_filter_spec";
        case TrialStatus::EmptyCropWindow:       return "empty_crop_window";
        case TrialStatus::InsufficientCrossings: return "insufficient_crossings";
        case TrialStatus::InvalidGeometry:       return "invalid_geometry";
    }
    return "unknown";
}

}  // namespace beamvib

namespace beamvib::core {

// ─── TrialAnalyzer constructor ────────────────────────────────────────────────

TrialAnalyzer::TrialAnalyzer(AnalysisConfig config)
    : config_(std::move(config))
{}

// ─── TrialAnalyzer::failed ────────────────────────────────────────────────────

TrialResult TrialAnalyzer::failed(const TrialId& id, TrialStatus status) noexcept {
    return TrialResult{
        .beam_length_mm = id.beam_length_mm,
        .trial_index    = id.trial_index,
        .frequency_hz   = std::nullopt,
        .modulus_pa     = std::nullopt,
        .status         = status,
    };
}

// ─── TrialAnalyzer::trace ─────────────────────────────────────────────────────

TrialTrace TrialAnalyzer::trace(const RawTrial& raw) const noexcept {
    TrialTrace out{
        .result      = failed(raw.id, TrialStatus::InvalidFilterSpec),
        .conditioned = std::nullopt,
        .window      = std::nullopt,
    };

    // ── Step 1: de-bias and low-pass ──────────────────────────────────────────
    out.conditioned = signal::SignalConditioner::condition(raw, config_.filter);
    if (!out.conditioned) {
        return out;
    }

    // ── Step 2: decay window ──────────────────────────────────────────────────
    out.window = signal::WindowCropper::crop(*out.conditioned, config_.crop_fraction);
    if (!out.window) {
        out.result.status = TrialStatus::EmptyCropWindow;
        return out;
    }

    // ── Step 3: zero-crossing frequency ───────────────────────────────────────
    const auto freq = frequency::FrequencyEstimator::estimate(*out.window, config_.method);
    if (!freq) {
        out.result.status = TrialStatus::InsufficientCrossings;
        return out;
    }

    // ── Step 4: cantilever physics (length named in mm) ───────────────────────
    const double length_m = raw.id.beam_length_mm / constants::MM_PER_M;
    const auto modulus = physics::ModulusCalculator::compute_modulus(
        *freq, length_m, config_.geometry);
    if (!modulus) {
        out.result.status = TrialStatus::InvalidGeometry;
        return out;
    }

    out.result.frequency_hz = *freq;
    out.result.modulus_pa   = *modulus;
    out.result.status       = TrialStatus::Ok;
    return out;
}

// ─── TrialAnalyzer::analyze ───────────────────────────────────────────────────

TrialResult TrialAnalyzer::analyze(const RawTrial& raw) const noexcept {
    return trace(raw).result;
}

}  // namespace beamvib::core
