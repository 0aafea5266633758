#pragma once

/// @file include/beamvib/types.hpp
/// @brief Shared value types for the beam vibration modulus analyzer.
///
/// Every pipeline stage exchanges one of the records below. All of them are
/// plain value types: the caller owns the RawTrial, the pipeline owns the
/// intermediate signals, and ResultAggregator keeps the TrialResults.

#include <cstddef>
#include <optional>
#include <vector>

namespace beamvib {

// ─── Samples ──────────────────────────────────────────────────────────────────

/// One recorded sample: sensor reading and its timestamp.
struct Sample {
    double value;  ///< Quantisation level (raw) or amplitude (conditioned)
    double time;   ///< Seconds since the start of the recording
};

/// Identifies one trial: beam length plus repetition index.
struct TrialId {
    double beam_length_mm;  ///< Free length of the cantilever, millimetres (> 0)
    int    trial_index;     ///< 1-based repetition index
};

/// A complete free-vibration recording as handed over by the loader.
/// Times are non-decreasing; at least 2 samples for a meaningful analysis.
struct RawTrial {
    TrialId             id;
    std::vector<Sample> samples;
};

// ─── Derived signals ──────────────────────────────────────────────────────────

/// Centered and low-pass filtered signal.
/// Same cardinality and timestamps as the RawTrial it came from.
struct ConditionedSignal {
    std::vector<double> amplitude;
    std::vector<double> time;

    [[nodiscard]] std::size_t size() const noexcept { return amplitude.size(); }
    [[nodiscard]] bool empty() const noexcept { return amplitude.empty(); }
};

/// Decay segment of a ConditionedSignal, from the excitation peak to the
/// last sample still above the crop threshold. Always holds ≥ 2 samples.
struct CroppedWindow {
    std::vector<double> amplitude;
    std::vector<double> time;
    std::size_t         start_index;     ///< Offset of amplitude[0] in the conditioned signal
    double              peak_amplitude;  ///< |amplitude| at the peak sample

    [[nodiscard]] std::size_t size() const noexcept { return amplitude.size(); }
};

// ─── Configuration ────────────────────────────────────────────────────────────

/// Cross-section and material of the beam, constant for one run.
struct BeamGeometry {
    double width_m;
    double thickness_m;
    double density_kg_m3;
};

// ─── Results ──────────────────────────────────────────────────────────────────

/// Outcome of analysing one trial.
enum class TrialStatus {
    Ok,                     ///< Frequency and modulus are present
    InvalidFilterSpec,      ///< Cutoff / order / sample rate out of range
    EmptyCropWindow,        ///< Fewer than 2 samples above the crop threshold
    InsufficientCrossings,  ///< Fewer than 2 same-direction zero crossings
    InvalidGeometry,        ///< Non-positive physical parameter or frequency
};

/// snake_case name of a TrialStatus, e.g. "insufficient_crossings".
[[nodiscard]] const char* to_string(TrialStatus s) noexcept;

/// Per-trial record. frequency_hz and modulus_pa are set iff status == Ok.
struct TrialResult {
    double                beam_length_mm;
    int                   trial_index;
    std::optional<double> frequency_hz;
    std::optional<double> modulus_pa;
    TrialStatus           status;

    [[nodiscard]] bool ok() const noexcept { return status == TrialStatus::Ok; }
};

/// Statistics over the trials of one beam length.
/// Means are absent (not zero) when no trial of this length succeeded.
struct LengthSummary {
    double                beam_length_mm;
    std::optional<double> mean_frequency_hz;
    std::optional<double> mean_modulus_pa;
    std::optional<double> modulus_stddev_pa;  ///< Sample stddev, needs ≥ 2 ok trials
    std::size_t           trial_count_ok;
    std::size_t           trial_count_total;
};

/// Statistics over every trial of the run.
struct OverallSummary {
    std::optional<double> mean_modulus_pa;
    std::size_t           total_trials;
    std::size_t           ok_trials;
};

}  // namespace beamvib
