#pragma once

/// @file include/beamvib/analyzer.hpp
/// @brief TrialAnalyzer — one trial through the full pipeline.
///
/// # Module: Trial Analyzer
///
/// ## Responsibility
/// Run a RawTrial through
///   SignalConditioner → WindowCropper → FrequencyEstimator → ModulusCalculator
/// and fold the outcome into a single TrialResult.
///
/// ## Failure Isolation
/// Every stage failure maps to a TrialStatus; nothing throws and nothing
/// aborts. A batch loop can call `analyze` on every trial unconditionally.
///
///   | Stage failure          | Status                 |
///   |------------------------|------------------------|
///   | filter spec rejected   | InvalidFilterSpec      |
///   | crop window < 2        | EmptyCropWindow        |
///   | < 2 same-dir crossings | InsufficientCrossings  |
///   | geometry / length ≤ 0  | InvalidGeometry        |
///
/// ## Usage
/// ```cpp
/// TrialAnalyzer analyzer(AnalysisConfig{});
/// ResultAggregator agg;
/// for (const auto& trial : trials) agg.add(analyzer.analyze(trial));
/// ```
///
/// ## Guarantees
/// - `analyze` and `trace` are const: one analyzer may serve many threads

#include "beamvib/types.hpp"
#include "beamvib/constants.hpp"
#include "beamvib/conditioner.hpp"
#include "beamvib/frequency.hpp"

#include <optional>

namespace beamvib::core {

/// Everything shared by all trials of one run.
struct AnalysisConfig {
    signal::FilterSpec filter{};

    /// Fraction of the peak amplitude that ends the decay window, in (0, 1].
    double crop_fraction = constants::DEFAULT_CROP_FRACTION;

    BeamGeometry geometry{
        .width_m       = constants::DEFAULT_WIDTH_M,
        .thickness_m   = constants::DEFAULT_THICKNESS_M,
        .density_kg_m3 = constants::DEFAULT_DENSITY_KG_M3,
    };

    frequency::FrequencyMethod method = frequency::FrequencyMethod::PeriodAverage;
};

/// TrialResult plus the intermediate series, for export and inspection.
/// `conditioned` is absent when the filter spec was rejected; `window` is
/// absent when cropping produced nothing.
struct TrialTrace {
    TrialResult                      result;
    std::optional<ConditionedSignal> conditioned;
    std::optional<CroppedWindow>     window;
};

class TrialAnalyzer {
public:
    explicit TrialAnalyzer(AnalysisConfig config = AnalysisConfig{});

    /// Analyse one trial.
    [[nodiscard]] TrialResult analyze(const RawTrial& raw) const noexcept;

    /// Analyse one trial and keep the conditioned and cropped series.
    [[nodiscard]] TrialTrace trace(const RawTrial& raw) const noexcept;

    [[nodiscard]] const AnalysisConfig& config() const noexcept { return config_; }

private:
    /// Result record with no measurement and the given failure status.
    [[nodiscard]] static TrialResult
    failed(const TrialId& id, TrialStatus status) noexcept;

    AnalysisConfig config_;
};

}  // namespace beamvib::core
