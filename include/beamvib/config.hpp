#pragma once

/// @file include/beamvib/config.hpp
/// @brief RunConfig — command-line configuration of one analysis run.
///
/// Every option has a default matching the rig's standard setup, so running
/// the tool with no flags analyses `data/120mm_Trial_{1..3}.csv` etc. and
/// writes into `output/`.
///
///   --input DIR          trial CSV directory            (data)
///   --output DIR         report / trace directory       (output)
///   --lengths L1,L2,...  beam lengths in mm             (120,160,200)
///   --trials N           trials per length              (3)
///   --cutoff HZ          low-pass cutoff                (70)
///   --sample-rate HZ     acquisition rate               (5000)
///   --order N            Butterworth order              (4)
///   --crop F             crop fraction of peak, (0, 1]  (0.1)
///   --width M            beam width                     (0.0255)
///   --thickness M        beam thickness                 (0.0008)
///   --density KG_M3      material density               (7700)
///   --method period|count  frequency estimator          (period)
///   --no-report          skip beam_analysis.csv
///   --trace              write filtered / cropped series per trial
///   --verbose            per-trial diagnostics on stderr
///   --help

#include "beamvib/analyzer.hpp"
#include "beamvib/constants.hpp"

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace beamvib::core {

struct RunConfig {
    std::filesystem::path input_dir  = "data";
    std::filesystem::path output_dir = "output";

    std::vector<double> lengths_mm{120.0, 160.0, 200.0};
    int                 trials_per_length = constants::DEFAULT_TRIALS_PER_LENGTH;

    AnalysisConfig analysis{};

    bool write_report = true;
    bool write_traces = false;
    bool verbose      = false;
    bool show_help    = false;
};

/// Parse command-line arguments (without the program name).
///
/// # Returns
/// The configuration, or `nullopt` after printing the offending argument to
/// stderr. Range checks cover only what the CLI can decide on its own
/// (trial count, non-empty length list); filter and geometry limits are
/// enforced per trial by the pipeline.
[[nodiscard]] std::optional<RunConfig>
parse_args(std::span<const std::string_view> args);

/// Parse "120,160,200" into lengths. Every entry must be a positive number.
[[nodiscard]] std::optional<std::vector<double>>
parse_lengths(std::string_view csv) noexcept;

/// Usage text for --help.
[[nodiscard]] std::string usage();

}  // namespace beamvib::core
