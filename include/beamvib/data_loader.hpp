#pragma once

/// @file include/beamvib/data_loader.hpp
/// @brief TrialLoader — CSV trial recordings and their file-naming convention.
///
/// # Module: Trial Loader
///
/// ## Responsibility
/// Turn the rig's CSV exports into RawTrial values and locate them on disk.
///
/// ## File Naming
/// One file per trial, `<L>mm_Trial_<N>.csv`, e.g. `120mm_Trial_1.csv`.
/// Integral lengths are written without a fractional part.
///
/// ## Expected CSV Format
/// ```
/// Quantisation Level,Time (s)
/// 512,0.0000
/// 530,0.0002
/// ```
/// The first line is a header and is skipped. Column 0 is the sensor
/// quantisation level, column 1 the timestamp in seconds; any further
/// columns are ignored.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` on unrecoverable errors
/// - Skips blank, `#`-comment, malformed and non-finite rows individually

#include "beamvib/types.hpp"

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace beamvib::core {

/// A trial file expected on disk.
struct TrialFile {
    TrialId               id;
    std::filesystem::path path;
};

/// Outcome of scanning a data directory for the expected trials.
struct DiscoveryResult {
    std::vector<TrialFile> found;    ///< Existing files, length-then-trial order
    std::vector<TrialFile> missing;  ///< Expected but absent
};

class TrialLoader {
public:
    TrialLoader() = delete;

    /// Load one trial from disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - RawTrial with every valid row otherwise (possibly no samples)
    [[nodiscard]] static std::optional<RawTrial>
    load_csv(const std::filesystem::path& path, const TrialId& id) noexcept;

    /// Parse samples from CSV text (header line first).
    [[nodiscard]] static std::vector<Sample>
    parse_csv_string(std::string_view csv_content) noexcept;

    /// `<L>mm_Trial_<N>.csv` for the given trial.
    [[nodiscard]] static std::string trial_filename(const TrialId& id);

    /// Inverse of `trial_filename`. Accepts a bare file name or a path.
    ///
    /// # Returns
    /// `nullopt` unless the name matches the convention with L > 0, N ≥ 1.
    [[nodiscard]] static std::optional<TrialId>
    parse_trial_filename(std::string_view name) noexcept;

    /// Enumerate the trial files expected under `directory`.
    [[nodiscard]] static DiscoveryResult
    discover(const std::filesystem::path& directory,
             std::span<const double> lengths_mm,
             int trials_per_length);

    /// Format a length as in file names: "120", or "120.5" when fractional.
    [[nodiscard]] static std::string format_length(double length_mm);

private:
    /// Parse a single data row. `nullopt` if malformed or non-finite.
    [[nodiscard]] static std::optional<Sample>
    parse_row(std::string_view line) noexcept;
};

}  // namespace beamvib::core
