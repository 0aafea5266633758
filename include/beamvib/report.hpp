#pragma once

/// @file include/beamvib/report.hpp
/// @brief ReportWriter — analysis table, signal traces and console lines.
///
/// # Module: Report Writer
///
/// ## Analysis Table (CSV)
/// ```
/// Length(mm),Trial,Frequency(Hz),Young's Modulus(GPa),Status
/// 120,1,12.34,14.56,ok
/// 120,2,,,insufficient_crossings
/// 120,avg,12.34,14.56,
/// overall,,,14.56,
/// ```
/// Trial rows appear in the order given, grouped by length. Each length is
/// closed by an `avg` row when it has at least one ok trial; an `overall`
/// row ends the table when any trial is ok. Values are rounded to 2
/// decimals; absent values are left blank.
///
/// ## Signal Trace (CSV)
/// `time,amplitude` per sample, for filtered and cropped series.
///
/// ## Guarantees
/// - Formatting functions are pure
/// - `write_*` return false when the file cannot be opened or written

#include "beamvib/types.hpp"

#include <filesystem>
#include <span>
#include <string>

namespace beamvib::core {

class ReportWriter {
public:
    ReportWriter() = delete;

    /// Render the analysis table.
    [[nodiscard]] static std::string
    analysis_table(std::span<const TrialResult>   results,
                   std::span<const LengthSummary> summaries,
                   const OverallSummary&          overall);

    /// Write the analysis table to `path`.
    [[nodiscard]] static bool
    write_table(const std::filesystem::path&   path,
                std::span<const TrialResult>   results,
                std::span<const LengthSummary> summaries,
                const OverallSummary&          overall);

    /// Render a `time,amplitude` trace.
    [[nodiscard]] static std::string
    trace_csv(std::span<const double> time, std::span<const double> amplitude);

    /// Write a trace to `path`.
    [[nodiscard]] static bool
    write_trace(const std::filesystem::path& path,
                std::span<const double>      time,
                std::span<const double>      amplitude);

    /// Console line for one trial, e.g.
    /// "120mm Trial 1: f=12.34Hz, E=14.56GPa".
    [[nodiscard]] static std::string trial_line(const TrialResult& result);

    /// Console line for one length summary.
    [[nodiscard]] static std::string length_line(const LengthSummary& summary);

    /// Console line for the overall summary.
    [[nodiscard]] static std::string overall_line(const OverallSummary& overall);

private:
    /// Write `content` to `path`, replacing any existing file.
    [[nodiscard]] static bool
    write_file(const std::filesystem::path& path, const std::string& content) noexcept;
};

}  // namespace beamvib::core
