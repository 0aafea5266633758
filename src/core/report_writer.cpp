/// @file src/core/report_writer.cpp
/// @brief ReportWriter — CSV analysis table, signal traces, console lines.

#include "beamvib/report.hpp"
#include "beamvib/data_loader.hpp"
#include "beamvib/modulus.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <iterator>

namespace beamvib::core {

namespace {

using physics::ModulusCalculator;

/// Two-decimal cell, blank when absent.
[[nodiscard]] std::string cell(const std::optional<double>& v) {
    return v ? fmt::format("{:.2f}", *v) : std::string{};
}

[[nodiscard]] std::optional<double> in_gpa(const std::optional<double>& pa) {
    if (!pa) return std::nullopt;
    return ModulusCalculator::to_gigapascals(*pa);
}

}  // namespace

// ─── ReportWriter::analysis_table ─────────────────────────────────────────────

std::string ReportWriter::analysis_table(std::span<const TrialResult>   results,
                                         std::span<const LengthSummary> summaries,
                                         const OverallSummary&          overall) {
    std::string out = "Length(mm),Trial,Frequency(Hz),Young's Modulus(GPa),Status\n";
    auto it = std::back_inserter(out);

    for (const auto& summary : summaries) {
        const std::string length = TrialLoader::format_length(summary.beam_length_mm);

        for (const auto& r : results) {
            if (r.beam_length_mm != summary.beam_length_mm) continue;
            fmt::format_to(it, "{},{},{},{},{}\n",
                           length, r.trial_index,
                           cell(r.frequency_hz), cell(in_gpa(r.modulus_pa)),
                           to_string(r.status));
        }

        // Averages row carries the modulus only; the frequency cell stays blank.
        if (summary.trial_count_ok > 0) {
            fmt::format_to(it, "{},avg,,{},\n",
                           length, cell(in_gpa(summary.mean_modulus_pa)));
        }
    }

    if (overall.mean_modulus_pa) {
        fmt::format_to(it, "overall,,,{},\n", cell(in_gpa(overall.mean_modulus_pa)));
    }

    return out;
}

// ─── ReportWriter::trace_csv ──────────────────────────────────────────────────

std::string ReportWriter::trace_csv(std::span<const double> time,
                                    std::span<const double> amplitude) {
    std::string out = "time,amplitude\n";
    auto it = std::back_inserter(out);
    const std::size_t n = std::min(time.size(), amplitude.size());
    for (std::size_t i = 0; i < n; ++i) {
        fmt::format_to(it, "{},{}\n", time[i], amplitude[i]);
    }
    return out;
}

// ─── Console lines ────────────────────────────────────────────────────────────

std::string ReportWriter::trial_line(const TrialResult& result) {
    const std::string head = fmt::format("{}mm Trial {}",
                                         TrialLoader::format_length(result.beam_length_mm),
                                         result.trial_index);
    if (!result.ok() || !result.frequency_hz || !result.modulus_pa) {
        return fmt::format("{}: skipped ({})", head, to_string(result.status));
    }
    return fmt::format("{}: f={:.2f}Hz, E={:.2f}GPa", head,
                       *result.frequency_hz,
                       ModulusCalculator::to_gigapascals(*result.modulus_pa));
}

std::string ReportWriter::length_line(const LengthSummary& summary) {
    const std::string length = TrialLoader::format_length(summary.beam_length_mm);
    if (!summary.mean_modulus_pa || !summary.mean_frequency_hz) {
        return fmt::format("{}mm: no valid trials (0/{} ok)", length, summary.trial_count_total);
    }

    std::string spread;
    if (summary.modulus_stddev_pa) {
        spread = fmt::format(" ± {:.2f}GPa",
                             ModulusCalculator::to_gigapascals(*summary.modulus_stddev_pa));
    }
    return fmt::format("{}mm: mean f={:.2f}Hz, mean E={:.2f}GPa{} ({}/{} ok)",
                       length,
                       *summary.mean_frequency_hz,
                       ModulusCalculator::to_gigapascals(*summary.mean_modulus_pa),
                       spread,
                       summary.trial_count_ok, summary.trial_count_total);
}

std::string ReportWriter::overall_line(const OverallSummary& overall) {
    if (!overall.mean_modulus_pa) {
        return fmt::format("Overall: no valid trials (0/{} ok)", overall.total_trials);
    }
    return fmt::format("Overall: E={:.2f}GPa ({}/{} ok)",
                       ModulusCalculator::to_gigapascals(*overall.mean_modulus_pa),
                       overall.ok_trials, overall.total_trials);
}

// ─── File output ──────────────────────────────────────────────────────────────

bool ReportWriter::write_file(const std::filesystem::path& path,
                              const std::string& content) noexcept {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file << content;
    file.flush();
    return file.good();
}

bool ReportWriter::write_table(const std::filesystem::path&   path,
                               std::span<const TrialResult>   results,
                               std::span<const LengthSummary> summaries,
                               const OverallSummary&          overall) {
    return write_file(path, analysis_table(results, summaries, overall));
}

bool ReportWriter::write_trace(const std::filesystem::path& path,
                               std::span<const double>      time,
                               std::span<const double>      amplitude) {
    return write_file(path, trace_csv(time, amplitude));
}

}  // namespace beamvib::core
