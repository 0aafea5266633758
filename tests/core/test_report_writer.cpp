#include <gtest/gtest.h>
#include "beamvib/report.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace beamvib;
using namespace beamvib::core;

namespace fs = std::filesystem;

namespace {

TrialResult ok_result(double length_mm, int trial, double freq_hz, double modulus_pa) {
    return TrialResult{length_mm, trial, freq_hz, modulus_pa, TrialStatus::Ok};
}

TrialResult failed_result(double length_mm, int trial, TrialStatus status) {
    return TrialResult{length_mm, trial, std::nullopt, std::nullopt, status};
}

std::string slurp(const fs::path& p) {
    std::ifstream in(p);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace

// ─── analysis_table ───────────────────────────────────────────────────────────

TEST(Report_Table, MixedOutcomes) {
    const std::vector<TrialResult> results{
        ok_result(120.0, 1, 12.34, 14558130110.515633),
        failed_result(120.0, 2, TrialStatus::InsufficientCrossings),
        failed_result(160.0, 1, TrialStatus::EmptyCropWindow),
    };
    const std::vector<LengthSummary> summaries{
        {120.0, 12.34, 14558130110.515633, std::nullopt, 1, 2},
        {160.0, std::nullopt, std::nullopt, std::nullopt, 0, 1},
    };
    const OverallSummary overall{14558130110.515633, 3, 1};

    const std::string expected =
        "Length(mm),Trial,Frequency(Hz),Young's Modulus(GPa),Status\n"
        "120,1,12.34,14.56,ok\n"
        "120,2,,,insufficient_crossings\n"
        "120,avg,,14.56,\n"
        "160,1,,,empty_crop_window\n"
        "overall,,,14.56,\n";
    EXPECT_EQ(ReportWriter::analysis_table(results, summaries, overall), expected);
}

TEST(Report_Table, NoValidTrialsHasNoOverallRow) {
    const std::vector<TrialResult> results{
        failed_result(200.0, 1, TrialStatus::InvalidGeometry),
    };
    const std::vector<LengthSummary> summaries{
        {200.0, std::nullopt, std::nullopt, std::nullopt, 0, 1},
    };
    const OverallSummary overall{std::nullopt, 1, 0};

    EXPECT_EQ(ReportWriter::analysis_table(results, summaries, overall),
              "Length(mm),Trial,Frequency(Hz),Young's Modulus(GPa),Status\n"
              "200,1,,,invalid_geometry\n");
}

TEST(Report_Table, RowsFollowSummaryOrder) {
    const std::vector<TrialResult> results{
        ok_result(200.0, 1, 16.47, 200e9),
        ok_result(120.0, 1, 45.74, 200e9),
    };
    const std::vector<LengthSummary> summaries{
        {120.0, 45.74, 200e9, std::nullopt, 1, 1},
        {200.0, 16.47, 200e9, std::nullopt, 1, 1},
    };
    const OverallSummary overall{200e9, 2, 2};

    const auto table = ReportWriter::analysis_table(results, summaries, overall);
    EXPECT_LT(table.find("120,1,"), table.find("200,1,"));
}

TEST(Report_Table, AverageRowLeavesFrequencyBlank) {
    const std::vector<TrialResult> results{
        ok_result(160.0, 1, 25.70, 199e9),
        ok_result(160.0, 2, 25.76, 201e9),
    };
    const std::vector<LengthSummary> summaries{
        {160.0, 25.73, 200e9, 1.41e9, 2, 2},
    };
    const OverallSummary overall{200e9, 2, 2};

    const auto table = ReportWriter::analysis_table(results, summaries, overall);
    EXPECT_NE(table.find("\n160,avg,,200.00,\n"), std::string::npos);
    EXPECT_EQ(table.find("25.73"), std::string::npos);
}

TEST(Report_Table, EmptyHasHeaderOnly) {
    EXPECT_EQ(ReportWriter::analysis_table({}, {}, OverallSummary{std::nullopt, 0, 0}),
              "Length(mm),Trial,Frequency(Hz),Young's Modulus(GPa),Status\n");
}

// ─── trace_csv ────────────────────────────────────────────────────────────────

TEST(Report_Trace, TimeThenAmplitude) {
    const std::vector<double> t{0.0, 0.5};
    const std::vector<double> a{1.25, -2.0};
    EXPECT_EQ(ReportWriter::trace_csv(t, a), "time,amplitude\n0,1.25\n0.5,-2\n");
}

TEST(Report_Trace, MismatchedLengthsTruncate) {
    const std::vector<double> t{0.0, 1.0, 2.0};
    const std::vector<double> a{3.0};
    EXPECT_EQ(ReportWriter::trace_csv(t, a), "time,amplitude\n0,3\n");
}

// ─── Console lines ────────────────────────────────────────────────────────────

TEST(Report_Lines, OkTrial) {
    EXPECT_EQ(ReportWriter::trial_line(ok_result(120.0, 1, 12.34, 14558130110.515633)),
              "120mm Trial 1: f=12.34Hz, E=14.56GPa");
}

TEST(Report_Lines, SkippedTrialNamesStatus) {
    EXPECT_EQ(ReportWriter::trial_line(failed_result(160.0, 3, TrialStatus::EmptyCropWindow)),
              "160mm Trial 3: skipped (empty_crop_window)");
}

TEST(Report_Lines, LengthWithSpread) {
    const LengthSummary s{120.0, 45.74, 200e9, 1.5e9, 3, 3};
    EXPECT_EQ(ReportWriter::length_line(s),
              "120mm: mean f=45.74Hz, mean E=200.00GPa ± 1.50GPa (3/3 ok)");
}

TEST(Report_Lines, LengthWithoutSpread) {
    const LengthSummary s{160.0, 25.73, 199.5e9, std::nullopt, 1, 3};
    EXPECT_EQ(ReportWriter::length_line(s),
              "160mm: mean f=25.73Hz, mean E=199.50GPa (1/3 ok)");
}

TEST(Report_Lines, LengthWithNoValidTrials) {
    const LengthSummary s{200.0, std::nullopt, std::nullopt, std::nullopt, 0, 3};
    EXPECT_EQ(ReportWriter::length_line(s), "200mm: no valid trials (0/3 ok)");
}

TEST(Report_Lines, Overall) {
    EXPECT_EQ(ReportWriter::overall_line(OverallSummary{201.234e9, 9, 7}),
              "Overall: E=201.23GPa (7/9 ok)");
    EXPECT_EQ(ReportWriter::overall_line(OverallSummary{std::nullopt, 9, 0}),
              "Overall: no valid trials (0/9 ok)");
}

// ─── File output ──────────────────────────────────────────────────────────────

TEST(Report_Files, WriteTableMatchesString) {
    const auto path = fs::temp_directory_path() / "beamvib_report_table.csv";
    const std::vector<TrialResult> results{ok_result(120.0, 1, 45.74, 200e9)};
    const std::vector<LengthSummary> summaries{{120.0, 45.74, 200e9, std::nullopt, 1, 1}};
    const OverallSummary overall{200e9, 1, 1};

    ASSERT_TRUE(ReportWriter::write_table(path, results, summaries, overall));
    EXPECT_EQ(slurp(path), ReportWriter::analysis_table(results, summaries, overall));
    fs::remove(path);
}

TEST(Report_Files, UnwritablePathFails) {
    const auto path = fs::temp_directory_path() / "beamvib_no_such_dir" / "x" / "report.csv";
    const std::vector<double> t{0.0};
    EXPECT_FALSE(ReportWriter::write_trace(path, t, t));
}
