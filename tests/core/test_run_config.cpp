#include <gtest/gtest.h>
#include "beamvib/config.hpp"
#include "beamvib/constants.hpp"
#include <string_view>
#include <vector>

using namespace beamvib;
using namespace beamvib::core;

namespace {

std::optional<RunConfig> parse(std::vector<std::string_view> args) {
    return parse_args(args);
}

}  // namespace

// ─── Defaults ─────────────────────────────────────────────────────────────────

TEST(RunConfig_Defaults, NoArgumentsGivesRigDefaults) {
    const auto cfg = parse({});
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->input_dir.string(), "data");
    EXPECT_EQ(cfg->output_dir.string(), "output");
    EXPECT_EQ(cfg->lengths_mm, (std::vector<double>{120.0, 160.0, 200.0}));
    EXPECT_EQ(cfg->trials_per_length, 3);
    EXPECT_DOUBLE_EQ(cfg->analysis.filter.cutoff_hz, 70.0);
    EXPECT_DOUBLE_EQ(cfg->analysis.filter.sample_rate_hz, 5000.0);
    EXPECT_EQ(cfg->analysis.filter.order, 4);
    EXPECT_DOUBLE_EQ(cfg->analysis.crop_fraction, 0.1);
    EXPECT_DOUBLE_EQ(cfg->analysis.geometry.width_m, 0.0255);
    EXPECT_DOUBLE_EQ(cfg->analysis.geometry.thickness_m, 0.0008);
    EXPECT_DOUBLE_EQ(cfg->analysis.geometry.density_kg_m3, 7700.0);
    EXPECT_EQ(cfg->analysis.method, frequency::FrequencyMethod::PeriodAverage);
    EXPECT_TRUE(cfg->write_report);
    EXPECT_FALSE(cfg->write_traces);
    EXPECT_FALSE(cfg->verbose);
    EXPECT_FALSE(cfg->show_help);
}

// ─── Flags ────────────────────────────────────────────────────────────────────

TEST(RunConfig_Flags, EveryOptionParsed) {
    const auto cfg = parse({"--input", "rig", "--output", "out", "--lengths", "100,150.5",
                            "--trials", "5", "--cutoff", "50", "--sample-rate", "2000",
                            "--order", "6", "--crop", "0.2", "--width", "0.02",
                            "--thickness", "0.001", "--density", "2700",
                            "--method", "count", "--no-report", "--trace", "--verbose"});
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->input_dir.string(), "rig");
    EXPECT_EQ(cfg->output_dir.string(), "out");
    EXPECT_EQ(cfg->lengths_mm, (std::vector<double>{100.0, 150.5}));
    EXPECT_EQ(cfg->trials_per_length, 5);
    EXPECT_DOUBLE_EQ(cfg->analysis.filter.cutoff_hz, 50.0);
    EXPECT_DOUBLE_EQ(cfg->analysis.filter.sample_rate_hz, 2000.0);
    EXPECT_EQ(cfg->analysis.filter.order, 6);
    EXPECT_DOUBLE_EQ(cfg->analysis.crop_fraction, 0.2);
    EXPECT_DOUBLE_EQ(cfg->analysis.geometry.width_m, 0.02);
    EXPECT_DOUBLE_EQ(cfg->analysis.geometry.thickness_m, 0.001);
    EXPECT_DOUBLE_EQ(cfg->analysis.geometry.density_kg_m3, 2700.0);
    EXPECT_EQ(cfg->analysis.method, frequency::FrequencyMethod::CrossingCount);
    EXPECT_FALSE(cfg->write_report);
    EXPECT_TRUE(cfg->write_traces);
    EXPECT_TRUE(cfg->verbose);
}

TEST(RunConfig_Flags, HelpSetsFlag) {
    const auto cfg = parse({"--help"});
    ASSERT_TRUE(cfg.has_value());
    EXPECT_TRUE(cfg->show_help);
}

TEST(RunConfig_Flags, OutOfRangeFilterStillParses) {
    // Range checks happen per trial, not at parse time.
    const auto cfg = parse({"--cutoff", "4000"});
    ASSERT_TRUE(cfg.has_value());
    EXPECT_DOUBLE_EQ(cfg->analysis.filter.cutoff_hz, 4000.0);
}

// ─── Errors ───────────────────────────────────────────────────────────────────

TEST(RunConfig_Errors, UnknownOption) {
    EXPECT_FALSE(parse({"--frobnicate"}).has_value());
}

TEST(RunConfig_Errors, MissingValue) {
    EXPECT_FALSE(parse({"--cutoff"}).has_value());
    EXPECT_FALSE(parse({"--input"}).has_value());
}

TEST(RunConfig_Errors, NonNumericValue) {
    EXPECT_FALSE(parse({"--cutoff", "seventy"}).has_value());
    EXPECT_FALSE(parse({"--order", "4.5"}).has_value());
}

TEST(RunConfig_Errors, TrialsBelowOne) {
    EXPECT_FALSE(parse({"--trials", "0"}).has_value());
}

TEST(RunConfig_Errors, UnknownMethod) {
    EXPECT_FALSE(parse({"--method", "fft"}).has_value());
}

TEST(RunConfig_Errors, BadLengths) {
    EXPECT_FALSE(parse({"--lengths", "120,-5"}).has_value());
}

// ─── parse_lengths ────────────────────────────────────────────────────────────

TEST(RunConfig_Lengths, CommaSeparated) {
    const auto l = parse_lengths("120, 160 ,200");
    ASSERT_TRUE(l.has_value());
    EXPECT_EQ(*l, (std::vector<double>{120.0, 160.0, 200.0}));
}

TEST(RunConfig_Lengths, SingleValue) {
    const auto l = parse_lengths("87.5");
    ASSERT_TRUE(l.has_value());
    EXPECT_EQ(*l, (std::vector<double>{87.5}));
}

TEST(RunConfig_Lengths, Rejections) {
    for (const char* s : {"", "120,", ",120", "120,,160", "0", "abc", "120;160"}) {
        EXPECT_FALSE(parse_lengths(s).has_value()) << "'" << s << "'";
    }
}

// ─── usage ────────────────────────────────────────────────────────────────────

TEST(RunConfig_Usage, MentionsEveryFlag) {
    const auto u = usage();
    for (const char* flag : {"--input", "--output", "--lengths", "--trials", "--no-report",
                             "--trace", "--cutoff", "--sample-rate", "--order", "--crop",
                             "--method", "--width", "--thickness", "--density", "--verbose",
                             "--help"}) {
        EXPECT_NE(u.find(flag), std::string::npos) << flag;
    }
}
