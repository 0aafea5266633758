/// @file src/core/run_config.cpp
/// @brief Command-line parsing into RunConfig.

#include "beamvib/config.hpp"
#include "parse_detail.hpp"

#include <fmt/core.h>

#include <cstdio>
#include <utility>

namespace beamvib::core {

namespace {

/// Fetch the value following flag `args[i]`, advancing `i`.
[[nodiscard]] std::optional<std::string_view>
take_value(std::span<const std::string_view> args, std::size_t& i) {
    if (i + 1 >= args.size()) {
        fmt::print(stderr, "Error: {} requires a value\n", args[i]);
        return std::nullopt;
    }
    return args[++i];
}

[[nodiscard]] bool read_double(std::span<const std::string_view> args,
                               std::size_t& i, double& out) {
    const std::string_view flag = args[i];
    const auto raw = take_value(args, i);
    if (!raw) return false;
    const auto v = detail::parse_double(*raw);
    if (!v) {
        fmt::print(stderr, "Error: {} expects a number, got '{}'\n", flag, *raw);
        return false;
    }
    out = *v;
    return true;
}

[[nodiscard]] bool read_int(std::span<const std::string_view> args,
                            std::size_t& i, int& out) {
    const std::string_view flag = args[i];
    const auto raw = take_value(args, i);
    if (!raw) return false;
    const auto v = detail::parse_int(*raw);
    if (!v) {
        fmt::print(stderr, "Error: {} expects an integer, got '{}'\n", flag, *raw);
        return false;
    }
    out = *v;
    return true;
}

}  // namespace

// ─── parse_lengths ────────────────────────────────────────────────────────────

std::optional<std::vector<double>> parse_lengths(std::string_view csv) noexcept {
    std::vector<double> lengths;
    std::size_t pos = 0;
    while (pos <= csv.size()) {
        auto comma = csv.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = csv.size();
        }
        const auto v = detail::parse_double(csv.substr(pos, comma - pos));
        if (!v || *v <= 0.0) {
            return std::nullopt;
        }
        lengths.push_back(*v);
        pos = comma + 1;
    }
    if (lengths.empty()) {
        return std::nullopt;
    }
    return lengths;
}

// ─── usage ────────────────────────────────────────────────────────────────────

std::string usage() {
    return
        "Usage: beamvib [options]\n"
        "\n"
        "Estimate the fundamental frequency and Young's modulus of a cantilever\n"
        "beam from free-vibration recordings named <L>mm_Trial_<N>.csv.\n"
        "\n"
        "Input / output:\n"
        "  --input DIR            trial CSV directory              [data]\n"
        "  --output DIR           report and trace directory       [output]\n"
        "  --lengths L1,L2,...    beam lengths in mm               [120,160,200]\n"
        "  --trials N             trials per length                [3]\n"
        "  --no-report            do not write beam_analysis.csv\n"
        "  --trace                write filtered/cropped series per trial\n"
        "\n"
        "Signal processing:\n"
        "  --cutoff HZ            low-pass cutoff frequency        [70]\n"
        "  --sample-rate HZ       sampling rate                    [5000]\n"
        "  --order N              Butterworth filter order         [4]\n"
        "  --crop F               crop fraction of peak amplitude  [0.1]\n"
        "  --method period|count  frequency estimator              [period]\n"
        "\n"
        "Beam:\n"
        "  --width M              beam width                       [0.0255]\n"
        "  --thickness M          beam thickness                   [0.0008]\n"
        "  --density KG_M3        material density                 [7700]\n"
        "\n"
        "  --verbose              per-trial diagnostics on stderr\n"
        "  --help                 show this help\n"
        "\n"
        "Trial CSV format (header required):\n"
        "  quantisation_level,time_s\n";
}

// ─── parse_args ───────────────────────────────────────────────────────────────

std::optional<RunConfig> parse_args(std::span<const std::string_view> args) {
    RunConfig cfg;
    auto& an = cfg.analysis;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string_view a = args[i];
        bool ok = true;

        if (a == "--help" || a == "-h") {
            cfg.show_help = true;
        } else if (a == "--input") {
            const auto v = take_value(args, i);
            ok = v.has_value();
            if (ok) cfg.input_dir = std::filesystem::path(std::string(*v));
        } else if (a == "--output") {
            const auto v = take_value(args, i);
            ok = v.has_value();
            if (ok) cfg.output_dir = std::filesystem::path(std::string(*v));
        } else if (a == "--lengths") {
            const auto v = take_value(args, i);
            ok = v.has_value();
            if (ok) {
                auto lengths = parse_lengths(*v);
                if (!lengths) {
                    fmt::print(stderr, "Error: --lengths expects positive numbers, got '{}'\n", *v);
                    ok = false;
                } else {
                    cfg.lengths_mm = std::move(*lengths);
                }
            }
        } else if (a == "--trials") {
            ok = read_int(args, i, cfg.trials_per_length);
            if (ok && cfg.trials_per_length < 1) {
                fmt::print(stderr, "Error: --trials must be at least 1\n");
                ok = false;
            }
        } else if (a == "--cutoff") {
            ok = read_double(args, i, an.filter.cutoff_hz);
        } else if (a == "--sample-rate") {
            ok = read_double(args, i, an.filter.sample_rate_hz);
        } else if (a == "--order") {
            ok = read_int(args, i, an.filter.order);
        } else if (a == "--crop") {
            ok = read_double(args, i, an.crop_fraction);
        } else if (a == "--width") {
            ok = read_double(args, i, an.geometry.width_m);
        } else if (a == "--thickness") {
            ok = read_double(args, i, an.geometry.thickness_m);
        } else if (a == "--density") {
            ok = read_double(args, i, an.geometry.density_kg_m3);
        } else if (a == "--method") {
            const auto v = take_value(args, i);
            ok = v.has_value();
            if (ok) {
                const auto m = frequency::parse_frequency_method(*v);
                if (!m) {
                    fmt::print(stderr, "Error: --method expects 'period' or 'count', got '{}'\n", *v);
                    ok = false;
                } else {
                    an.method = *m;
                }
            }
        } else if (a == "--no-report") {
            cfg.write_report = false;
        } else if (a == "--trace") {
            cfg.write_traces = true;
        } else if (a == "--verbose" || a == "-v") {
            cfg.verbose = true;
        } else {
            fmt::print(stderr, "Error: unknown option '{}'\n", a);
            ok = false;
        }

        if (!ok) {
            return std::nullopt;
        }
    }

    return cfg;
}

}  // namespace beamvib::core
