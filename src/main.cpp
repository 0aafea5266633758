/// @file src/main.cpp
/// @brief beamvib CLI entry point.
///
/// Usage:
///   beamvib [--input DIR] [--lengths 120,160,200] [--trials 3] ...
///   beamvib --help
///
/// Loads every <L>mm_Trial_<N>.csv, analyses each trial independently,
/// prints per-trial and summary lines and writes output/beam_analysis.csv.

#include "beamvib/aggregator.hpp"
#include "beamvib/analyzer.hpp"
#include "beamvib/config.hpp"
#include "beamvib/data_loader.hpp"
#include "beamvib/frequency.hpp"
#include "beamvib/modulus.hpp"
#include "beamvib/report.hpp"

#include <fmt/core.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

using namespace beamvib;
using namespace beamvib::core;

/// Write the filtered and cropped series of one trial next to the report.
void write_traces(const RunConfig& cfg, const TrialTrace& trace) {
    const auto stem = fmt::format("{}mm_Trial{}",
                                  TrialLoader::format_length(trace.result.beam_length_mm),
                                  trace.result.trial_index);

    if (trace.conditioned) {
        const auto path = cfg.output_dir / (stem + "_filtered.csv");
        if (!ReportWriter::write_trace(path, trace.conditioned->time, trace.conditioned->amplitude)) {
            fmt::print(stderr, "Warning: cannot write trace '{}'\n", path.string());
        }
    }
    if (trace.window) {
        const auto path = cfg.output_dir / (stem + "_cropped.csv");
        if (!ReportWriter::write_trace(path, trace.window->time, trace.window->amplitude)) {
            fmt::print(stderr, "Warning: cannot write trace '{}'\n", path.string());
        }
    }
}

/// Per-trial diagnostics for --verbose.
void print_diagnostics(const RawTrial& raw, const TrialTrace& trace) {
    fmt::print(stderr, "  {} samples", raw.samples.size());
    if (trace.window) {
        const auto crossings = frequency::FrequencyEstimator::detect_crossings(*trace.window);
        fmt::print(stderr, ", window [{}, {}) peak={:.3f}, {} zero crossings",
                   trace.window->start_index,
                   trace.window->start_index + trace.window->size(),
                   trace.window->peak_amplitude,
                   crossings.size());
    }
    fmt::print(stderr, ", status={}\n", to_string(trace.result.status));
}

/// Run the full batch. Returns 0 on success, 1 on a run-level error.
int run(const RunConfig& cfg) {
    const auto discovery = TrialLoader::discover(cfg.input_dir, cfg.lengths_mm,
                                                 cfg.trials_per_length);
    for (const auto& f : discovery.missing) {
        fmt::print(stderr, "Warning: missing file: {}\n", f.path.string());
    }
    if (discovery.found.empty()) {
        fmt::print(stderr, "Error: no trial files found in '{}'\n", cfg.input_dir.string());
        return 1;
    }

    if (!signal::SignalConditioner::is_valid(cfg.analysis.filter)) {
        fmt::print(stderr,
            "Warning: filter spec (cutoff={} Hz, fs={} Hz, order={}) is invalid; "
            "every trial will report {}\n",
            cfg.analysis.filter.cutoff_hz, cfg.analysis.filter.sample_rate_hz,
            cfg.analysis.filter.order, to_string(TrialStatus::InvalidFilterSpec));
    }
    if (!physics::ModulusCalculator::is_valid(cfg.analysis.geometry)) {
        fmt::print(stderr, "Warning: beam geometry is invalid; every trial will report {}\n",
                   to_string(TrialStatus::InvalidGeometry));
    }

    if (cfg.write_report || cfg.write_traces) {
        std::error_code ec;
        std::filesystem::create_directories(cfg.output_dir, ec);
        if (ec) {
            fmt::print(stderr, "Error: cannot create output directory '{}': {}\n",
                       cfg.output_dir.string(), ec.message());
            return 1;
        }
    }

    const TrialAnalyzer analyzer(cfg.analysis);
    ResultAggregator aggregator;

    for (const auto& file : discovery.found) {
        const auto raw = TrialLoader::load_csv(file.path, file.id);
        if (!raw) {
            fmt::print(stderr, "Warning: cannot open '{}', skipping\n", file.path.string());
            continue;
        }
        if (raw->samples.size() < 2) {
            fmt::print(stderr, "Warning: '{}' has {} valid samples\n",
                       file.path.string(), raw->samples.size());
        }

        const TrialTrace trace = analyzer.trace(*raw);
        if (!aggregator.add(trace.result)) {
            fmt::print(stderr, "Warning: '{}' has no finite beam length, skipping\n",
                       file.path.string());
            continue;
        }

        fmt::print("{}\n", ReportWriter::trial_line(trace.result));
        if (cfg.verbose) {
            print_diagnostics(*raw, trace);
        }
        if (cfg.write_traces) {
            write_traces(cfg, trace);
        }
    }

    const auto results   = aggregator.results();
    const auto summaries = aggregator.summarize_by_length();
    const auto overall   = aggregator.summarize_overall();

    fmt::print("\n");
    for (const auto& s : summaries) {
        fmt::print("{}\n", ReportWriter::length_line(s));
    }
    fmt::print("{}\n", ReportWriter::overall_line(overall));

    if (cfg.write_report) {
        const auto path = cfg.output_dir / "beam_analysis.csv";
        if (!ReportWriter::write_table(path, results, summaries, overall)) {
            fmt::print(stderr, "Error: cannot write '{}'\n", path.string());
            return 1;
        }
        fmt::print("\nAnalysis complete. Report -> {}\n", path.string());
    } else {
        fmt::print("\nSkipped saving the analysis report.\n");
    }

    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    std::vector<std::string_view> args;
    args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0);
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    const auto cfg = beamvib::core::parse_args(args);
    if (!cfg) {
        fmt::print(stderr, "{}", beamvib::core::usage());
        return 1;
    }
    if (cfg->show_help) {
        fmt::print("{}", beamvib::core::usage());
        return 0;
    }

    return run(*cfg);
}
