/**
 * @file  bench/bench_pipeline.cpp
 * @brief Google Benchmark suite for the per-trial analysis path.
 *
 * Benchmarks
 * ----------
 *   BM_Design_Lowpass            — coefficient design per filter order
 *   BM_Filtfilt                  — zero-phase section filtering vs. record length
 *   BM_DetectCrossings           — zero-crossing scan vs. window length
 *   BM_AnalyzeTrial              — full condition → crop → estimate → modulus
 *   BM_ParseCsv                  — trial CSV text → samples
 *
 * Build (CMake):
 *   cmake -DBEAMVIB_BENCH=ON ..
 *   cmake --build build --target bench_pipeline
 *   ./build/bench_pipeline --benchmark_format=json
 *
 * Throughput units: items/second (samples processed).
 */

#include "benchmark/benchmark.h"

#include "beamvib/analyzer.hpp"
#include "beamvib/data_loader.hpp"
#include "beamvib/filter.hpp"
#include "beamvib/frequency.hpp"
#include "support/synthetic_signals.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <vector>

namespace {

beamvib::RawTrial make_trial(std::size_t n) {
    beamvib::testing::ImpactSpec spec;
    spec.duration_s = static_cast<double>(n) / spec.fs_hz;
    return beamvib::testing::make_beam_trial(160.0, 1, 200e9, spec);
}

std::vector<double> levels_of(const beamvib::RawTrial& raw) {
    std::vector<double> v;
    v.reserve(raw.samples.size());
    for (const auto& s : raw.samples) v.push_back(s.value - 512.0);
    return v;
}

}  // namespace

// ── Filter ─────────────────────────────────────────────────────────────────────

static void BM_Design_Lowpass(benchmark::State& state) {
    const int order = static_cast<int>(state.range(0));
    for (auto _ : state) {
        auto c = beamvib::signal::ButterworthFilter::design_lowpass(order, 0.028);
        benchmark::DoNotOptimize(c);
    }
}
BENCHMARK(BM_Design_Lowpass)->DenseRange(2, 12, 2);

static void BM_Filtfilt(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto x = levels_of(make_trial(n));
    const auto c = beamvib::signal::ButterworthFilter::design_lowpass(4, 0.028);
    if (!c) {
        state.SkipWithError("filter design failed");
        return;
    }
    for (auto _ : state) {
        auto y = beamvib::signal::ButterworthFilter::sosfiltfilt(*c, x);
        benchmark::DoNotOptimize(y);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Filtfilt)->RangeMultiplier(4)->Range(1024, 65536)->Unit(benchmark::kMicrosecond);

// ── Frequency ──────────────────────────────────────────────────────────────────

static void BM_DetectCrossings(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto w = beamvib::testing::make_sine_window(25.0, 5000.0, n);
    for (auto _ : state) {
        auto c = beamvib::frequency::FrequencyEstimator::detect_crossings(w);
        benchmark::DoNotOptimize(c);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_DetectCrossings)->RangeMultiplier(4)->Range(1024, 65536);

// ── End to end ─────────────────────────────────────────────────────────────────

static void BM_AnalyzeTrial(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto raw = make_trial(n);
    const beamvib::core::TrialAnalyzer analyzer;
    for (auto _ : state) {
        auto r = analyzer.analyze(raw);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_AnalyzeTrial)->Arg(5000)->Arg(10000)->Arg(50000)->Unit(benchmark::kMillisecond);

static void BM_ParseCsv(benchmark::State& state) {
    const auto raw = make_trial(static_cast<std::size_t>(state.range(0)));
    std::string csv = "quantisation_level,time_s\n";
    auto it = std::back_inserter(csv);
    for (const auto& s : raw.samples) fmt::format_to(it, "{},{}\n", s.value, s.time);

    for (auto _ : state) {
        auto samples = beamvib::core::TrialLoader::parse_csv_string(csv);
        benchmark::DoNotOptimize(samples);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations())
                            * static_cast<int64_t>(csv.size()));
}
BENCHMARK(BM_ParseCsv)->Arg(10000)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
