/**
 * @file  fuzz_trial_analyzer.cpp
 * @brief libFuzzer target for the full per-trial analysis.
 *
 * Build:
 *   cmake -DBEAMVIB_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_trial_analyzer
 *
 * Run for 60 seconds:
 *   ./fuzz_trial_analyzer -max_total_time=60
 *
 * Input layout:
 *   The byte stream is read as consecutive little-endian int16 quantisation
 *   levels sampled at 5 kHz. Raw integer levels keep every sample finite,
 *   matching what the rig's ADC can produce.
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort.
 *   2. status == Ok  ⇔  frequency and modulus are both present.
 *   3. Present frequency and modulus are finite and > 0.
 *   4. The trial identity is carried through unchanged.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include "beamvib/analyzer.hpp"

using namespace beamvib;
using namespace beamvib::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    RawTrial raw{.id = TrialId{.beam_length_mm = 160.0, .trial_index = 1}, .samples = {}};
    raw.samples.reserve(size / 2);
    for (size_t i = 0; i + 1 < size; i += 2) {
        int16_t level = 0;
        std::memcpy(&level, data + i, sizeof(level));
        raw.samples.push_back(Sample{
            .value = static_cast<double>(level),
            .time  = static_cast<double>(i / 2) / 5000.0,
        });
    }

    static const TrialAnalyzer analyzer;
    const auto r = analyzer.analyze(raw);

    assert(r.ok() == (r.frequency_hz.has_value() && r.modulus_pa.has_value()));
    if (r.frequency_hz) {
        assert(std::isfinite(*r.frequency_hz) && *r.frequency_hz > 0.0);
    }
    if (r.modulus_pa) {
        assert(std::isfinite(*r.modulus_pa) && *r.modulus_pa > 0.0);
    }
    assert(r.beam_length_mm == 160.0);
    assert(r.trial_index == 1);

    return 0;
}
