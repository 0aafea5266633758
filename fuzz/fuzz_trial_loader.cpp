/**
 * @file  fuzz_trial_loader.cpp
 * @brief libFuzzer target for trial CSV parsing and file-name parsing.
 *
 * Build:
 *   cmake -DBEAMVIB_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_trial_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_trial_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every parsed sample has a finite level and time.
 *   3. A parsed file name has length > 0 and trial index ≥ 1, and
 *      formatting it back yields a name that parses to the same id.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "beamvib/data_loader.hpp"

using namespace beamvib;
using namespace beamvib::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto samples = TrialLoader::parse_csv_string(input);
    for (const auto& s : samples) {
        assert(std::isfinite(s.value));
        assert(std::isfinite(s.time));
    }

    const auto id = TrialLoader::parse_trial_filename(input);
    if (id.has_value()) {
        assert(id->beam_length_mm > 0.0);
        assert(id->trial_index >= 1);

        const auto again = TrialLoader::parse_trial_filename(TrialLoader::trial_filename(*id));
        assert(again.has_value());
        assert(again->trial_index == id->trial_index);
        assert(again->beam_length_mm == id->beam_length_mm);
    }

    return 0;
}
