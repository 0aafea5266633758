/// @file src/signal/signal_conditioner.cpp
/// @brief SignalConditioner — mean removal followed by zero-phase low-pass.

#include "beamvib/conditioner.hpp"
#include "beamvib/filter.hpp"

#include <cmath>
#include <numeric>

namespace beamvib::signal {

// ─── SignalConditioner::is_valid ──────────────────────────────────────────────

bool SignalConditioner::is_valid(const FilterSpec& spec) noexcept {
    if (!std::isfinite(spec.cutoff_hz) || !std::isfinite(spec.sample_rate_hz)) {
        return false;
    }
    if (spec.sample_rate_hz <= 0.0) return false;
    if (spec.cutoff_hz <= 0.0)      return false;

    // Nyquist: the cutoff must lie strictly below fs/2.
    if (spec.cutoff_hz >= 0.5 * spec.sample_rate_hz) return false;

    return spec.order >= 1 && spec.order <= constants::MAX_FILTER_ORDER;
}

// ─── SignalConditioner::center ────────────────────────────────────────────────

std::vector<double>
SignalConditioner::center(std::span<const double> values) noexcept {
    if (values.empty()) {
        return {};
    }
    const double mean = std::accumulate(values.begin(), values.end(), 0.0)
                        / static_cast<double>(values.size());

    std::vector<double> out;
    out.reserve(values.size());
    for (double v : values) {
        out.push_back(v - mean);
    }
    return out;
}

// ─── SignalConditioner::condition ─────────────────────────────────────────────

std::optional<ConditionedSignal>
SignalConditioner::condition(const RawTrial& raw, const FilterSpec& spec) noexcept {
    if (!is_valid(spec)) {
        return std::nullopt;
    }

    const double nyquist = 0.5 * spec.sample_rate_hz;
    auto sections = ButterworthFilter::design_lowpass(spec.order, spec.cutoff_hz / nyquist);
    if (!sections) {
        return std::nullopt;
    }

    ConditionedSignal out;
    if (raw.samples.empty()) {
        return out;
    }

    std::vector<double> levels;
    levels.reserve(raw.samples.size());
    out.time.reserve(raw.samples.size());
    for (const auto& s : raw.samples) {
        levels.push_back(s.value);
        out.time.push_back(s.time);
    }

    const auto centered = center(levels);

    auto filtered = ButterworthFilter::sosfiltfilt(*sections, centered);
    if (!filtered) {
        return std::nullopt;
    }
    out.amplitude = std::move(*filtered);

    return out;
}

}  // namespace beamvib::signal
