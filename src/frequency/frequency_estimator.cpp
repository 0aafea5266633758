/// @file src/frequency/frequency_estimator.cpp
/// @brief Zero-crossing frequency estimation with interpolated crossing times.

#include "beamvib/frequency.hpp"
#include "beamvib/constants.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <numeric>

namespace beamvib::frequency {

// ─── FrequencyMethod ──────────────────────────────────────────────────────────

const char* to_string(FrequencyMethod m) noexcept {
    switch (m) {
        case FrequencyMethod::PeriodAverage: return "period";
        case FrequencyMethod::CrossingCount: return "count";
    }
    return "unknown";
}

std::optional<FrequencyMethod>
parse_frequency_method(std::string_view name) noexcept {
    if (name == "period") return FrequencyMethod::PeriodAverage;
    if (name == "count")  return FrequencyMethod::CrossingCount;
    return std::nullopt;
}

// ─── FrequencyEstimator::detect_crossings ─────────────────────────────────────

std::vector<ZeroCrossing>
FrequencyEstimator::detect_crossings(const CroppedWindow& window) noexcept {
    std::vector<ZeroCrossing> out;
    const std::size_t n = std::min(window.amplitude.size(), window.time.size());

    bool have_prev = false;
    std::size_t prev = 0;

    for (std::size_t i = 0; i < n; ++i) {
        const double y = window.amplitude[i];
        if (y == 0.0 || !std::isfinite(y)) {
            continue;
        }

        if (have_prev) {
            const double yp = window.amplitude[prev];
            if ((yp < 0.0) != (y < 0.0)) {
                const double tp = window.time[prev];
                const double t  = window.time[i];
                const double t_cross = tp + (0.0 - yp) * (t - tp) / (y - yp);
                out.push_back(ZeroCrossing{
                    .time      = t_cross,
                    .index     = i,
                    .direction = yp < 0.0 ? CrossingDirection::Rising
                                          : CrossingDirection::Falling,
                });
            }
        }

        have_prev = true;
        prev = i;
    }

    return out;
}

// ─── FrequencyEstimator::period_intervals ─────────────────────────────────────

std::vector<double>
FrequencyEstimator::period_intervals(std::span<const ZeroCrossing> crossings) noexcept {
    std::vector<double> periods;

    for (const auto dir : {CrossingDirection::Rising, CrossingDirection::Falling}) {
        bool have_last = false;
        double last_time = 0.0;
        for (const auto& c : crossings) {
            if (c.direction != dir) continue;
            if (have_last) {
                periods.push_back(c.time - last_time);
            }
            have_last = true;
            last_time = c.time;
        }
    }

    return periods;
}

// ─── FrequencyEstimator::from_periods ─────────────────────────────────────────

std::optional<double>
FrequencyEstimator::from_periods(std::span<const ZeroCrossing> crossings) noexcept {
    const auto periods = period_intervals(crossings);
    if (periods.empty()) {
        return std::nullopt;  // no direction reached 2 crossings
    }

    const double mean_period = std::accumulate(periods.begin(), periods.end(), 0.0)
                               / static_cast<double>(periods.size());
    if (!std::isfinite(mean_period) || mean_period <= constants::FLOAT_EPSILON) {
        return std::nullopt;
    }
    return 1.0 / mean_period;
}

// ─── FrequencyEstimator::from_count ───────────────────────────────────────────

std::optional<double>
FrequencyEstimator::from_count(std::span<const ZeroCrossing> crossings) noexcept {
    // Three alternating crossings are the first point at which one direction
    // has a pair.
    if (crossings.size() < constants::MIN_SAME_DIRECTION_CROSSINGS + 1) {
        return std::nullopt;
    }

    const double span = crossings.back().time - crossings.front().time;
    if (!std::isfinite(span) || span <= constants::FLOAT_EPSILON) {
        return std::nullopt;
    }

    const double cycles = static_cast<double>(crossings.size() - 1) / 2.0;
    return cycles / span;
}

// ─── FrequencyEstimator::estimate ─────────────────────────────────────────────

std::optional<double>
FrequencyEstimator::estimate(const CroppedWindow& window,
                             FrequencyMethod method) noexcept {
    const auto crossings = detect_crossings(window);

    switch (method) {
        case FrequencyMethod::PeriodAverage: return from_periods(crossings);
        case FrequencyMethod::CrossingCount: return from_count(crossings);
    }
    return std::nullopt;
}

}  // namespace beamvib::frequency
