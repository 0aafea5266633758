/// @file src/core/result_aggregator.cpp
/// @brief ResultAggregator — grouping by beam length and absent-safe means.

#include "beamvib/aggregator.hpp"

#include <cmath>
#include <map>
#include <numeric>

namespace beamvib::core {

// ─── Statistics helpers ───────────────────────────────────────────────────────

std::optional<double> ResultAggregator::mean(std::span<const double> v) noexcept {
    if (v.empty()) {
        return std::nullopt;
    }
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

std::optional<double>
ResultAggregator::stddev(std::span<const double> v, double mean_val) noexcept {
    if (v.size() < 2) {
        return std::nullopt;
    }
    double sq_sum = 0.0;
    for (double x : v) {
        const double d = x - mean_val;
        sq_sum += d * d;
    }
    return std::sqrt(sq_sum / static_cast<double>(v.size() - 1));
}

// ─── add / results / size / clear ─────────────────────────────────────────────

bool ResultAggregator::add(const TrialResult& result) {
    // Lengths key an ordered map below; NaN has no place in that ordering.
    if (!std::isfinite(result.beam_length_mm)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    results_.push_back(result);
    return true;
}

std::vector<TrialResult> ResultAggregator::results() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_;
}

std::size_t ResultAggregator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.size();
}

void ResultAggregator::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    results_.clear();
}

// ─── summarize_by_length ──────────────────────────────────────────────────────

std::vector<LengthSummary> ResultAggregator::summarize_by_length() const {
    struct Bucket {
        std::vector<double> frequencies;
        std::vector<double> moduli;
        std::size_t         total = 0;
    };

    // std::map keeps lengths in ascending order.
    std::map<double, Bucket> buckets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& r : results_) {
            auto& b = buckets[r.beam_length_mm];
            ++b.total;
            if (r.ok() && r.frequency_hz && r.modulus_pa) {
                b.frequencies.push_back(*r.frequency_hz);
                b.moduli.push_back(*r.modulus_pa);
            }
        }
    }

    std::vector<LengthSummary> out;
    out.reserve(buckets.size());
    for (const auto& [length, b] : buckets) {
        const auto mean_mod = mean(b.moduli);
        out.push_back(LengthSummary{
            .beam_length_mm    = length,
            .mean_frequency_hz = mean(b.frequencies),
            .mean_modulus_pa   = mean_mod,
            .modulus_stddev_pa = mean_mod ? stddev(b.moduli, *mean_mod) : std::nullopt,
            .trial_count_ok    = b.moduli.size(),
            .trial_count_total = b.total,
        });
    }
    return out;
}

// ─── summarize_overall ────────────────────────────────────────────────────────

OverallSummary ResultAggregator::summarize_overall() const {
    std::vector<double> moduli;
    std::size_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        total = results_.size();
        for (const auto& r : results_) {
            if (r.ok() && r.modulus_pa) {
                moduli.push_back(*r.modulus_pa);
            }
        }
    }

    return OverallSummary{
        .mean_modulus_pa = mean(moduli),
        .total_trials    = total,
        .ok_trials       = moduli.size(),
    };
}

}  // namespace beamvib::core
