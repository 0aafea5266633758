#pragma once

/// @file include/beamvib/aggregator.hpp
/// @brief ResultAggregator — per-length and overall statistics over trials.
///
/// # Module: Result Aggregator
///
/// ## Responsibility
/// Retain every TrialResult of a run and roll them up:
///   - per beam length (ascending): mean frequency, mean modulus, modulus
///     spread, ok / total trial counts
///   - overall: mean modulus across all ok trials, ok / total counts
///
/// ## Edge Cases
/// - Only status == Ok trials contribute to means
/// - No ok trials → mean is absent (never 0, never NaN)
/// - Fewer than 2 ok trials → stddev absent
/// - A record whose length is NaN or infinite is refused by `add`
///
/// ## Guarantees
/// - `add` and the summaries are serialized by an internal mutex, so
///   analyzers running on several threads may share one aggregator
/// - Insertion order of results is preserved

#include "beamvib/types.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace beamvib::core {

class ResultAggregator {
public:
    ResultAggregator() = default;

    ResultAggregator(const ResultAggregator&)            = delete;
    ResultAggregator& operator=(const ResultAggregator&) = delete;

    /// Append one trial record.
    ///
    /// # Returns
    /// `false`, recording nothing, when `beam_length_mm` is not finite.
    bool add(const TrialResult& result);

    /// One summary per distinct beam length, ascending by length.
    [[nodiscard]] std::vector<LengthSummary> summarize_by_length() const;

    /// Summary over all recorded trials.
    [[nodiscard]] OverallSummary summarize_overall() const;

    /// Copy of all records in insertion order.
    [[nodiscard]] std::vector<TrialResult> results() const;

    /// Number of records (ok and failed).
    [[nodiscard]] std::size_t size() const;

    /// Drop all records.
    void clear();

private:
    /// Arithmetic mean; `nullopt` for an empty span.
    [[nodiscard]] static std::optional<double>
    mean(std::span<const double> v) noexcept;

    /// Sample stddev (Bessel-corrected); `nullopt` below 2 values.
    [[nodiscard]] static std::optional<double>
    stddev(std::span<const double> v, double mean_val) noexcept;

    mutable std::mutex       mutex_;
    std::vector<TrialResult> results_;
};

}  // namespace beamvib::core
