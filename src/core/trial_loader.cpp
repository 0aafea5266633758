/// @file src/core/trial_loader.cpp
/// @brief TrialLoader — CSV parsing and `<L>mm_Trial_<N>.csv` naming.

#include "beamvib/data_loader.hpp"
#include "parse_detail.hpp"

#include <fmt/format.h>

#include <cmath>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace beamvib::core {

namespace {

constexpr std::string_view TRIAL_INFIX  = "mm_Trial_";
constexpr std::string_view TRIAL_SUFFIX = ".csv";

using detail::parse_double;
using detail::parse_int;
using detail::trim;

}  // namespace

// ─── TrialLoader::parse_row ───────────────────────────────────────────────────

std::optional<Sample> TrialLoader::parse_row(std::string_view line) noexcept {
    line = trim(line);
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    const auto comma = line.find(',');
    if (comma == std::string_view::npos) {
        return std::nullopt;  // need at least level and time
    }

    const std::string_view rest = line.substr(comma + 1);
    const auto next_comma = rest.find(',');

    const auto level = parse_double(line.substr(0, comma));
    const auto time  = parse_double(rest.substr(0, next_comma));
    if (!level || !time) {
        return std::nullopt;
    }

    return Sample{.value = *level, .time = *time};
}

// ─── TrialLoader::parse_csv_string ────────────────────────────────────────────

std::vector<Sample> TrialLoader::parse_csv_string(std::string_view csv_content) noexcept {
    std::vector<Sample> samples;
    bool header_skipped = false;

    std::size_t pos = 0;
    while (pos < csv_content.size()) {
        auto eol = csv_content.find('\n', pos);
        if (eol == std::string_view::npos) {
            eol = csv_content.size();
        }
        const std::string_view line = trim(csv_content.substr(pos, eol - pos));
        pos = eol + 1;

        if (!header_skipped) {
            // First non-empty, non-comment line is the header.
            if (!line.empty() && line.front() != '#') {
                header_skipped = true;
            }
            continue;
        }

        if (auto s = parse_row(line)) {
            samples.push_back(*s);
        }
    }

    return samples;
}

// ─── TrialLoader::load_csv ────────────────────────────────────────────────────

std::optional<RawTrial>
TrialLoader::load_csv(const std::filesystem::path& path, const TrialId& id) noexcept {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    return RawTrial{
        .id      = id,
        .samples = parse_csv_string(contents.str()),
    };
}

// ─── File naming ──────────────────────────────────────────────────────────────

std::string TrialLoader::format_length(double length_mm) {
    if (std::isfinite(length_mm) && std::floor(length_mm) == length_mm
        && std::abs(length_mm) < 1e15) {
        return fmt::format("{}", static_cast<long long>(length_mm));
    }
    return fmt::format("{}", length_mm);
}

std::string TrialLoader::trial_filename(const TrialId& id) {
    return fmt::format("{}{}{}{}", format_length(id.beam_length_mm),
                       TRIAL_INFIX, id.trial_index, TRIAL_SUFFIX);
}

std::optional<TrialId> TrialLoader::parse_trial_filename(std::string_view name) noexcept {
    // Strip any directory part.
    const auto slash = name.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        name.remove_prefix(slash + 1);
    }

    if (name.size() <= TRIAL_SUFFIX.size()
        || name.substr(name.size() - TRIAL_SUFFIX.size()) != TRIAL_SUFFIX) {
        return std::nullopt;
    }
    name.remove_suffix(TRIAL_SUFFIX.size());

    const auto infix = name.find(TRIAL_INFIX);
    if (infix == std::string_view::npos || infix == 0) {
        return std::nullopt;
    }

    const auto length = parse_double(name.substr(0, infix));
    const auto trial  = parse_int(name.substr(infix + TRIAL_INFIX.size()));
    if (!length || *length <= 0.0 || !trial || *trial < 1) {
        return std::nullopt;
    }

    return TrialId{.beam_length_mm = *length, .trial_index = *trial};
}

// ─── TrialLoader::discover ────────────────────────────────────────────────────

DiscoveryResult TrialLoader::discover(const std::filesystem::path& directory,
                                      std::span<const double> lengths_mm,
                                      int trials_per_length) {
    DiscoveryResult out;
    for (const double length : lengths_mm) {
        for (int t = 1; t <= trials_per_length; ++t) {
            const TrialId id{.beam_length_mm = length, .trial_index = t};
            TrialFile file{.id = id, .path = directory / trial_filename(id)};

            std::error_code ec;
            if (std::filesystem::is_regular_file(file.path, ec)) {
                out.found.push_back(std::move(file));
            } else {
                out.missing.push_back(std::move(file));
            }
        }
    }
    return out;
}

}  // namespace beamvib::core
