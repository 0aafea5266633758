#pragma once

/// @file src/core/parse_detail.hpp
/// @brief Locale-independent number parsing shared by the loader and the CLI.
///
/// Internal header — not part of the public include/ tree.

#include <charconv>
#include <cmath>
#include <optional>
#include <string_view>
#include <system_error>

namespace beamvib::core::detail {

[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/// Parse the whole (trimmed) token as a finite double.
[[nodiscard]] inline std::optional<double> parse_double(std::string_view token) noexcept {
    token = trim(token);
    if (token.empty()) {
        return std::nullopt;
    }
    // from_chars rejects a leading '+'.
    if (token.front() == '+') {
        token.remove_prefix(1);
    }
    double val = 0.0;
    const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), val);
    if (ec != std::errc{} || ptr != token.data() + token.size()) {
        return std::nullopt;  // not a number, or trailing garbage
    }
    if (!std::isfinite(val)) {
        return std::nullopt;
    }
    return val;
}

/// Parse the whole (trimmed) token as a base-10 int.
[[nodiscard]] inline std::optional<int> parse_int(std::string_view token) noexcept {
    token = trim(token);
    int val = 0;
    const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), val);
    if (token.empty() || ec != std::errc{} || ptr != token.data() + token.size()) {
        return std::nullopt;
    }
    return val;
}

}  // namespace beamvib::core::detail
