/// @file src/signal/butterworth_filter.cpp
/// @brief Butterworth low-pass design, IIR filtering and zero-phase filtfilt.

#include "beamvib/filter.hpp"
#include "beamvib/constants.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <array>
#include <cmath>
#include <complex>
#include <cstddef>

namespace beamvib::signal {

namespace {

using cplx = std::complex<double>;

/// Pad b and a to a common length so every state update sees both.
std::size_t state_length(const FilterCoefficients& c) noexcept {
    const std::size_t n = std::max(c.a.size(), c.b.size());
    return n == 0 ? 0 : n - 1;
}

double coeff(const std::vector<double>& v, std::size_t i) noexcept {
    return i < v.size() ? v[i] : 0.0;
}

/// Polynomial product, lowest power of z⁻¹ first.
std::vector<double> poly_mul(const std::vector<double>& p,
                             const std::array<double, 3>& q) {
    std::vector<double> out(p.size() + q.size() - 1, 0.0);
    for (std::size_t i = 0; i < p.size(); ++i) {
        for (std::size_t j = 0; j < q.size(); ++j) {
            out[i + j] += p[i] * q[j];
        }
    }
    return out;
}

/// Odd reflection about each end point: 2·x[0] − x[k] on the left,
/// 2·x[n−1] − x[n−1−k] on the right. Requires padlen < n.
std::vector<double> odd_extend(std::span<const double> x, std::size_t padlen) {
    const std::size_t n = x.size();
    std::vector<double> ext;
    ext.reserve(n + 2 * padlen);
    for (std::size_t k = padlen; k >= 1; --k) {
        ext.push_back(2.0 * x[0] - x[k]);
    }
    ext.insert(ext.end(), x.begin(), x.end());
    for (std::size_t k = 1; k <= padlen; ++k) {
        ext.push_back(2.0 * x[n - 1] - x[n - 1 - k]);
    }
    return ext;
}

FilterCoefficients as_coefficients(const Biquad& s) {
    return FilterCoefficients{.b = std::vector<double>(s.b.begin(), s.b.end()),
                              .a = std::vector<double>(s.a.begin(), s.a.end())};
}

std::vector<double> strip_padding(const std::vector<double>& y,
                                  std::size_t padlen, std::size_t n) {
    return std::vector<double>(y.begin() + static_cast<std::ptrdiff_t>(padlen),
                               y.begin() + static_cast<std::ptrdiff_t>(padlen + n));
}

}  // namespace

// ─── ButterworthFilter::design_lowpass ────────────────────────────────────────

std::optional<SecondOrderSections>
ButterworthFilter::design_lowpass(int order, double normalized_cutoff) noexcept {
    if (order < 1 || order > constants::MAX_FILTER_ORDER) return std::nullopt;
    if (!std::isfinite(normalized_cutoff))                 return std::nullopt;
    if (normalized_cutoff <= 0.0 || normalized_cutoff >= 1.0) return std::nullopt;

    const int N = order;

    // Pre-warped analog cutoff for a sampling rate normalised to fs = 2.
    constexpr double FS2 = 4.0;
    const double warped = FS2 * std::tan(constants::PI * normalized_cutoff / 2.0);

    SecondOrderSections out;
    out.sections.reserve(static_cast<std::size_t>((N + 1) / 2));

    // Odd order: the real pole p = −Ω_c maps to z = (4 − Ω_c)/(4 + Ω_c).
    // 1 − z = 2Ω_c/(4 + Ω_c) is formed directly, not by subtraction.
    if (N % 2 == 1) {
        const double z = (FS2 - warped) / (FS2 + warped);
        const double g = warped / (FS2 + warped);
        Biquad s;
        s.b = {g, g, 0.0};
        s.a = {1.0, -z, 0.0};
        out.sections.push_back(s);
    }

    // Conjugate pairs, farthest from the unit circle first. A section with
    // poles z, z̄ has denominator 1 − 2Re(z)·z⁻¹ + |z|²·z⁻² and DC value
    // |1 − z|², with 1 − z = −2p/(4 − p).
    for (int m = (N % 2 == 1) ? 2 : 1; m < N; m += 2) {
        const double theta = constants::PI * static_cast<double>(m)
                             / (2.0 * static_cast<double>(N));
        const cplx p = -warped * std::exp(cplx{0.0, theta});
        const cplx z = (FS2 + p) / (FS2 - p);
        const double dc = std::norm(-2.0 * p / (FS2 - p));
        const double g = dc / 4.0;

        Biquad s;
        s.b = {g, 2.0 * g, g};
        s.a = {1.0, -2.0 * z.real(), std::norm(z)};
        out.sections.push_back(s);
    }

    for (const auto& s : out.sections) {
        for (double v : s.b) if (!std::isfinite(v)) return std::nullopt;
        for (double v : s.a) if (!std::isfinite(v)) return std::nullopt;
    }

    return out;
}

// ─── ButterworthFilter::to_transfer_function ──────────────────────────────────

FilterCoefficients
ButterworthFilter::to_transfer_function(const SecondOrderSections& sos) noexcept {
    FilterCoefficients out{.b = {1.0}, .a = {1.0}};
    for (const auto& s : sos.sections) {
        out.b = poly_mul(out.b, s.b);
        out.a = poly_mul(out.a, s.a);
    }
    // First-order sections contribute a trailing zero each.
    const std::size_t len = static_cast<std::size_t>(sos.order()) + 1;
    out.b.resize(len);
    out.a.resize(len);
    return out;
}

// ─── ButterworthFilter::lfilter ───────────────────────────────────────────────

std::vector<double>
ButterworthFilter::lfilter(const FilterCoefficients& coeffs,
                           std::span<const double> x,
                           std::span<const double> zi) noexcept {
    std::vector<double> y(x.size(), 0.0);
    if (coeffs.a.empty() || coeffs.b.empty()) {
        return y;
    }

    const double a0 = coeffs.a[0];
    const std::size_t ns = state_length(coeffs);

    std::vector<double> b(ns + 1), a(ns + 1);
    for (std::size_t i = 0; i <= ns; ++i) {
        b[i] = coeff(coeffs.b, i) / a0;
        a[i] = coeff(coeffs.a, i) / a0;
    }

    std::vector<double> z(ns, 0.0);
    for (std::size_t i = 0; i < ns && i < zi.size(); ++i) {
        z[i] = zi[i];
    }

    for (std::size_t n = 0; n < x.size(); ++n) {
        const double xn = x[n];
        const double yn = b[0] * xn + (ns > 0 ? z[0] : 0.0);
        for (std::size_t j = 0; j + 1 < ns; ++j) {
            z[j] = b[j + 1] * xn + z[j + 1] - a[j + 1] * yn;
        }
        if (ns > 0) {
            z[ns - 1] = b[ns] * xn - a[ns] * yn;
        }
        y[n] = yn;
    }

    return y;
}

// ─── ButterworthFilter::lfilter_zi ────────────────────────────────────────────

std::optional<std::vector<double>>
ButterworthFilter::lfilter_zi(const FilterCoefficients& coeffs) noexcept {
    if (coeffs.a.empty() || coeffs.b.empty() || coeffs.a[0] == 0.0) {
        return std::nullopt;
    }

    const std::size_t ns = state_length(coeffs);
    if (ns == 0) {
        return std::vector<double>{};
    }

    const double a0 = coeffs.a[0];
    const double b0 = coeff(coeffs.b, 0) / a0;

    // I − Aᵀ where Aᵀ has −a[1:] down its first column and ones on the
    // superdiagonal.
    Eigen::MatrixXd lhs = Eigen::MatrixXd::Identity(
        static_cast<Eigen::Index>(ns), static_cast<Eigen::Index>(ns));
    Eigen::VectorXd rhs(static_cast<Eigen::Index>(ns));

    for (std::size_t i = 0; i < ns; ++i) {
        const auto r = static_cast<Eigen::Index>(i);
        const double ai = coeff(coeffs.a, i + 1) / a0;
        const double bi = coeff(coeffs.b, i + 1) / a0;
        lhs(r, 0) += ai;
        if (i + 1 < ns) {
            lhs(r, r + 1) -= 1.0;
        }
        rhs(r) = bi - ai * b0;
    }

    const Eigen::FullPivLU<Eigen::MatrixXd> lu(lhs);
    if (!lu.isInvertible()) {
        return std::nullopt;
    }
    const Eigen::VectorXd sol = lu.solve(rhs);

    std::vector<double> zi(ns);
    for (std::size_t i = 0; i < ns; ++i) {
        zi[i] = sol(static_cast<Eigen::Index>(i));
        if (!std::isfinite(zi[i])) return std::nullopt;
    }
    return zi;
}

// ─── ButterworthFilter::filtfilt ──────────────────────────────────────────────

std::optional<std::vector<double>>
ButterworthFilter::filtfilt(const FilterCoefficients& coeffs,
                            std::span<const double> x) noexcept {
    const std::size_t n = x.size();
    if (n == 0) {
        return std::vector<double>{};
    }

    auto zi = lfilter_zi(coeffs);
    if (!zi) {
        return std::nullopt;
    }

    std::size_t padlen = 3 * std::max(coeffs.a.size(), coeffs.b.size());
    if (padlen >= n) {
        padlen = n - 1;
    }
    const auto ext = odd_extend(x, padlen);

    std::vector<double> state(zi->size());

    // Forward pass.
    const double x0 = ext.front();
    std::transform(zi->begin(), zi->end(), state.begin(),
                   [x0](double z) { return z * x0; });
    std::vector<double> fwd = lfilter(coeffs, ext, state);

    // Backward pass over the reversed forward output.
    std::reverse(fwd.begin(), fwd.end());
    const double y0 = fwd.front();
    std::transform(zi->begin(), zi->end(), state.begin(),
                   [y0](double z) { return z * y0; });
    std::vector<double> bwd = lfilter(coeffs, fwd, state);
    std::reverse(bwd.begin(), bwd.end());

    return strip_padding(bwd, padlen, n);
}

// ─── ButterworthFilter::sosfilt ───────────────────────────────────────────────

std::vector<double>
ButterworthFilter::sosfilt(const SecondOrderSections& sos,
                           std::span<const double> x,
                           std::span<const SectionState> zi) noexcept {
    std::vector<double> y(x.begin(), x.end());

    for (std::size_t k = 0; k < sos.sections.size(); ++k) {
        const auto& s = sos.sections[k];
        const double a0 = s.a[0];
        const double b0 = s.b[0] / a0, b1 = s.b[1] / a0, b2 = s.b[2] / a0;
        const double a1 = s.a[1] / a0, a2 = s.a[2] / a0;

        double z0 = k < zi.size() ? zi[k][0] : 0.0;
        double z1 = k < zi.size() ? zi[k][1] : 0.0;
        for (double& v : y) {
            const double xn = v;
            const double yn = b0 * xn + z0;
            z0 = b1 * xn + z1 - a1 * yn;
            z1 = b2 * xn - a2 * yn;
            v = yn;
        }
    }
    return y;
}

// ─── ButterworthFilter::sosfilt_zi ────────────────────────────────────────────

std::optional<std::vector<SectionState>>
ButterworthFilter::sosfilt_zi(const SecondOrderSections& sos) noexcept {
    std::vector<SectionState> out;
    out.reserve(sos.sections.size());

    double scale = 1.0;
    for (const auto& s : sos.sections) {
        const auto zi = lfilter_zi(as_coefficients(s));
        if (!zi || zi->size() != 2) {
            return std::nullopt;
        }
        out.push_back(SectionState{scale * (*zi)[0], scale * (*zi)[1]});

        const double a_sum = s.a[0] + s.a[1] + s.a[2];
        scale *= (s.b[0] + s.b[1] + s.b[2]) / a_sum;
    }
    return out;
}

// ─── ButterworthFilter::sosfiltfilt ───────────────────────────────────────────

std::optional<std::vector<double>>
ButterworthFilter::sosfiltfilt(const SecondOrderSections& sos,
                               std::span<const double> x) noexcept {
    const std::size_t n = x.size();
    if (n == 0) {
        return std::vector<double>{};
    }

    const auto zi = sosfilt_zi(sos);
    if (!zi) {
        return std::nullopt;
    }

    std::size_t padlen = 3 * (static_cast<std::size_t>(sos.order()) + 1);
    if (padlen >= n) {
        padlen = n - 1;
    }
    const auto ext = odd_extend(x, padlen);

    std::vector<SectionState> state(zi->size());
    const auto seed = [&](double v) {
        std::transform(zi->begin(), zi->end(), state.begin(),
                       [v](const SectionState& z) { return SectionState{z[0] * v, z[1] * v}; });
    };

    // Forward pass.
    seed(ext.front());
    std::vector<double> fwd = sosfilt(sos, ext, state);

    // Backward pass over the reversed forward output.
    std::reverse(fwd.begin(), fwd.end());
    seed(fwd.front());
    std::vector<double> bwd = sosfilt(sos, fwd, state);
    std::reverse(bwd.begin(), bwd.end());

    return strip_padding(bwd, padlen, n);
}

// ─── ButterworthFilter::gain_at ───────────────────────────────────────────────

double ButterworthFilter::gain_at(const FilterCoefficients& coeffs,
                                  double normalized_frequency) noexcept {
    const double w = constants::PI * normalized_frequency;
    cplx num{0.0, 0.0};
    cplx den{0.0, 0.0};
    for (std::size_t k = 0; k < coeffs.b.size(); ++k) {
        num += coeffs.b[k] * std::exp(cplx{0.0, -w * static_cast<double>(k)});
    }
    for (std::size_t k = 0; k < coeffs.a.size(); ++k) {
        den += coeffs.a[k] * std::exp(cplx{0.0, -w * static_cast<double>(k)});
    }
    if (std::abs(den) == 0.0) {
        return 0.0;
    }
    return std::abs(num / den);
}

double ButterworthFilter::gain_at(const SecondOrderSections& sos,
                                  double normalized_frequency) noexcept {
    double g = 1.0;
    for (const auto& s : sos.sections) {
        g *= gain_at(as_coefficients(s), normalized_frequency);
    }
    return g;
}

}  // namespace beamvib::signal
