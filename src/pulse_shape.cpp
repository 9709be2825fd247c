#include "mpam/pulse_shape.hpp"
#include "mpam/errors.hpp"
#include <cmath>
#include <cstddef>
#include <utility>

namespace mpam {

static constexpr double kPi = 3.14159265358979323846;

static inline double sinc(double t)
{
    return (std::fabs(t) < 1e-12) ? 1.0 : std::sin(kPi * t) / (kPi * t);
}

std::string PulseShape::type_name() const
{
    switch (type) {
        case PulseType::Rectangular:      return "rectangular";
        case PulseType::RaisedCosine:     return "raised cosine";
        case PulseType::RootRaisedCosine: return "root raised cosine";
    }
    return "unknown";
}

std::vector<double> norm_filter_coefficients(std::vector<double> h)
{
    const std::size_t n = h.size();
    if (n == 0) throw InvalidArgument("norm_filter_coefficients: empty filter");

    const double ref = (n % 2 == 0) ? 0.5 * (h[n / 2 - 1] + h[n / 2])
                                    : h[(n - 1) / 2];
    if (ref == 0.0)
        throw DomainError("norm_filter_coefficients: reference tap is zero");

    for (auto& c : h) c /= ref;
    return h;
}

static double raised_cosine_tap(double t, double beta)
{
    if (beta > 0.0 && std::fabs(std::fabs(t) - 1.0 / (2.0 * beta)) < 1e-9)
        return kPi / 4.0 * sinc(1.0 / (2.0 * beta));
    return sinc(t) * std::cos(kPi * beta * t) / (1.0 - 4.0 * beta * beta * t * t);
}

static double root_raised_cosine_tap(double t, double beta)
{
    if (beta == 0.0) return sinc(t);
    if (std::fabs(t) < 1e-9)
        return 1.0 - beta + 4.0 * beta / kPi;
    if (std::fabs(std::fabs(t) - 1.0 / (4.0 * beta)) < 1e-9) {
        const double term1 = (1.0 + 2.0 / kPi) * std::sin(kPi / (4.0 * beta));
        const double term2 = (1.0 - 2.0 / kPi) * std::cos(kPi / (4.0 * beta));
        return beta / std::sqrt(2.0) * (term1 + term2);
    }
    const double num = std::sin(kPi * t * (1.0 - beta)) + 4.0 * beta * t * std::cos(kPi * t * (1.0 + beta));
    const double den = kPi * t * (1.0 - (4.0 * beta * t) * (4.0 * beta * t));
    return num / den;
}

PulseShape select_pulse_shape(PulseType type, int sps, double rolloff, int span)
{
    if (sps < 1) throw InvalidArgument("select_pulse_shape: sps must be >= 1");

    PulseShape p;
    p.type = type;
    p.sps  = sps;

    if (type == PulseType::Rectangular) {
        p.h.assign(static_cast<std::size_t>(sps), 1.0);
        p.h = norm_filter_coefficients(std::move(p.h));
        return p;
    }

    if (!(rolloff >= 0.0 && rolloff <= 1.0))
        throw InvalidArgument("select_pulse_shape: rolloff must be in [0, 1]");
    if (span < 1)
        throw InvalidArgument("select_pulse_shape: span must be >= 1");

    p.rolloff = rolloff;
    p.span    = span;

    const int half_len = span * sps;
    p.h.resize(static_cast<std::size_t>(2 * half_len + 1));
    for (int i = 0; i <= 2 * half_len; ++i) {
        const double t = static_cast<double>(i - half_len) / sps; // 以符号周期为单位
        p.h[static_cast<std::size_t>(i)] = (type == PulseType::RaisedCosine)
                                               ? raised_cosine_tap(t, rolloff)
                                               : root_raised_cosine_tap(t, rolloff);
    }
    p.h = norm_filter_coefficients(std::move(p.h));
    return p;
}

std::vector<double> shape_pulses(const std::vector<double>& x, const PulseShape& pulse)
{
    if (pulse.sps < 1) throw InvalidArgument("shape_pulses: sps must be >= 1");
    if (pulse.h.empty()) throw InvalidArgument("shape_pulses: empty filter");

    const std::size_t sps = static_cast<std::size_t>(pulse.sps);
    const std::size_t N   = x.size() * sps;
    std::vector<double> y(N, 0.0);

    // 上采样序列只有 n = i*sps 处非零，直接按冲激叠加 h
    for (std::size_t i = 0; i < x.size(); ++i) {
        const std::size_t n0 = i * sps;
        for (std::size_t k = 0; k < pulse.h.size() && n0 + k < N; ++k)
            y[n0 + k] += x[i] * pulse.h[k];
    }
    return y;
}

} // namespace mpam
