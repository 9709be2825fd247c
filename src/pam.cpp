#include "mpam/pam.hpp"
#include "mpam/errors.hpp"
#include "mpam/gray_code.hpp"
#include "mpam/power_adjust.hpp"
#include "mpam/qfunc.hpp"
#include <algorithm>
#include <bit>
#include <cmath>
#include <utility>

namespace mpam {

PAM::PAM(int M, double bit_rate, LevelSpacing spacing, PulseShape pulse)
    : M_(M), bit_rate_(bit_rate), spacing_(spacing), pulse_(std::move(pulse))
{
    if (M_ < 2) throw InvalidArgument("PAM: M must be >= 2");
    // Gray 标签只对 2 的幂阶数构成 0..M-1 的置换
    if (!std::has_single_bit(static_cast<unsigned>(M_)))
        throw InvalidArgument("PAM: M must be a power of 2");
    if (!(bit_rate_ > 0.0) || !std::isfinite(bit_rate_))
        throw InvalidArgument("PAM: bit rate must be positive");
    if (pulse_.sps < 1) throw InvalidArgument("PAM: pulse shape sps must be >= 1");

    // 归一化滤波器系数，保证成形后电平幅度不变
    pulse_.h = norm_filter_coefficients(std::move(pulse_.h));

    set_level_spacing(spacing_);
}

PAM::PAM(int M, double bit_rate, const std::string& spacing, PulseShape pulse)
    : PAM(M, bit_rate, parse_level_spacing(spacing), std::move(pulse))
{
}

double PAM::symbol_rate() const
{
    return bit_rate_ / std::log2(static_cast<double>(M_));
}

void PAM::set_level_spacing(LevelSpacing spacing)
{
    spacing_ = spacing;
    if (spacing_ == LevelSpacing::EquallySpaced) {
        set_ = equally_spaced_levels(M_);
    } else if (set_.M != M_) {
        // 优化的电平需要调用 optimize_level_spacing 或 set_levels 之后才可用
        set_ = LevelSet{};
        set_.M = M_;
    }
    set_.spacing = spacing_;
}

PAM& PAM::set_levels(std::vector<double> levels, std::vector<double> thresholds)
{
    set_.set_levels(std::move(levels), std::move(thresholds));
    return *this;
}

PAM& PAM::norm_levels()
{
    set_.normalize();
    return *this;
}

PAM& PAM::adjust_levels(double Ptx, double rex_dB)
{
    mpam::adjust_levels(set_, Ptx, rex_dB);
    return *this;
}

const LevelSet& PAM::optimize_level_spacing(double ber_target, double rex_dB,
                                            const NoiseModel& noise, bool verbose)
{
    last_ = mpam::optimize_level_spacing(M_, ber_target, rex_dB, noise, params_, verbose);
    set_  = last_.levels;
    spacing_ = LevelSpacing::Optimized;
    return set_;
}

BerResult PAM::ber_awgn(const NoiseModel& noise) const
{
    require_levels("ber_awgn");
    return mpam::ber_awgn(set_, noise);
}

std::vector<double> PAM::modulate(const std::vector<int>& symbols) const
{
    require_levels("modulate");

    std::vector<double> x;
    x.reserve(symbols.size());
    for (int s : symbols) {
        if (s < 0 || s >= M_)
            throw InvalidArgument("PAM::modulate: symbol " + std::to_string(s) + " out of range");
        x.push_back(set_.levels[static_cast<std::size_t>(gray_decode(s))]);
    }
    return x;
}

std::vector<int> PAM::demodulate(const std::vector<double>& samples) const
{
    require_levels("demodulate");

    std::vector<int> out;
    out.reserve(samples.size());
    for (double y : samples) {
        // 判决序号 = 不大于样点的门限个数
        const auto idx = std::count_if(set_.thresholds.begin(), set_.thresholds.end(),
                                       [y](double b) { return y >= b; });
        out.push_back(gray_encode(static_cast<int>(idx)));
    }
    return out;
}

std::vector<double> PAM::signal(const std::vector<int>& symbols) const
{
    return shape_pulses(modulate(symbols), pulse_);
}

double PAM::required_power_dBm(double N0, double ber_target) const
{
    if (!(N0 > 0.0)) throw InvalidArgument("required_power_dBm: N0 must be positive");
    if (!(ber_target > 0.0 && ber_target < 1.0))
        throw InvalidArgument("required_power_dBm: BERtarget must be in (0, 1)");

    const double R     = 1.0; // 响应度
    const double log2M = std::log2(static_cast<double>(M_));
    const double Pe    = M_ * ber_target * log2M / (2.0 * (M_ - 1));
    const double Preq  = (M_ - 1) * std::sqrt(bit_rate_ * N0 / (2.0 * R * R * log2M)) * qfunc_inv(Pe);
    return 10.0 * std::log10(Preq / 1e-3);
}

void PAM::summary(std::ostream& os) const
{
    os << "[INFO] PAM parameters summary:\n"
       << "  PAM order      : " << M_ << "\n"
       << "  Symbol rate    : " << symbol_rate() / 1e9 << " Gbaud\n"
       << "  Level spacing  : " << to_string(spacing_) << "\n"
       << "  Pulse shape    : " << pulse_.type_name() << " (sps=" << pulse_.sps << ")\n";
    if (!set_.empty()) {
        os << "  Levels         :";
        for (double a : set_.levels) os << " " << a;
        os << "\n  Thresholds     :";
        for (double b : set_.thresholds) os << " " << b;
        os << "\n";
    }
}

void PAM::require_levels(const char* who) const
{
    if (set_.empty())
        throw InvalidArgument(std::string("PAM::") + who +
                              ": levels not set (call optimize_level_spacing or set_levels first)");
}

} // namespace mpam
