#include "mpam/noise_model.hpp"
#include "mpam/errors.hpp"
#include <cmath>
#include <sstream>
#include <utility>

namespace mpam {

double checked_noise_std(const NoiseModel& model, double level)
{
    const double s = model.noise_std(level);
    if (!std::isfinite(s) || !(s > 0.0)) {
        std::ostringstream oss;
        oss << "noise_std(" << level << ") returned " << s << " (must be positive and finite)";
        throw DomainError(oss.str());
    }
    return s;
}

FunctionNoise::FunctionNoise(std::function<double(double)> fn)
    : fn_(std::move(fn))
{
    if (!fn_) throw InvalidArgument("FunctionNoise: empty callable");
}

ReferredNoise::ReferredNoise(const NoiseModel& inner, double gain)
    : inner_(inner), gain_(gain)
{
    if (!std::isfinite(gain) || !(gain > 0.0))
        throw InvalidArgument("ReferredNoise: gain must be positive and finite");
}

double ReferredNoise::noise_std(double level) const
{
    return inner_.noise_std(gain_ * level) / gain_;
}

// 以下模型的返回值都按 level 的单位给出（光电流噪声 / 响应度）

double PinNoise::noise_std(double level) const
{
    const double var_thermal = thermal_N0 * noise_bw;
    const double var_shot    = 2.0 * kElementaryCharge * (responsivity * level + dark_current) * noise_bw;
    return std::sqrt(var_thermal + var_shot) / responsivity;
}

double ApdNoise::excess_noise_factor() const
{
    return ka * gain + (1.0 - ka) * (2.0 - 1.0 / gain);
}

double ApdNoise::noise_std(double level) const
{
    const double F = excess_noise_factor();
    const double var_thermal = thermal_N0 * noise_bw;
    const double var_shot    = 2.0 * kElementaryCharge * gain * gain * F *
                               (responsivity * level / gain + dark_current) * noise_bw;
    return std::sqrt(var_thermal + var_shot) / responsivity;
}

double SoaNoise::noise_std(double level) const
{
    const double var_thermal = thermal_N0 * noise_bw;
    const double var_sig_sp  = 2.0 * level * ase_psd * noise_bw;
    const double var_sp_sp   = 2.0 * ase_psd * ase_psd * optical_bw * noise_bw *
                               (1.0 - noise_bw / (2.0 * optical_bw));
    return std::sqrt(var_thermal + var_sig_sp + var_sp_sp);
}

} // namespace mpam
