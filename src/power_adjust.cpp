#include "mpam/power_adjust.hpp"
#include "mpam/errors.hpp"
#include <cmath>

namespace mpam {

double extinction_ratio(double rex_dB)
{
    if (std::isnan(rex_dB))
        throw InvalidArgument("extinction_ratio: rex_dB is NaN");
    return std::pow(10.0, -std::fabs(rex_dB) / 10.0);
}

LevelSet& adjust_levels(LevelSet& set, double Ptx, double rex_dB)
{
    if (!std::isfinite(Ptx) || !(Ptx > 0.0))
        throw InvalidArgument("adjust_levels: Ptx must be positive and finite");

    const double rex = extinction_ratio(rex_dB);

    double scale  = 0.0;
    double offset = 0.0;
    switch (set.spacing) {
        case LevelSpacing::EquallySpaced: {
            // 从归一化等间距电平重新开始，重复调用结果不变
            set = equally_spaced_levels(set.M);
            const double amean = set.mean_level();
            const double Pmin  = 2.0 * Ptx * rex / (1.0 + rex); // 最低电平功率
            scale  = (Ptx / amean) * ((1.0 - rex) / (1.0 + rex));
            offset = Pmin;
            break;
        }
        case LevelSpacing::Optimized: {
            if (set.empty())
                throw InvalidArgument("adjust_levels: optimized levels not computed yet");
            const double amean = set.mean_level();
            if (amean == 0.0 || !std::isfinite(amean))
                throw DomainError("adjust_levels: mean level is zero");
            scale = Ptx / amean;
            break;
        }
    }

    for (auto& a : set.levels)     a = a * scale + offset;
    for (auto& b : set.thresholds) b = b * scale + offset;
    return set;
}

} // namespace mpam
