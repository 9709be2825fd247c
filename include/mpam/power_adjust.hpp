#pragma once
#include "mpam/level_set.hpp"

namespace mpam {

// 消光比 rex = Pmin/Pmax = 10^(-|rex_dB|/10)，rex_dB = -inf 时为 0
double extinction_ratio(double rex_dB);

/**
 * 把 level set 调整到目标平均发射功率 Ptx 与消光比 rex_dB（原地修改并返回）。
 * 规则由 set.spacing 决定：
 *   EquallySpaced  先恢复为归一化等间距电平，再做仿射映射
 *                    P = a * (Ptx/mean(a)) * (1-rex)/(1+rex) + Pmin,
 *                    Pmin = 2*Ptx*rex/(1+rex)
 *   Optimized      消光比已在优化中保证，只做线性缩放 P = a * Ptx/mean(a)
 * thresholds 使用同一映射。
 */
LevelSet& adjust_levels(LevelSet& set, double Ptx, double rex_dB);

} // namespace mpam
