#pragma once

namespace mpam {

// 标准正态分布上尾概率 Q(x) = 0.5 * erfc(x / sqrt(2))
double qfunc(double x);

// Q 函数的反函数：返回 x 使 Q(x) = p，要求 p ∈ (0, 1)
double qfunc_inv(double p);

} // namespace mpam
