#pragma once
#include <functional>

namespace mpam {

struct RootOptions {
    int    max_iterations = 100;    // Brent 迭代上限
    int    max_expansions = 200;    // 异号区间搜索的最大扩张次数
    double initial_step   = 0.02;   // x0 == 0 时的初始步长，否则取 |x0|/50
    double x_tolerance    = 1e-15;  // 区间宽度绝对容差
    double f_tolerance    = 0.0;    // |f(x)| <= f_tolerance 才算收敛（0 表示只看区间宽度）
};

struct RootResult {
    double x{0.0};          // 最后一次迭代值（失败时也返回，供调用方继续使用）
    double fx{0.0};
    int    iterations{0};
    bool   bracketed{false};
    bool   converged{false};
};

/**
 * 标量求根：从 x0 出发向两侧成倍扩张搜索异号区间，再用 Brent 法收缩。
 * 不抛异常；是否收敛由 RootResult::converged 给出，由调用方决定如何告警。
 */
RootResult find_root(const std::function<double(double)>& f,
                     double x0,
                     const RootOptions& opt = RootOptions{});

} // namespace mpam
