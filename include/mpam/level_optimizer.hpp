#pragma once
#include <vector>
#include "mpam/errors.hpp"
#include "mpam/level_set.hpp"
#include "mpam/noise_model.hpp"
#include "mpam/params.hpp"

namespace mpam {

struct OptimizationResult {
    LevelSet                levels;              // spacing = Optimized，接收端电平
    std::vector<Diagnostic> diagnostics;         // 非致命告警
    std::vector<double>     tolerance_history;   // 每次外层迭代的 ||a_k - a_{k-1}||
    int                     iterations{0};
    bool                    converged{false};
    double                  achieved_ber{0.0};
    double                  ber_relative_error{0.0};

    bool has(DiagnosticKind kind) const;
};

// 每个门限允许的单侧尾概率 Pe = log2(M) * BERtarget * M / (2(M-1))
double per_threshold_error_probability(int M, double ber_target);

/**
 * 电平间距与判决门限的联合优化（高斯近似）：
 * 在信号相关噪声 noise_std(level) 下，使每个门限单侧尾概率都等于 Pe，
 * 从而整体 BER 等于 ber_target。消光比约束通过每轮把 levels[0] 锚定到
 * levels[M-1] * rex 实现。
 *
 * 外层为不动点迭代，内层逐级做两次一维求根（先门限，再下一电平）。
 * 求根失败、迭代次数用完、最终 BER 偏差过大都只记录 Diagnostic 并打印
 * [WARN]，结果始终返回。verbose=true 时逐轮打印 tolerance。
 *
 * 参数非法抛 InvalidArgument；噪声模型返回非正/非有限值抛 DomainError。
 */
OptimizationResult optimize_level_spacing(int M,
                                          double ber_target,
                                          double rex_dB,
                                          const NoiseModel& noise,
                                          const Params& params = Params{},
                                          bool verbose = false);

} // namespace mpam
