#include "mpam/ber.hpp"
#include "mpam/errors.hpp"
#include "mpam/level_optimizer.hpp"
#include "mpam/noise_model.hpp"
#include "mpam/qfunc.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

static inline bool rel_approx(double a, double b, double rel)
{
    return std::fabs(a - b) <= rel * std::fabs(b);
}

int main()
{
    using namespace mpam;

    Params quiet;
    quiet.log_warnings = false;

    // 信号相关噪声：σ^2 = 1e-4 + 0.01 P
    FunctionNoise sig_dep([](double p) { return std::sqrt(1e-4 + 0.01 * p); });

    // --- 用例 1：M=4，BER 1e-4，消光比 -10 dB：收敛且 BER 命中目标 ---
    {
        const double target = 1e-4;
        const OptimizationResult r = optimize_level_spacing(4, target, -10.0, sig_dep, quiet);

        assert(r.converged);
        assert(r.diagnostics.empty());
        assert(r.iterations >= 2 && r.iterations <= quiet.max_iterations);
        assert(static_cast<int>(r.tolerance_history.size()) == r.iterations);
        assert(r.tolerance_history.back() < quiet.abs_tolerance);

        const LevelSet& s = r.levels;
        assert(s.M == 4 && s.spacing == LevelSpacing::Optimized);
        assert(s.is_monotonic());
        assert(s.levels[0] > 0.0);
        assert(rel_approx(s.levels[0], 0.1 * s.levels[3], 1e-4));

        // 每个门限两侧尾概率都等于 Pe（σ 取对应电平处）
        const double Pe = per_threshold_error_probability(4, target);
        for (std::size_t k = 0; k + 1 < s.levels.size(); ++k) {
            const double up = qfunc((s.thresholds[k] - s.levels[k]) / sig_dep.noise_std(s.levels[k]));
            const double dn = qfunc((s.levels[k + 1] - s.thresholds[k]) / sig_dep.noise_std(s.levels[k + 1]));
            assert(rel_approx(up, Pe, 1e-4));
            assert(rel_approx(dn, Pe, 1e-4));
        }

        // 噪声随功率增大，间距也应递增
        assert(s.levels[2] - s.levels[1] > s.levels[1] - s.levels[0]);
        assert(s.levels[3] - s.levels[2] > s.levels[2] - s.levels[1]);

        assert(rel_approx(r.achieved_ber, target, 1e-3));
        assert(rel_approx(ber_awgn(s, sig_dep).ber_total, r.achieved_ber, 1e-12));
        assert(r.ber_relative_error <= quiet.max_ber_relative_error);
    }

    // --- 用例 2：常数噪声 + 无限消光比：退化为从 0 开始的等间距 ---
    {
        const double sigma = 0.01;
        const OptimizationResult r = optimize_level_spacing(
            4, 1e-3, -std::numeric_limits<double>::infinity(), ConstantNoise(sigma), quiet);
        assert(r.converged);
        assert(r.levels.levels[0] == 0.0);

        const double d = sigma * qfunc_inv(per_threshold_error_probability(4, 1e-3));
        for (int k = 1; k < 4; ++k)
            assert(rel_approx(r.levels.levels[k], 2.0 * k * d, 1e-6));
        for (int k = 0; k < 3; ++k)
            assert(rel_approx(r.levels.thresholds[k], (2.0 * k + 1.0) * d, 1e-6));
    }

    // --- 用例 3：M=2 同样适用 ---
    {
        const OptimizationResult r = optimize_level_spacing(2, 1e-6, -6.0, sig_dep, quiet);
        assert(r.converged);
        assert(r.levels.is_monotonic());
        assert(rel_approx(r.achieved_ber, 1e-6, 1e-3));
    }

    // --- 用例 4：相同输入结果逐位一致 ---
    {
        const OptimizationResult r1 = optimize_level_spacing(8, 1e-5, -12.0, sig_dep, quiet);
        const OptimizationResult r2 = optimize_level_spacing(8, 1e-5, -12.0, sig_dep, quiet);
        assert(r1.iterations == r2.iterations);
        for (std::size_t k = 0; k < r1.levels.levels.size(); ++k)
            assert(r1.levels.levels[k] == r2.levels.levels[k]);
        for (std::size_t k = 0; k < r1.levels.thresholds.size(); ++k)
            assert(r1.levels.thresholds[k] == r2.levels.thresholds[k]);
    }

    // --- 用例 5：几乎无噪声：求根达不到残差要求，只告警不抛异常 ---
    {
        const OptimizationResult r = optimize_level_spacing(4, 1e-4, -10.0, ConstantNoise(1e-300), quiet);
        assert(r.has(DiagnosticKind::RootFindNotConverged));
        assert(r.has(DiagnosticKind::BerToleranceExceeded));
        assert(r.levels.is_monotonic());
        for (std::size_t k = 0; k + 1 < r.levels.levels.size(); ++k) {
            assert(r.levels.levels[k] <= r.levels.thresholds[k]);
            assert(r.levels.thresholds[k] <= r.levels.levels[k + 1]);
        }
        for (const auto& d : r.diagnostics)
            assert(!d.message.empty());
    }

    // --- 用例 6：不连续的噪声模型 ---
    {
        FunctionNoise step([](double p) { return p < 1e-3 ? 0.01 : 1e-300; });
        const OptimizationResult r = optimize_level_spacing(4, 1e-4, -10.0, step, quiet);
        assert(r.has(DiagnosticKind::RootFindNotConverged));
        assert(r.iterations >= 1);
        assert(r.levels.is_monotonic());
    }

    // --- 用例 7：迭代次数用完 ---
    {
        Params p = quiet;
        p.max_iterations = 1;
        const OptimizationResult r = optimize_level_spacing(4, 1e-4, -10.0, sig_dep, p);
        assert(!r.converged);
        assert(r.iterations == 1);
        assert(r.has(DiagnosticKind::IterationLimitReached));
    }

    // --- 用例 8：非法参数 ---
    {
        auto throws_invalid = [&](int M, double ber, const Params& p) {
            try {
                (void)optimize_level_spacing(M, ber, -10.0, sig_dep, p);
            } catch (const InvalidArgument&) {
                return true;
            }
            return false;
        };
        assert(throws_invalid(1, 1e-4, quiet));
        assert(throws_invalid(4, 0.0, quiet));
        assert(throws_invalid(4, 1.0, quiet));
        assert(throws_invalid(4, 0.4, quiet)); // Pe >= 0.5

        Params bad = quiet;
        bad.max_iterations = 0;
        assert(throws_invalid(4, 1e-4, bad));

        bool threw = false;
        try {
            (void)optimize_level_spacing(4, 1e-4, -10.0, ConstantNoise(-1.0), quiet);
        } catch (const DomainError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "All level optimizer tests passed.\n";
    return 0;
}
