#include "mpam/errors.hpp"
#include "mpam/noise_model.hpp"
#include "mpam/pam.hpp"
#include "mpam/qfunc.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <sstream>
#include <vector>

static inline bool approx(double a, double b, double eps = 1e-12)
{
    return std::fabs(a - b) <= eps;
}

static inline bool rel_approx(double a, double b, double rel)
{
    return std::fabs(a - b) <= rel * std::fabs(b);
}

int main()
{
    using namespace mpam;

    // --- 用例 1：构造与基本属性 ---
    {
        PAM pam(4, 112e9, LevelSpacing::EquallySpaced);
        assert(pam.order() == 4);
        assert(approx(pam.symbol_rate(), 56e9, 1e-3));
        assert(pam.level_spacing() == LevelSpacing::EquallySpaced);
        assert(pam.levels().is_monotonic());

        PAM by_name(8, 56e9, "optimized");
        assert(by_name.level_spacing() == LevelSpacing::Optimized);
        assert(by_name.levels().empty());

        bool threw = false;
        try { PAM bad(4, 56e9, "uniform"); (void)bad; } catch (const InvalidArgument&) { threw = true; }
        assert(threw);

        threw = false;
        try { PAM bad(1, 56e9, LevelSpacing::EquallySpaced); (void)bad; } catch (const InvalidArgument&) { threw = true; }
        assert(threw);

        // 非 2 的幂阶数没有合法的 Gray 标签
        for (int M : {3, 5, 6, 7, 12}) {
            threw = false;
            try { PAM bad(M, 56e9, LevelSpacing::EquallySpaced); (void)bad; } catch (const InvalidArgument&) { threw = true; }
            assert(threw);
        }

        threw = false;
        try { PAM bad(4, 0.0, LevelSpacing::EquallySpaced); (void)bad; } catch (const InvalidArgument&) { threw = true; }
        assert(threw);
    }

    // --- 用例 2：Gray 映射与判决 ---
    {
        PAM pam(4, 56e9, LevelSpacing::EquallySpaced);
        const std::vector<int> sym = {0, 1, 3, 2};
        const auto x = pam.modulate(sym);
        const double expect[] = {0.0, 1.0 / 3.0, 2.0 / 3.0, 1.0};
        for (int i = 0; i < 4; ++i) assert(approx(x[i], expect[i]));
        assert(pam.demodulate(x) == sym);

        // 门限上的样点判到上一个电平
        const auto& b = pam.levels().thresholds;
        assert(pam.demodulate({b[0], b[1] - 1e-9, 2.0, -1.0}) == (std::vector<int>{1, 1, 2, 0}));

        // 8-PAM：所有标签往返一致，各电平的标签按 Gray 顺序
        PAM pam8(8, 168e9, LevelSpacing::EquallySpaced);
        const std::vector<int> sym8 = {0, 1, 2, 3, 4, 5, 6, 7};
        const auto x8 = pam8.modulate(sym8);
        assert(pam8.demodulate(x8) == sym8);
        const auto labels = pam8.demodulate(pam8.levels().levels);
        const int gray8[] = {0, 1, 3, 2, 6, 7, 5, 4};
        for (int k = 0; k < 8; ++k) {
            assert(labels[k] == gray8[k]);
            assert(labels[k] >= 0 && labels[k] < 8);
        }

        bool threw = false;
        try { (void)pam.modulate({0, 4}); } catch (const InvalidArgument&) { threw = true; }
        assert(threw);
    }

    // --- 用例 3：优化电平未计算前不能调制 ---
    {
        PAM pam(4, 56e9, LevelSpacing::Optimized);
        bool threw = false;
        try { (void)pam.modulate({0, 1}); } catch (const InvalidArgument&) { threw = true; }
        assert(threw);

        threw = false;
        try { (void)pam.ber_awgn(ConstantNoise(0.1)); } catch (const InvalidArgument&) { threw = true; }
        assert(threw);

        threw = false;
        try { pam.adjust_levels(1e-3, -10.0); } catch (const InvalidArgument&) { threw = true; }
        assert(threw);
    }

    // --- 用例 4：优化 -> BER -> 调整到发射功率 ---
    {
        PAM pam(4, 112e9, LevelSpacing::Optimized);
        pam.params().log_warnings = false;
        FunctionNoise noise([](double p) { return std::sqrt(1e-4 + 0.01 * p); });

        const LevelSet& s = pam.optimize_level_spacing(1e-4, -10.0, noise);
        assert(s.is_monotonic());
        assert(pam.level_spacing() == LevelSpacing::Optimized);
        assert(pam.diagnostics().empty());
        assert(pam.last_optimization().converged);
        assert(rel_approx(pam.ber_awgn(noise).ber_total, 1e-4, 1e-3));

        const double ratio = s.levels[0] / s.levels[3];
        pam.adjust_levels(2e-3, -10.0);
        assert(rel_approx(pam.levels().mean_level(), 2e-3, 1e-12));
        assert(rel_approx(pam.levels().levels[0] / pam.levels().levels[3], ratio, 1e-12));

        // 归一化后最高电平为 1
        pam.norm_levels();
        assert(approx(pam.levels().levels.back(), 1.0));
    }

    // --- 用例 5：set_levels 链式调用 ---
    {
        PAM pam(2, 10e9, LevelSpacing::Optimized);
        pam.set_levels({0.2, 2.0}, {1.0}).norm_levels();
        assert(approx(pam.levels().levels[0], 0.1));
        assert(approx(pam.levels().thresholds[0], 0.5));

        bool threw = false;
        try { pam.set_levels({0.0, 0.5, 1.0}, {0.25, 0.75}); } catch (const InvalidArgument&) { threw = true; }
        assert(threw);
    }

    // --- 用例 6：脉冲成形波形 ---
    {
        PAM pam(4, 56e9, LevelSpacing::EquallySpaced, select_pulse_shape(PulseType::Rectangular, 4));
        const auto y = pam.signal({0, 2, 3});
        assert(y.size() == 12);
        for (int n = 0; n < 4; ++n) assert(approx(y[n], 0.0));
        for (int n = 4; n < 8; ++n) assert(approx(y[n], 1.0));
        for (int n = 8; n < 12; ++n) assert(approx(y[n], 2.0 / 3.0));
    }

    // --- 用例 7：热噪声受限所需接收功率 ---
    {
        const double N0 = 1e-22, Rb = 10e9;
        PAM pam2(2, Rb, LevelSpacing::EquallySpaced);
        const double P2 = std::sqrt(Rb * N0 / 2.0) * qfunc_inv(1e-9);
        assert(approx(pam2.required_power_dBm(N0, 1e-9), 10.0 * std::log10(P2 / 1e-3), 1e-9));

        // 同比特率下 4-PAM 需要更高功率
        PAM pam4(4, Rb, LevelSpacing::EquallySpaced);
        assert(pam4.required_power_dBm(N0, 1e-9) > pam2.required_power_dBm(N0, 1e-9));

        bool threw = false;
        try { (void)pam2.required_power_dBm(0.0, 1e-9); } catch (const InvalidArgument&) { threw = true; }
        assert(threw);
    }

    // --- 用例 8：参数摘要 ---
    {
        PAM pam(4, 56e9, LevelSpacing::EquallySpaced);
        std::ostringstream oss;
        pam.summary(oss);
        const std::string text = oss.str();
        assert(text.find("PAM order") != std::string::npos);
        assert(text.find("equally-spaced") != std::string::npos);
        assert(text.find("Thresholds") != std::string::npos);
    }

    std::cout << "All PAM tests passed.\n";
    return 0;
}
