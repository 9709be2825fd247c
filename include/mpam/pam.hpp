#pragma once
#include <iostream>
#include <string>
#include <vector>

#include "mpam/ber.hpp"
#include "mpam/level_optimizer.hpp"
#include "mpam/level_set.hpp"
#include "mpam/noise_model.hpp"
#include "mpam/params.hpp"
#include "mpam/pulse_shape.hpp"

namespace mpam {

/**
 * M-PAM 调制器：持有电平/门限、脉冲形状和优化配置。
 * 每个实例只供一个线程使用；并行扫描时每个任务各自构造一个 PAM。
 */
class PAM {
public:
    PAM(int M, double bit_rate, LevelSpacing spacing, PulseShape pulse = PulseShape{});
    // spacing 取 "equally-spaced" 或 "optimized"，否则抛 InvalidArgument
    PAM(int M, double bit_rate, const std::string& spacing, PulseShape pulse = PulseShape{});

    int    order() const { return M_; }
    double bit_rate() const { return bit_rate_; }
    double symbol_rate() const;   // 矩形脉冲假设：Rb / log2(M)

    LevelSpacing level_spacing() const { return spacing_; }
    void set_level_spacing(LevelSpacing spacing);

    const LevelSet&   levels() const { return set_; }
    const PulseShape& pulse_shape() const { return pulse_; }

    Params&       params() { return params_; }
    const Params& params() const { return params_; }

    PAM& set_levels(std::vector<double> levels, std::vector<double> thresholds);
    PAM& norm_levels();
    PAM& adjust_levels(double Ptx, double rex_dB);

    // 优化后的电平位于 noise_std 的输入域（接收端），之后用 adjust_levels 换算到发射端
    const LevelSet& optimize_level_spacing(double ber_target, double rex_dB,
                                           const NoiseModel& noise, bool verbose = false);
    const std::vector<Diagnostic>& diagnostics() const { return last_.diagnostics; }
    const OptimizationResult&      last_optimization() const { return last_; }

    BerResult ber_awgn(const NoiseModel& noise) const;

    // Gray 标签符号 (0..M-1) -> 电平
    std::vector<double> modulate(const std::vector<int>& symbols) const;
    // 样点 -> Gray 标签符号
    std::vector<int>    demodulate(const std::vector<double>& samples) const;
    // 脉冲成形后的波形（每符号 sps 个样点，不去群时延）
    std::vector<double> signal(const std::vector<int>& symbols) const;

    // 热噪声受限接收机（响应度 1）达到 ber_target 所需的接收功率 (dBm)
    double required_power_dBm(double N0, double ber_target) const;

    void summary(std::ostream& os = std::cout) const;

private:
    void require_levels(const char* who) const;

    int          M_;
    double       bit_rate_;
    LevelSpacing spacing_;
    PulseShape   pulse_;
    LevelSet     set_;
    Params       params_;
    OptimizationResult last_;
};

} // namespace mpam
