#pragma once
#include <functional>
#include <memory>

namespace mpam {

/**
 * 信号相关的噪声标准差模型：noise_std(level) > 0。
 * 由外部物理模型（光纤/放大器/探测器）提供，优化器与 BER 计算只依赖此接口。
 */
class NoiseModel {
public:
    virtual ~NoiseModel() = default;
    virtual double noise_std(double level) const = 0;
};

// 调用 model.noise_std(level)，结果非正或非有限时抛 DomainError
double checked_noise_std(const NoiseModel& model, double level);

// 与信号无关的 AWGN
class ConstantNoise : public NoiseModel {
public:
    explicit ConstantNoise(double sigma) : sigma_(sigma) {}
    double noise_std(double) const override { return sigma_; }

private:
    double sigma_;
};

// 任意可调用对象（测试中常用 lambda）
class FunctionNoise : public NoiseModel {
public:
    explicit FunctionNoise(std::function<double(double)> fn);
    double noise_std(double level) const override { return fn_(level); }

private:
    std::function<double(double)> fn_;
};

/**
 * 把接收端（物理单位）的噪声模型映射到归一化电平域：
 *   noise_std(P) = inner.noise_std(gain * P) / gain
 * gain 通常取 Pmax * link_gain（AGC 把最高电平归一化到 1）。
 * 只保存引用，inner 的生命周期由调用方保证。
 */
class ReferredNoise : public NoiseModel {
public:
    ReferredNoise(const NoiseModel& inner, double gain);
    ReferredNoise(const NoiseModel&& inner, double gain) = delete;
    double noise_std(double level) const override;

private:
    const NoiseModel& inner_;
    double gain_;
};

// ===== 闭式高斯近似噪声模型（电平单位：光功率 W）=====

inline constexpr double kElementaryCharge = 1.602176634e-19; // C

// PIN：热噪声 + 散粒噪声（含暗电流）
struct PinNoise : public NoiseModel {
    double responsivity  = 1.0;     // A/W
    double dark_current  = 10e-9;   // A
    double thermal_N0    = 30e-12 * 30e-12; // 单边热噪声 PSD, A^2/Hz
    double noise_bw      = 50e9;    // 单边噪声带宽 Δf, Hz

    double noise_std(double level) const override;
};

// APD：热噪声 + 倍增散粒噪声（McIntyre 过剩噪声因子）；level 为倍增后的光功率等效值
struct ApdNoise : public NoiseModel {
    double gain          = 10.0;
    double ka            = 0.09;    // 电离系数比
    double responsivity  = 1.0;
    double dark_current  = 10e-9;
    double thermal_N0    = 30e-12 * 30e-12;
    double noise_bw      = 50e9;

    double excess_noise_factor() const;
    double noise_std(double level) const override;
};

// SOA 前置放大：热噪声 + 信号-ASE 拍频 + ASE-ASE 拍频（单偏振）；level 为放大后的光功率
struct SoaNoise : public NoiseModel {
    double ase_psd       = 6e-17;   // ASE 单偏振 PSD (W/Hz)
    double thermal_N0    = 30e-12 * 30e-12;
    double noise_bw      = 50e9;    // 电滤波器单边噪声带宽 Δf
    double optical_bw    = 200e9;   // 光滤波器双边噪声带宽 Δfopt

    double noise_std(double level) const override;
};

} // namespace mpam
