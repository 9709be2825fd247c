#pragma once
#include <string>
#include <vector>

namespace mpam {

enum class PulseType {
    Rectangular,
    RaisedCosine,
    RootRaisedCosine
};

/**
 * 脉冲成形描述：h 为 FIR 系数（每符号 sps 个样点），
 * rolloff/span 只对 (root) raised cosine 有意义。
 */
struct PulseShape {
    PulseType           type{PulseType::Rectangular};
    std::vector<double> h{1.0};
    int                 sps{1};
    double              rolloff{0.0};
    int                 span{0};     // 单侧符号数

    std::string type_name() const;
};

/**
 * 生成脉冲：
 *   Rectangular       h = ones(sps)
 *   RaisedCosine      长度 2*span*sps+1
 *   RootRaisedCosine  长度 2*span*sps+1
 * 系数已按 norm_filter_coefficients 归一化。
 */
PulseShape select_pulse_shape(PulseType type, int sps, double rolloff = 0.0, int span = 0);

/**
 * 归一化 FIR 系数，使符号中心处的响应为 1：
 *   奇数长度：除以中心抽头 h[(n-1)/2]
 *   偶数长度：除以两个中心抽头的平均 (h[n/2-1] + h[n/2]) / 2
 * 参考值为 0 抛 DomainError，h 为空抛 InvalidArgument。
 */
std::vector<double> norm_filter_coefficients(std::vector<double> h);

// 符号率序列上采样 sps 倍后做因果 FIR 滤波（不去群时延），输出长度 x.size()*sps
std::vector<double> shape_pulses(const std::vector<double>& x, const PulseShape& pulse);

} // namespace mpam
