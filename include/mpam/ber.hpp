#pragma once
#include <cstddef>
#include <vector>
#include "mpam/level_set.hpp"
#include "mpam/noise_model.hpp"

namespace mpam {

struct BerResult {
    std::vector<double> ser;            // p(error | level k)，长度 M
    double              ser_total{0.0}; // mean(ser)，等概先验
    std::vector<double> ber_per_level;  // p(error | k) p(k) / log2(M)
    double              ber_total{0.0}; // sum(ber_per_level)
};

/**
 * 高斯尾近似下的解析 SER/BER：
 *   k = 0     只算上门限 Q((b0 - a0)/σ)
 *   k = M-1   只算下门限 Q((a_{M-1} - b_{M-2})/σ)
 *   其它      上下两个门限之和
 * σ 取发送电平处的 noise_std(levels[k])，而不是门限处。
 * 噪声模型返回非正/非有限值时抛 DomainError。
 */
BerResult ber_awgn(const LevelSet& set, const NoiseModel& noise);

// 打印一行 "[RESULT] <label> BER=<ber>  SER=<ser>  (M=<M>)"，返回原结果
const BerResult& print_ber(const BerResult& r, const char* label, int M);

// ===== 判决结果计数（用于检查 demodulate 输出）=====
struct ErrorStats {
    std::size_t errors{0};
    std::size_t total{0};
    double      rate{0.0};
};

// 逐符号比较（只比较两者公共长度）
ErrorStats count_symbol_errors(const std::vector<int>& ref_symbols,
                               const std::vector<int>& rx_symbols);

// Gray 标签下逐比特比较：每个符号 log2(M) 比特
ErrorStats count_bit_errors(const std::vector<int>& ref_symbols,
                            const std::vector<int>& rx_symbols,
                            int M);

} // namespace mpam
