#pragma once
#include <stdexcept>
#include <string>

namespace mpam {

// 致命错误：参数非法（长度不对、M<2、未知的 level spacing 选项等）
class InvalidArgument : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// 致命错误：噪声模型返回非正/非有限值，或归一化除数为 0
class DomainError : public std::domain_error {
public:
    using std::domain_error::domain_error;
};

// ===== 非致命诊断（不抛异常，随结果返回并打印 [WARN]）=====
enum class DiagnosticKind {
    RootFindNotConverged,   // 一维求根未满足自身收敛条件，沿用最后一次迭代值
    BerToleranceExceeded,   // 收敛后实际 BER 与目标的相对误差超过上限
    IterationLimitReached   // 外层迭代次数用完仍未达到 abs_tolerance
};

struct Diagnostic {
    DiagnosticKind kind{DiagnosticKind::RootFindNotConverged};
    int         iteration{-1};     // 外层迭代序号（从 0 开始），不适用时为 -1
    int         level_index{-1};   // 出问题的 level 序号，不适用时为 -1
    double      value{0.0};        // 残差 / 相对误差 / 最终 tolerance
    std::string message;
};

const char* to_string(DiagnosticKind kind);

} // namespace mpam
