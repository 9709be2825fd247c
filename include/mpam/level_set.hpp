#pragma once
#include <string>
#include <vector>

namespace mpam {

// level 的来源决定功率调整规则（见 power_adjust.hpp）
enum class LevelSpacing {
    EquallySpaced,
    Optimized
};

const char* to_string(LevelSpacing spacing);

// "equally-spaced" / "optimized" -> LevelSpacing，其余抛 InvalidArgument
LevelSpacing parse_level_spacing(const std::string& name);

/**
 * M 元 PAM 的电平与判决门限：
 *   levels[0] < thresholds[0] < levels[1] < ... < thresholds[M-2] < levels[M-1]
 * thresholds[i] 分隔 levels[i] 与 levels[i+1]。
 */
struct LevelSet {
    int M{0};
    std::vector<double> levels;      // M 个
    std::vector<double> thresholds;  // M-1 个
    LevelSpacing spacing{LevelSpacing::EquallySpaced};

    bool empty() const { return levels.empty(); }

    // 只检查个数（M 与 M-1），不检查单调性
    void set_levels(std::vector<double> new_levels, std::vector<double> new_thresholds);

    // 所有 level/threshold 除以 levels[M-1]；顶层为 0 时抛 DomainError
    LevelSet& normalize();

    // levels 与 thresholds 严格交错递增
    bool is_monotonic() const;

    double mean_level() const;
};

// 归一化的等间距电平：levels[k] = 2k/(2(M-1))，thresholds[k] = (2k+1)/(2(M-1))
LevelSet equally_spaced_levels(int M);

} // namespace mpam
