#pragma once
#include <cstddef>

namespace mpam {

struct Params {
  // ===== 外层不动点迭代 =====
  int    max_iterations         = 20;    // 最大外层迭代次数
  double abs_tolerance          = 1e-6;  // levels 相邻两次迭代变化量(2-范数)的收敛门限
  double max_ber_relative_error = 1e-3;  // 可接受的 |BER - BERtarget| / BERtarget

  // ===== 一维求根（threshold / level 的增量）=====
  int    root_max_iterations     = 100;    // Brent 迭代上限
  int    root_max_expansions     = 200;    // 搜索异号区间时的最大扩张次数
  double root_initial_step       = 0.02;   // 起点为 0 时的初始搜索步长
  double root_x_tolerance        = 1e-15;  // 区间宽度的绝对容差
  double root_f_rel_tolerance    = 1e-6;   // |f(x)| <= rel * Pe 才视为收敛

  // ===== 输出控制 =====
  bool log_warnings = true;  // 非致命诊断同时打印 [WARN] 到 std::cerr

  // 基本有效性检查
  constexpr bool valid() const {
    return (max_iterations >= 1) &&
           (abs_tolerance > 0.0) &&
           (max_ber_relative_error > 0.0) &&
           (root_max_iterations >= 1) &&
           (root_max_expansions >= 1) &&
           (root_initial_step > 0.0) &&
           (root_x_tolerance > 0.0) &&
           (root_f_rel_tolerance > 0.0);
  }
};

} // namespace mpam
