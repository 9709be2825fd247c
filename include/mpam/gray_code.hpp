#pragma once

namespace mpam {

// 自然二进制序号 -> Gray 标签：g = n ^ (n >> 1)
int gray_encode(int index);

// Gray 标签 -> 自然二进制序号（电平下标）
int gray_decode(int gray);

} // namespace mpam
