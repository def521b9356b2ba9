#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace h5tree::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;

// 渲染默认阈值：数组“足够小可完整打印 / 数据集足够小可读取”的元素上限。
inline constexpr std::size_t kDefaultMaxDisplayItems = 10;

// 文本截断阈值，同时决定二进制 blob 是否“足够短可按文本解码”。
inline constexpr std::size_t kDefaultMaxStringLength = 100;

// 报告分隔行宽度（'=' 重复次数）。
inline constexpr std::size_t kSeparatorWidth = 60;

inline constexpr const char *kDefaultOutputPath = "h5_structure.txt";

}  // 命名空间 h5tree::core
