#pragma once

#include "h5tree/core/common.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace h5tree::utils {

/**
 * @brief UTF-8 文本工具（按码点计数/截断、容错解码）。
 *
 * 约定：
 * - 非法字节序列按“最大非法子段”计为 1 个码点（与常见的 replace 解码一致）；
 * - 所有函数都不会失败，也不会抛异常（除内存分配外）。
 */

// 文本长度（码点数）。
[[nodiscard]] std::size_t utf8_length(std::string_view text) noexcept;

// 取前 count 个码点，原样保留字节（不做替换）。
[[nodiscard]] std::string utf8_prefix(std::string_view text, std::size_t count);

// 容错解码：非法序列替换为 U+FFFD。
[[nodiscard]] std::string decode_utf8_lossy(core::bytes_view bytes);

} // namespace h5tree::utils
