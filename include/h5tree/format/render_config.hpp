#pragma once

#include "h5tree/core/common.hpp"

#include <cstddef>

namespace h5tree::format {

/**
 * @brief 一次探查会话的渲染阈值（构造后只读）。
 */
struct RenderConfig final {
    // 数组完整打印、数据集读取展示的元素上限。
    std::size_t max_display_items{core::kDefaultMaxDisplayItems};

    // 文本截断长度（码点）；blob 长度严格小于该值才按文本解码。
    std::size_t max_string_length{core::kDefaultMaxStringLength};
};

} // namespace h5tree::format
