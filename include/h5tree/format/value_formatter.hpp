#pragma once

#include "h5tree/format/render_config.hpp"
#include "h5tree/model/value.hpp"

#include <string>

namespace h5tree::format {

/**
 * @brief 属性值/数据集内容的有界可读化输出。
 *
 * 规则（按值类型）：
 * - 数组：空数组固定输出 "[] (empty array)"；不超过上限时完整打印；
 *   超限的一维数组只打印首尾各 max_display_items/2 个元素；
 *   超限的多维数组只打印形状与 dtype；
 * - blob：长度 < max_string_length 时容错解码为文本，否则 "<bytes of length N>"；
 * - 文本：超过 max_string_length 个码点时截断并追加 "... [truncated]"；
 * - 其他：输出自带的文本形式。
 *
 * format() 是纯函数，不会失败。
 */
class ValueFormatter final {
 public:
    explicit ValueFormatter(RenderConfig config = {}) noexcept : config_(config) {}

    [[nodiscard]] std::string format(const model::Value &value) const;

    [[nodiscard]] const RenderConfig &config() const noexcept { return config_; }

 private:
    const RenderConfig config_;
};

/**
 * @brief 数组的完整打印形式（嵌套方括号，元素按列对齐）。
 */
[[nodiscard]] std::string full_array_text(const model::NumericArray &array);

} // namespace h5tree::format
