#pragma once

#include <cstdint>
#include <string>
#include <type_traits>

namespace h5tree::utils {

/**
 * @brief 浮点数的十进制拆分：value = ±d0.d1d2... × 10^exponent。
 *
 * digits 不含前导/尾随 0（值为 0 时为 "0"）。
 */
struct Decimal final {
    bool negative{false};
    std::string digits;
    int exponent{0};
};

// 最短可回读表示（按各自精度：float 与 double 结果不同）。
[[nodiscard]] Decimal to_decimal(double value);
[[nodiscard]] Decimal to_decimal(float value);

// 半精度（float16）值的最短可回读表示（最多 5 位有效数字）；value 须能精确表示为半精度。
[[nodiscard]] Decimal to_decimal_half(float value);

// 四舍五入到 significant 位有效数字，并去掉尾随 0。
[[nodiscard]] Decimal to_decimal_rounded(double value, int significant);

// 定点展开：返回 (整数部分含符号, 小数部分)。
void split_positional(const Decimal &d, std::string &int_part, std::string &frac_part);

/**
 * @brief 单个标量的通用文本形式。
 *
 * 浮点：-4 <= exp < 16 时定点（整数值补 ".0"），否则科学计数法；
 * nan/inf 拼写为 "nan"/"inf"/"-inf"。
 */
[[nodiscard]] std::string scalar_text(double value);
[[nodiscard]] std::string scalar_text(float value);
[[nodiscard]] std::string scalar_text(bool value);

// float16 标量（数值以 float 承载）。
[[nodiscard]] std::string scalar_text_half(float value);

template <class T>
[[nodiscard]] std::string scalar_text(T value) {
    static_assert(std::is_integral_v<T>, "T must be integral");
    if constexpr (sizeof(T) == 1) {
        return std::to_string(static_cast<int>(value));
    } else {
        return std::to_string(value);
    }
}

} // namespace h5tree::utils
