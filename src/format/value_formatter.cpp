#include "h5tree/format/value_formatter.hpp"

#include "h5tree/utils/number_text.hpp"
#include "h5tree/utils/utf8.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstddef>
#include <string>
#include <type_traits>
#include <vector>

namespace h5tree::format {
namespace {

// 定点模式下的最大小数位数。
constexpr int kFloatPrecision = 8;

constexpr const char *kTruncatedSuffix = "... [truncated]";

[[nodiscard]] std::string pad_left_(const std::string &s, std::size_t width) {
    if (s.size() >= width) {
        return s;
    }
    return std::string(width - s.size(), ' ') + s;
}

[[nodiscard]] std::string pad_right_(const std::string &s, std::size_t width) {
    if (s.size() >= width) {
        return s;
    }
    return s + std::string(width - s.size(), ' ');
}

// 元素的打印风格（由 dtype 与数据来源决定）。
struct ElementStyle final {
    bool half{false};          // float16：按半精度取最短位数
    bool byte_strings{false};  // 字节串：打印为 b'...'
};

[[nodiscard]] ElementStyle style_of_(const model::NumericArray &array) {
    return ElementStyle{array.dtype == "float16", array.byte_strings};
}

[[nodiscard]] std::string quoted_(const std::string &s) {
    return "'" + s + "'";
}

// 字节串字面量：可打印 ASCII 原样输出，其余按 \xNN 转义。
[[nodiscard]] std::string bytes_literal_(const std::string &s) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out = "b'";
    for (const char ch : s) {
        const auto c = static_cast<unsigned char>(ch);
        switch (c) {
        case '\\':
            out += "\\\\";
            break;
        case '\'':
            out += "\\'";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        default:
            if (c >= 0x20U && c < 0x7FU) {
                out.push_back(ch);
            } else {
                out += "\\x";
                out.push_back(kHex[c >> 4U]);
                out.push_back(kHex[c & 0x0FU]);
            }
            break;
        }
    }
    out.push_back('\'');
    return out;
}

// 省略形式中的元素：标量的通用文本形式（字符串不加引号）。
template <class T>
[[nodiscard]] std::string item_text_(const T &v, const ElementStyle &style) {
    if constexpr (std::is_same_v<T, std::string>) {
        return style.byte_strings ? bytes_literal_(v) : v;
    } else if constexpr (std::is_same_v<T, float>) {
        return style.half ? utils::scalar_text_half(v) : utils::scalar_text(v);
    } else {
        return utils::scalar_text(v);
    }
}

// 完整打印中的单元格（非浮点）：字符串加引号。
template <class T>
[[nodiscard]] std::string cell_text_(const T &v, const ElementStyle &style) {
    if constexpr (std::is_same_v<T, std::string>) {
        return style.byte_strings ? bytes_literal_(v) : quoted_(v);
    } else {
        return utils::scalar_text(v);
    }
}

template <class F>
[[nodiscard]] utils::Decimal shortest_decimal_(F v, bool half) {
    if constexpr (std::is_same_v<F, float>) {
        if (half) {
            return utils::to_decimal_half(v);
        }
    }
    return utils::to_decimal(v);
}

[[nodiscard]] std::string special_float_text_(double v) {
    if (std::isnan(v)) {
        return "nan";
    }
    return v < 0 ? "-inf" : "inf";
}

// 浮点数组的单元格：统一精度、按小数点对齐。
template <class F>
[[nodiscard]] std::vector<std::string> float_cells_(const std::vector<F> &values, bool half) {
    double max_val = 0.0;
    double min_val = 0.0;
    bool has_nonzero = false;
    for (const auto v : values) {
        if (!std::isfinite(v) || v == 0) {
            continue;
        }
        const double a = std::fabs(static_cast<double>(v));
        if (!has_nonzero) {
            max_val = a;
            min_val = a;
            has_nonzero = true;
        } else {
            max_val = std::max(max_val, a);
            min_val = std::min(min_val, a);
        }
    }
    const bool exp_mode =
        has_nonzero && (max_val >= 1.e8 || min_val < 0.0001 || max_val / min_val > 1000.);

    std::vector<utils::Decimal> decimals(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        const auto v = values[i];
        if (!std::isfinite(v)) {
            continue;
        }
        auto d = shortest_decimal_(v, half);
        const int digits = static_cast<int>(d.digits.size());
        if (exp_mode) {
            if (digits - 1 > kFloatPrecision) {
                d = utils::to_decimal_rounded(static_cast<double>(v), kFloatPrecision + 1);
            }
        } else if (digits - d.exponent - 1 > kFloatPrecision) {
            d = utils::to_decimal_rounded(static_cast<double>(v),
                                          d.exponent + 1 + kFloatPrecision);
        }
        decimals[i] = std::move(d);
    }

    std::vector<std::string> int_parts(values.size());
    std::vector<std::string> tails(values.size());
    std::size_t pad_left = 0;
    std::size_t pad_right = 0;

    if (!exp_mode) {
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (!std::isfinite(values[i])) {
                continue;
            }
            utils::split_positional(decimals[i], int_parts[i], tails[i]);
            pad_left = std::max(pad_left, int_parts[i].size());
            pad_right = std::max(pad_right, tails[i].size());
        }
        for (std::size_t i = 0; i < values.size(); ++i) {
            tails[i] = "." + pad_right_(tails[i], pad_right);
        }
    } else {
        std::size_t precision = 0;
        std::size_t exp_width = 2;
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (!std::isfinite(values[i])) {
                continue;
            }
            precision = std::max(precision, decimals[i].digits.size() - 1);
            exp_width = std::max(exp_width, std::to_string(std::abs(decimals[i].exponent)).size());
        }
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (!std::isfinite(values[i])) {
                continue;
            }
            const auto &d = decimals[i];
            int_parts[i] = (d.negative ? "-" : "") + d.digits.substr(0, 1);
            std::string frac = d.digits.substr(1);
            frac.resize(precision, '0');
            std::string exp = std::to_string(std::abs(d.exponent));
            exp = std::string(exp_width - exp.size(), '0') + exp;
            tails[i] = "." + frac + "e" + (d.exponent < 0 ? "-" : "+") + exp;
            pad_left = std::max(pad_left, int_parts[i].size());
        }
    }

    // nan/inf 可能比有限值更宽：所有单元格统一右对齐到最大宽度。
    std::vector<std::string> cells(values.size());
    std::size_t width = 0;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (std::isfinite(values[i])) {
            cells[i] = pad_left_(int_parts[i], pad_left) + tails[i];
        } else {
            cells[i] = special_float_text_(static_cast<double>(values[i]));
        }
        width = std::max(width, cells[i].size());
    }
    for (auto &c : cells) {
        c = pad_left_(c, width);
    }
    return cells;
}

template <class T>
[[nodiscard]] std::vector<std::string> cells_(const std::vector<T> &values, const ElementStyle &style) {
    if constexpr (std::is_floating_point_v<T>) {
        return float_cells_(values, style.half);
    } else {
        std::vector<std::string> cells;
        cells.reserve(values.size());
        std::size_t width = 0;
        for (const auto &v : values) {
            cells.push_back(cell_text_<T>(v, style));
            width = std::max(width, cells.back().size());
        }
        // 字符串不对齐，整数与布尔右对齐。
        if constexpr (!std::is_same_v<T, std::string>) {
            for (auto &c : cells) {
                c = pad_left_(c, width);
            }
        }
        return cells;
    }
}

void nest_(std::string &out,
           const std::vector<std::string> &cells,
           const model::Shape &shape,
           std::size_t axis,
           std::size_t &cursor) {
    out.push_back('[');
    const auto extent = shape[axis];
    const bool last_axis = (axis + 1 == shape.size());
    for (std::uint64_t i = 0; i < extent; ++i) {
        if (i != 0) {
            if (last_axis) {
                out.push_back(' ');
            } else {
                out.append(shape.size() - axis - 1, '\n');
                out.append(axis + 1, ' ');
            }
        }
        if (last_axis) {
            out += cells[cursor++];
        } else {
            nest_(out, cells, shape, axis + 1, cursor);
        }
    }
    out.push_back(']');
}

[[nodiscard]] std::string join_(const std::vector<std::string> &parts) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i != 0) {
            out += ", ";
        }
        out += parts[i];
    }
    return out;
}

// 超限一维数组：首尾各 half 个元素。
[[nodiscard]] std::string elided_text_(const model::NumericArray &array, std::size_t max_items) {
    const std::size_t half = max_items / 2;
    const auto style = style_of_(array);
    std::vector<std::string> head;
    std::vector<std::string> tail;
    std::visit(
        [&](const auto &values) {
            using V = typename std::decay_t<decltype(values)>::value_type;
            const std::size_t n = values.size();
            const std::size_t h = std::min(half, n);
            for (std::size_t i = 0; i < h; ++i) {
                head.push_back(item_text_<V>(values[i], style));
            }
            for (std::size_t i = n - h; i < n; ++i) {
                tail.push_back(item_text_<V>(values[i], style));
            }
        },
        array.elements);

    return "[" + join_(head) + " ... " + join_(tail) + "] (shape=" + model::shape_text(array.shape) +
           ", first/last " + std::to_string(max_items) + " items)";
}

[[nodiscard]] std::string format_array_(const model::NumericArray &array, const RenderConfig &config) {
    const std::size_t n = array.size();
    if (n == 0) {
        return "[] (empty array)";
    }
    if (n <= config.max_display_items) {
        return full_array_text(array);
    }
    if (array.rank() == 1) {
        return elided_text_(array, config.max_display_items);
    }
    return "<array of shape " + model::shape_text(array.shape) + " dtype=" + array.dtype +
           "> (too large to display)";
}

[[nodiscard]] std::string format_blob_(const model::Blob &blob, const RenderConfig &config) {
    // 注意：这里是严格小于，与文本的“小于等于”不对称。
    if (blob.bytes.size() < config.max_string_length) {
        return utils::decode_utf8_lossy(core::bytes_view{blob.bytes.data(), blob.bytes.size()});
    }
    return "<bytes of length " + std::to_string(blob.bytes.size()) + ">";
}

[[nodiscard]] std::string format_text_(const model::Text &text, const RenderConfig &config) {
    if (utils::utf8_length(text.value) <= config.max_string_length) {
        return text.value;
    }
    return utils::utf8_prefix(text.value, config.max_string_length) + kTruncatedSuffix;
}

} // namespace

std::string full_array_text(const model::NumericArray &array) {
    const auto style = style_of_(array);
    const auto cells =
        std::visit([&](const auto &values) { return cells_(values, style); }, array.elements);
    if (array.shape.empty()) {
        return cells.empty() ? std::string{} : cells.front();
    }
    if (cells.size() != model::element_count(array.shape)) {
        // 形状与数据不一致时退化为一维输出。
        std::string out = "[";
        for (std::size_t i = 0; i < cells.size(); ++i) {
            if (i != 0) {
                out.push_back(' ');
            }
            out += cells[i];
        }
        out.push_back(']');
        return out;
    }
    std::string out;
    std::size_t cursor = 0;
    nest_(out, cells, array.shape, 0, cursor);
    return out;
}

std::string ValueFormatter::format(const model::Value &value) const {
    return std::visit(
        [&](const auto &v) -> std::string {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, model::NumericArray>) {
                return format_array_(v, config_);
            } else if constexpr (std::is_same_v<T, model::Blob>) {
                return format_blob_(v, config_);
            } else if constexpr (std::is_same_v<T, model::Text>) {
                return format_text_(v, config_);
            } else {
                static_assert(std::is_same_v<T, model::Opaque>, "unhandled value kind");
                return v.repr;
            }
        },
        value.storage());
}

} // namespace h5tree::format
