#pragma once

#include "h5tree/model/value.hpp"

#include <hdf5.h>

#include <string>
#include <system_error>

namespace h5tree::h5 {

// 读取来源：属性与数据集对字符串的映射不同（见 read_value）。
enum class Source : int {
  attribute = 0,
  dataset = 1,
};

/**
 * @brief HDF5 数据类型的展示名（numpy 风格）。
 *
 * 例："int32"、"uint8"、"float64"、"bool"、"|S8"、"object"、"compound"。
 */
[[nodiscard]] std::string dtype_name(hid_t type);

/**
 * @brief 读取属性或数据集的全部内容。
 *
 * 映射规则：
 * - 整数/浮点/枚举：rank>=1 为数组；标量为 Opaque（自带文本形式）；
 * - FALSE/TRUE 两成员的 int8 枚举视为 bool；
 * - 字符串：属性的变长字符串为 Text，其余标量为 Blob；rank>=1 为字符串数组；
 * - 空数据空间：Opaque "Empty(dtype=...)"；
 * - 复合/引用等不展开的类型：Opaque 占位。
 *
 * 失败返回 errc::read_failed，out_err 为 HDF5 错误栈汇总。
 */
std::error_code read_value(hid_t object, Source source, model::Value& out, std::string& out_err);

/**
 * @brief 读取数据集的形状、元素总数与 dtype（不读内容）。
 */
std::error_code read_dataset_layout(hid_t dataset,
                                    model::Shape& shape,
                                    std::uint64_t& size,
                                    std::string& dtype,
                                    std::string& out_err);

}  // namespace h5tree::h5
