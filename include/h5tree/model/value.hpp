#pragma once

#include "h5tree/core/common.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace h5tree::model {

using byte = core::byte;

// 各维长度（按存储顺序）；空向量表示标量 "()"。
using Shape = std::vector<std::uint64_t>;

using Elements = std::variant<std::vector<std::int8_t>,
                              std::vector<std::int16_t>,
                              std::vector<std::int32_t>,
                              std::vector<std::int64_t>,
                              std::vector<std::uint8_t>,
                              std::vector<std::uint16_t>,
                              std::vector<std::uint32_t>,
                              std::vector<std::uint64_t>,
                              std::vector<float>,
                              std::vector<double>,
                              std::vector<bool>,
                              std::vector<std::string>>;

/**
 * @brief N 维同构数组（行主序平铺存储）。
 *
 * 约定：
 * - elements 的元素个数等于 shape 各维乘积；
 * - dtype 为元素类型名（如 "int32"、"float64"、"|S8"），决定展示形式；
 * - byte_strings 为真时字符串元素是字节串（打印为 b'...'），否则是文本。
 */
struct NumericArray final {
  Shape shape;
  std::string dtype;
  Elements elements;
  bool byte_strings{false};

  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] std::size_t rank() const noexcept { return shape.size(); }
};

struct Blob final {
  std::vector<byte> bytes;
};

struct Text final {
  std::string value;
};

// 其他值：自带通用文本形式（标量、空数据集、不支持展开的复合类型等）。
struct Opaque final {
  std::string repr;
};

/**
 * @brief 属性值/数据集内容（四选一）。
 */
class Value final {
 public:
  using storage_type = std::variant<NumericArray, Blob, Text, Opaque>;

  Value() = delete;

  explicit Value(NumericArray v);
  explicit Value(Blob v);
  explicit Value(Text v);
  explicit Value(Opaque v);

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  static Value array(Shape shape, std::string dtype, Elements elements);
  static Value blob(std::vector<byte> bytes);
  static Value text(std::string value);
  static Value opaque(std::string repr);

 private:
  storage_type storage_;
};

// 形状的元组写法："()"、"(3,)"、"(2, 3)"。
[[nodiscard]] std::string shape_text(const Shape& shape);

// 各维乘积（空形状为 1）。
[[nodiscard]] std::uint64_t element_count(const Shape& shape) noexcept;

}  // namespace h5tree::model
