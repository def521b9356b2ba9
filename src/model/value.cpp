#include "h5tree/model/value.hpp"

#include <utility>

namespace h5tree::model {

std::size_t NumericArray::size() const noexcept {
  return std::visit([](const auto& v) -> std::size_t { return v.size(); }, elements);
}

Value::Value(NumericArray v) : storage_(std::move(v)) {}
Value::Value(Blob v) : storage_(std::move(v)) {}
Value::Value(Text v) : storage_(std::move(v)) {}
Value::Value(Opaque v) : storage_(std::move(v)) {}

Value Value::array(Shape shape, std::string dtype, Elements elements) {
  return Value(NumericArray{std::move(shape), std::move(dtype), std::move(elements)});
}

Value Value::blob(std::vector<byte> bytes) {
  return Value(Blob{std::move(bytes)});
}

Value Value::text(std::string value) {
  return Value(Text{std::move(value)});
}

Value Value::opaque(std::string repr) {
  return Value(Opaque{std::move(repr)});
}

std::string shape_text(const Shape& shape) {
  std::string out = "(";
  for (std::size_t i = 0; i < shape.size(); ++i) {
    if (i != 0) {
      out += ", ";
    }
    out += std::to_string(shape[i]);
  }
  // 单元素元组需要尾随逗号。
  if (shape.size() == 1) {
    out += ",";
  }
  out += ")";
  return out;
}

std::uint64_t element_count(const Shape& shape) noexcept {
  std::uint64_t n = 1;
  for (const auto d : shape) {
    n *= d;
  }
  return n;
}

}  // namespace h5tree::model
