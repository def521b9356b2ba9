#include "h5tree/h5/value_reader.hpp"

#include "h5tree/core/error.hpp"
#include "h5tree/h5/handle.hpp"
#include "h5tree/utils/number_text.hpp"

#include <cstdint>
#include <cstring>
#include <functional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace h5tree::h5 {
namespace {

using ReadFn = std::function<herr_t(hid_t mem_type, void* buf)>;

[[nodiscard]] std::error_code fail_(std::string& out_err, std::string_view context) {
  out_err = error_stack_message(context);
  return core::make_error_code(core::errc::read_failed);
}

[[nodiscard]] std::string member_name_(hid_t type, unsigned index) {
  char* raw = H5Tget_member_name(type, index);
  if (raw == nullptr) {
    return {};
  }
  std::string name(raw);
  H5free_memory(raw);
  return name;
}

// 常见约定：bool 以 int8 枚举 {FALSE=0, TRUE=1} 存储。
[[nodiscard]] bool is_bool_enum_(hid_t type) {
  if (H5Tget_nmembers(type) != 2) {
    return false;
  }
  Handle super(H5Tget_super(type), H5Tclose);
  if (!super.valid() || H5Tget_size(super.id()) != 1) {
    return false;
  }
  return member_name_(type, 0) == "FALSE" && member_name_(type, 1) == "TRUE";
}

[[nodiscard]] std::string integer_name_(hid_t type) {
  const auto bits = H5Tget_size(type) * 8;
  const bool is_unsigned = (H5Tget_sign(type) == H5T_SGN_NONE);
  return std::string(is_unsigned ? "uint" : "int") + std::to_string(bits);
}

[[nodiscard]] std::error_code read_shape_(hid_t space, model::Shape& shape, std::string& out_err) {
  const int ndims = H5Sget_simple_extent_ndims(space);
  if (ndims < 0) {
    return fail_(out_err, "unable to get dataspace rank");
  }
  std::vector<hsize_t> dims(static_cast<std::size_t>(ndims));
  if (ndims > 0 && H5Sget_simple_extent_dims(space, dims.data(), nullptr) < 0) {
    return fail_(out_err, "unable to get dataspace dimensions");
  }
  shape.assign(dims.begin(), dims.end());
  return {};
}

template <class T>
[[nodiscard]] model::Value numeric_value_(model::Shape shape, std::string dtype, std::vector<T> values) {
  if (shape.empty()) {
    // 标量：不是数组，直接给出通用文本形式。
    if constexpr (std::is_same_v<T, bool>) {
      return model::Value::opaque(utils::scalar_text(static_cast<bool>(values.front())));
    } else if constexpr (std::is_same_v<T, float>) {
      return model::Value::opaque(dtype == "float16" ? utils::scalar_text_half(values.front())
                                                     : utils::scalar_text(values.front()));
    } else {
      return model::Value::opaque(utils::scalar_text(values.front()));
    }
  }
  return model::Value::array(std::move(shape), std::move(dtype), model::Elements{std::move(values)});
}

template <class T>
[[nodiscard]] std::error_code read_numeric_(const ReadFn& read,
                                            hid_t mem_type,
                                            std::size_t count,
                                            std::vector<T>& out,
                                            std::string& out_err) {
  out.resize(count);
  if (count != 0 && read(mem_type, out.data()) < 0) {
    return fail_(out_err, "unable to read data");
  }
  return {};
}

template <class T>
[[nodiscard]] std::error_code read_integer_as_(const ReadFn& read,
                                               hid_t mem_type,
                                               std::size_t count,
                                               model::Shape shape,
                                               std::string dtype,
                                               model::Value& out,
                                               std::string& out_err) {
  std::vector<T> values;
  if (auto ec = read_numeric_(read, mem_type, count, values, out_err)) {
    return ec;
  }
  out = numeric_value_(std::move(shape), std::move(dtype), std::move(values));
  return {};
}

// 按内存整数类型的宽度与符号分派到具体的 C++ 类型。
[[nodiscard]] std::error_code read_integer_(const ReadFn& read,
                                            hid_t mem_type,
                                            hid_t layout_type,
                                            std::size_t count,
                                            model::Shape shape,
                                            std::string dtype,
                                            model::Value& out,
                                            std::string& out_err) {
  const auto size = H5Tget_size(layout_type);
  const bool is_unsigned = (H5Tget_sign(layout_type) == H5T_SGN_NONE);
  switch (size) {
    case 1:
      return is_unsigned
               ? read_integer_as_<std::uint8_t>(read, mem_type, count, std::move(shape), std::move(dtype), out, out_err)
               : read_integer_as_<std::int8_t>(read, mem_type, count, std::move(shape), std::move(dtype), out, out_err);
    case 2:
      return is_unsigned
               ? read_integer_as_<std::uint16_t>(read, mem_type, count, std::move(shape), std::move(dtype), out, out_err)
               : read_integer_as_<std::int16_t>(read, mem_type, count, std::move(shape), std::move(dtype), out, out_err);
    case 4:
      return is_unsigned
               ? read_integer_as_<std::uint32_t>(read, mem_type, count, std::move(shape), std::move(dtype), out, out_err)
               : read_integer_as_<std::int32_t>(read, mem_type, count, std::move(shape), std::move(dtype), out, out_err);
    case 8:
      return is_unsigned
               ? read_integer_as_<std::uint64_t>(read, mem_type, count, std::move(shape), std::move(dtype), out, out_err)
               : read_integer_as_<std::int64_t>(read, mem_type, count, std::move(shape), std::move(dtype), out, out_err);
    default:
      out_err = "unsupported integer width " + std::to_string(size);
      return core::make_error_code(core::errc::unsupported_type);
  }
}

[[nodiscard]] std::error_code read_enum_(const ReadFn& read,
                                         hid_t file_type,
                                         std::size_t count,
                                         model::Shape shape,
                                         std::string dtype,
                                         model::Value& out,
                                         std::string& out_err) {
  // 枚举之间按成员名转换；内存侧使用原生枚举，再按底层整数解释。
  Handle mem(H5Tget_native_type(file_type, H5T_DIR_ASCEND), H5Tclose);
  if (!mem.valid()) {
    return fail_(out_err, "unable to get native enum type");
  }
  Handle base(H5Tget_super(mem.id()), H5Tclose);
  if (!base.valid()) {
    return fail_(out_err, "unable to get enum base type");
  }

  if (is_bool_enum_(file_type)) {
    std::vector<std::int8_t> raw;
    if (auto ec = read_numeric_(read, mem.id(), count, raw, out_err)) {
      return ec;
    }
    std::vector<bool> values(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
      values[i] = (raw[i] != 0);
    }
    out = numeric_value_(std::move(shape), std::move(dtype), std::move(values));
    return {};
  }
  return read_integer_(read, mem.id(), base.id(), count, std::move(shape), std::move(dtype), out, out_err);
}

[[nodiscard]] std::error_code read_float_(const ReadFn& read,
                                          hid_t file_type,
                                          std::size_t count,
                                          model::Shape shape,
                                          std::string dtype,
                                          model::Value& out,
                                          std::string& out_err) {
  // float16 按 float 读取（HDF5 负责格式转换）。
  if (H5Tget_size(file_type) <= 4) {
    std::vector<float> values;
    if (auto ec = read_numeric_(read, H5T_NATIVE_FLOAT, count, values, out_err)) {
      return ec;
    }
    out = numeric_value_(std::move(shape), std::move(dtype), std::move(values));
    return {};
  }
  std::vector<double> values;
  if (auto ec = read_numeric_(read, H5T_NATIVE_DOUBLE, count, values, out_err)) {
    return ec;
  }
  out = numeric_value_(std::move(shape), std::move(dtype), std::move(values));
  return {};
}

[[nodiscard]] std::error_code read_strings_(const ReadFn& read,
                                            hid_t file_type,
                                            hid_t space,
                                            std::size_t count,
                                            std::vector<std::string>& out,
                                            std::string& out_err) {
  out.clear();
  out.reserve(count);
  if (count == 0) {
    return {};
  }

  if (H5Tis_variable_str(file_type) > 0) {
    Handle mem(H5Tcopy(H5T_C_S1), H5Tclose);
    if (!mem.valid() || H5Tset_size(mem.id(), H5T_VARIABLE) < 0 ||
        H5Tset_cset(mem.id(), H5Tget_cset(file_type)) < 0) {
      return fail_(out_err, "unable to build string memory type");
    }
    std::vector<char*> ptrs(count, nullptr);
    if (read(mem.id(), ptrs.data()) < 0) {
      return fail_(out_err, "unable to read data");
    }
    for (auto* p : ptrs) {
      out.emplace_back(p != nullptr ? p : "");
    }
    (void)H5Dvlen_reclaim(mem.id(), space, H5P_DEFAULT, ptrs.data());
    return {};
  }

  const std::size_t width = H5Tget_size(file_type);
  Handle mem(H5Tcopy(file_type), H5Tclose);
  if (!mem.valid()) {
    return fail_(out_err, "unable to build string memory type");
  }
  std::vector<char> buf(width * count, '\0');
  if (read(mem.id(), buf.data()) < 0) {
    return fail_(out_err, "unable to read data");
  }
  for (std::size_t i = 0; i < count; ++i) {
    const char* p = buf.data() + i * width;
    // 定长字符串去掉尾部填充的 '\0'。
    std::size_t len = width;
    while (len > 0 && p[len - 1] == '\0') {
      --len;
    }
    out.emplace_back(p, len);
  }
  return {};
}

}  // namespace

std::string dtype_name(hid_t type) {
  switch (H5Tget_class(type)) {
    case H5T_INTEGER:
      return integer_name_(type);
    case H5T_FLOAT:
      return "float" + std::to_string(H5Tget_size(type) * 8);
    case H5T_ENUM: {
      if (is_bool_enum_(type)) {
        return "bool";
      }
      Handle super(H5Tget_super(type), H5Tclose);
      return super.valid() ? integer_name_(super.id()) : "enum";
    }
    case H5T_STRING:
      if (H5Tis_variable_str(type) > 0) {
        return "object";
      }
      return "|S" + std::to_string(H5Tget_size(type));
    case H5T_COMPOUND:
      return "compound";
    case H5T_OPAQUE:
      return "opaque";
    case H5T_BITFIELD:
      return "bitfield";
    case H5T_REFERENCE:
      return "reference";
    case H5T_ARRAY:
      return "array";
    case H5T_VLEN:
      return "vlen";
    case H5T_TIME:
      return "time";
    default:
      return "unknown";
  }
}

std::error_code read_dataset_layout(hid_t dataset,
                                    model::Shape& shape,
                                    std::uint64_t& size,
                                    std::string& dtype,
                                    std::string& out_err) {
  Handle space(H5Dget_space(dataset), H5Sclose);
  if (!space.valid()) {
    return fail_(out_err, "unable to get dataspace");
  }
  Handle type(H5Dget_type(dataset), H5Tclose);
  if (!type.valid()) {
    return fail_(out_err, "unable to get datatype");
  }
  if (auto ec = read_shape_(space.id(), shape, out_err)) {
    return ec;
  }
  const hssize_t npoints = H5Sget_simple_extent_npoints(space.id());
  if (npoints < 0) {
    return fail_(out_err, "unable to get number of elements");
  }
  size = static_cast<std::uint64_t>(npoints);
  dtype = dtype_name(type.id());
  return {};
}

std::error_code read_value(hid_t object, Source source, model::Value& out, std::string& out_err) {
  const bool is_attribute = (source == Source::attribute);

  Handle space(is_attribute ? H5Aget_space(object) : H5Dget_space(object), H5Sclose);
  if (!space.valid()) {
    return fail_(out_err, "unable to get dataspace");
  }
  Handle type(is_attribute ? H5Aget_type(object) : H5Dget_type(object), H5Tclose);
  if (!type.valid()) {
    return fail_(out_err, "unable to get datatype");
  }

  auto dtype = dtype_name(type.id());
  if (H5Sget_simple_extent_type(space.id()) == H5S_NULL) {
    out = model::Value::opaque("Empty(dtype=" + dtype + ")");
    return {};
  }

  model::Shape shape;
  if (auto ec = read_shape_(space.id(), shape, out_err)) {
    return ec;
  }
  const auto count = static_cast<std::size_t>(model::element_count(shape));

  const ReadFn read = [&](hid_t mem_type, void* buf) -> herr_t {
    if (is_attribute) {
      return H5Aread(object, mem_type, buf);
    }
    return H5Dread(object, mem_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, buf);
  };

  switch (H5Tget_class(type.id())) {
    case H5T_INTEGER: {
      Handle mem(H5Tget_native_type(type.id(), H5T_DIR_ASCEND), H5Tclose);
      if (!mem.valid()) {
        return fail_(out_err, "unable to get native integer type");
      }
      return read_integer_(read, mem.id(), mem.id(), count, std::move(shape), std::move(dtype), out, out_err);
    }
    case H5T_FLOAT:
      return read_float_(read, type.id(), count, std::move(shape), std::move(dtype), out, out_err);
    case H5T_ENUM:
      return read_enum_(read, type.id(), count, std::move(shape), std::move(dtype), out, out_err);
    case H5T_STRING: {
      std::vector<std::string> values;
      if (auto ec = read_strings_(read, type.id(), space.id(), count, values, out_err)) {
        return ec;
      }
      // 只有属性上的变长字符串是文本，其余都按字节串处理。
      const bool is_text = is_attribute && H5Tis_variable_str(type.id()) > 0;
      if (!shape.empty()) {
        out = model::Value(model::NumericArray{
          std::move(shape), std::move(dtype), model::Elements{std::move(values)}, !is_text});
        return {};
      }
      auto& s = values.front();
      if (is_text) {
        out = model::Value::text(std::move(s));
      } else {
        out = model::Value::blob(std::vector<model::byte>(s.begin(), s.end()));
      }
      return {};
    }
    default:
      break;
  }

  // 不展开的类型：只给出类型与形状。
  if (shape.empty()) {
    out = model::Value::opaque("<" + dtype + " value>");
  } else {
    out = model::Value::opaque("<" + dtype + " array of shape " + model::shape_text(shape) + ">");
  }
  return {};
}

}  // namespace h5tree::h5
