#pragma once

#include <system_error>

namespace h5tree::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - reader/session 接口统一返回 std::error_code，不向调用方抛异常；
 * - 需要可读原因时，通过额外的 `std::string &out_err` 参数带回；
 * - read_failed 只影响单个数据集的一行输出，其余错误会终止本次探查。
 */
enum class errc : int {
  ok = 0,
  file_not_found = 1,
  unreadable_file = 2,
  read_failed = 3,
  unsupported_type = 4,
  output_open_failed = 5,
  unexpected = 6,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace h5tree::core

namespace std {
template <>
struct is_error_code_enum<h5tree::core::errc> : true_type {};
}  // namespace std
