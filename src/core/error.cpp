#include "h5tree/core/error.hpp"

#include <string>

namespace h5tree::core {
namespace {

// core::errc 的 std::error_category 实现：
// - name() 用于区分错误域
// - message() 返回可读的英文描述（用于日志；面向用户的提示由 session 拼装）
class h5tree_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "h5tree.core"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::file_not_found:
        return "file not found";
      case errc::unreadable_file:
        return "unreadable file";
      case errc::read_failed:
        return "read failed";
      case errc::unsupported_type:
        return "unsupported type";
      case errc::output_open_failed:
        return "output open failed";
      case errc::unexpected:
        return "unexpected error";
      default:
        return "unknown h5tree.core error";
    }
  }
};

}  // 匿名命名空间

const std::error_category& error_category() noexcept {
  static h5tree_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // 命名空间 h5tree::core
