#pragma once

#include "h5tree/format/render_config.hpp"
#include "h5tree/walk/tree_walker.hpp"

#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <system_error>

namespace h5tree::session {

/**
 * @brief 一次探查会话：打开文件、遍历输出、汇报结果。
 *
 * 两种模式：
 * - 指定 output_path：先写 60 个 '=' 的分隔行，再遍历；关闭文件后提示保存位置；
 * - 仅控制台：先写 "HDF5 File Structure: <path>" 与分隔行，遍历后写空行与完成提示。
 *
 * 所有失败都在这里转成一行可读提示并以错误码返回，不会向调用方抛异常：
 * - errc::file_not_found / unreadable_file / output_open_failed / unexpected。
 * 文件打开失败时不会创建输出文件；输出文件写入失败（如磁盘已满）同样报 output_open_failed。
 *
 * 诊断日志走 spdlog 默认 logger（默认写 stdout）。需要与报告分开时，
 * 先调用 core::use_stderr_logger()。
 */
class Explorer final {
 public:
  explicit Explorer(format::RenderConfig config = {}, std::ostream& console = std::cout) noexcept
      : config_(config), console_(console), walker_(config, console) {}

  std::error_code explore(const std::string& path,
                          const std::optional<std::string>& output_path = std::nullopt) const;

 private:
  std::error_code explore_impl_(const std::string& path, const std::optional<std::string>& output_path) const;

  const format::RenderConfig config_;
  std::ostream& console_;
  const walk::TreeWalker walker_;
};

// 报告分隔行（kSeparatorWidth 个 '='）。
[[nodiscard]] std::string separator_line();

}  // namespace h5tree::session
