#pragma once

#include <ostream>
#include <string_view>

namespace h5tree::walk {

/**
 * @brief 行输出：控制台必写，文件（若有）同步写入同一份文本。
 *
 * 两路输出在同一次 write_line 调用内完成，遍历逻辑无需区分输出目标。
 */
class LineSink final {
 public:
  explicit LineSink(std::ostream& console, std::ostream* file = nullptr) noexcept
      : console_(console), file_(file) {}

  void write_line(std::string_view line);

  [[nodiscard]] bool has_file() const noexcept { return file_ != nullptr; }

 private:
  std::ostream& console_;
  std::ostream* file_{nullptr};
};

}  // namespace h5tree::walk
