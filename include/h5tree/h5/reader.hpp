#pragma once

#include "h5tree/h5/handle.hpp"
#include "h5tree/model/node.hpp"

#include <memory>
#include <string>
#include <system_error>

namespace h5tree::h5 {

/**
 * @brief 只读打开的 HDF5 文件。
 *
 * 文件句柄以 shared_ptr 持有：load_root() 产生的数据集读取器会共享它，
 * 因此在树被丢弃前文件不会被关闭。
 */
class File final {
 public:
  File() = default;

  /**
   * @brief 只读打开文件。
   *
   * - 路径不存在：errc::file_not_found；
   * - 不是 HDF5 文件或无法打开：errc::unreadable_file，out_err 为底层原因。
   */
  static std::error_code open(const std::string& path, File& out, std::string& out_err);

  [[nodiscard]] bool is_open() const noexcept { return handle_ && handle_->valid(); }
  [[nodiscard]] hid_t id() const noexcept { return handle_ ? handle_->id() : H5I_INVALID_HID; }
  [[nodiscard]] const std::string& path() const noexcept { return path_; }

 private:
  friend std::error_code load_root(const File& file, model::Group& out, std::string& out_err);

  std::shared_ptr<Handle> handle_;
  std::string path_;
};

/**
 * @brief 读取根组下的完整结构（组、数据集、属性）。
 *
 * - 子节点与属性的顺序：跟踪了创建顺序时按创建顺序，否则按名字；
 * - 软链接/外部链接会被跟随，悬空链接跳过并记 warn；
 * - 指向祖先组的链接只输出组本身，不再展开（防止环）；
 * - 数据集内容不在此处读取，由 Dataset::loader 按需读取。
 *
 * 结构读取失败返回 errc::unreadable_file。
 */
std::error_code load_root(const File& file, model::Group& out, std::string& out_err);

}  // namespace h5tree::h5
