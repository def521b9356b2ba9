#pragma once

#include <hdf5.h>

#include <string>
#include <string_view>

namespace h5tree::h5 {

/**
 * @brief HDF5 标识符（hid_t）的 RAII 持有者。
 *
 * - 只可移动，析构时用构造时给定的 close 函数释放；
 * - 无效 id（< 0）不会被关闭，可直接用 valid() 判定上一次 HDF5 调用是否成功。
 */
class Handle final {
 public:
  using closer_type = herr_t (*)(hid_t);

  Handle() noexcept = default;
  Handle(hid_t id, closer_type closer) noexcept : id_(id), closer_(closer) {}
  ~Handle() { close(); }

  Handle(Handle&& other) noexcept;
  Handle& operator=(Handle&& other) noexcept;

  Handle(const Handle&) = delete;
  Handle& operator=(const Handle&) = delete;

  [[nodiscard]] hid_t id() const noexcept { return id_; }
  [[nodiscard]] bool valid() const noexcept { return id_ >= 0; }

  void close() noexcept;

 private:
  hid_t id_{H5I_INVALID_HID};
  closer_type closer_{nullptr};
};

// 关闭 HDF5 默认的错误栈自动打印（错误统一由调用方汇总）。
void silence_error_printing() noexcept;

/**
 * @brief 汇总并清空当前线程的 HDF5 错误栈。
 *
 * 返回 "<API 层描述> (<最内层描述>)"；错误栈为空时返回 fallback。
 */
[[nodiscard]] std::string error_stack_message(std::string_view fallback);

}  // namespace h5tree::h5
