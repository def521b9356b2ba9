#include "h5tree/h5/handle.hpp"

#include <utility>
#include <vector>

namespace h5tree::h5 {

Handle::Handle(Handle&& other) noexcept
    : id_(std::exchange(other.id_, H5I_INVALID_HID)), closer_(std::exchange(other.closer_, nullptr)) {}

Handle& Handle::operator=(Handle&& other) noexcept {
  if (this != &other) {
    close();
    id_ = std::exchange(other.id_, H5I_INVALID_HID);
    closer_ = std::exchange(other.closer_, nullptr);
  }
  return *this;
}

void Handle::close() noexcept {
  if (valid() && closer_ != nullptr) {
    // 析构路径上无法上报，关闭失败只会留在 HDF5 错误栈里。
    (void)closer_(id_);
  }
  id_ = H5I_INVALID_HID;
  closer_ = nullptr;
}

void silence_error_printing() noexcept {
  (void)H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
}

std::string error_stack_message(std::string_view fallback) {
  std::vector<std::string> descs;

  const auto walker = [](unsigned, const H5E_error2_t* err, void* data) -> herr_t {
    auto* out = static_cast<std::vector<std::string>*>(data);
    if (err != nullptr && err->desc != nullptr && err->desc[0] != '\0') {
      out->emplace_back(err->desc);
    }
    return 0;
  };

  // DOWNWARD：从 API 层开始，到最早发现错误的内层函数结束。
  const herr_t walk_err = H5Ewalk2(H5E_DEFAULT, H5E_WALK_DOWNWARD, walker, &descs);
  (void)H5Eclear2(H5E_DEFAULT);

  if (walk_err < 0 || descs.empty()) {
    return std::string(fallback);
  }
  if (descs.size() == 1) {
    return descs.front();
  }
  return descs.front() + " (" + descs.back() + ")";
}

}  // namespace h5tree::h5
