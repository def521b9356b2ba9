#pragma once

#include "h5tree/model/value.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace h5tree::model {

struct Attribute final {
  std::string name;
  Value value;
};

using AttributeList = std::vector<Attribute>;

/**
 * @brief 按需读取数据集全部内容。
 *
 * 失败时返回非零错误码，并通过 out_err 带回可读原因（用于 "<error reading: ...>"）。
 */
using PayloadLoader = std::function<std::error_code(Value& out, std::string& out_err)>;

class Node;

/**
 * @brief 组：属性 + 有序子节点（顺序与容器原生顺序一致）。
 *
 * 根组的 name 与 path 都是 "/"。
 */
struct Group final {
  std::string name;
  std::string path;
  AttributeList attributes;
  std::vector<Node> children;
};

struct Dataset final {
  std::string name;
  std::string path;
  AttributeList attributes;
  Shape shape;
  std::string dtype;
  std::uint64_t size{0};
  PayloadLoader loader;

  // 未设置 loader 时返回 errc::read_failed。
  std::error_code load(Value& out, std::string& out_err) const;
};

/**
 * @brief 容器树节点（Group / Dataset 二选一）。
 */
class Node final {
 public:
  using storage_type = std::variant<Group, Dataset>;

  Node() = delete;

  explicit Node(Group v);
  explicit Node(Dataset v);

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  [[nodiscard]] const std::string& name() const noexcept;

 private:
  storage_type storage_;
};

// 由父路径与链接名拼出绝对路径（根为 "/"）。
[[nodiscard]] std::string join_path(const std::string& parent, const std::string& name);

}  // namespace h5tree::model
