#pragma once

#include "h5tree/format/render_config.hpp"
#include "h5tree/format/value_formatter.hpp"
#include "h5tree/model/node.hpp"
#include "h5tree/walk/line_sink.hpp"

#include <cstddef>
#include <iostream>
#include <ostream>

namespace h5tree::walk {

/**
 * @brief 容器树的先序深度优先遍历与逐行输出。
 *
 * 输出规则（每行前缀 depth*2 个空格）：
 * - 进入组："Group: <path>"，随后是组属性；
 * - 子组："  ├─ Subgroup: <name>"，然后以 depth+2 递归；
 * - 数据集："  ├─ Dataset: <name>"，随后 Path/Shape/Dtype/Size、数据集属性、Data 行。
 *
 * Data 行只在 size <= max_display_items 时才读取内容；读取失败只影响这一行。
 */
class TreeWalker final {
 public:
  explicit TreeWalker(format::RenderConfig config = {}, std::ostream& console = std::cout) noexcept
      : formatter_(config), console_(console) {}

  // file 非空时与控制台写入完全相同的文本。
  void walk(const model::Group& group, std::ostream* file = nullptr, std::size_t depth = 0) const;

  void walk(const model::Group& group, LineSink& sink, std::size_t depth = 0) const;

 private:
  void emit_attributes_(const model::AttributeList& attributes,
                        const std::string& prefix,
                        LineSink& sink) const;
  void emit_dataset_(const model::Dataset& dataset, std::size_t depth, LineSink& sink) const;
  void emit_content_(const model::Dataset& dataset, std::size_t depth, LineSink& sink) const;

  const format::ValueFormatter formatter_;
  std::ostream& console_;
};

}  // namespace h5tree::walk
