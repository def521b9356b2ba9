#include "h5tree/walk/tree_walker.hpp"

#include "h5tree/core/error.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <string>
#include <type_traits>
#include <variant>

namespace h5tree::walk {
namespace {

// 缩进与连接符只由 depth 决定，兄弟节点之间不共享可变状态。
[[nodiscard]] std::string indent_(std::size_t depth) {
  return std::string(depth * 2, ' ');
}

[[nodiscard]] std::string branch_prefix_(std::size_t depth) {
  return indent_(depth) + "  ├─ ";
}

[[nodiscard]] std::string detail_prefix_(std::size_t depth) {
  return indent_(depth) + "  │    ├─ ";
}

[[nodiscard]] std::string last_detail_prefix_(std::size_t depth) {
  return indent_(depth) + "  │    └─ ";
}

}  // namespace

void TreeWalker::walk(const model::Group& group, std::ostream* file, std::size_t depth) const {
  LineSink sink(console_, file);
  walk(group, sink, depth);
}

void TreeWalker::walk(const model::Group& group, LineSink& sink, std::size_t depth) const {
  spdlog::debug("walk group {} (depth={})", group.path, depth);

  sink.write_line(indent_(depth) + "Group: " + group.path);
  emit_attributes_(group.attributes, branch_prefix_(depth), sink);

  for (const auto& child : group.children) {
    std::visit(
      [&](const auto& node) {
        using T = std::decay_t<decltype(node)>;

        if constexpr (std::is_same_v<T, model::Group>) {
          sink.write_line(branch_prefix_(depth) + "Subgroup: " + node.name);
          // 中间一级留给 "Subgroup:" 行的视觉嵌套。
          walk(node, sink, depth + 2);
        } else {
          emit_dataset_(node, depth, sink);
        }
      },
      child.storage());
  }
}

void TreeWalker::emit_attributes_(const model::AttributeList& attributes,
                                  const std::string& prefix,
                                  LineSink& sink) const {
  for (const auto& attr : attributes) {
    sink.write_line(prefix + "Attribute: " + attr.name + " = " + formatter_.format(attr.value));
  }
}

void TreeWalker::emit_dataset_(const model::Dataset& dataset, std::size_t depth, LineSink& sink) const {
  const auto detail = detail_prefix_(depth);

  sink.write_line(branch_prefix_(depth) + "Dataset: " + dataset.name);
  sink.write_line(detail + "Path: " + dataset.path);
  sink.write_line(detail + "Shape: " + model::shape_text(dataset.shape));
  sink.write_line(detail + "Dtype: " + dataset.dtype);
  sink.write_line(detail + "Size: " + std::to_string(dataset.size) + " elements");

  emit_attributes_(dataset.attributes, detail, sink);
  emit_content_(dataset, depth, sink);
}

void TreeWalker::emit_content_(const model::Dataset& dataset, std::size_t depth, LineSink& sink) const {
  const auto prefix = last_detail_prefix_(depth) + "Data: ";

  if (dataset.size > formatter_.config().max_display_items) {
    sink.write_line(prefix + "<too large (" + std::to_string(dataset.size) +
                    " elements), skipping display>");
    return;
  }

  auto data = model::Value::opaque({});
  std::string err;
  std::error_code ec;
  try {
    ec = dataset.load(data, err);
  } catch (const std::exception& e) {
    ec = core::make_error_code(core::errc::read_failed);
    err = e.what();
  }

  if (ec) {
    if (err.empty()) {
      err = ec.message();
    }
    spdlog::warn("read {} failed: {}", dataset.path, err);
    sink.write_line(prefix + "<error reading: " + err + ">");
    return;
  }
  sink.write_line(prefix + formatter_.format(data));
}

}  // namespace h5tree::walk
