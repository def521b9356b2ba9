#include "h5tree/model/node.hpp"

#include "h5tree/core/error.hpp"

#include <utility>

namespace h5tree::model {

std::error_code Dataset::load(Value& out, std::string& out_err) const {
  if (!loader) {
    out_err = "no payload reader attached";
    return core::make_error_code(core::errc::read_failed);
  }
  return loader(out, out_err);
}

Node::Node(Group v) : storage_(std::move(v)) {}
Node::Node(Dataset v) : storage_(std::move(v)) {}

const std::string& Node::name() const noexcept {
  return std::visit([](const auto& v) -> const std::string& { return v.name; }, storage_);
}

std::string join_path(const std::string& parent, const std::string& name) {
  if (parent.empty() || parent == "/") {
    return "/" + name;
  }
  return parent + "/" + name;
}

}  // namespace h5tree::model
