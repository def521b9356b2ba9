/**
 * @file test_tree_walker.cpp
 * @brief TreeWalker 逐行输出单元测试（内存中构造的树，不依赖 HDF5 文件）
 */

#include "h5tree/core/error.hpp"
#include "h5tree/walk/tree_walker.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using h5tree::core::errc;
using h5tree::core::make_error_code;
using h5tree::format::RenderConfig;
using h5tree::model::Attribute;
using h5tree::model::Dataset;
using h5tree::model::Group;
using h5tree::model::Node;
using h5tree::model::Value;
using h5tree::walk::LineSink;
using h5tree::walk::TreeWalker;

struct LoadCounter final {
  int calls{0};
};

Dataset make_dataset(const std::string& parent, const std::string& name, std::vector<std::int32_t> values) {
  Dataset ds;
  ds.name = name;
  ds.path = h5tree::model::join_path(parent, name);
  ds.shape = {values.size()};
  ds.dtype = "int32";
  ds.size = values.size();
  ds.loader = [values](Value& out, std::string&) -> std::error_code {
    out = Value::array({values.size()}, "int32", values);
    return {};
  };
  return ds;
}

Group make_tree(LoadCounter& big_loads) {
  Group root{"/", "/", {}, {}};
  root.attributes.push_back(Attribute{"title", Value::text("demo")});

  auto counts = make_dataset("/", "counts", {1, 2, 3});
  counts.attributes.push_back(Attribute{"units", Value::text("m")});
  root.children.emplace_back(std::move(counts));

  Group sub{"sub", "/sub", {}, {}};
  sub.attributes.push_back(Attribute{"version", Value::opaque("2")});

  Dataset big;
  big.name = "big";
  big.path = "/sub/big";
  big.shape = {1000};
  big.dtype = "float64";
  big.size = 1000;
  big.loader = [&big_loads](Value& out, std::string&) -> std::error_code {
    ++big_loads.calls;
    out = Value::opaque("should not be shown");
    return {};
  };
  sub.children.emplace_back(std::move(big));
  root.children.emplace_back(std::move(sub));

  root.children.emplace_back(make_dataset("/", "tail", {9}));
  return root;
}

const char* const kExpected =
  "Group: /\n"
  "  ├─ Attribute: title = demo\n"
  "  ├─ Dataset: counts\n"
  "  │    ├─ Path: /counts\n"
  "  │    ├─ Shape: (3,)\n"
  "  │    ├─ Dtype: int32\n"
  "  │    ├─ Size: 3 elements\n"
  "  │    ├─ Attribute: units = m\n"
  "  │    └─ Data: [1 2 3]\n"
  "  ├─ Subgroup: sub\n"
  "    Group: /sub\n"
  "      ├─ Attribute: version = 2\n"
  "      ├─ Dataset: big\n"
  "      │    ├─ Path: /sub/big\n"
  "      │    ├─ Shape: (1000,)\n"
  "      │    ├─ Dtype: float64\n"
  "      │    ├─ Size: 1000 elements\n"
  "      │    └─ Data: <too large (1000 elements), skipping display>\n"
  "  ├─ Dataset: tail\n"
  "  │    ├─ Path: /tail\n"
  "  │    ├─ Shape: (1,)\n"
  "  │    ├─ Dtype: int32\n"
  "  │    ├─ Size: 1 elements\n"
  "  │    └─ Data: [9]\n";

void test_walk_emits_tree_lines() {
  LoadCounter big_loads;
  const auto root = make_tree(big_loads);

  std::ostringstream console;
  const TreeWalker walker(RenderConfig{}, console);
  walker.walk(root);

  TEST_EXPECT_EQ(console.str(), std::string(kExpected));
  // 超过上限的数据集不应被读取。
  TEST_EXPECT_EQ(big_loads.calls, 0);
}

void test_walk_writes_same_text_to_file() {
  LoadCounter big_loads;
  const auto root = make_tree(big_loads);

  std::ostringstream console;
  std::ostringstream file;
  const TreeWalker walker(RenderConfig{}, console);
  walker.walk(root, &file);

  TEST_EXPECT_EQ(console.str(), file.str());
  TEST_EXPECT_EQ(file.str(), std::string(kExpected));
}

void test_walk_is_repeatable() {
  LoadCounter big_loads;
  const auto root = make_tree(big_loads);

  std::ostringstream first;
  std::ostringstream second;
  TreeWalker(RenderConfig{}, first).walk(root);
  TreeWalker(RenderConfig{}, second).walk(root);
  TEST_EXPECT_EQ(first.str(), second.str());
}

void test_walk_respects_depth_offset() {
  Group root{"/", "/", {}, {}};
  root.children.emplace_back(Group{"inner", "/inner", {}, {}});

  std::ostringstream console;
  const TreeWalker walker(RenderConfig{}, console);
  walker.walk(root, nullptr, 1);

  TEST_EXPECT_EQ(console.str(),
                 std::string("  Group: /\n"
                             "    ├─ Subgroup: inner\n"
                             "      Group: /inner\n"));
}

void test_read_errors_only_affect_data_line() {
  Group root{"/", "/", {}, {}};

  Dataset failing;
  failing.name = "broken";
  failing.path = "/broken";
  failing.shape = {2};
  failing.dtype = "float32";
  failing.size = 2;
  failing.loader = [](Value&, std::string& err) -> std::error_code {
    err = "filter missing";
    return make_error_code(errc::read_failed);
  };
  root.children.emplace_back(std::move(failing));

  Dataset throwing;
  throwing.name = "thrower";
  throwing.path = "/thrower";
  throwing.shape = {1};
  throwing.dtype = "int32";
  throwing.size = 1;
  throwing.loader = [](Value&, std::string&) -> std::error_code { throw std::runtime_error("boom"); };
  root.children.emplace_back(std::move(throwing));

  Dataset silent;
  silent.name = "silent";
  silent.path = "/silent";
  silent.shape = {1};
  silent.dtype = "int32";
  silent.size = 1;
  silent.loader = [](Value&, std::string&) -> std::error_code { return make_error_code(errc::read_failed); };
  root.children.emplace_back(std::move(silent));

  Dataset detached;
  detached.name = "detached";
  detached.path = "/detached";
  detached.shape = {1};
  detached.dtype = "int32";
  detached.size = 1;
  root.children.emplace_back(std::move(detached));

  root.children.emplace_back(make_dataset("/", "after", {5}));

  std::ostringstream console;
  const TreeWalker walker(RenderConfig{}, console);
  walker.walk(root);
  const auto text = console.str();

  TEST_EXPECT(text.find("  │    └─ Data: <error reading: filter missing>\n") != std::string::npos);
  TEST_EXPECT(text.find("  │    └─ Data: <error reading: boom>\n") != std::string::npos);
  TEST_EXPECT(text.find("  │    └─ Data: <error reading: read failed>\n") != std::string::npos);
  TEST_EXPECT(text.find("  │    └─ Data: <error reading: no payload reader attached>\n") != std::string::npos);
  // 出错之后的兄弟节点照常输出。
  TEST_EXPECT(text.find("  │    └─ Data: [5]\n") != std::string::npos);
}

void test_data_line_uses_formatter_config() {
  Group root{"/", "/", {}, {}};
  root.children.emplace_back(make_dataset("/", "five", {1, 2, 3, 4, 5}));

  RenderConfig cfg;
  cfg.max_display_items = 4;
  std::ostringstream console;
  TreeWalker(cfg, console).walk(root);
  TEST_EXPECT(console.str().find("  │    └─ Data: <too large (5 elements), skipping display>\n") !=
              std::string::npos);

  cfg.max_display_items = 5;
  std::ostringstream console2;
  TreeWalker(cfg, console2).walk(root);
  TEST_EXPECT(console2.str().find("  │    └─ Data: [1 2 3 4 5]\n") != std::string::npos);
}

void test_line_sink_writes_both_targets() {
  std::ostringstream console;
  std::ostringstream file;
  LineSink sink(console, &file);
  TEST_EXPECT(sink.has_file());
  sink.write_line("abc");
  sink.write_line("");
  TEST_EXPECT_EQ(console.str(), "abc\n\n");
  TEST_EXPECT_EQ(file.str(), "abc\n\n");

  std::ostringstream only;
  LineSink console_only(only);
  TEST_EXPECT(!console_only.has_file());
  console_only.write_line("x");
  TEST_EXPECT_EQ(only.str(), "x\n");
}

}  // namespace

int main() {
  test_walk_emits_tree_lines();
  test_walk_writes_same_text_to_file();
  test_walk_is_repeatable();
  test_walk_respects_depth_offset();
  test_read_errors_only_affect_data_line();
  test_data_line_uses_formatter_config();
  test_line_sink_writes_both_targets();
  return ::h5tree::tests::run_and_report();
}
