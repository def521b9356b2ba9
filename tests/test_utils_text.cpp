/**
 * @file test_utils_text.cpp
 * @brief UTF-8 与数字文本工具单元测试
 */

#include "h5tree/utils/number_text.hpp"
#include "h5tree/utils/utf8.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace {

using namespace h5tree::utils;
using h5tree::core::byte;
using h5tree::core::bytes_view;

const std::string kReplacement = "\xEF\xBF\xBD";

std::string decode(const std::vector<byte>& bytes) {
  return decode_utf8_lossy(bytes_view{bytes.data(), bytes.size()});
}

void test_utf8_length_counts_code_points() {
  TEST_EXPECT_EQ(utf8_length(""), 0u);
  TEST_EXPECT_EQ(utf8_length("abc"), 3u);
  TEST_EXPECT_EQ(utf8_length("h\xC3\xA9llo"), 5u);        // héllo
  TEST_EXPECT_EQ(utf8_length("\xE4\xB8\xAD\xE6\x96\x87"), 2u);  // 中文
  // 非法字节各自计为一个码点。
  TEST_EXPECT_EQ(utf8_length("a\xFF" "b"), 3u);
}

void test_utf8_prefix() {
  TEST_EXPECT_EQ(utf8_prefix("abcdef", 3), "abc");
  TEST_EXPECT_EQ(utf8_prefix("h\xC3\xA9llo", 2), "h\xC3\xA9");
  TEST_EXPECT_EQ(utf8_prefix("abc", 10), "abc");
  TEST_EXPECT_EQ(utf8_prefix("abc", 0), "");
}

void test_lossy_decode() {
  TEST_EXPECT_EQ(decode({'o', 'k'}), "ok");
  TEST_EXPECT_EQ(decode({0x61, 0xFF, 0x62}), "a" + kReplacement + "b");
  // 截断的多字节序列只替换为一个 U+FFFD。
  TEST_EXPECT_EQ(decode({0x61, 0xE4, 0xB8}), "a" + kReplacement);
  // 过长编码 / 代理区都是非法的。
  TEST_EXPECT_EQ(decode({0xC0, 0x80}), kReplacement + kReplacement);
  TEST_EXPECT_EQ(decode({0xED, 0xA0, 0x80}), kReplacement + kReplacement + kReplacement);
  TEST_EXPECT_EQ(decode({0xE4, 0xB8, 0xAD}), "\xE4\xB8\xAD");
  TEST_EXPECT_EQ(decode({}), "");
}

void test_scalar_text() {
  TEST_EXPECT_EQ(scalar_text(std::int32_t{5}), "5");
  TEST_EXPECT_EQ(scalar_text(std::int8_t{-3}), "-3");
  TEST_EXPECT_EQ(scalar_text(std::uint8_t{200}), "200");
  TEST_EXPECT_EQ(scalar_text(true), "True");
  TEST_EXPECT_EQ(scalar_text(false), "False");

  TEST_EXPECT_EQ(scalar_text(3.14), "3.14");
  TEST_EXPECT_EQ(scalar_text(1.0), "1.0");
  TEST_EXPECT_EQ(scalar_text(0.0), "0.0");
  TEST_EXPECT_EQ(scalar_text(-2.5), "-2.5");
  TEST_EXPECT_EQ(scalar_text(100000.0), "100000.0");
  TEST_EXPECT_EQ(scalar_text(1e16), "1e+16");
  TEST_EXPECT_EQ(scalar_text(1.5e-5), "1.5e-05");
  TEST_EXPECT_EQ(scalar_text(0.0001), "0.0001");
  TEST_EXPECT_EQ(scalar_text(0.1f), "0.1");
  TEST_EXPECT_EQ(scalar_text(std::numeric_limits<double>::quiet_NaN()), "nan");
  TEST_EXPECT_EQ(scalar_text(-std::numeric_limits<double>::infinity()), "-inf");
}

void test_half_precision_text() {
  TEST_EXPECT_EQ(scalar_text_half(0.0999755859375f), "0.1");
  TEST_EXPECT_EQ(scalar_text_half(1.0009765625f), "1.001");
  TEST_EXPECT_EQ(scalar_text_half(65504.0f), "65500.0");
  TEST_EXPECT_EQ(scalar_text_half(0.5f), "0.5");
  TEST_EXPECT_EQ(scalar_text_half(0.0f), "0.0");
  TEST_EXPECT_EQ(scalar_text_half(-2.0f), "-2.0");

  const auto d = to_decimal_half(0.0999755859375f);
  TEST_EXPECT_EQ(d.digits, std::string("1"));
  TEST_EXPECT_EQ(d.exponent, -1);
}

void test_decimal_rounding() {
  const auto d = to_decimal_rounded(0.123456789, 8);
  TEST_EXPECT_EQ(d.digits, std::string("12345679"));
  TEST_EXPECT_EQ(d.exponent, -1);

  std::string int_part;
  std::string frac_part;
  split_positional(d, int_part, frac_part);
  TEST_EXPECT_EQ(int_part, "0");
  TEST_EXPECT_EQ(frac_part, "12345679");

  split_positional(to_decimal(1200.0), int_part, frac_part);
  TEST_EXPECT_EQ(int_part, "1200");
  TEST_EXPECT_EQ(frac_part, "");
}

}  // namespace

int main() {
  test_utf8_length_counts_code_points();
  test_utf8_prefix();
  test_lossy_decode();
  test_scalar_text();
  test_half_precision_text();
  test_decimal_rounding();
  return ::h5tree::tests::run_and_report();
}
