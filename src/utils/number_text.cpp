#include "h5tree/utils/number_text.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string_view>

namespace h5tree::utils {
namespace {

// 解析 to_chars(scientific) 的输出，例如 "-1.25e+03"、"1e-07"。
[[nodiscard]] Decimal parse_scientific_(std::string_view s) {
    Decimal d;
    std::size_t i = 0;
    if (i < s.size() && s[i] == '-') {
        d.negative = true;
        ++i;
    }
    for (; i < s.size() && s[i] != 'e'; ++i) {
        if (s[i] != '.') {
            d.digits.push_back(s[i]);
        }
    }
    if (i < s.size()) {
        ++i;
        int sign = 1;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
            sign = (s[i] == '-') ? -1 : 1;
            ++i;
        }
        int exp = 0;
        std::from_chars(s.data() + i, s.data() + s.size(), exp);
        d.exponent = sign * exp;
    }
    while (d.digits.size() > 1 && d.digits.back() == '0') {
        d.digits.pop_back();
    }
    if (d.digits == "0") {
        d.exponent = 0;
    }
    return d;
}

template <class T>
[[nodiscard]] Decimal shortest_(T value) {
    char buf[64];
    const auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
    return parse_scientific_(std::string_view(buf, static_cast<std::size_t>(res.ptr - buf)));
}

[[nodiscard]] std::string special_text_(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    return value < 0 ? "-inf" : "inf";
}

[[nodiscard]] std::string general_text_(const Decimal &d) {
    std::string out;
    if (d.exponent >= -4 && d.exponent < 16) {
        std::string int_part;
        std::string frac_part;
        split_positional(d, int_part, frac_part);
        out = int_part + "." + (frac_part.empty() ? "0" : frac_part);
        return out;
    }

    if (d.negative) {
        out.push_back('-');
    }
    out.push_back(d.digits[0]);
    if (d.digits.size() > 1) {
        out.push_back('.');
        out.append(d.digits, 1, std::string::npos);
    }
    const int exp = d.exponent;
    out.push_back('e');
    out.push_back(exp < 0 ? '-' : '+');
    const auto mag = std::to_string(std::abs(exp));
    if (mag.size() < 2) {
        out.push_back('0');
    }
    out += mag;
    return out;
}

[[nodiscard]] double decimal_value_(const Decimal &d) {
    std::string text = d.negative ? "-" : "";
    text += d.digits;
    text += "e" + std::to_string(d.exponent - static_cast<int>(d.digits.size()) + 1);
    return std::strtod(text.c_str(), nullptr);
}

// candidate 是否落在 value 的半精度舍入区间内（不含边界）。
[[nodiscard]] bool rounds_to_half_(double candidate, double value) {
    constexpr int kMinNormalExp = -14;
    constexpr int kMantissaBits = 10;

    const double a = std::fabs(value);
    const double c = std::fabs(candidate);
    int exp = 0;
    (void)std::frexp(a, &exp);
    const int e = std::max(exp - 1, kMinNormalExp);
    const double gap_above = std::ldexp(1.0, e - kMantissaBits);
    // 2 的整数次幂：下方相邻值的间距减半。
    const bool power_of_two = (a == std::ldexp(1.0, exp - 1)) && (exp - 1 > kMinNormalExp);
    const double gap_below = power_of_two ? gap_above / 2 : gap_above;

    if (c >= a) {
        return (c - a) < gap_above / 2;
    }
    return (a - c) < gap_below / 2;
}

} // namespace

Decimal to_decimal(double value) { return shortest_(value); }

Decimal to_decimal(float value) { return shortest_(value); }

Decimal to_decimal_half(float value) {
    constexpr int kMaxHalfDigits = 5;
    if (!std::isfinite(value) || value == 0.0f) {
        return to_decimal(value);
    }
    const double v = static_cast<double>(value);
    for (int significant = 1; significant <= kMaxHalfDigits; ++significant) {
        auto d = to_decimal_rounded(v, significant);
        if (rounds_to_half_(decimal_value_(d), v)) {
            return d;
        }
    }
    return to_decimal(value);
}

Decimal to_decimal_rounded(double value, int significant) {
    if (significant < 1) {
        significant = 1;
    }
    char buf[128];
    const auto res = std::to_chars(
        buf, buf + sizeof(buf), value, std::chars_format::scientific, significant - 1);
    return parse_scientific_(std::string_view(buf, static_cast<std::size_t>(res.ptr - buf)));
}

void split_positional(const Decimal &d, std::string &int_part, std::string &frac_part) {
    int_part.clear();
    frac_part.clear();
    if (d.negative) {
        int_part.push_back('-');
    }
    const int n = static_cast<int>(d.digits.size());
    if (d.exponent >= 0) {
        const int int_len = d.exponent + 1;
        for (int i = 0; i < int_len; ++i) {
            int_part.push_back(i < n ? d.digits[static_cast<std::size_t>(i)] : '0');
        }
        if (n > int_len) {
            frac_part.assign(d.digits, static_cast<std::size_t>(int_len), std::string::npos);
        }
        return;
    }
    int_part.push_back('0');
    frac_part.assign(static_cast<std::size_t>(-d.exponent - 1), '0');
    frac_part += d.digits;
}

std::string scalar_text(double value) {
    if (!std::isfinite(value)) {
        return special_text_(value);
    }
    return general_text_(to_decimal(value));
}

std::string scalar_text(float value) {
    if (!std::isfinite(value)) {
        return special_text_(value);
    }
    return general_text_(to_decimal(value));
}

std::string scalar_text(bool value) { return value ? "True" : "False"; }

std::string scalar_text_half(float value) {
    if (!std::isfinite(value)) {
        return special_text_(value);
    }
    return general_text_(to_decimal_half(value));
}

} // namespace h5tree::utils
