#include "h5tree/utils/utf8.hpp"

namespace h5tree::utils {
namespace {

constexpr const char *kReplacement = "\xEF\xBF\xBD";  // U+FFFD

struct Sequence final {
    std::size_t length{1};
    bool valid{false};
};

[[nodiscard]] bool is_continuation_(unsigned char c) noexcept {
    return (c & 0xC0U) == 0x80U;
}

// 按 Unicode 表 3-7 判定 [pos, ...) 处的序列：
// - 合法：返回完整长度；
// - 非法：返回最大非法子段长度（至少 1）。
[[nodiscard]] Sequence next_sequence_(const unsigned char *p,
                                      std::size_t size,
                                      std::size_t pos) noexcept {
    const unsigned char lead = p[pos];
    if (lead < 0x80U) {
        return {1, true};
    }

    std::size_t need = 0;
    unsigned char lo = 0x80U;
    unsigned char hi = 0xBFU;
    if (lead >= 0xC2U && lead <= 0xDFU) {
        need = 1;
    } else if (lead == 0xE0U) {
        need = 2;
        lo = 0xA0U;
    } else if (lead >= 0xE1U && lead <= 0xECU) {
        need = 2;
    } else if (lead == 0xEDU) {
        need = 2;
        hi = 0x9FU;
    } else if (lead >= 0xEEU && lead <= 0xEFU) {
        need = 2;
    } else if (lead == 0xF0U) {
        need = 3;
        lo = 0x90U;
    } else if (lead >= 0xF1U && lead <= 0xF3U) {
        need = 3;
    } else if (lead == 0xF4U) {
        need = 3;
        hi = 0x8FU;
    } else {
        return {1, false};
    }

    std::size_t consumed = 1;
    for (std::size_t k = 0; k < need; ++k) {
        const std::size_t at = pos + 1 + k;
        if (at >= size) {
            return {consumed, false};
        }
        const unsigned char c = p[at];
        // 只有第二个字节有收窄的取值范围。
        const bool ok = (k == 0) ? (c >= lo && c <= hi) : is_continuation_(c);
        if (!ok) {
            return {consumed, false};
        }
        ++consumed;
    }
    return {consumed, true};
}

} // namespace

std::size_t utf8_length(std::string_view text) noexcept {
    const auto *p = reinterpret_cast<const unsigned char *>(text.data());
    std::size_t count = 0;
    for (std::size_t i = 0; i < text.size();) {
        i += next_sequence_(p, text.size(), i).length;
        ++count;
    }
    return count;
}

std::string utf8_prefix(std::string_view text, std::size_t count) {
    const auto *p = reinterpret_cast<const unsigned char *>(text.data());
    std::size_t i = 0;
    for (std::size_t n = 0; n < count && i < text.size(); ++n) {
        i += next_sequence_(p, text.size(), i).length;
    }
    return std::string(text.substr(0, i));
}

std::string decode_utf8_lossy(core::bytes_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (std::size_t i = 0; i < bytes.size();) {
        const auto seq = next_sequence_(bytes.data(), bytes.size(), i);
        if (seq.valid) {
            out.append(reinterpret_cast<const char *>(bytes.data() + i), seq.length);
        } else {
            out += kReplacement;
        }
        i += seq.length;
    }
    return out;
}

} // namespace h5tree::utils
