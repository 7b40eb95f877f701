#include "stumper/utils/utf8.hpp"

#include <cstddef>
#include <cstdint>

namespace stumper::utils {
namespace {

[[nodiscard]] bool is_continuation_(unsigned char c) noexcept {
    return (c & 0xC0U) == 0x80U;
}

/**
 * 解码从 data[pos] 开始的一个码点，写入 cp，返回其字节数；非法时返回 0。
 */
[[nodiscard]] std::size_t decode_one_(const unsigned char *data,
                                      std::size_t size,
                                      std::size_t pos,
                                      std::uint32_t &cp) noexcept {
    const unsigned char lead = data[pos];
    if (lead < 0x80U) {
        cp = lead;
        return 1;
    }

    std::size_t n = 0;
    std::uint32_t v = 0;
    std::uint32_t min_cp = 0;
    if ((lead & 0xE0U) == 0xC0U) {
        n = 2;
        v = lead & 0x1FU;
        min_cp = 0x80;
    } else if ((lead & 0xF0U) == 0xE0U) {
        n = 3;
        v = lead & 0x0FU;
        min_cp = 0x800;
    } else if ((lead & 0xF8U) == 0xF0U) {
        n = 4;
        v = lead & 0x07U;
        min_cp = 0x10000;
    } else {
        return 0;
    }

    if (size - pos < n) {
        return 0;
    }
    for (std::size_t i = 1; i < n; ++i) {
        const unsigned char c = data[pos + i];
        if (!is_continuation_(c)) {
            return 0;
        }
        v = (v << 6) | (c & 0x3FU);
    }

    // 过长编码 / 代理区 / 超出 Unicode 范围。
    if (v < min_cp) {
        return 0;
    }
    if (v >= 0xD800 && v <= 0xDFFF) {
        return 0;
    }
    if (v > 0x10FFFF) {
        return 0;
    }
    cp = v;
    return n;
}

/**
 * 附着在前一个码点上、不单独构成字符的码点：
 * 组合附加符号、变体选择符、emoji 肤色修饰符、标签字符。
 */
[[nodiscard]] bool is_extending_(std::uint32_t cp) noexcept {
    return (cp >= 0x0300 && cp <= 0x036F) ||
           (cp >= 0x1AB0 && cp <= 0x1AFF) ||
           (cp >= 0x1DC0 && cp <= 0x1DFF) ||
           (cp >= 0x20D0 && cp <= 0x20FF) ||
           (cp >= 0xFE00 && cp <= 0xFE0F) ||
           (cp >= 0xFE20 && cp <= 0xFE2F) ||
           (cp >= 0x1F3FB && cp <= 0x1F3FF) ||
           (cp >= 0xE0020 && cp <= 0xE007F) ||
           (cp >= 0xE0100 && cp <= 0xE01EF);
}

constexpr std::uint32_t kZeroWidthJoiner = 0x200D;

} // namespace

std::error_code validate_utf8(std::string_view text) noexcept {
    const auto *data = reinterpret_cast<const unsigned char *>(text.data());
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::uint32_t cp = 0;
        const auto n = decode_one_(data, text.size(), pos, cp);
        if (n == 0) {
            return stumper::core::make_error_code(stumper::core::errc::invalid_utf8);
        }
        pos += n;
    }
    return {};
}

std::error_code decode_utf8(stumper::core::bytes_view bytes, std::string &out) {
    const std::string_view text{reinterpret_cast<const char *>(bytes.data()), bytes.size()};
    if (const auto ec = validate_utf8(text)) {
        return ec;
    }
    out.assign(text);
    return {};
}

std::error_code split_code_points(std::string_view text,
                                  std::vector<std::string_view> &out) {
    out.clear();

    const auto *data = reinterpret_cast<const unsigned char *>(text.data());
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::uint32_t cp = 0;
        const auto n = decode_one_(data, text.size(), pos, cp);
        if (n == 0) {
            out.clear();
            return stumper::core::make_error_code(stumper::core::errc::invalid_utf8);
        }
        out.push_back(text.substr(pos, n));
        pos += n;
    }
    return {};
}

std::error_code split_characters(std::string_view text,
                                 std::vector<std::string_view> &out) {
    out.clear();

    const auto *data = reinterpret_cast<const unsigned char *>(text.data());
    std::size_t start = 0;
    std::size_t pos = 0;
    bool joined = false;
    while (pos < text.size()) {
        std::uint32_t cp = 0;
        const auto n = decode_one_(data, text.size(), pos, cp);
        if (n == 0) {
            out.clear();
            return stumper::core::make_error_code(stumper::core::errc::invalid_utf8);
        }

        // 新字符开始：不是附着码点，且前一个码点不是 ZWJ。
        const bool extends = is_extending_(cp) || cp == kZeroWidthJoiner || joined;
        if (pos != start && !extends) {
            out.push_back(text.substr(start, pos - start));
            start = pos;
        }
        joined = (cp == kZeroWidthJoiner);
        pos += n;
    }
    if (start < text.size()) {
        out.push_back(text.substr(start));
    }
    return {};
}

} // namespace stumper::utils
