#pragma once

#include "stumper/core/common.hpp"
#include "stumper/core/error.hpp"

#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace stumper::utils {

/**
 * @brief UTF-8 校验/解码工具。
 *
 * 严格按 RFC 3629：拒绝过长编码、代理区码点（U+D800..U+DFFF）、
 * 超过 U+10FFFF 的码点以及被截断的多字节序列。
 *
 * 失败返回 core::errc::invalid_utf8。
 */
std::error_code validate_utf8(std::string_view text) noexcept;

/**
 * @brief 将 bytes 按 UTF-8 解码为字符串（成功时 out 为原样拷贝）。
 *
 * 失败时 out 保持不变。
 */
std::error_code decode_utf8(stumper::core::bytes_view bytes, std::string &out);

/**
 * @brief 按码点切分 UTF-8 文本；每个元素指向 text 内部的一个码点。
 */
std::error_code split_code_points(std::string_view text,
                                  std::vector<std::string_view> &out);

/**
 * @brief 按用户可见字符切分 UTF-8 文本（简化的字素簇）。
 *
 * 组合附加符号、变体选择符（U+FE0F 等）、emoji 肤色修饰符、标签字符
 * 附着在前一个码点上；ZWJ（U+200D）把前后两个码点连成一个字符。
 * 例如 "❤️"（U+2764 U+FE0F）与 "é" 各算一个字符。
 */
std::error_code split_characters(std::string_view text,
                                 std::vector<std::string_view> &out);

} // namespace stumper::utils
