#pragma once

#include <system_error>

namespace stumper::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 本库不抛异常，可失败的接口统一返回 std::error_code；
 * - invalid_brackets：FacadeConfig::brackets 不是恰好 2 个字符；
 * - invalid_utf8：字节序列不是合法 UTF-8（HTTP body 解码等）。
 */
enum class errc : int {
  ok = 0,
  invalid_brackets = 1,
  invalid_utf8 = 2,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace stumper::core

namespace std {
template <>
struct is_error_code_enum<stumper::core::errc> : true_type {};
}  // namespace std
