#pragma once

#include "stumper/core/common.hpp"

#include <string>
#include <string_view>

namespace stumper::utils {

/**
 * @brief ASCII 大小写不敏感比较（HTTP header 名称匹配用）。
 */
[[nodiscard]] bool iequals(std::string_view lhs, std::string_view rhs) noexcept;

/**
 * @brief 将耗时格式化为秒数（最短表示，至少一位小数），如 "0.0 seconds"、"1.5 seconds"。
 */
[[nodiscard]] std::string format_elapsed(stumper::core::duration elapsed);

} // namespace stumper::utils
