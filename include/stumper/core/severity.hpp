#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace stumper::core {

/**
 * @brief 日志严重级别（按 ordinal 从低到高排序）。
 *
 * 说明：
 * - 每个级别关联一个显示名、一个单字符缩写（显示名首字母）和一个图标；
 * - 名称表/图标表与枚举个数一致，由 severity.cpp 内的 static_assert 保证。
 */
enum class Severity : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    notice = 3,
    warning = 4,
    error = 5,
    fault = 6,
};

inline constexpr std::size_t kSeverityCount = 7;

inline constexpr std::array<Severity, kSeverityCount> kAllSeverities{
    Severity::trace,
    Severity::debug,
    Severity::info,
    Severity::notice,
    Severity::warning,
    Severity::error,
    Severity::fault,
};

[[nodiscard]] constexpr std::size_t ordinal(Severity level) noexcept {
    return static_cast<std::size_t>(level);
}

// 显示名，如 "Notice"。
[[nodiscard]] std::string_view severity_name(Severity level) noexcept;

// 单字符缩写（显示名首字母，大写），如 "N"。
[[nodiscard]] std::string_view severity_initial(Severity level) noexcept;

// 图标（UTF-8 编码，可能由多个码点组成）。
[[nodiscard]] std::string_view severity_icon(Severity level) noexcept;

// 名称表与图标表的条目数（用于一致性测试）。
[[nodiscard]] std::size_t severity_name_count() noexcept;
[[nodiscard]] std::size_t severity_icon_count() noexcept;

} // namespace stumper::core
