#pragma once

#include "stumper/core/severity.hpp"

namespace stumper::core {

/**
 * @brief 进程级最低输出级别（全局日志量开关）。
 *
 * 说明：
 * - 对所有 Facade 实例生效：低于该阈值的调用直接返回，不构造字符串、不写 sink；
 * - 每次调用时读取，不缓存；内部为原子变量，可跨线程调整；
 * - 初始值为 Severity::trace（全部输出）。
 */
void set_minimum_severity(Severity level) noexcept;
[[nodiscard]] Severity minimum_severity() noexcept;

/**
 * @brief 门控判定：level 不低于进程阈值，且不低于实例下限 floor 时返回 true。
 */
[[nodiscard]] bool should_log(Severity level, Severity floor = Severity::trace) noexcept;

} // namespace stumper::core
