#pragma once

#include "stumper/core/severity.hpp"

#include <memory>
#include <string_view>

namespace stumper::core {

/**
 * @brief 日志后端（sink）抽象：写入一行已格式化、带级别标记的文本。
 *
 * 约定：
 * - write 不应无限期阻塞，且自行吞掉 I/O 错误（noexcept）；
 * - 本库只负责构造字符串和级别门控，传输/持久化/轮转均由后端负责。
 */
class Sink {
public:
    virtual ~Sink() = default;

    virtual void write(Severity level, std::string_view text) noexcept = 0;
};

// 后端日志分类名（对应 spdlog logger 名称）：默认 sink 使用 default，
// HTTP 追踪可通过 TraceOptions::sink 写入 network。
inline constexpr std::string_view kDefaultCategory = "default";
inline constexpr std::string_view kNetworkCategory = "network";

/**
 * @brief 创建写入 spdlog 的 sink。
 *
 * 说明：
 * - 若 spdlog 注册表里已有名为 name 的 logger，则直接复用（不修改其配置）；
 * - 否则创建一个彩色 stdout logger 并注册，其级别放开到 trace，
 *   由 Facade 的门控作为唯一过滤点；
 * - 级别映射：notice -> info，warning -> warn，error -> err，fault -> critical，
 *   其余同名映射。
 */
[[nodiscard]] std::shared_ptr<Sink> make_spdlog_sink(std::string_view name);

/**
 * @brief 进程级默认 sink。
 *
 * 首次访问时初始化为 make_spdlog_sink(kDefaultCategory)；
 * set_default_sink(nullptr) 恢复为该 spdlog 默认值。替换操作有互斥保护。
 */
[[nodiscard]] std::shared_ptr<Sink> default_sink();
void set_default_sink(std::shared_ptr<Sink> sink);

} // namespace stumper::core
