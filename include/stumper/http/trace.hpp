#pragma once

#include "stumper/core/common.hpp"
#include "stumper/core/facade.hpp"
#include "stumper/core/severity.hpp"
#include "stumper/core/sink.hpp"
#include "stumper/http/message.hpp"
#include "stumper/http/redaction.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace stumper::http {

/**
 * @brief HTTP 追踪输出的详细程度。
 */
enum class Verbosity : std::uint8_t {
    basic = 0,    // 仅状态/请求行
    headers = 1,  // + header 列表
    body = 2,     // + header 列表 + 解码后的 body 文本
};

struct TraceOptions final {
    // 请求耗时，仅用于展示（log_request 不展示）。
    stumper::core::duration elapsed{};

    // 详细程度（仅 log_response 使用）。
    Verbosity verbosity{Verbosity::basic};

    // 每一行输出使用的日志级别。
    stumper::core::Severity level{stumper::core::Severity::info};

    // 输出目标；为空时使用进程级默认 sink。
    // 例如 make_spdlog_sink(core::kNetworkCategory) 把追踪写入 "network" 分类。
    stumper::core::Sink *sink{nullptr};
};

/**
 * @brief 将 HTTP 请求/响应渲染为多行可读日志，每行一次 Facade::log 调用。
 *
 * 说明：
 * - 多行输出不保证原子性：并发日志可能在行粒度上交错；
 * - header 按调用方给出的顺序输出，命中脱敏集合的值替换为 kRedactedMask；
 * - body 不是合法 UTF-8 时不会向外报错，只在输出中体现。
 */
class HttpTraceLogger final {
public:
    HttpTraceLogger(const stumper::core::Facade &facade, RedactionSet &redactions) noexcept
        : facade_(&facade), redactions_(&redactions) {}

    /**
     * @brief 输出一次响应。
     *
     * body 为 nullopt 表示长度未知（输出 "unknown-length body"）。
     */
    void log_response(const Response &response,
                      std::optional<stumper::core::bytes_view> body,
                      const TraceOptions &options = {}) const;

    /**
     * @brief 输出一次请求（始终包含 header 列表；有 body 时尝试输出文本）。
     */
    void log_request(const Request &request, const TraceOptions &options = {}) const;

    // 追加脱敏 header 名称（永久生效，无移除接口）。
    void redact_header(std::string_view name) const;

private:
    void line_(const TraceOptions &options, std::string_view text) const;
    void header_line_(const TraceOptions &options, const Header &header) const;

    const stumper::core::Facade *facade_;
    RedactionSet *redactions_;
};

// 以下便捷接口使用 core::default_facade() 与 global_redactions()。
void log_response(const Response &response,
                  std::optional<stumper::core::bytes_view> body,
                  const TraceOptions &options = {});
void log_request(const Request &request, const TraceOptions &options = {});
void redact_header(std::string_view name);

} // namespace stumper::http
