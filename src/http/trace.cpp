#include "stumper/http/trace.hpp"

#include "stumper/utils/text.hpp"
#include "stumper/utils/utf8.hpp"

#include <algorithm>
#include <sstream>
#include <string>

namespace stumper::http {
namespace {

constexpr std::string_view kContentLength = "Content-Length";

// 长度未知时记为 -1（仅摘要行改写为 "unknown-length"）。
[[nodiscard]] long long content_length_(std::optional<stumper::core::bytes_view> body) noexcept {
    return body ? static_cast<long long>(body->size()) : -1;
}

[[nodiscard]] std::string body_info_(std::optional<stumper::core::bytes_view> body) {
    if (!body) {
        return "unknown-length body";
    }
    return std::to_string(content_length_(body)) + "-byte body";
}

[[nodiscard]] bool declares_content_length_(const Headers &headers) noexcept {
    return std::any_of(headers.begin(), headers.end(), [](const Header &h) {
        return stumper::utils::iequals(h.name, kContentLength);
    });
}

} // namespace

void HttpTraceLogger::log_response(const Response &response,
                                   std::optional<stumper::core::bytes_view> body,
                                   const TraceOptions &options) const {
    const bool show_headers =
        options.verbosity == Verbosity::headers || options.verbosity == Verbosity::body;

    line_(options, "URLResponse Info");

    std::ostringstream summary;
    summary << "<--- " << response.status_code << ' ' << response.url
            << " (elapsed: " << stumper::utils::format_elapsed(options.elapsed) << ", "
            << body_info_(body) << ')';
    line_(options, summary.str());

    if (show_headers) {
        for (const auto &header : response.headers) {
            header_line_(options, header);
        }
    }

    if (options.verbosity == Verbosity::body) {
        std::string text;
        if (body && !stumper::utils::decode_utf8(*body, text)) {
            line_(options, "Request Body");
            line_(options, text);
        } else {
            line_(options, "Unable to parse body");
        }
        line_(options, "<-- END HTTP (" + std::to_string(content_length_(body)) + "-byte body)");
    } else {
        line_(options, "<-- END HTTP");
    }
}

void HttpTraceLogger::log_request(const Request &request,
                                  const TraceOptions &options) const {
    const std::string method = request.method.value_or("UNKNOWN");

    line_(options, "URLRequest Info");
    line_(options, "--> " + method + " " + request.url.value_or(""));

    if (request.body && !declares_content_length_(request.headers)) {
        line_(options,
              std::string(kContentLength) + ": " + std::to_string(request.body->size()));
    }

    line_(options, "Request Headers");
    for (const auto &header : request.headers) {
        header_line_(options, header);
    }

    if (!request.body) {
        line_(options, "--> END " + method);
        return;
    }

    const stumper::core::bytes_view bytes{request.body->data(), request.body->size()};
    std::string text;
    // 请求 body 解码失败时不输出提示，只输出结束行。
    if (!stumper::utils::decode_utf8(bytes, text)) {
        line_(options, "Request Body");
        line_(options, text);
    }

    std::ostringstream end;
    end << "--> END " << method << " (" << bytes.size() << "-byte body)";
    line_(options, end.str());
}

void HttpTraceLogger::redact_header(std::string_view name) const {
    redactions_->add(name);
}

void HttpTraceLogger::line_(const TraceOptions &options, std::string_view text) const {
    facade_->log(text, options.level, stumper::core::CallOptions{{}, {}, options.sink});
}

void HttpTraceLogger::header_line_(const TraceOptions &options,
                                   const Header &header) const {
    const std::string_view value =
        redactions_->contains(header.name) ? kRedactedMask : std::string_view{header.value};
    line_(options, header.name + ": " + std::string(value));
}

void log_response(const Response &response,
                  std::optional<stumper::core::bytes_view> body,
                  const TraceOptions &options) {
    HttpTraceLogger(stumper::core::default_facade(), global_redactions())
        .log_response(response, body, options);
}

void log_request(const Request &request, const TraceOptions &options) {
    HttpTraceLogger(stumper::core::default_facade(), global_redactions())
        .log_request(request, options);
}

void redact_header(std::string_view name) {
    global_redactions().add(name);
}

} // namespace stumper::http
