/**
 * @file http_trace_example.cpp
 * @brief 演示 stumper::http 的请求/响应追踪输出（含 header 脱敏）
 *
 * 运行：
 * - ./build/examples/http_trace_example [basic|headers|body]
 */

#include <stumper/core/common.hpp>
#include <stumper/http/message.hpp>
#include <stumper/http/trace.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

using namespace stumper;

namespace {

[[nodiscard]] std::vector<core::byte> to_bytes(std::string_view s) {
    return std::vector<core::byte>(s.begin(), s.end());
}

[[nodiscard]] http::Verbosity parse_verbosity(int argc, char **argv) {
    if (argc < 2) {
        return http::Verbosity::body;
    }
    const std::string_view v{argv[1]};
    if (v == "basic") {
        return http::Verbosity::basic;
    }
    if (v == "headers") {
        return http::Verbosity::headers;
    }
    return http::Verbosity::body;
}

} // namespace

int main(int argc, char **argv) {
    http::redact_header("Authorization");

    http::Request req;
    req.method = "POST";
    req.url = "https://api.example.com/v1/orders";
    req.headers = {
        {"Authorization", "Bearer do-not-log-me"},
        {"Content-Type", "application/json"},
    };
    req.body = to_bytes(R"({"sku":"A-100","qty":2})");
    http::log_request(req);

    http::Response rsp;
    rsp.status_code = 201;
    rsp.url = "https://api.example.com/v1/orders";
    rsp.headers = {
        {"Content-Type", "application/json"},
        {"authorization", "echoed-secret"},
    };
    const auto body = to_bytes(R"({"id":42,"status":"created"})");

    http::TraceOptions opts;
    opts.elapsed = std::chrono::milliseconds(125);
    opts.verbosity = parse_verbosity(argc, argv);
    http::log_response(rsp, core::bytes_view{body.data(), body.size()}, opts);

    // 非 UTF-8 body：输出 "Unable to parse body"。
    const std::vector<core::byte> binary{0x89, 0x50, 0x4E, 0x47};
    opts.verbosity = http::Verbosity::body;
    opts.level = core::Severity::warning;
    http::log_response(rsp, core::bytes_view{binary.data(), binary.size()}, opts);

    return 0;
}
