#pragma once

#include "stumper/core/common.hpp"

#include <optional>
#include <string>
#include <vector>

namespace stumper::http {

struct Header final {
    std::string name;
    std::string value;
};

// 保持调用方给出的顺序；同名 header 允许重复出现。
using Headers = std::vector<Header>;

/**
 * @brief 待追踪的 HTTP 请求（字段缺失时按默认值输出：method -> "UNKNOWN"，url -> ""）。
 */
struct Request final {
    std::optional<std::string> method{};
    std::optional<std::string> url{};
    Headers headers{};
    std::optional<std::vector<stumper::core::byte>> body{};
};

/**
 * @brief 待追踪的 HTTP 响应（body 单独传给 log_response）。
 */
struct Response final {
    int status_code{0};
    std::string url{};
    Headers headers{};
};

} // namespace stumper::http
