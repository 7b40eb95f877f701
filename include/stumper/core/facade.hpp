#pragma once

#include "stumper/core/severity.hpp"
#include "stumper/core/sink.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace stumper::core {

/**
 * @brief Facade 配置（创建后不可变）。
 *
 * 生成的行格式：
 *   [N] prefix: message
 *   ^^^^ level slug（show_level=true 时）
 */
struct FacadeConfig final {
    // 默认前缀（调用方未覆盖时使用）。
    std::string prefix{"stumper"};

    // 前缀与消息之间的分隔符（其后固定再跟一个空格）。
    std::string separator{":"};

    // 级别标记两侧的括号，必须恰好是 2 个字符（按用户可见字符计数，"❤️❤️" 合法）。
    std::string brackets{"[]"};

    // true 时级别标记使用图标，否则使用级别名首字母。
    bool use_icons{false};

    // 是否输出级别标记。
    bool show_level{true};

    // 实例级下限：只能让本实例更安静，不能绕过进程级阈值。
    Severity minimum_severity{Severity::trace};
};

/**
 * @brief 单次调用的覆盖项；空字符串/空指针表示沿用实例默认值。
 */
struct CallOptions final {
    std::string_view prefix{};
    std::string_view separator{};
    Sink *sink{nullptr};
};

/**
 * @brief 日志门面：级别门控 + 行格式化 + 分发到 sink。
 *
 * 说明：
 * - 门控读取进程级阈值（见 core/log.hpp），对所有实例生效；
 * - 低于阈值的调用不构造字符串；
 * - 所有日志接口都不会向外抛出，sink 的失败由 sink 自己处理。
 */
class Facade final {
public:
    /**
     * @brief 校验配置并创建实例。
     *
     * brackets 不是恰好 2 个字符时返回 errc::invalid_brackets，out 保持不变。
     */
    [[nodiscard]] static std::error_code create(FacadeConfig config,
                                                std::unique_ptr<Facade> &out);

    Facade(const Facade &) = delete;
    Facade &operator=(const Facade &) = delete;

    [[nodiscard]] const FacadeConfig &config() const noexcept { return config_; }

    // 按 level 路由到对应的级别接口。
    void log(std::string_view message, Severity level, const CallOptions &options = {}) const;

    void trace(std::string_view message, const CallOptions &options = {}) const;
    void debug(std::string_view message, const CallOptions &options = {}) const;
    void info(std::string_view message, const CallOptions &options = {}) const;
    void notice(std::string_view message, const CallOptions &options = {}) const;
    void warning(std::string_view message, const CallOptions &options = {}) const;
    void error(std::string_view message, const CallOptions &options = {}) const;
    void fault(std::string_view message, const CallOptions &options = {}) const;

    /**
     * @brief 构造一行日志文本（不做门控、不写 sink）。
     */
    [[nodiscard]] std::string format(Severity level,
                                     std::string_view message,
                                     std::string_view prefix = {},
                                     std::string_view separator = {}) const;

private:
    Facade(FacadeConfig config, std::string_view open, std::string_view close);

    void emit_(Severity level, std::string_view message, const CallOptions &options) const;
    [[nodiscard]] std::string level_slug_(Severity level) const;

    FacadeConfig config_;
    std::string open_;
    std::string close_;

    friend const Facade &default_facade();
};

/**
 * @brief 进程级默认实例（FacadeConfig 默认值），首次访问时构造，生命周期同进程。
 */
[[nodiscard]] const Facade &default_facade();

} // namespace stumper::core
