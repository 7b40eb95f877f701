/**
 * @file facade_example.cpp
 * @brief 演示 stumper::core::Facade 的级别门控与行格式化
 *
 * 运行：
 * - ./build/examples/facade_example [--icons] [--no-level] [--min <level>]
 *   其中 <level> 为 trace/debug/info/notice/warning/error/fault。
 */

#include <stumper/core/error.hpp>
#include <stumper/core/facade.hpp>
#include <stumper/core/log.hpp>
#include <stumper/core/severity.hpp>

#include <iostream>
#include <memory>
#include <optional>
#include <string_view>

using namespace stumper;

namespace {

[[nodiscard]] bool has_flag(int argc, char **argv, std::string_view flag) {
    for (int i = 0; i < argc; ++i) {
        if (argv[i] == flag) {
            return true;
        }
    }
    return false;
}

[[nodiscard]] std::optional<std::string_view> flag_value(int argc, char **argv,
                                                         std::string_view flag) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (argv[i] == flag) {
            return std::string_view{argv[i + 1]};
        }
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<core::Severity> parse_level(std::string_view text) {
    for (const auto level : core::kAllSeverities) {
        const auto name = core::severity_name(level);
        if (name.size() != text.size()) {
            continue;
        }
        bool same = true;
        for (std::size_t i = 0; i < name.size(); ++i) {
            if ((name[i] | 0x20) != (text[i] | 0x20)) {
                same = false;
                break;
            }
        }
        if (same) {
            return level;
        }
    }
    return std::nullopt;
}

void print_usage(const char *argv0) {
    std::cout << "用法:\n";
    std::cout << "  " << argv0 << " [--icons] [--no-level] [--min <level>]\n";
}

} // namespace

int main(int argc, char **argv) {
    if (has_flag(argc, argv, "-h") || has_flag(argc, argv, "--help")) {
        print_usage(argv[0]);
        return 0;
    }

    if (const auto text = flag_value(argc, argv, "--min")) {
        const auto level = parse_level(*text);
        if (!level) {
            std::cerr << "unknown level: " << *text << "\n";
            print_usage(argv[0]);
            return 2;
        }
        core::set_minimum_severity(*level);
    }

    core::FacadeConfig cfg;
    cfg.prefix = "example";
    cfg.use_icons = has_flag(argc, argv, "--icons");
    cfg.show_level = !has_flag(argc, argv, "--no-level");

    std::unique_ptr<core::Facade> facade;
    if (const auto ec = core::Facade::create(cfg, facade)) {
        std::cerr << "create facade failed: " << ec.message() << "\n";
        return 1;
    }

    for (const auto level : core::kAllSeverities) {
        facade->log(core::severity_name(level), level);
    }

    // 单次覆盖前缀/分隔符。
    facade->notice("per-call override", core::CallOptions{"override", " >"});

    // 非法括号配置会被拒绝。
    core::FacadeConfig bad = cfg;
    bad.brackets = "[";
    std::unique_ptr<core::Facade> rejected;
    const auto ec = core::Facade::create(bad, rejected);
    std::cout << "brackets \"[\" -> " << ec.message() << "\n";

    return 0;
}
