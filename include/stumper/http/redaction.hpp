#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace stumper::http {

// 被脱敏 header 的值在输出中替换为该掩码。
inline constexpr std::string_view kRedactedMask = "██";

/**
 * @brief 需要脱敏的 header 名称集合。
 *
 * 语义：
 * - 只增不减：没有移除接口，add 不去重；
 * - 匹配时对名称做 ASCII 大小写不敏感比较；
 * - 内部有互斥保护，可跨线程 add/contains。
 */
class RedactionSet final {
public:
    RedactionSet() = default;

    RedactionSet(const RedactionSet &) = delete;
    RedactionSet &operator=(const RedactionSet &) = delete;

    void add(std::string_view name);
    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mu_;
    std::vector<std::string> names_{};
};

/**
 * @brief 进程级脱敏集合：启动时为空，生命周期同进程。
 */
[[nodiscard]] RedactionSet &global_redactions();

} // namespace stumper::http
