#include "stumper/core/error.hpp"

#include <string>

namespace stumper::core {
namespace {

// core::errc 的 std::error_category 实现：
// - name() 用于区分错误域
// - message() 返回可读的英文描述（便于调试与日志）
class stumper_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "stumper.core"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::invalid_brackets:
        return "invalid bracket pair";
      case errc::invalid_utf8:
        return "invalid utf-8";
      default:
        return "unknown stumper.core error";
    }
  }
};

}  // 匿名命名空间

const std::error_category& error_category() noexcept {
  static stumper_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // 命名空间 stumper::core
