#include "stumper/core/severity.hpp"

namespace stumper::core {
namespace {

using namespace std::string_view_literals;

// 表长度由初始化列表推导，再由下方 static_assert 与枚举个数比对。
constexpr std::array kNames{
    "Trace"sv,
    "Debug"sv,
    "Info"sv,
    "Notice"sv,
    "Warning"sv,
    "Error"sv,
    "Fault"sv,
};

constexpr std::array kInitials{
    "T"sv,
    "D"sv,
    "I"sv,
    "N"sv,
    "W"sv,
    "E"sv,
    "F"sv,
};

constexpr std::array kIcons{
    "💜"sv,
    "💚"sv,
    "💙"sv,
    "🖤"sv,
    "💛"sv,
    "🩷"sv,
    "❤️"sv,
};

static_assert(kNames.size() == kSeverityCount, "severity name table size mismatch");
static_assert(kInitials.size() == kSeverityCount, "severity initial table size mismatch");
static_assert(kIcons.size() == kSeverityCount, "severity icon table size mismatch");
static_assert(ordinal(Severity::fault) + 1 == kSeverityCount);

[[nodiscard]] constexpr bool initials_match_names() noexcept {
    for (std::size_t i = 0; i < kSeverityCount; ++i) {
        if (kInitials[i].size() != 1 || kNames[i].empty()) {
            return false;
        }
        if (kInitials[i].front() != kNames[i].front()) {
            return false;
        }
    }
    return true;
}

static_assert(initials_match_names(), "severity initial must be the first letter of its name");

} // namespace

std::string_view severity_name(Severity level) noexcept {
    return kNames[ordinal(level)];
}

std::string_view severity_initial(Severity level) noexcept {
    return kInitials[ordinal(level)];
}

std::string_view severity_icon(Severity level) noexcept {
    return kIcons[ordinal(level)];
}

std::size_t severity_name_count() noexcept { return kNames.size(); }

std::size_t severity_icon_count() noexcept { return kIcons.size(); }

} // namespace stumper::core
