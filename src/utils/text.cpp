#include "stumper/utils/text.hpp"

#include <array>
#include <charconv>
#include <chrono>

namespace stumper::utils {
namespace {

[[nodiscard]] char to_lower_ascii_(char c) noexcept {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c - 'A' + 'a');
    }
    return c;
}

} // namespace

bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (to_lower_ascii_(lhs[i]) != to_lower_ascii_(rhs[i])) {
            return false;
        }
    }
    return true;
}

std::string format_elapsed(stumper::core::duration elapsed) {
    const double seconds = std::chrono::duration<double>(elapsed).count();

    std::array<char, 64> buf{};
    const auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), seconds);
    std::string out;
    if (ec != std::errc{}) {
        out = "0.0";
    } else {
        out.assign(buf.data(), end);
        if (out.find_first_of(".e") == std::string::npos) {
            out += ".0";
        }
    }
    out += " seconds";
    return out;
}

} // namespace stumper::utils
