#include "stumper/core/log.hpp"

#include <atomic>

namespace stumper::core {
namespace {

std::atomic<Severity> g_minimum_severity{Severity::trace};

} // namespace

void set_minimum_severity(Severity level) noexcept {
    g_minimum_severity.store(level, std::memory_order_relaxed);
}

Severity minimum_severity() noexcept {
    return g_minimum_severity.load(std::memory_order_relaxed);
}

bool should_log(Severity level, Severity floor) noexcept {
    return ordinal(minimum_severity()) <= ordinal(level) &&
           ordinal(floor) <= ordinal(level);
}

} // namespace stumper::core
