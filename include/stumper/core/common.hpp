#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>

namespace stumper::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;

using steady_clock = std::chrono::steady_clock;
using duration = steady_clock::duration;

}  // 命名空间 stumper::core
