#pragma once

#include <chrono>
#include <cstdint>

namespace rollback::util {

using Clock     = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline std::uint64_t ToUnixMillis(Timestamp ts) {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count());
}

inline Timestamp FromUnixMillis(std::uint64_t ms) {
  return Timestamp(std::chrono::milliseconds(ms));
}

inline std::uint64_t NowMillis() {
  return ToUnixMillis(Clock::now());
}

} // namespace rollback::util
