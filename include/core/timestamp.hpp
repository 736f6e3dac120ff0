#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>

namespace pwr_agent::core {

// Milliseconds since the unix epoch. Snapshots, actions and feedback all carry
// this clock so staleness can be compared across threads.
using Clock = std::function<std::uint64_t()>;

inline std::uint64_t unix_timestamp_now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

inline Clock system_clock_ms() { return [] { return unix_timestamp_now_ms(); }; }

inline std::uint8_t local_hour_of_day(const std::uint64_t unix_ms) noexcept {
  const auto seconds = static_cast<std::time_t>(unix_ms / 1000ULL);
  std::tm local{};
  if (localtime_r(&seconds, &local) == nullptr) {
    return 12;
  }
  return static_cast<std::uint8_t>(local.tm_hour);
}

}  // namespace pwr_agent::core
