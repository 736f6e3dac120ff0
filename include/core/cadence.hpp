#pragma once

#include <cstdint>

namespace pwr_agent::core {

// Fires when a wall-clock interval has elapsed since the last fire, or when
// enough events have been counted, whichever comes first. A zero interval
// or a zero threshold disables that trigger.
class Cadence {
 public:
  Cadence() = default;
  Cadence(std::uint64_t interval_ms, std::uint64_t event_threshold) noexcept;

  void start(std::uint64_t now_ms) noexcept;
  void count(std::uint64_t events = 1) noexcept;

  [[nodiscard]] bool due(std::uint64_t now_ms) const noexcept;
  [[nodiscard]] std::uint64_t pending_events() const noexcept;

  void fire(std::uint64_t now_ms) noexcept;

 private:
  std::uint64_t interval_ms_{0};
  std::uint64_t event_threshold_{0};
  std::uint64_t last_fire_ms_{0};
  std::uint64_t events_{0};
  bool started_{false};
};

}  // namespace pwr_agent::core
