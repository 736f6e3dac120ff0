#include "core/cadence.hpp"

namespace pwr_agent::core {

Cadence::Cadence(const std::uint64_t interval_ms, const std::uint64_t event_threshold) noexcept
    : interval_ms_(interval_ms), event_threshold_(event_threshold) {}

void Cadence::start(const std::uint64_t now_ms) noexcept {
  last_fire_ms_ = now_ms;
  started_ = true;
}

void Cadence::count(const std::uint64_t events) noexcept { events_ += events; }

bool Cadence::due(const std::uint64_t now_ms) const noexcept {
  if (event_threshold_ != 0 && events_ >= event_threshold_) {
    return true;
  }
  if (interval_ms_ == 0 || events_ == 0) {
    return false;
  }
  if (!started_) {
    return true;
  }
  return now_ms >= last_fire_ms_ && (now_ms - last_fire_ms_) >= interval_ms_;
}

std::uint64_t Cadence::pending_events() const noexcept { return events_; }

void Cadence::fire(const std::uint64_t now_ms) noexcept {
  last_fire_ms_ = now_ms;
  events_ = 0;
  started_ = true;
}

}  // namespace pwr_agent::core
