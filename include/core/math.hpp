#pragma once

#include <algorithm>

namespace pwr_agent::core {

inline constexpr float clamp01(const float value) noexcept {
  return std::clamp(value, 0.0F, 1.0F);
}

inline constexpr float clamp_range(const float value, const float lo, const float hi) noexcept {
  return std::clamp(value, lo, hi);
}

// Position of value inside [lower, upper] as a fraction in [0, 1].
// A degenerate band reports 1 once value reaches it.
inline constexpr float band_position(const float value, const float lower, const float upper) noexcept {
  if (upper <= lower) {
    return value >= lower ? 1.0F : 0.0F;
  }
  return clamp01((value - lower) / (upper - lower));
}

inline constexpr float lerp(const float from, const float to, const float t) noexcept {
  return from + ((to - from) * t);
}

}  // namespace pwr_agent::core
