#pragma once

#include <array>
#include <cstddef>

#include "model/context_state.hpp"
#include "model/snapshot.hpp"

namespace pwr_agent::reasoning {

// Order is significant: persisted model weights are indexed by position.
enum class feature : std::size_t {
  BATTERY_PERCENT = 0,
  CPU_PERCENT,
  MEMORY_PERCENT,
  GPU_PERCENT,
  NETWORK_ACTIVITY,
  SCREEN_BRIGHTNESS,
  TIME_OF_DAY,
  POWER_PLUGGED,
  TARGET_APP_CPU,
  TARGET_APP_MEMORY,
  CONTEXT_SCORE,
};

inline constexpr std::size_t kFeatureCount = 11;

using FeatureVector = std::array<float, kFeatureCount>;

inline FeatureVector extract_features(const model::system_snapshot& snapshot, const model::context_state& context) noexcept {
  constexpr float kBytesPerMiB = 1024.0F * 1024.0F;
  FeatureVector features{};
  features[static_cast<std::size_t>(feature::BATTERY_PERCENT)] = snapshot.battery_percent;
  features[static_cast<std::size_t>(feature::CPU_PERCENT)] = snapshot.cpu_percent;
  features[static_cast<std::size_t>(feature::MEMORY_PERCENT)] = snapshot.memory_percent;
  features[static_cast<std::size_t>(feature::GPU_PERCENT)] = snapshot.gpu_percent;
  features[static_cast<std::size_t>(feature::NETWORK_ACTIVITY)] =
      static_cast<float>(snapshot.network_bytes_sent + snapshot.network_bytes_recv) / kBytesPerMiB;
  features[static_cast<std::size_t>(feature::SCREEN_BRIGHTNESS)] = snapshot.screen_brightness;
  features[static_cast<std::size_t>(feature::TIME_OF_DAY)] = static_cast<float>(context.hour_of_day);
  features[static_cast<std::size_t>(feature::POWER_PLUGGED)] =
      context.source == model::power_source::PLUGGED ? 1.0F : 0.0F;
  features[static_cast<std::size_t>(feature::TARGET_APP_CPU)] = snapshot.target_app_cpu;
  features[static_cast<std::size_t>(feature::TARGET_APP_MEMORY)] = snapshot.target_app_memory;
  features[static_cast<std::size_t>(feature::CONTEXT_SCORE)] = context.context_score;
  return features;
}

}  // namespace pwr_agent::reasoning
