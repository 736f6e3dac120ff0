#pragma once

#include <deque>

#include "core/config.hpp"
#include "model/context_state.hpp"
#include "model/snapshot.hpp"

namespace pwr_agent::reasoning {

using SnapshotWindow = std::deque<model::system_snapshot>;

// Turns a snapshot plus the caller's trailing window into a qualitative
// context. Holds configuration only; analyze() has no side effects.
class ContextAnalyzer {
 public:
  explicit ContextAnalyzer(core::ContextConfig config = {}) noexcept;

  // recent_history is ordered oldest first and may or may not already end
  // with snapshot.
  [[nodiscard]] model::context_state analyze(const model::system_snapshot& snapshot,
                                             const SnapshotWindow& recent_history) const noexcept;

  [[nodiscard]] model::battery_level classify_battery(float battery_percent, model::power_source source) const noexcept;
  [[nodiscard]] model::performance_demand classify_demand(float cpu_percent, float gpu_percent) const noexcept;
  [[nodiscard]] model::power_source classify_power_source(bool plugged, float power_draw_w) const noexcept;
  [[nodiscard]] model::user_activity classify_activity(const model::system_snapshot& snapshot,
                                                       const SnapshotWindow& recent_history,
                                                       std::uint8_t hour_of_day) const noexcept;

  [[nodiscard]] static float context_score(model::battery_level battery, model::performance_demand demand,
                                           model::user_activity activity, model::power_source source) noexcept;

 private:
  [[nodiscard]] bool near_zero_activity(const model::system_snapshot& snapshot) const noexcept;
  [[nodiscard]] bool is_night(std::uint8_t hour_of_day) const noexcept;

  core::ContextConfig config_{};
};

}  // namespace pwr_agent::reasoning
