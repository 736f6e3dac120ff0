#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "model/feedback.hpp"
#include "model/optimization_action.hpp"

namespace pwr_agent::control {

enum class controller_state : std::uint8_t {
  STOPPED = 0,
  RUNNING = 1,
  PAUSED = 2,
  EMERGENCY = 3,
};

inline constexpr const char* to_string(const controller_state state) noexcept {
  switch (state) {
    case controller_state::STOPPED:
      return "stopped";
    case controller_state::RUNNING:
      return "running";
    case controller_state::PAUSED:
      return "paused";
    case controller_state::EMERGENCY:
      return "emergency";
  }
  return "unknown";
}

// Copy handed to readers outside the control loop.
struct ControllerStatus {
  controller_state state{controller_state::STOPPED};
  model::mode_name mode{model::mode_name::BALANCED};
  std::size_t active_count{0};
  float aggregate_savings{0.0F};
  float running_satisfaction{0.8F};

  std::size_t ticks{0};
  std::size_t decisions{0};
  std::size_t stale_snapshots{0};
  std::size_t missing_snapshots{0};
  std::size_t unavailable_metrics{0};
  std::size_t dispatches{0};
  std::size_t dispatch_failures{0};
  // Reverts that keep failing plus applies that failed after every retry.
  std::size_t stuck_actions{0};
  std::size_t pending_dispatches{0};
  std::size_t retrain_failures{0};

  std::size_t model_samples{0};
  float historical_accuracy{1.0F};

  std::string last_decision_id{};
  model::decision_source last_source{model::decision_source::RULE};
  model::severity last_severity{model::severity::NONE};
  float battery_percent{0.0F};
  float context_score{0.0F};
  std::uint64_t timestamp_ms{0};
};

}  // namespace pwr_agent::control
