#include "actuators/dry_run.hpp"

#include <iostream>
#include <utility>

namespace pwr_agent::actuators {

DryRunActuator::DryRunActuator(std::string name, const bool log_actions)
    : name_(std::move(name)), log_actions_(log_actions) {}

model::action_result DryRunActuator::apply(const model::optimization_action& action) {
  if (action.id.empty()) {
    return {false, "action id is empty"};
  }
  if (!(action.intensity >= 0.0F && action.intensity <= 1.0F)) {
    return {false, "intensity out of range"};
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    active_[action.id] = action;
  }
  if (log_actions_) {
    std::cerr << "[actuator:" << name_ << "] apply " << action.id << ' ' << model::to_string(action.type)
              << " intensity=" << action.intensity << '\n';
  }
  return {true, "applied"};
}

model::action_result DryRunActuator::revert(const std::string& action_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_.erase(action_id) == 0) {
      return {false, "action not active"};
    }
  }
  if (log_actions_) {
    std::cerr << "[actuator:" << name_ << "] revert " << action_id << '\n';
  }
  return {true, "reverted"};
}

std::vector<std::string> DryRunActuator::list_active() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(active_.size());
  for (const auto& [id, action] : active_) {
    ids.push_back(id);
  }
  return ids;
}

}  // namespace pwr_agent::actuators
