#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "actuators/actuator.hpp"

namespace pwr_agent::actuators {

// Records applied actions without touching the platform.
class DryRunActuator final : public Actuator {
 public:
  explicit DryRunActuator(std::string name, bool log_actions = true);

  model::action_result apply(const model::optimization_action& action) override;
  model::action_result revert(const std::string& action_id) override;
  [[nodiscard]] std::vector<std::string> list_active() override;

 private:
  std::string name_;
  bool log_actions_{true};
  std::mutex mutex_{};
  std::unordered_map<std::string, model::optimization_action> active_{};
};

}  // namespace pwr_agent::actuators
