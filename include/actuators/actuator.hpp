#pragma once

#include <string>
#include <vector>

#include "model/optimization_action.hpp"

namespace pwr_agent::actuators {

// Capability that changes one class of platform setting. Implementations
// must tolerate concurrent calls for different action ids.
class Actuator {
 public:
  virtual ~Actuator() = default;

  virtual model::action_result apply(const model::optimization_action& action) = 0;
  virtual model::action_result revert(const std::string& action_id) = 0;
  [[nodiscard]] virtual std::vector<std::string> list_active() = 0;
};

}  // namespace pwr_agent::actuators
