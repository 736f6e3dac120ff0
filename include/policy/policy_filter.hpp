#pragma once

#include <string>
#include <vector>

#include "core/config.hpp"
#include "model/optimization_action.hpp"

namespace pwr_agent::policy {

struct TargetCapability {
  std::string target;
  model::action_type type{model::action_type::CPU_THROTTLE};
};

class PolicyFilter {
 public:
  PolicyFilter(core::PolicyConfig config, std::vector<TargetCapability> targets);

  // Gates candidates by mode and confidence. An emergency bypasses the mode
  // and synthesizes a full-intensity action for every known target.
  // Candidates for targets without a registered actuator are dropped.
  [[nodiscard]] std::vector<model::optimization_action> filter(const std::vector<model::optimization_action>& candidates,
                                                               const model::optimization_mode& mode,
                                                               bool emergency) const;

  [[nodiscard]] const std::vector<TargetCapability>& targets() const noexcept { return targets_; }

 private:
  [[nodiscard]] bool known_target(const std::string& target) const noexcept;
  [[nodiscard]] std::vector<model::optimization_action> filter_normal(
      const std::vector<model::optimization_action>& candidates, const model::optimization_mode& mode) const;
  [[nodiscard]] std::vector<model::optimization_action> filter_emergency(
      const std::vector<model::optimization_action>& candidates) const;

  core::PolicyConfig config_{};
  std::vector<TargetCapability> targets_{};
};

// Sets intensity and rescales savings and impact proportionally.
void rescale_intensity(model::optimization_action& action, float intensity) noexcept;

}  // namespace pwr_agent::policy
