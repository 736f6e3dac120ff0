#pragma once

#include <memory>
#include <string>
#include <vector>

#include "actuators/actuator.hpp"
#include "core/config.hpp"
#include "model/optimization_action.hpp"
#include "policy/policy_filter.hpp"

namespace pwr_agent::actuators {

struct ActiveAction {
  std::string target;
  std::string action_id;
};

class ActuatorRegistry {
 public:
  // Returns false when the target is already registered or actuator is null.
  bool add(std::string target, model::action_type default_type, std::shared_ptr<Actuator> actuator);

  [[nodiscard]] std::shared_ptr<Actuator> find(const std::string& target) const;
  [[nodiscard]] std::vector<policy::TargetCapability> capabilities() const;
  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

  // Queries each distinct actuator once. An actuator shared by several
  // targets reports its ids under the first target it was registered for.
  [[nodiscard]] std::vector<ActiveAction> list_active() const;

 private:
  struct Entry {
    std::string target;
    model::action_type type;
    std::shared_ptr<Actuator> actuator;
  };

  std::vector<Entry> entries_{};
};

// Dry-run actuators for the standard targets, minus those disabled under
// `targets:` in the config.
ActuatorRegistry make_dry_run_registry(const core::AgentConfig& config);

}  // namespace pwr_agent::actuators
