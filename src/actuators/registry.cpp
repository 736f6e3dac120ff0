#include "actuators/registry.hpp"

#include <algorithm>
#include <utility>

#include "actuators/dry_run.hpp"

namespace pwr_agent::actuators {
namespace {

struct DefaultTarget {
  const char* name;
  model::action_type type;
};

constexpr DefaultTarget kDefaultTargets[] = {
    {"system", model::action_type::CPU_THROTTLE},
    {"display", model::action_type::BRIGHTNESS_ADJUST},
    {"network", model::action_type::NETWORK_LIMIT},
    {"target_app", model::action_type::APP_THROTTLE},
    {"processes", model::action_type::PROCESS_PRIORITY},
};

bool is_target_enabled(const core::AgentConfig& config, const std::string& name) {
  const auto it = config.target_enabled.find(name);
  if (it == config.target_enabled.end()) {
    return true;
  }
  return it->second;
}

}  // namespace

bool ActuatorRegistry::add(std::string target, const model::action_type default_type,
                           std::shared_ptr<Actuator> actuator) {
  if (actuator == nullptr) {
    return false;
  }
  const bool exists = std::any_of(entries_.begin(), entries_.end(),
                                  [&](const Entry& entry) { return entry.target == target; });
  if (exists) {
    return false;
  }
  entries_.push_back({std::move(target), default_type, std::move(actuator)});
  return true;
}

std::shared_ptr<Actuator> ActuatorRegistry::find(const std::string& target) const {
  for (const Entry& entry : entries_) {
    if (entry.target == target) {
      return entry.actuator;
    }
  }
  return nullptr;
}

std::vector<policy::TargetCapability> ActuatorRegistry::capabilities() const {
  std::vector<policy::TargetCapability> out;
  out.reserve(entries_.size());
  for (const Entry& entry : entries_) {
    out.push_back({entry.target, entry.type});
  }
  return out;
}

std::vector<ActiveAction> ActuatorRegistry::list_active() const {
  std::vector<ActiveAction> out;
  std::vector<const Actuator*> visited;
  for (const Entry& entry : entries_) {
    if (std::find(visited.begin(), visited.end(), entry.actuator.get()) != visited.end()) {
      continue;
    }
    visited.push_back(entry.actuator.get());
    for (std::string& id : entry.actuator->list_active()) {
      out.push_back({entry.target, std::move(id)});
    }
  }
  return out;
}

ActuatorRegistry make_dry_run_registry(const core::AgentConfig& config) {
  ActuatorRegistry registry;
  for (const DefaultTarget& target : kDefaultTargets) {
    if (!is_target_enabled(config, target.name)) {
      continue;
    }
    registry.add(target.name, target.type, std::make_shared<DryRunActuator>(target.name));
  }
  return registry;
}

}  // namespace pwr_agent::actuators
