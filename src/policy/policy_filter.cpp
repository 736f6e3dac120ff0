#include "policy/policy_filter.hpp"

#include <algorithm>
#include <unordered_map>
#include <utility>

#include "core/math.hpp"

namespace pwr_agent::policy {
namespace {

bool by_savings_desc(const model::optimization_action& lhs, const model::optimization_action& rhs) {
  return lhs.estimated_savings > rhs.estimated_savings;
}

}  // namespace

void rescale_intensity(model::optimization_action& action, const float intensity) noexcept {
  const float clamped = core::clamp01(intensity);
  if (action.intensity > 0.0F) {
    const float ratio = clamped / action.intensity;
    action.estimated_savings *= ratio;
    action.performance_impact = core::clamp01(action.performance_impact * ratio);
  }
  action.intensity = clamped;
}

PolicyFilter::PolicyFilter(core::PolicyConfig config, std::vector<TargetCapability> targets)
    : config_(config), targets_(std::move(targets)) {}

bool PolicyFilter::known_target(const std::string& target) const noexcept {
  return std::any_of(targets_.begin(), targets_.end(),
                     [&](const TargetCapability& capability) { return capability.target == target; });
}

std::vector<model::optimization_action> PolicyFilter::filter(const std::vector<model::optimization_action>& candidates,
                                                             const model::optimization_mode& mode,
                                                             const bool emergency) const {
  return emergency ? filter_emergency(candidates) : filter_normal(candidates, mode);
}

std::vector<model::optimization_action> PolicyFilter::filter_normal(
    const std::vector<model::optimization_action>& candidates, const model::optimization_mode& mode) const {
  const float max_intensity = core::clamp01(mode.max_intensity);

  std::unordered_map<std::string, model::optimization_action> best_by_target;
  for (const model::optimization_action& candidate : candidates) {
    if (candidate.confidence < mode.min_confidence) {
      continue;
    }
    if (candidate.performance_impact > config_.max_performance_impact) {
      continue;
    }
    if (!targets_.empty() && !known_target(candidate.target_component)) {
      continue;
    }

    model::optimization_action approved = candidate;
    approved.confidence = core::clamp01(approved.confidence);
    if (approved.intensity > max_intensity) {
      rescale_intensity(approved, max_intensity);
    } else {
      approved.intensity = core::clamp01(approved.intensity);
    }

    const auto it = best_by_target.find(approved.target_component);
    if (it == best_by_target.end()) {
      best_by_target.emplace(approved.target_component, std::move(approved));
    } else if (approved.estimated_savings > it->second.estimated_savings) {
      it->second = std::move(approved);
    }
  }

  std::vector<model::optimization_action> out;
  out.reserve(best_by_target.size());
  for (auto& [target, action] : best_by_target) {
    out.push_back(std::move(action));
  }
  std::sort(out.begin(), out.end(), [](const auto& lhs, const auto& rhs) {
    if (lhs.estimated_savings != rhs.estimated_savings) {
      return lhs.estimated_savings > rhs.estimated_savings;
    }
    return lhs.target_component < rhs.target_component;
  });
  if (out.size() > config_.max_actions_per_cycle) {
    out.resize(config_.max_actions_per_cycle);
  }
  return out;
}

std::vector<model::optimization_action> PolicyFilter::filter_emergency(
    const std::vector<model::optimization_action>& candidates) const {
  std::vector<model::optimization_action> out;

  if (targets_.empty()) {
    for (const model::optimization_action& candidate : candidates) {
      if (candidate.confidence < config_.emergency_min_confidence) {
        continue;
      }
      const bool seen = std::any_of(out.begin(), out.end(), [&](const model::optimization_action& action) {
        return action.target_component == candidate.target_component;
      });
      if (seen) {
        continue;
      }
      model::optimization_action approved = candidate;
      rescale_intensity(approved, 1.0F);
      approved.confidence = 1.0F;
      out.push_back(std::move(approved));
    }
    std::stable_sort(out.begin(), out.end(), by_savings_desc);
    return out;
  }

  out.reserve(targets_.size());
  for (const TargetCapability& capability : targets_) {
    model::optimization_action action{};
    action.type = capability.type;
    action.target_component = capability.target;
    action.intensity = 1.0F;
    action.performance_impact = 1.0F;

    // Keep the model's savings estimate for this target when it produced one.
    const auto match = std::find_if(candidates.begin(), candidates.end(), [&](const model::optimization_action& c) {
      return c.target_component == capability.target;
    });
    if (match != candidates.end()) {
      action = *match;
      action.type = capability.type;
      rescale_intensity(action, 1.0F);
    }
    action.confidence = 1.0F;
    out.push_back(std::move(action));
  }
  std::stable_sort(out.begin(), out.end(), by_savings_desc);
  return out;
}

}  // namespace pwr_agent::policy
