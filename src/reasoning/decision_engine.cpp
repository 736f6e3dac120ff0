#include "reasoning/decision_engine.hpp"

#include <algorithm>
#include <iostream>
#include <optional>
#include <utility>

#include "core/math.hpp"

namespace pwr_agent::reasoning {
namespace {

const char* availability_label(const model_availability availability) noexcept {
  switch (availability) {
    case model_availability::AVAILABLE:
      return "available";
    case model_availability::ABSENT:
      return "absent";
    case model_availability::UNDERTRAINED:
      return "undertrained";
  }
  return "unknown";
}

}  // namespace

ActionMap default_action_map() {
  using model::action_type;
  ActionMap map{};
  map[static_cast<std::size_t>(model::severity::LIGHT)] = {
      {"display", action_type::BRIGHTNESS_ADJUST, 0.3F, 5.0F, 0.1F},
  };
  map[static_cast<std::size_t>(model::severity::MODERATE)] = {
      {"system", action_type::CPU_THROTTLE, 0.5F, 10.0F, 0.3F},
      {"display", action_type::BRIGHTNESS_ADJUST, 0.5F, 8.0F, 0.2F},
      {"network", action_type::NETWORK_LIMIT, 0.3F, 4.0F, 0.1F},
  };
  map[static_cast<std::size_t>(model::severity::AGGRESSIVE)] = {
      {"system", action_type::CPU_THROTTLE, 0.8F, 20.0F, 0.6F},
      {"display", action_type::BRIGHTNESS_ADJUST, 0.7F, 15.0F, 0.4F},
      {"target_app", action_type::APP_THROTTLE, 0.6F, 12.0F, 0.5F},
      {"network", action_type::NETWORK_LIMIT, 0.6F, 6.0F, 0.2F},
      {"processes", action_type::PROCESS_PRIORITY, 0.5F, 5.0F, 0.2F},
  };
  return map;
}

std::vector<ActionTemplate> default_away_actions() {
  using model::action_type;
  return {
      {"display", action_type::BRIGHTNESS_ADJUST, 0.9F, 30.0F, 0.1F},
      {"network", action_type::NETWORK_LIMIT, 0.6F, 15.0F, 0.2F},
  };
}

DecisionEngine::DecisionEngine(core::DecisionConfig config, std::shared_ptr<const ModelHandle> model, ActionMap actions,
                               std::vector<ActionTemplate> away_actions)
    : config_(config),
      actions_(std::move(actions)),
      away_actions_(std::move(away_actions)),
      rules_(config),
      learned_(config, std::move(model)) {}

Decision DecisionEngine::decide(const model::system_snapshot& snapshot, const model::context_state& context,
                                const Calibration& calibration) {
  const model_availability availability = learned_.availability(calibration);
  if (availability != last_availability_) {
    if (availability == model_availability::AVAILABLE) {
      std::cerr << "[decision] learned model available, " << calibration.sample_count << " samples\n";
    } else {
      std::cerr << "[decision] learned model " << availability_label(availability) << ", using rule table\n";
    }
    last_availability_ = availability;
  }

  std::optional<Verdict> verdict = learned_.classify(snapshot, context, calibration);
  if (!verdict.has_value()) {
    verdict = rules_.classify(snapshot, context, calibration);
  }

  Decision decision{};
  decision.source = verdict->source;
  decision.level = verdict->level;
  decision.probabilities = verdict->probabilities;
  decision.candidates = candidates_for(verdict->level, snapshot, context, verdict->confidence, calibration);
  if (context.activity == model::user_activity::AWAY && context.source == model::power_source::BATTERY) {
    add_away_candidates(snapshot, calibrated_confidence(verdict->confidence, context, calibration),
                        decision.candidates);
  }
  return decision;
}

float DecisionEngine::calibrated_confidence(const float base_confidence, const model::context_state& context,
                                            const Calibration& calibration) const noexcept {
  float confidence = base_confidence * core::clamp01(calibration.historical_accuracy);
  if (context.battery == model::battery_level::CRITICAL) {
    confidence *= config_.emergency_confidence_boost;
  }
  return core::clamp01(confidence);
}

// Fixed-intensity actions for an unattended machine. Each replaces the
// severity candidate on its target when it saves more.
void DecisionEngine::add_away_candidates(const model::system_snapshot& snapshot, const float confidence,
                                         std::vector<model::optimization_action>& candidates) const {
  constexpr float kBytesPerMiB = 1024.0F * 1024.0F;
  const float network_mib = static_cast<float>(snapshot.network_bytes_sent + snapshot.network_bytes_recv) / kBytesPerMiB;

  for (const ActionTemplate& action : away_actions_) {
    if (!template_applies(action, snapshot)) {
      continue;
    }
    if (action.type == model::action_type::NETWORK_LIMIT && network_mib <= config_.away_network_mib) {
      continue;
    }

    model::optimization_action candidate{};
    candidate.type = action.type;
    candidate.target_component = action.target;
    candidate.intensity = core::clamp01(action.base_intensity);
    candidate.estimated_savings = action.base_savings;
    candidate.performance_impact = core::clamp01(action.base_impact);
    candidate.confidence = confidence;
    candidate.created_at_ms = snapshot.timestamp_ms;

    const auto existing = std::find_if(candidates.begin(), candidates.end(), [&](const auto& other) {
      return other.target_component == candidate.target_component;
    });
    if (existing == candidates.end()) {
      candidates.push_back(std::move(candidate));
    } else if (candidate.estimated_savings > existing->estimated_savings) {
      *existing = std::move(candidate);
    }
  }

  std::stable_sort(candidates.begin(), candidates.end(), [](const auto& lhs, const auto& rhs) {
    return lhs.estimated_savings > rhs.estimated_savings;
  });
}

std::vector<model::optimization_action> DecisionEngine::candidates_for(const model::severity level,
                                                                       const model::system_snapshot& snapshot,
                                                                       const model::context_state& context,
                                                                       const float base_confidence,
                                                                       const Calibration& calibration) const {
  std::vector<model::optimization_action> candidates;
  const auto& templates = actions_[static_cast<std::size_t>(level)];
  if (templates.empty()) {
    return candidates;
  }

  const float score_scale =
      config_.score_floor + ((1.0F - config_.score_floor) * core::clamp_range(context.context_score, 0.0F, 3.0F) / 3.0F);
  const float scale = score_scale * band_scale(level, snapshot);

  const float confidence = calibrated_confidence(base_confidence, context, calibration);

  for (const ActionTemplate& action : templates) {
    if (!template_applies(action, snapshot)) {
      continue;
    }
    model::optimization_action candidate{};
    candidate.type = action.type;
    candidate.target_component = action.target;
    candidate.intensity = core::clamp01(action.base_intensity * scale);
    const float ratio = action.base_intensity > 0.0F ? candidate.intensity / action.base_intensity : 1.0F;
    candidate.estimated_savings = action.base_savings * ratio;
    candidate.performance_impact = core::clamp01(action.base_impact * ratio);
    candidate.confidence = confidence;
    candidate.created_at_ms = snapshot.timestamp_ms;
    candidates.push_back(std::move(candidate));
  }

  std::stable_sort(candidates.begin(), candidates.end(), [](const auto& lhs, const auto& rhs) {
    return lhs.estimated_savings > rhs.estimated_savings;
  });
  return candidates;
}

// Interpolation factor for how deep the reading sits inside the band that
// selected this severity.
float DecisionEngine::band_scale(const model::severity level, const model::system_snapshot& snapshot) const noexcept {
  float depth = 0.5F;
  switch (level) {
    case model::severity::AGGRESSIVE:
      depth = 1.0F - core::band_position(snapshot.battery_percent, 0.0F, config_.aggressive_battery_pct);
      break;
    case model::severity::MODERATE:
      depth = 1.0F - core::band_position(snapshot.battery_percent, config_.aggressive_battery_pct,
                                         config_.moderate_battery_pct);
      break;
    case model::severity::LIGHT:
      depth = core::band_position(snapshot.cpu_percent, config_.light_cpu_pct, 100.0F);
      break;
    case model::severity::NONE:
      break;
  }
  return core::lerp(config_.interp_low, config_.interp_high, depth);
}

bool DecisionEngine::template_applies(const ActionTemplate& action, const model::system_snapshot& snapshot) const noexcept {
  switch (action.type) {
    case model::action_type::BRIGHTNESS_ADJUST:
      return snapshot.screen_brightness > config_.min_brightness_for_dimming;
    case model::action_type::APP_THROTTLE:
      return snapshot.target_app_cpu <= config_.critical_app_cpu_pct;
    case model::action_type::CPU_THROTTLE:
    case model::action_type::NETWORK_LIMIT:
    case model::action_type::PROCESS_PRIORITY:
      return true;
  }
  return true;
}

}  // namespace pwr_agent::reasoning
