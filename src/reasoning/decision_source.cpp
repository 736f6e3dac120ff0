#include "reasoning/decision_source.hpp"

#include <utility>

#include "reasoning/features.hpp"

namespace pwr_agent::reasoning {

namespace {

ClassProbabilities one_hot(const model::severity level) noexcept {
  ClassProbabilities probabilities{};
  probabilities[static_cast<std::size_t>(level)] = 1.0F;
  return probabilities;
}

}  // namespace

RuleDecisionSource::RuleDecisionSource(const core::DecisionConfig& config) : confidence_(config.rule_confidence) {
  const float aggressive_below = config.aggressive_battery_pct;
  const float moderate_below = config.moderate_battery_pct;
  const float light_below = config.light_battery_pct;
  const float light_cpu = config.light_cpu_pct;

  rules_.push_back({"plugged", model::severity::NONE,
                    [](const model::system_snapshot&, const model::context_state& context) {
                      return context.source == model::power_source::PLUGGED &&
                             context.battery != model::battery_level::CRITICAL;
                    }});
  rules_.push_back({"battery_aggressive", model::severity::AGGRESSIVE,
                    [aggressive_below](const model::system_snapshot& snapshot, const model::context_state&) {
                      return snapshot.battery_percent < aggressive_below;
                    }});
  rules_.push_back({"battery_moderate", model::severity::MODERATE,
                    [moderate_below](const model::system_snapshot& snapshot, const model::context_state&) {
                      return snapshot.battery_percent < moderate_below;
                    }});
  rules_.push_back({"battery_light_busy_cpu", model::severity::LIGHT,
                    [light_below, light_cpu](const model::system_snapshot& snapshot, const model::context_state&) {
                      return snapshot.battery_percent < light_below && snapshot.cpu_percent > light_cpu;
                    }});
  rules_.push_back({"default", model::severity::NONE,
                    [](const model::system_snapshot&, const model::context_state&) { return true; }});
}

std::optional<Verdict> RuleDecisionSource::classify(const model::system_snapshot& snapshot,
                                                    const model::context_state& context,
                                                    const Calibration& /*calibration*/) const {
  for (const Rule& rule : rules_) {
    if (rule.matches(snapshot, context)) {
      return Verdict{rule.level, one_hot(rule.level), confidence_, model::decision_source::RULE};
    }
  }
  return Verdict{model::severity::NONE, one_hot(model::severity::NONE), confidence_, model::decision_source::RULE};
}

LearnedDecisionSource::LearnedDecisionSource(const core::DecisionConfig& config,
                                             std::shared_ptr<const ModelHandle> handle)
    : handle_(std::move(handle)), min_samples_(config.min_model_samples), probability_floor_(config.probability_floor) {}

model_availability LearnedDecisionSource::availability(const Calibration& calibration) const noexcept {
  if (handle_ == nullptr) {
    return model_availability::ABSENT;
  }
  const ModelHandle::Model model = handle_->load();
  if (model == nullptr) {
    return model_availability::ABSENT;
  }
  if (model->sample_count() < min_samples_ || calibration.sample_count < min_samples_) {
    return model_availability::UNDERTRAINED;
  }
  return model_availability::AVAILABLE;
}

std::optional<Verdict> LearnedDecisionSource::classify(const model::system_snapshot& snapshot,
                                                       const model::context_state& context,
                                                       const Calibration& calibration) const {
  if (availability(calibration) != model_availability::AVAILABLE) {
    return std::nullopt;
  }

  const ModelHandle::Model model = handle_->load();
  if (model == nullptr) {
    return std::nullopt;
  }

  const ClassProbabilities probabilities = model->predict_proba(extract_features(snapshot, context));
  const model::severity level = top_class(probabilities);
  const float top = probabilities[static_cast<std::size_t>(level)];
  if (top < probability_floor_) {
    return std::nullopt;
  }

  return Verdict{level, probabilities, top, model::decision_source::LEARNED};
}

}  // namespace pwr_agent::reasoning
