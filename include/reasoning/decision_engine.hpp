#pragma once

#include <array>
#include <memory>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "model/context_state.hpp"
#include "model/feedback.hpp"
#include "model/optimization_action.hpp"
#include "model/snapshot.hpp"
#include "reasoning/classifier.hpp"
#include "reasoning/decision_source.hpp"
#include "reasoning/model_handle.hpp"

namespace pwr_agent::reasoning {

struct ActionTemplate {
  std::string target;
  model::action_type type{model::action_type::CPU_THROTTLE};
  float base_intensity{0.0F};
  float base_savings{0.0F};
  float base_impact{0.0F};
};

// Indexed by model::severity.
using ActionMap = std::array<std::vector<ActionTemplate>, model::kSeverityClasses>;

ActionMap default_action_map();
// Added on battery power when the user is away, whatever the severity.
std::vector<ActionTemplate> default_away_actions();

struct Decision {
  model::decision_source source{model::decision_source::RULE};
  model::severity level{model::severity::NONE};
  ClassProbabilities probabilities{};
  // Sorted by estimated savings, highest first. Ids are left empty.
  std::vector<model::optimization_action> candidates{};
};

class DecisionEngine {
 public:
  DecisionEngine(core::DecisionConfig config, std::shared_ptr<const ModelHandle> model,
                 ActionMap actions = default_action_map(),
                 std::vector<ActionTemplate> away_actions = default_away_actions());

  // Consults the learned model first and falls back to the rule table when
  // the model is missing, undertrained or below the probability floor.
  Decision decide(const model::system_snapshot& snapshot, const model::context_state& context,
                  const Calibration& calibration);

  [[nodiscard]] std::vector<model::optimization_action> candidates_for(model::severity level,
                                                                       const model::system_snapshot& snapshot,
                                                                       const model::context_state& context,
                                                                       float base_confidence,
                                                                       const Calibration& calibration) const;

 private:
  [[nodiscard]] float band_scale(model::severity level, const model::system_snapshot& snapshot) const noexcept;
  [[nodiscard]] bool template_applies(const ActionTemplate& action, const model::system_snapshot& snapshot) const noexcept;
  [[nodiscard]] float calibrated_confidence(float base_confidence, const model::context_state& context,
                                            const Calibration& calibration) const noexcept;
  void add_away_candidates(const model::system_snapshot& snapshot, float confidence,
                           std::vector<model::optimization_action>& candidates) const;

  core::DecisionConfig config_{};
  ActionMap actions_{};
  std::vector<ActionTemplate> away_actions_{};
  RuleDecisionSource rules_;
  LearnedDecisionSource learned_;
  model_availability last_availability_{model_availability::AVAILABLE};
};

}  // namespace pwr_agent::reasoning
