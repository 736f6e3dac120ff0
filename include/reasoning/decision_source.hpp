#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "model/context_state.hpp"
#include "model/feedback.hpp"
#include "model/snapshot.hpp"
#include "reasoning/classifier.hpp"
#include "reasoning/model_handle.hpp"

namespace pwr_agent::reasoning {

struct Verdict {
  model::severity level{model::severity::NONE};
  ClassProbabilities probabilities{};
  // Uncalibrated: class probability or the rule constant.
  float confidence{0.0F};
  model::decision_source source{model::decision_source::RULE};
};

class DecisionSource {
 public:
  virtual ~DecisionSource() = default;

  virtual std::optional<Verdict> classify(const model::system_snapshot& snapshot, const model::context_state& context,
                                          const Calibration& calibration) const = 0;
};

// Ordered threshold table; the first matching row wins and the last row
// always matches.
class RuleDecisionSource final : public DecisionSource {
 public:
  struct Rule {
    std::string name;
    model::severity level;
    std::function<bool(const model::system_snapshot&, const model::context_state&)> matches;
  };

  explicit RuleDecisionSource(const core::DecisionConfig& config);

  std::optional<Verdict> classify(const model::system_snapshot& snapshot, const model::context_state& context,
                                  const Calibration& calibration) const override;

  [[nodiscard]] const std::vector<Rule>& rules() const noexcept { return rules_; }

 private:
  std::vector<Rule> rules_{};
  float confidence_{0.75F};
};

enum class model_availability {
  AVAILABLE,
  ABSENT,
  UNDERTRAINED,
};

class LearnedDecisionSource final : public DecisionSource {
 public:
  LearnedDecisionSource(const core::DecisionConfig& config, std::shared_ptr<const ModelHandle> handle);

  [[nodiscard]] model_availability availability(const Calibration& calibration) const noexcept;

  // Empty when the model is unavailable or not confident enough.
  std::optional<Verdict> classify(const model::system_snapshot& snapshot, const model::context_state& context,
                                  const Calibration& calibration) const override;

 private:
  std::shared_ptr<const ModelHandle> handle_{};
  std::size_t min_samples_{0};
  float probability_floor_{0.0F};
};

}  // namespace pwr_agent::reasoning
