#pragma once

#include <array>
#include <cstddef>
#include <vector>

#include "model/optimization_action.hpp"
#include "reasoning/features.hpp"

namespace pwr_agent::reasoning {

using ClassProbabilities = std::array<float, model::kSeverityClasses>;

struct TrainingSample {
  FeatureVector features{};
  model::severity label{model::severity::NONE};
  float weight{1.0F};
};

struct TrainingOptions {
  std::size_t epochs{300};
  float learning_rate{0.5F};
  float l2_penalty{0.001F};
};

// Multinomial logistic model over standardized features.
class SeverityClassifier {
 public:
  using WeightMatrix = std::array<FeatureVector, model::kSeverityClasses>;

  SeverityClassifier() = default;
  SeverityClassifier(FeatureVector mean, FeatureVector scale, WeightMatrix weights, ClassProbabilities bias,
                     std::size_t sample_count) noexcept;

  // Full-batch gradient descent from zero weights; deterministic for a given
  // sample order. Throws std::invalid_argument on an empty or weightless set
  // and std::runtime_error if the optimisation diverges.
  static SeverityClassifier train(const std::vector<TrainingSample>& samples, const TrainingOptions& options);

  [[nodiscard]] ClassProbabilities predict_proba(const FeatureVector& features) const noexcept;
  [[nodiscard]] model::severity predict(const FeatureVector& features) const noexcept;
  [[nodiscard]] float accuracy(const std::vector<TrainingSample>& samples) const noexcept;

  [[nodiscard]] std::size_t sample_count() const noexcept { return sample_count_; }
  [[nodiscard]] const FeatureVector& mean() const noexcept { return mean_; }
  [[nodiscard]] const FeatureVector& scale() const noexcept { return scale_; }
  [[nodiscard]] const WeightMatrix& weights() const noexcept { return weights_; }
  [[nodiscard]] const ClassProbabilities& bias() const noexcept { return bias_; }

 private:
  [[nodiscard]] FeatureVector standardize(const FeatureVector& features) const noexcept;

  FeatureVector mean_{};
  FeatureVector scale_{};
  WeightMatrix weights_{};
  ClassProbabilities bias_{};
  std::size_t sample_count_{0};
};

model::severity top_class(const ClassProbabilities& probabilities) noexcept;

}  // namespace pwr_agent::reasoning
