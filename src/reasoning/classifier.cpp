#include "reasoning/classifier.hpp"

#include <cmath>
#include <stdexcept>

namespace pwr_agent::reasoning {

namespace {

constexpr float kMinScale = 1e-6F;

ClassProbabilities softmax(const ClassProbabilities& logits) noexcept {
  float max_logit = logits[0];
  for (const float logit : logits) {
    max_logit = logit > max_logit ? logit : max_logit;
  }

  ClassProbabilities out{};
  float total = 0.0F;
  for (std::size_t k = 0; k < logits.size(); ++k) {
    out[k] = std::exp(logits[k] - max_logit);
    total += out[k];
  }
  for (float& value : out) {
    value /= total;
  }
  return out;
}

}  // namespace

SeverityClassifier::SeverityClassifier(FeatureVector mean, FeatureVector scale, WeightMatrix weights,
                                       ClassProbabilities bias, const std::size_t sample_count) noexcept
    : mean_(mean), scale_(scale), weights_(weights), bias_(bias), sample_count_(sample_count) {}

SeverityClassifier SeverityClassifier::train(const std::vector<TrainingSample>& samples, const TrainingOptions& options) {
  if (samples.empty()) {
    throw std::invalid_argument("cannot train severity classifier without samples");
  }

  double total_weight = 0.0;
  std::array<double, kFeatureCount> sum{};
  for (const TrainingSample& sample : samples) {
    total_weight += sample.weight;
    for (std::size_t j = 0; j < kFeatureCount; ++j) {
      sum[j] += static_cast<double>(sample.weight) * sample.features[j];
    }
  }
  if (!(total_weight > 0.0)) {
    throw std::invalid_argument("training samples carry no weight");
  }

  FeatureVector mean{};
  for (std::size_t j = 0; j < kFeatureCount; ++j) {
    mean[j] = static_cast<float>(sum[j] / total_weight);
  }

  std::array<double, kFeatureCount> variance{};
  for (const TrainingSample& sample : samples) {
    for (std::size_t j = 0; j < kFeatureCount; ++j) {
      const double delta = static_cast<double>(sample.features[j]) - mean[j];
      variance[j] += static_cast<double>(sample.weight) * delta * delta;
    }
  }

  FeatureVector scale{};
  for (std::size_t j = 0; j < kFeatureCount; ++j) {
    const auto stddev = static_cast<float>(std::sqrt(variance[j] / total_weight));
    scale[j] = stddev > kMinScale ? stddev : 1.0F;
  }

  SeverityClassifier model(mean, scale, WeightMatrix{}, ClassProbabilities{}, samples.size());

  std::vector<FeatureVector> standardized;
  standardized.reserve(samples.size());
  for (const TrainingSample& sample : samples) {
    standardized.push_back(model.standardize(sample.features));
  }

  const auto inv_weight = static_cast<float>(1.0 / total_weight);
  for (std::size_t epoch = 0; epoch < options.epochs; ++epoch) {
    WeightMatrix grad_w{};
    ClassProbabilities grad_b{};

    for (std::size_t i = 0; i < samples.size(); ++i) {
      const FeatureVector& x = standardized[i];
      ClassProbabilities logits = model.bias_;
      for (std::size_t k = 0; k < model::kSeverityClasses; ++k) {
        for (std::size_t j = 0; j < kFeatureCount; ++j) {
          logits[k] += model.weights_[k][j] * x[j];
        }
      }
      const ClassProbabilities p = softmax(logits);
      const auto label = static_cast<std::size_t>(samples[i].label);

      for (std::size_t k = 0; k < model::kSeverityClasses; ++k) {
        const float error = samples[i].weight * (p[k] - (k == label ? 1.0F : 0.0F));
        grad_b[k] += error;
        for (std::size_t j = 0; j < kFeatureCount; ++j) {
          grad_w[k][j] += error * x[j];
        }
      }
    }

    for (std::size_t k = 0; k < model::kSeverityClasses; ++k) {
      model.bias_[k] -= options.learning_rate * grad_b[k] * inv_weight;
      for (std::size_t j = 0; j < kFeatureCount; ++j) {
        const float gradient = (grad_w[k][j] * inv_weight) + (options.l2_penalty * model.weights_[k][j]);
        model.weights_[k][j] -= options.learning_rate * gradient;
        if (!std::isfinite(model.weights_[k][j])) {
          throw std::runtime_error("severity classifier training diverged");
        }
      }
    }
  }

  return model;
}

ClassProbabilities SeverityClassifier::predict_proba(const FeatureVector& features) const noexcept {
  const FeatureVector x = standardize(features);
  ClassProbabilities logits = bias_;
  for (std::size_t k = 0; k < model::kSeverityClasses; ++k) {
    for (std::size_t j = 0; j < kFeatureCount; ++j) {
      logits[k] += weights_[k][j] * x[j];
    }
  }
  return softmax(logits);
}

model::severity SeverityClassifier::predict(const FeatureVector& features) const noexcept {
  return top_class(predict_proba(features));
}

float SeverityClassifier::accuracy(const std::vector<TrainingSample>& samples) const noexcept {
  if (samples.empty()) {
    return 0.0F;
  }

  std::size_t hits = 0;
  for (const TrainingSample& sample : samples) {
    if (predict(sample.features) == sample.label) {
      ++hits;
    }
  }
  return static_cast<float>(hits) / static_cast<float>(samples.size());
}

FeatureVector SeverityClassifier::standardize(const FeatureVector& features) const noexcept {
  FeatureVector out{};
  for (std::size_t j = 0; j < kFeatureCount; ++j) {
    const float scale = scale_[j] > kMinScale ? scale_[j] : 1.0F;
    out[j] = (features[j] - mean_[j]) / scale;
  }
  return out;
}

model::severity top_class(const ClassProbabilities& probabilities) noexcept {
  std::size_t best = 0;
  for (std::size_t k = 1; k < probabilities.size(); ++k) {
    if (probabilities[k] > probabilities[best]) {
      best = k;
    }
  }
  return static_cast<model::severity>(best);
}

}  // namespace pwr_agent::reasoning
