#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <utility>

#include "reasoning/classifier.hpp"

namespace pwr_agent::reasoning {

struct Calibration {
  float historical_accuracy{1.0F};
  std::size_t sample_count{0};
};

// Current classifier shared between the retraining worker (writer) and the
// decision path (reader). Published models are immutable; a swap replaces
// the whole pointer so readers never see a half-trained model.
class ModelHandle {
 public:
  using Model = std::shared_ptr<const SeverityClassifier>;

  [[nodiscard]] Model load() const noexcept { return model_.load(std::memory_order_acquire); }

  void publish(Model model) noexcept { model_.store(std::move(model), std::memory_order_release); }

 private:
  std::atomic<Model> model_{};
};

}  // namespace pwr_agent::reasoning
