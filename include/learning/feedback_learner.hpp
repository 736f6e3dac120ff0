#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <variant>
#include <vector>

#include "core/cadence.hpp"
#include "core/config.hpp"
#include "core/timestamp.hpp"
#include "model/feedback.hpp"
#include "reasoning/classifier.hpp"
#include "reasoning/context_analyzer.hpp"
#include "reasoning/model_handle.hpp"
#include "store/state_store.hpp"

namespace pwr_agent::learning {

using Trainer =
    std::function<reasoning::SeverityClassifier(const std::vector<reasoning::TrainingSample>&, const reasoning::TrainingOptions&)>;

using BufferEntry = std::variant<model::decision_outcome, model::feedback_record>;

struct LearnerStats {
  std::size_t buffered{0};
  std::size_t pending_samples{0};
  std::size_t retrains{0};
  std::size_t retrain_failures{0};
  std::size_t persist_failures{0};
  std::size_t model_samples{0};
  float historical_accuracy{1.0F};
  bool model_loaded{false};
  // Persisted state could not be read; it is not overwritten until it can.
  bool state_held{false};
};

// Label for a decision given the user's verdict on it.
model::severity feedback_label(model::severity decided, const model::feedback_record& feedback) noexcept;

// Whether feedback counts as the decision having been right.
bool feedback_correct(const model::feedback_record& feedback) noexcept;

// Owns the outcome/feedback ring buffer and the retraining worker. Appends
// never block on training; a new model is published through the handle
// returned by model_handle().
class FeedbackLearner {
 public:
  FeedbackLearner(core::LearnerConfig config, core::ContextConfig context_config,
                  std::shared_ptr<store::StateStore> store, core::Clock clock = core::system_clock_ms(),
                  Trainer trainer = &reasoning::SeverityClassifier::train);
  ~FeedbackLearner();

  FeedbackLearner(const FeedbackLearner&) = delete;
  FeedbackLearner& operator=(const FeedbackLearner&) = delete;

  // Restores the persisted model and buffer, or trains from the bootstrap
  // set, then starts the worker. Persisted documents that fail to parse are
  // logged and ignored. Documents that cannot be read are retried before
  // every persist and left untouched until they load.
  void initialize();
  // Stops the worker and persists the buffer and model.
  void shutdown();

  void record_outcome(model::decision_outcome outcome);
  void submit_feedback(model::feedback_record feedback);

  // Synchronous retrain on the calling thread. Returns false and keeps the
  // current model if training fails.
  bool retrain();
  // Asks the worker to retrain regardless of cadence.
  void request_retrain();
  // Waits until the worker has no queued work.
  bool wait_idle(std::chrono::milliseconds timeout);

  [[nodiscard]] reasoning::Calibration get_calibration() const;
  [[nodiscard]] std::shared_ptr<const reasoning::ModelHandle> model_handle() const noexcept { return handle_; }
  [[nodiscard]] LearnerStats stats() const;

  // Training samples derived from the current buffer, before weighting.
  [[nodiscard]] std::vector<reasoning::TrainingSample> live_samples() const;
  [[nodiscard]] const std::vector<reasoning::TrainingSample>& bootstrap_samples() const noexcept { return bootstrap_; }

 private:
  void append(BufferEntry entry);
  void worker_loop();
  void persist();
  void restore();
  // Both return false when the store could not be read.
  bool restore_model();
  bool restore_buffer();
  [[nodiscard]] std::vector<reasoning::TrainingSample> live_samples_locked() const;
  [[nodiscard]] float accuracy_locked() const;
  [[nodiscard]] std::chrono::milliseconds poll_period() const noexcept;

  core::LearnerConfig config_;
  reasoning::ContextAnalyzer analyzer_;
  std::shared_ptr<store::StateStore> store_;
  core::Clock clock_;
  Trainer trainer_;
  std::shared_ptr<reasoning::ModelHandle> handle_{std::make_shared<reasoning::ModelHandle>()};
  std::vector<reasoning::TrainingSample> bootstrap_{};

  mutable std::mutex mutex_{};
  std::condition_variable wake_{};
  std::condition_variable idle_{};
  std::deque<BufferEntry> buffer_{};
  core::Cadence cadence_{};
  float historical_accuracy_{1.0F};
  std::size_t appends_since_persist_{0};
  bool retrain_requested_{false};
  bool persist_requested_{false};
  bool busy_{false};
  bool model_unread_{false};
  bool buffer_unread_{false};
  bool stopping_{false};
  LearnerStats stats_{};
  std::thread worker_{};
};

}  // namespace pwr_agent::learning
