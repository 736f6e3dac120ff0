#include "learning/feedback_learner.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <string>
#include <unordered_map>
#include <utility>

#include <nlohmann/json.hpp>

#include "learning/bootstrap.hpp"
#include "reasoning/features.hpp"
#include "store/codec.hpp"

namespace pwr_agent::learning {
namespace {

constexpr float kSatisfiedThreshold = 0.5F;
constexpr float kDissatisfiedThreshold = 0.4F;
constexpr std::chrono::milliseconds kMaxPollPeriod{1000};
constexpr std::chrono::milliseconds kMinPollPeriod{10};

model::severity shift(const model::severity level, const int delta) noexcept {
  const int shifted = std::clamp(static_cast<int>(level) + delta, 0, static_cast<int>(model::kSeverityClasses) - 1);
  return static_cast<model::severity>(shifted);
}

nlohmann::json entry_to_json(const BufferEntry& entry) {
  if (const auto* outcome = std::get_if<model::decision_outcome>(&entry)) {
    return {{"kind", "outcome"}, {"data", store::outcome_to_json(*outcome)}};
  }
  return {{"kind", "feedback"}, {"data", store::feedback_to_json(std::get<model::feedback_record>(entry))}};
}

BufferEntry entry_from_json(const nlohmann::json& doc) {
  const std::string kind = doc.at("kind").get<std::string>();
  if (kind == "outcome") {
    return store::outcome_from_json(doc.at("data"));
  }
  if (kind == "feedback") {
    return store::feedback_from_json(doc.at("data"));
  }
  throw std::runtime_error("unknown buffer entry kind: " + kind);
}

}  // namespace

model::severity feedback_label(const model::severity decided, const model::feedback_record& feedback) noexcept {
  if (!feedback.performance_acceptable || feedback.satisfaction < kDissatisfiedThreshold) {
    return shift(decided, -1);
  }
  if (!feedback.battery_improvement) {
    return shift(decided, +1);
  }
  return decided;
}

bool feedback_correct(const model::feedback_record& feedback) noexcept {
  return feedback.satisfaction >= kSatisfiedThreshold && feedback.performance_acceptable;
}

FeedbackLearner::FeedbackLearner(core::LearnerConfig config, core::ContextConfig context_config,
                                 std::shared_ptr<store::StateStore> store, core::Clock clock, Trainer trainer)
    : config_(config),
      analyzer_(context_config),
      store_(std::move(store)),
      clock_(std::move(clock)),
      trainer_(std::move(trainer)),
      cadence_(static_cast<std::uint64_t>(config.retrain_interval.count()), config.retrain_sample_threshold) {}

FeedbackLearner::~FeedbackLearner() { shutdown(); }

void FeedbackLearner::initialize() {
  if (worker_.joinable()) {
    return;
  }

  bootstrap_ = generate_bootstrap(config_.bootstrap_samples, config_.bootstrap_seed, analyzer_);
  restore();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    cadence_.start(clock_());
    historical_accuracy_ = accuracy_locked();
    stopping_ = false;
  }

  if (handle_->load() == nullptr) {
    std::cerr << "[learner] no persisted model, training on " << bootstrap_.size() << " bootstrap samples\n";
    if (!retrain()) {
      std::cerr << "[learner] bootstrap training failed; decisions use the rule table\n";
    }
  }

  worker_ = std::thread([this] { worker_loop(); });
}

void FeedbackLearner::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  wake_.notify_all();
  if (!worker_.joinable()) {
    return;
  }
  worker_.join();
  persist();
  idle_.notify_all();
}

void FeedbackLearner::record_outcome(model::decision_outcome outcome) { append(std::move(outcome)); }

void FeedbackLearner::submit_feedback(model::feedback_record feedback) { append(std::move(feedback)); }

void FeedbackLearner::append(BufferEntry entry) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.push_back(std::move(entry));
    while (buffer_.size() > std::max<std::size_t>(config_.buffer_capacity, 1)) {
      buffer_.pop_front();
    }
    cadence_.count();
    ++appends_since_persist_;
    if (config_.persist_every > 0 && appends_since_persist_ >= config_.persist_every) {
      appends_since_persist_ = 0;
      persist_requested_ = true;
    }
    if (cadence_.due(clock_())) {
      retrain_requested_ = true;
    }
  }
  wake_.notify_one();
}

bool FeedbackLearner::retrain() {
  std::vector<reasoning::TrainingSample> training;
  float accuracy = 1.0F;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    training = bootstrap_;
    for (reasoning::TrainingSample sample : live_samples_locked()) {
      sample.weight = config_.live_sample_weight;
      training.push_back(sample);
    }
    accuracy = accuracy_locked();
  }

  const reasoning::TrainingOptions options{config_.training_epochs, config_.learning_rate, config_.l2_penalty};
  std::shared_ptr<const reasoning::SeverityClassifier> model;
  try {
    model = std::make_shared<const reasoning::SeverityClassifier>(trainer_(training, options));
  } catch (const std::exception& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.retrain_failures;
    // The failed attempt consumes the trigger; the next threshold or interval retries.
    cadence_.fire(clock_());
    std::cerr << "[learner] retrain failed, keeping previous model: " << error.what() << '\n';
    return false;
  }

  handle_->publish(model);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    historical_accuracy_ = accuracy;
    cadence_.fire(clock_());
    ++stats_.retrains;
  }
  persist();
  return true;
}

void FeedbackLearner::request_retrain() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    retrain_requested_ = true;
  }
  wake_.notify_one();
}

bool FeedbackLearner::wait_idle(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_.wait_for(lock, timeout,
                        [this] { return stopping_ || (!busy_ && !retrain_requested_ && !persist_requested_); });
}

reasoning::Calibration FeedbackLearner::get_calibration() const {
  const reasoning::ModelHandle::Model model = handle_->load();
  std::lock_guard<std::mutex> lock(mutex_);
  return {historical_accuracy_, model != nullptr ? model->sample_count() : 0};
}

LearnerStats FeedbackLearner::stats() const {
  const reasoning::ModelHandle::Model model = handle_->load();
  std::lock_guard<std::mutex> lock(mutex_);
  LearnerStats out = stats_;
  out.buffered = buffer_.size();
  out.pending_samples = cadence_.pending_events();
  out.historical_accuracy = historical_accuracy_;
  out.model_samples = model != nullptr ? model->sample_count() : 0;
  out.state_held = model_unread_ || buffer_unread_;
  return out;
}

std::vector<reasoning::TrainingSample> FeedbackLearner::live_samples() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return live_samples_locked();
}

std::vector<reasoning::TrainingSample> FeedbackLearner::live_samples_locked() const {
  std::unordered_map<std::string, const model::feedback_record*> feedback_by_decision;
  for (const BufferEntry& entry : buffer_) {
    if (const auto* feedback = std::get_if<model::feedback_record>(&entry)) {
      if (!feedback->decision_id.empty()) {
        feedback_by_decision[feedback->decision_id] = feedback;
      }
    }
  }

  std::vector<reasoning::TrainingSample> samples;
  for (const BufferEntry& entry : buffer_) {
    const auto* outcome = std::get_if<model::decision_outcome>(&entry);
    if (outcome == nullptr) {
      continue;
    }

    model::severity label = outcome->decided;
    const auto linked = feedback_by_decision.find(outcome->decision_id);
    if (linked != feedback_by_decision.end()) {
      label = feedback_label(outcome->decided, *linked->second);
    } else if (outcome->observed_satisfaction < kSatisfiedThreshold) {
      continue;
    }

    model::context_state context{};
    context.source =
        analyzer_.classify_power_source(outcome->snapshot.power_plugged, outcome->snapshot.battery_power_draw);
    context.hour_of_day = core::local_hour_of_day(outcome->snapshot.timestamp_ms);
    context.context_score = outcome->context_score;

    reasoning::TrainingSample sample{};
    sample.features = reasoning::extract_features(outcome->snapshot, context);
    sample.label = label;
    samples.push_back(sample);
  }
  return samples;
}

float FeedbackLearner::accuracy_locked() const {
  float accuracy = 1.0F;
  for (const BufferEntry& entry : buffer_) {
    if (const auto* feedback = std::get_if<model::feedback_record>(&entry)) {
      const float correct = feedback_correct(*feedback) ? 1.0F : 0.0F;
      accuracy = (config_.accuracy_alpha * correct) + ((1.0F - config_.accuracy_alpha) * accuracy);
    }
  }
  return accuracy;
}

std::chrono::milliseconds FeedbackLearner::poll_period() const noexcept {
  if (config_.retrain_interval.count() <= 0) {
    return kMaxPollPeriod;
  }
  return std::clamp(config_.retrain_interval, kMinPollPeriod, kMaxPollPeriod);
}

void FeedbackLearner::worker_loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    wake_.wait_for(lock, poll_period(), [this] { return stopping_ || retrain_requested_ || persist_requested_; });
    if (stopping_) {
      break;
    }
    if (!retrain_requested_ && cadence_.due(clock_())) {
      retrain_requested_ = true;
    }

    const bool do_retrain = retrain_requested_;
    const bool do_persist = persist_requested_;
    retrain_requested_ = false;
    persist_requested_ = false;
    if (!do_retrain && !do_persist) {
      continue;
    }

    busy_ = true;
    lock.unlock();
    const bool retrained = do_retrain && retrain();
    if (do_persist && !retrained) {
      persist();
    }
    lock.lock();
    busy_ = false;
    idle_.notify_all();
  }
}

void FeedbackLearner::persist() {
  if (store_ == nullptr) {
    return;
  }

  // A key whose earlier load failed is only written once it has been read.
  bool hold_model = false;
  bool hold_buffer = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    hold_model = model_unread_;
    hold_buffer = buffer_unread_;
  }
  if (hold_model && restore_model()) {
    hold_model = false;
  }
  if (hold_buffer && restore_buffer()) {
    hold_buffer = false;
  }

  bool ok = true;
  if (!hold_buffer) {
    nlohmann::json buffer_doc = nlohmann::json::object();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      nlohmann::json entries = nlohmann::json::array();
      for (const BufferEntry& entry : buffer_) {
        entries.push_back(entry_to_json(entry));
      }
      buffer_doc["entries"] = std::move(entries);
    }
    ok = store_->save(store::kLearnerBufferKey, buffer_doc);
  }
  if (const reasoning::ModelHandle::Model model = handle_->load(); model != nullptr && !hold_model) {
    ok = store_->save(store::kModelKey, store::classifier_to_json(*model)) && ok;
  }

  if (!ok) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.persist_failures;
    std::cerr << "[learner] failed to persist learner state\n";
  }
}

void FeedbackLearner::restore() {
  if (store_ == nullptr) {
    return;
  }
  restore_model();
  restore_buffer();
}

bool FeedbackLearner::restore_model() {
  bool readable = true;
  try {
    if (const auto doc = store_->load(store::kModelKey); doc.has_value()) {
      auto model = std::make_shared<const reasoning::SeverityClassifier>(store::classifier_from_json(*doc));
      const reasoning::ModelHandle::Model current = handle_->load();
      if (current == nullptr || model->sample_count() >= current->sample_count()) {
        std::cerr << "[learner] restored model trained on " << model->sample_count() << " samples\n";
        handle_->publish(std::move(model));
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.model_loaded = true;
      }
    }
  } catch (const store::StoreUnavailable& error) {
    std::cerr << "[learner] holding persisted model until the store is readable: " << error.what() << '\n';
    readable = false;
  } catch (const std::exception& error) {
    std::cerr << "[learner] ignoring persisted model: " << error.what() << '\n';
  }

  std::lock_guard<std::mutex> lock(mutex_);
  model_unread_ = !readable;
  return readable;
}

bool FeedbackLearner::restore_buffer() {
  bool readable = true;
  try {
    if (const auto doc = store_->load(store::kLearnerBufferKey); doc.has_value()) {
      std::deque<BufferEntry> restored;
      for (const nlohmann::json& entry : doc->at("entries")) {
        restored.push_back(entry_from_json(entry));
      }
      std::cerr << "[learner] restored " << restored.size() << " buffered records\n";
      std::lock_guard<std::mutex> lock(mutex_);
      // Records appended while the store was unreadable are newer than the persisted ones.
      for (BufferEntry& entry : buffer_) {
        restored.push_back(std::move(entry));
      }
      while (restored.size() > std::max<std::size_t>(config_.buffer_capacity, 1)) {
        restored.pop_front();
      }
      buffer_ = std::move(restored);
    }
  } catch (const store::StoreUnavailable& error) {
    std::cerr << "[learner] holding persisted buffer until the store is readable: " << error.what() << '\n';
    readable = false;
  } catch (const std::exception& error) {
    std::cerr << "[learner] ignoring persisted buffer: " << error.what() << '\n';
  }

  std::lock_guard<std::mutex> lock(mutex_);
  buffer_unread_ = !readable;
  return readable;
}

}  // namespace pwr_agent::learning
