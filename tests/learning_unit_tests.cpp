#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "learning/bootstrap.hpp"
#include "learning/feedback_learner.hpp"
#include "model/feedback.hpp"
#include "model/optimization_action.hpp"
#include "model/snapshot.hpp"
#include "reasoning/classifier.hpp"
#include "reasoning/context_analyzer.hpp"
#include "reasoning/features.hpp"
#include "store/state_store.hpp"

using pwr_agent::core::ContextConfig;
using pwr_agent::core::LearnerConfig;
using pwr_agent::learning::bootstrap_label;
using pwr_agent::learning::feedback_correct;
using pwr_agent::learning::feedback_label;
using pwr_agent::learning::FeedbackLearner;
using pwr_agent::learning::generate_bootstrap;
using pwr_agent::model::decision_outcome;
using pwr_agent::model::feedback_record;
using pwr_agent::model::severity;
using pwr_agent::model::system_snapshot;
using pwr_agent::reasoning::ContextAnalyzer;
using pwr_agent::reasoning::SeverityClassifier;
using pwr_agent::reasoning::TrainingOptions;
using pwr_agent::reasoning::TrainingSample;
using pwr_agent::store::FileStateStore;
using pwr_agent::store::MemoryStateStore;

namespace {

constexpr std::uint64_t kNowMs = 1'700'000'000'000ULL;

bool almost_equal(float a, float b, float eps = 1e-4F) {
  return std::fabs(a - b) <= eps;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

LearnerConfig small_config() {
  LearnerConfig config;
  config.bootstrap_samples = 200;
  config.training_epochs = 60;
  config.retrain_sample_threshold = 0;
  config.retrain_interval = std::chrono::milliseconds(0);
  config.persist_every = 0;
  return config;
}

std::unique_ptr<FeedbackLearner> make_learner(const LearnerConfig& config,
                                              std::shared_ptr<pwr_agent::store::StateStore> store,
                                              pwr_agent::learning::Trainer trainer = &SeverityClassifier::train) {
  return std::make_unique<FeedbackLearner>(config, ContextConfig{}, std::move(store), [] { return kNowMs; },
                                           std::move(trainer));
}

system_snapshot make_snapshot(const float battery, const float cpu, const bool plugged) {
  system_snapshot snapshot{};
  snapshot.timestamp_ms = kNowMs;
  snapshot.battery_percent = battery;
  snapshot.battery_power_draw = plugged ? -5.0F : 10.0F;
  snapshot.cpu_percent = cpu;
  snapshot.memory_percent = 50.0F;
  snapshot.screen_brightness = 60.0F;
  snapshot.power_plugged = plugged;
  return snapshot;
}

decision_outcome make_outcome(const std::string& id, const severity decided, const float satisfaction) {
  decision_outcome outcome{};
  outcome.decision_id = id;
  outcome.snapshot = make_snapshot(20.0F, 60.0F, false);
  outcome.context_score = 1.5F;
  outcome.decided = decided;
  outcome.observed_satisfaction = satisfaction;
  outcome.timestamp_ms = kNowMs;
  return outcome;
}

feedback_record make_feedback(const std::string& decision_id, const float satisfaction, const bool improved) {
  feedback_record feedback{};
  feedback.decision_id = decision_id;
  feedback.satisfaction = satisfaction;
  feedback.battery_improvement = improved;
  feedback.timestamp_ms = kNowMs;
  return feedback;
}

int test_bootstrap_label_table() {
  if (bootstrap_label(5.0F, 99.0F, 99.0F, true) != severity::NONE ||
      bootstrap_label(10.0F, 0.0F, 20.0F, false) != severity::AGGRESSIVE ||
      bootstrap_label(20.0F, 80.0F, 20.0F, false) != severity::MODERATE ||
      bootstrap_label(20.0F, 10.0F, 85.0F, false) != severity::MODERATE ||
      bootstrap_label(20.0F, 10.0F, 20.0F, false) != severity::LIGHT ||
      bootstrap_label(45.0F, 95.0F, 20.0F, false) != severity::LIGHT ||
      bootstrap_label(45.0F, 50.0F, 20.0F, false) != severity::NONE ||
      bootstrap_label(80.0F, 99.0F, 99.0F, false) != severity::NONE) {
    return fail("test_bootstrap_label_table", "unexpected bootstrap label");
  }
  return 0;
}

int test_bootstrap_is_deterministic_per_seed() {
  const ContextAnalyzer analyzer;
  const auto first = generate_bootstrap(100, 42, analyzer);
  const auto second = generate_bootstrap(100, 42, analyzer);
  const auto other = generate_bootstrap(100, 43, analyzer);
  if (first.size() != 100) {
    return fail("test_bootstrap_is_deterministic_per_seed", "wrong sample count");
  }
  bool differs = false;
  for (std::size_t i = 0; i < first.size(); ++i) {
    if (first[i].features != second[i].features || first[i].label != second[i].label) {
      return fail("test_bootstrap_is_deterministic_per_seed", "same seed must reproduce samples");
    }
    differs = differs || first[i].features != other[i].features;
  }
  if (!differs) {
    return fail("test_bootstrap_is_deterministic_per_seed", "different seeds should differ");
  }
  return 0;
}

int test_classifier_learns_bootstrap_rules() {
  const ContextAnalyzer analyzer;
  const auto samples = generate_bootstrap(1000, 42, analyzer);
  const SeverityClassifier model = SeverityClassifier::train(samples, TrainingOptions{});
  if (model.sample_count() != samples.size()) {
    return fail("test_classifier_learns_bootstrap_rules", "sample count should match training set");
  }
  if (model.accuracy(samples) <= 0.75F) {
    return fail("test_classifier_learns_bootstrap_rules", "training accuracy too low");
  }

  const system_snapshot drained = make_snapshot(6.0F, 50.0F, false);
  const system_snapshot charged = make_snapshot(90.0F, 50.0F, true);
  const auto p_drained = model.predict_proba(
      pwr_agent::reasoning::extract_features(drained, analyzer.analyze(drained, {})));
  const auto p_charged = model.predict_proba(
      pwr_agent::reasoning::extract_features(charged, analyzer.analyze(charged, {})));
  constexpr std::size_t kAggressive = static_cast<std::size_t>(severity::AGGRESSIVE);
  if (p_drained[kAggressive] <= p_charged[kAggressive]) {
    return fail("test_classifier_learns_bootstrap_rules", "drained battery should lean aggressive");
  }

  try {
    (void)SeverityClassifier::train({}, TrainingOptions{});
    return fail("test_classifier_learns_bootstrap_rules", "empty training set should throw");
  } catch (const std::invalid_argument&) {
  }
  return 0;
}

int test_feedback_label_adjustments() {
  feedback_record unacceptable = make_feedback("d", 0.9F, true);
  unacceptable.performance_acceptable = false;
  if (feedback_label(severity::MODERATE, unacceptable) != severity::LIGHT) {
    return fail("test_feedback_label_adjustments", "performance complaint should lower severity");
  }
  if (feedback_label(severity::MODERATE, make_feedback("d", 0.2F, true)) != severity::LIGHT) {
    return fail("test_feedback_label_adjustments", "low satisfaction should lower severity");
  }
  if (feedback_label(severity::MODERATE, make_feedback("d", 0.8F, false)) != severity::AGGRESSIVE) {
    return fail("test_feedback_label_adjustments", "no battery improvement should raise severity");
  }
  if (feedback_label(severity::MODERATE, make_feedback("d", 0.8F, true)) != severity::MODERATE) {
    return fail("test_feedback_label_adjustments", "good feedback should keep severity");
  }
  if (feedback_label(severity::NONE, make_feedback("d", 0.1F, true)) != severity::NONE ||
      feedback_label(severity::AGGRESSIVE, make_feedback("d", 0.9F, false)) != severity::AGGRESSIVE) {
    return fail("test_feedback_label_adjustments", "labels should stay within the severity range");
  }
  if (!feedback_correct(make_feedback("d", 0.5F, false)) || feedback_correct(make_feedback("d", 0.49F, true))) {
    return fail("test_feedback_label_adjustments", "correctness threshold is satisfaction >= 0.5");
  }
  return 0;
}

int test_learner_bootstraps_and_swaps_model() {
  auto learner = make_learner(small_config(), std::make_shared<MemoryStateStore>());
  learner->initialize();

  const auto handle = learner->model_handle();
  const auto before = handle->load();
  if (before == nullptr || before->sample_count() != 200) {
    return fail("test_learner_bootstraps_and_swaps_model", "bootstrap model should be published");
  }
  const auto calibration = learner->get_calibration();
  if (!almost_equal(calibration.historical_accuracy, 1.0F) || calibration.sample_count != 200) {
    return fail("test_learner_bootstraps_and_swaps_model", "fresh learner should report full accuracy");
  }

  learner->record_outcome(make_outcome("dec-1", severity::MODERATE, 0.9F));
  if (!learner->retrain()) {
    return fail("test_learner_bootstraps_and_swaps_model", "retrain should succeed");
  }
  const auto after = handle->load();
  if (after == before || after->sample_count() != 201) {
    return fail("test_learner_bootstraps_and_swaps_model", "retrain should publish a new model");
  }
  if (before->sample_count() != 200) {
    return fail("test_learner_bootstraps_and_swaps_model", "previous model must stay intact for its readers");
  }
  learner->shutdown();
  return 0;
}

int test_retrain_failure_keeps_previous_model() {
  auto calls = std::make_shared<int>(0);
  pwr_agent::learning::Trainer flaky = [calls](const std::vector<TrainingSample>& samples,
                                               const TrainingOptions& options) {
    if (++*calls > 1) {
      throw std::runtime_error("injected divergence");
    }
    return SeverityClassifier::train(samples, options);
  };
  auto learner = make_learner(small_config(), std::make_shared<MemoryStateStore>(), flaky);
  learner->initialize();

  const auto before = learner->model_handle()->load();
  if (learner->retrain()) {
    return fail("test_retrain_failure_keeps_previous_model", "injected failure should be reported");
  }
  if (learner->model_handle()->load() != before || learner->stats().retrain_failures != 1) {
    return fail("test_retrain_failure_keeps_previous_model", "previous model should keep serving");
  }
  learner->shutdown();
  return 0;
}

int test_failed_retrain_waits_for_next_trigger() {
  auto calls = std::make_shared<int>(0);
  pwr_agent::learning::Trainer broken = [calls](const std::vector<TrainingSample>&,
                                                const TrainingOptions&) -> SeverityClassifier {
    ++*calls;
    throw std::runtime_error("injected divergence");
  };
  LearnerConfig config = small_config();
  config.retrain_sample_threshold = 3;
  config.retrain_interval = std::chrono::milliseconds(20);
  auto learner = make_learner(config, std::make_shared<MemoryStateStore>(), broken);
  learner->initialize();
  if (*calls != 1 || learner->model_handle()->load() != nullptr) {
    return fail("test_failed_retrain_waits_for_next_trigger", "bootstrap training should fail once");
  }

  for (int i = 0; i < 3; ++i) {
    learner->record_outcome(make_outcome("dec-" + std::to_string(i), severity::LIGHT, 0.9F));
  }
  if (!learner->wait_idle(std::chrono::milliseconds(10000))) {
    return fail("test_failed_retrain_waits_for_next_trigger", "worker did not go idle");
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(250));
  if (*calls != 2 || learner->stats().retrain_failures != 2 || learner->stats().pending_samples != 0) {
    return fail("test_failed_retrain_waits_for_next_trigger", "failure should not retrain on every poll");
  }

  for (int i = 3; i < 6; ++i) {
    learner->record_outcome(make_outcome("dec-" + std::to_string(i), severity::LIGHT, 0.9F));
  }
  if (!learner->wait_idle(std::chrono::milliseconds(10000)) || *calls != 3) {
    return fail("test_failed_retrain_waits_for_next_trigger", "next threshold should retry");
  }
  learner->shutdown();
  return 0;
}

int test_live_samples_and_calibration() {
  auto learner = make_learner(small_config(), std::make_shared<MemoryStateStore>());
  learner->initialize();

  learner->record_outcome(make_outcome("dec-1", severity::MODERATE, 0.9F));
  learner->record_outcome(make_outcome("dec-2", severity::MODERATE, 0.2F));
  learner->record_outcome(make_outcome("dec-3", severity::MODERATE, 0.2F));
  learner->submit_feedback(make_feedback("dec-3", 0.2F, true));
  learner->submit_feedback(make_feedback("dec-3", 0.1F, true));

  const auto samples = learner->live_samples();
  if (samples.size() != 2) {
    return fail("test_live_samples_and_calibration", "unsatisfied unlinked outcomes should be skipped");
  }
  if (samples[0].label != severity::MODERATE || samples[1].label != severity::LIGHT) {
    return fail("test_live_samples_and_calibration", "linked feedback should relabel its outcome");
  }

  if (!learner->retrain()) {
    return fail("test_live_samples_and_calibration", "retrain should succeed");
  }
  const auto calibration = learner->get_calibration();
  if (!almost_equal(calibration.historical_accuracy, 0.81F, 1e-3F) || calibration.sample_count != 202) {
    return fail("test_live_samples_and_calibration", "accuracy should decay with wrong feedback");
  }
  learner->shutdown();
  return 0;
}

int test_buffer_is_bounded() {
  LearnerConfig config = small_config();
  config.buffer_capacity = 5;
  auto learner = make_learner(config, std::make_shared<MemoryStateStore>());
  for (int i = 0; i < 8; ++i) {
    learner->record_outcome(make_outcome("dec-" + std::to_string(i), severity::LIGHT, 0.9F));
  }
  if (learner->stats().buffered != 5) {
    return fail("test_buffer_is_bounded", "oldest records should be evicted");
  }
  return 0;
}

int test_sample_threshold_triggers_background_retrain() {
  LearnerConfig config = small_config();
  config.retrain_sample_threshold = 3;
  auto learner = make_learner(config, std::make_shared<MemoryStateStore>());
  learner->initialize();

  for (int i = 0; i < 3; ++i) {
    learner->record_outcome(make_outcome("dec-" + std::to_string(i), severity::LIGHT, 0.9F));
  }
  if (!learner->wait_idle(std::chrono::milliseconds(10000))) {
    return fail("test_sample_threshold_triggers_background_retrain", "worker did not go idle");
  }
  const auto stats = learner->stats();
  if (stats.retrains != 2 || stats.model_samples != 203 || stats.pending_samples != 0) {
    return fail("test_sample_threshold_triggers_background_retrain", "threshold should retrain in background");
  }
  learner->shutdown();
  return 0;
}

int test_restores_persisted_state() {
  auto store = std::make_shared<MemoryStateStore>();
  {
    auto first = make_learner(small_config(), store);
    first->initialize();
    first->record_outcome(make_outcome("dec-1", severity::LIGHT, 0.9F));
    first->submit_feedback(make_feedback("dec-1", 0.9F, true));
    first->shutdown();
  }

  auto second = make_learner(small_config(), store);
  second->initialize();
  const auto stats = second->stats();
  if (!stats.model_loaded || stats.retrains != 0 || stats.buffered != 2 || stats.model_samples != 200) {
    return fail("test_restores_persisted_state", "persisted model and buffer should be restored");
  }
  second->shutdown();

  store->save(pwr_agent::store::kModelKey, nlohmann::json{{"format", 99}});
  auto third = make_learner(small_config(), store);
  third->initialize();
  if (third->stats().model_loaded || third->stats().retrains != 1) {
    return fail("test_restores_persisted_state", "unreadable model should be retrained from bootstrap");
  }
  third->shutdown();
  return 0;
}

int test_file_state_store() {
  const std::filesystem::path dir =
      std::filesystem::temp_directory_path() / ("pwr-agent-store-" + std::to_string(::getpid()));
  std::filesystem::remove_all(dir);
  FileStateStore store(dir);

  if (store.load("missing").has_value()) {
    return fail("test_file_state_store", "missing key should load as empty");
  }
  const nlohmann::json doc{{"actions", nlohmann::json::array({1, 2, 3})}};
  if (!store.save("active_actions", doc)) {
    return fail("test_file_state_store", "save should succeed");
  }
  const auto loaded = store.load("active_actions");
  if (!loaded.has_value() || *loaded != doc || !std::filesystem::exists(store.path_for("active_actions"))) {
    return fail("test_file_state_store", "saved document should load back");
  }

  {
    std::ofstream corrupt(store.path_for("broken"));
    corrupt << "{ not json";
  }
  bool threw = false;
  try {
    (void)store.load("broken");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  std::filesystem::remove_all(dir);
  if (!threw) {
    return fail("test_file_state_store", "corrupt document should throw");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_bootstrap_label_table(); rc != 0) return rc;
  if (int rc = test_bootstrap_is_deterministic_per_seed(); rc != 0) return rc;
  if (int rc = test_classifier_learns_bootstrap_rules(); rc != 0) return rc;
  if (int rc = test_feedback_label_adjustments(); rc != 0) return rc;
  if (int rc = test_learner_bootstraps_and_swaps_model(); rc != 0) return rc;
  if (int rc = test_retrain_failure_keeps_previous_model(); rc != 0) return rc;
  if (int rc = test_failed_retrain_waits_for_next_trigger(); rc != 0) return rc;
  if (int rc = test_live_samples_and_calibration(); rc != 0) return rc;
  if (int rc = test_buffer_is_bounded(); rc != 0) return rc;
  if (int rc = test_sample_threshold_triggers_background_retrain(); rc != 0) return rc;
  if (int rc = test_restores_persisted_state(); rc != 0) return rc;
  if (int rc = test_file_state_store(); rc != 0) return rc;

  std::cout << "[PASS] learning unit tests\n";
  return 0;
}
