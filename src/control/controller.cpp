#include "control/controller.hpp"

#include <algorithm>
#include <bitset>
#include <cmath>
#include <exception>
#include <iostream>
#include <iterator>
#include <thread>
#include <unordered_set>
#include <utility>

#include <nlohmann/json.hpp>

#include "store/codec.hpp"

namespace pwr_agent::control {
namespace {

constexpr float kSatisfactionDecay = 0.8F;

bool same_action(const model::optimization_action& current, const model::optimization_action& wanted,
                 const float tolerance) noexcept {
  return current.type == wanted.type && std::fabs(current.intensity - wanted.intensity) <= tolerance;
}

std::shared_ptr<const reasoning::ModelHandle> handle_of(const std::shared_ptr<learning::FeedbackLearner>& learner) {
  return learner != nullptr ? learner->model_handle() : nullptr;
}

std::vector<policy::TargetCapability> capabilities_of(const std::shared_ptr<actuators::ActuatorRegistry>& registry) {
  return registry != nullptr ? registry->capabilities() : std::vector<policy::TargetCapability>{};
}

model::decision_source parse_source(const std::string& value) noexcept {
  if (value == "learned") {
    return model::decision_source::LEARNED;
  }
  if (value == "emergency") {
    return model::decision_source::EMERGENCY;
  }
  return model::decision_source::RULE;
}

}  // namespace

Controller::Controller(core::AgentConfig config, std::shared_ptr<monitor::Monitor> monitor,
                       std::shared_ptr<actuators::ActuatorRegistry> actuators,
                       std::shared_ptr<store::StateStore> store, std::shared_ptr<learning::FeedbackLearner> learner,
                       core::Clock clock)
    : config_(std::move(config)),
      monitor_(std::move(monitor)),
      actuators_(std::move(actuators)),
      store_(std::move(store)),
      learner_(std::move(learner)),
      clock_(std::move(clock)),
      analyzer_(config_.context),
      engine_(config_.decision, handle_of(learner_)),
      filter_(config_.policy, capabilities_of(actuators_)),
      dispatcher_(config_.actuation),
      mode_(config_.mode) {
  if (actuators_ == nullptr) {
    actuators_ = std::make_shared<actuators::ActuatorRegistry>();
  }
  counters_.mode = mode_;
  publish_status();
}

Controller::~Controller() {
  std::lock_guard<std::mutex> lock(mutex_);
  poll_pending(true);
}

void Controller::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != controller_state::STOPPED) {
    return;
  }

  if (learner_ != nullptr) {
    try {
      learner_->initialize();
    } catch (const std::exception& error) {
      std::cerr << "[controller] learner initialization failed: " << error.what() << '\n';
    }
  }

  reload_active_table();
  stop_requested_.store(false);
  first_tick_ = true;
  transition(controller_state::RUNNING, "start");
  persist_active_table();
  publish_status();
}

void Controller::reload_active_table() {
  std::vector<ActiveEntry> persisted;
  if (store_ != nullptr) {
    try {
      if (const auto doc = store_->load(store::kActiveActionsKey); doc.has_value()) {
        for (const nlohmann::json& item : doc->at("actions")) {
          ActiveEntry entry{};
          entry.action = store::action_from_json(item.at("action"));
          entry.issued_by = parse_source(item.value("source", std::string("rule")));
          entry.stuck = item.value("stuck", false);
          persisted.push_back(std::move(entry));
        }
      }
    } catch (const store::StoreUnavailable& error) {
      std::cerr << "[controller] holding persisted active table until the store is readable: " << error.what()
                << '\n';
      table_unread_ = true;
    } catch (const std::exception& error) {
      std::cerr << "[controller] ignoring persisted active table: " << error.what() << '\n';
      persisted.clear();
    }
  }

  std::vector<actuators::ActiveAction> reported;
  bool listed = true;
  try {
    reported = actuators_->list_active();
  } catch (const std::exception& error) {
    std::cerr << "[controller] list_active failed, trusting persisted table: " << error.what() << '\n';
    listed = false;
  }

  std::unordered_set<std::string> reported_ids;
  for (const actuators::ActiveAction& item : reported) {
    reported_ids.insert(item.action_id);
  }

  active_.clear();
  std::unordered_set<std::string> known_ids;
  for (ActiveEntry& entry : persisted) {
    if (listed && reported_ids.count(entry.action.id) == 0) {
      continue;
    }
    if (active_.count(entry.action.target_component) != 0) {
      continue;
    }
    known_ids.insert(entry.action.id);
    active_.emplace(entry.action.target_component, std::move(entry));
  }

  std::vector<DispatchJob> orphans;
  for (const actuators::ActiveAction& item : reported) {
    if (known_ids.count(item.action_id) != 0) {
      continue;
    }
    DispatchJob job{};
    job.kind = job_kind::REVERT;
    job.target = item.target;
    job.previous.id = item.action_id;
    job.previous.target_component = item.target;
    orphans.push_back(std::move(job));
  }

  if (!active_.empty() || !orphans.empty()) {
    std::cerr << "[controller] reloaded " << active_.size() << " active actions, reverting " << orphans.size()
              << " orphans\n";
  }

  for (const DispatchJob& job : orphans) {
    const std::shared_ptr<actuators::Actuator> actuator = actuators_->find(job.target);
    if (actuator == nullptr) {
      continue;
    }
    std::uint32_t attempts = 0;
    const model::action_result result = dispatcher_.revert(*actuator, job.previous.id, attempts);
    ++counters_.dispatches;
    if (!result.success) {
      ++counters_.dispatch_failures;
      std::cerr << "[controller] orphan " << job.previous.id << " revert failed: " << result.message << '\n';
    }
  }
  table_dirty_ = true;
}

void Controller::tick() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == controller_state::STOPPED) {
    return;
  }
  ++counters_.ticks;

  poll_pending(false);

  const std::optional<model::system_snapshot> latest = monitor_ != nullptr ? monitor_->latest_snapshot() : std::nullopt;
  const std::uint64_t now_ms = clock_();
  if (!latest.has_value()) {
    ++counters_.missing_snapshots;
    publish_status();
    return;
  }

  const model::system_snapshot& snapshot = *latest;
  const auto stale_after_ms = static_cast<std::uint64_t>(config_.sampling_interval.count()) * 2ULL;
  if (now_ms > snapshot.timestamp_ms && now_ms - snapshot.timestamp_ms > stale_after_ms) {
    ++counters_.stale_snapshots;
    if (feed_was_ok_) {
      std::cerr << "[controller] snapshot feed is stale, skipping ticks\n";
      feed_was_ok_ = false;
    }
    publish_status();
    return;
  }
  if (!feed_was_ok_) {
    std::cerr << "[controller] snapshot feed recovered\n";
    feed_was_ok_ = true;
  }

  if (snapshot.timestamp_ms != last_snapshot_ms_ || history_.empty()) {
    counters_.unavailable_metrics += std::bitset<32>(snapshot.unavailable).count();
    history_.push_back(snapshot);
    while (history_.size() > std::max<std::size_t>(config_.history_window, 1)) {
      history_.pop_front();
    }
    last_snapshot_ms_ = snapshot.timestamp_ms;
  }

  const model::context_state context = analyzer_.analyze(snapshot, history_);
  counters_.battery_percent = snapshot.battery_percent;
  counters_.context_score = context.context_score;
  counters_.timestamp_ms = now_ms;

  if (state_ == controller_state::PAUSED) {
    publish_status();
    return;
  }

  const bool critical = context.battery == model::battery_level::CRITICAL;
  if (critical && state_ == controller_state::RUNNING) {
    transition(controller_state::EMERGENCY, "battery critical");
  }

  const reasoning::Calibration calibration =
      learner_ != nullptr ? learner_->get_calibration() : reasoning::Calibration{};
  const reasoning::Decision decision = engine_.decide(snapshot, context, calibration);
  const model::optimization_mode mode = core::mode_settings(config_, mode_);
  const std::vector<model::optimization_action> approved = filter_.filter(decision.candidates, mode, critical);
  const model::decision_source source = critical ? model::decision_source::EMERGENCY : decision.source;

  reconcile(approved, source, now_ms);

  if (state_ == controller_state::EMERGENCY && !critical && !has_emergency_entries()) {
    transition(controller_state::RUNNING, "battery above critical");
  }

  std::vector<std::string> applied;
  applied.reserve(active_.size());
  for (const auto& [target, entry] : active_) {
    applied.push_back(entry.action.id);
  }
  record_outcome(snapshot, context, decision, source, std::move(applied), now_ms);

  persist_active_table();
  publish_status();
}

void Controller::reconcile(const std::vector<model::optimization_action>& approved,
                           const model::decision_source source, const std::uint64_t now_ms) {
  std::vector<DispatchJob> jobs;
  std::unordered_set<std::string> wanted;

  for (const model::optimization_action& candidate : approved) {
    const std::string& target = candidate.target_component;
    if (!wanted.insert(target).second) {
      continue;
    }
    if (pending_.count(target) != 0) {
      continue;
    }

    if (const auto failed = failed_applies_.find(target); failed != failed_applies_.end()) {
      if (same_action(failed->second, candidate, config_.actuation.intensity_tolerance)) {
        continue;
      }
      failed_applies_.erase(failed);
    }

    const auto it = active_.find(target);
    if (it != active_.end() && same_action(it->second.action, candidate, config_.actuation.intensity_tolerance)) {
      if (it->second.issued_by == model::decision_source::EMERGENCY && source != model::decision_source::EMERGENCY) {
        it->second.issued_by = source;
        table_dirty_ = true;
      }
      it->second.stuck = false;
      continue;
    }

    DispatchJob job{};
    job.target = target;
    job.next = candidate;
    job.next.id = next_action_id(now_ms);
    job.next.created_at_ms = now_ms;
    if (it == active_.end()) {
      job.kind = job_kind::ISSUE;
    } else {
      job.kind = job_kind::REPLACE;
      job.previous = it->second.action;
    }
    jobs.push_back(std::move(job));
  }

  for (auto failed = failed_applies_.begin(); failed != failed_applies_.end();) {
    failed = wanted.count(failed->first) != 0 ? std::next(failed) : failed_applies_.erase(failed);
  }

  for (const auto& [target, entry] : active_) {
    if (wanted.count(target) != 0 || pending_.count(target) != 0) {
      continue;
    }
    DispatchJob job{};
    job.kind = job_kind::REVERT;
    job.target = target;
    job.previous = entry.action;
    jobs.push_back(std::move(job));
  }

  dispatch(std::move(jobs), source, false);
}

void Controller::dispatch(std::vector<DispatchJob> jobs, const model::decision_source source, const bool wait_all) {
  if (jobs.empty()) {
    return;
  }

  std::vector<PendingJob> launched;
  launched.reserve(jobs.size());
  for (DispatchJob& job : jobs) {
    std::shared_ptr<actuators::Actuator> actuator = actuators_->find(job.target);
    if (actuator == nullptr) {
      if (job.kind != job_kind::ISSUE) {
        std::cerr << "[controller] no actuator for " << job.target << ", dropping " << job.previous.id << '\n';
        active_.erase(job.target);
        table_dirty_ = true;
      }
      continue;
    }

    ++counters_.dispatches;
    const Dispatcher dispatcher = dispatcher_;
    std::future<DispatchResult> result =
        std::async(std::launch::async, [dispatcher, actuator, job] { return dispatcher.run(*actuator, job); });
    launched.push_back({std::move(job), source, std::move(result)});
  }

  const auto deadline = std::chrono::steady_clock::now() + config_.actuation.dispatch_timeout;
  for (PendingJob& item : launched) {
    const bool ready = wait_all || item.result.wait_until(deadline) == std::future_status::ready;
    if (ready) {
      apply_result(item.job, item.source, item.result.get());
      continue;
    }
    std::cerr << "[controller] dispatch for " << item.job.target << " still running, polling next tick\n";
    const std::string target = item.job.target;
    pending_.emplace(target, std::move(item));
  }
}

void Controller::apply_result(const DispatchJob& job, const model::decision_source source,
                              const DispatchResult& result) {
  table_dirty_ = true;

  if (!result.revert_ok) {
    ++counters_.dispatch_failures;
    const auto it = active_.find(job.target);
    if (it != active_.end()) {
      if (!it->second.stuck) {
        std::cerr << "[controller] revert of " << job.previous.id << " on " << job.target
                  << " failed after " << result.attempts << " attempts, marked stuck: " << result.message << '\n';
      }
      it->second.stuck = true;
    }
    return;
  }

  if (job.kind == job_kind::REVERT) {
    active_.erase(job.target);
    return;
  }

  if (!result.apply_ok) {
    ++counters_.dispatch_failures;
    std::cerr << "[controller] apply of " << model::to_string(job.next.type) << " on " << job.target
              << " failed after " << result.attempts << " attempts, marked stuck until the decision changes: "
              << result.message << '\n';
    active_.erase(job.target);
    failed_applies_[job.target] = job.next;
    return;
  }

  failed_applies_.erase(job.target);
  active_[job.target] = ActiveEntry{job.next, source, false};
}

void Controller::poll_pending(const bool wait_all) {
  for (auto it = pending_.begin(); it != pending_.end();) {
    PendingJob& item = it->second;
    const bool ready = wait_all || item.result.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready;
    if (!ready) {
      ++it;
      continue;
    }
    apply_result(item.job, item.source, item.result.get());
    it = pending_.erase(it);
  }
}

void Controller::retry_stuck_reverts() {
  std::vector<DispatchJob> jobs;
  for (const auto& [target, entry] : active_) {
    if (!entry.stuck || pending_.count(target) != 0) {
      continue;
    }
    DispatchJob job{};
    job.kind = job_kind::REVERT;
    job.target = target;
    job.previous = entry.action;
    jobs.push_back(std::move(job));
  }
  dispatch(std::move(jobs), model::decision_source::RULE, true);
}

std::size_t Controller::revert_all_locked() {
  poll_pending(true);

  std::vector<DispatchJob> jobs;
  for (const auto& [target, entry] : active_) {
    DispatchJob job{};
    job.kind = job_kind::REVERT;
    job.target = target;
    job.previous = entry.action;
    jobs.push_back(std::move(job));
  }

  const std::size_t before = active_.size();
  dispatch(std::move(jobs), model::decision_source::RULE, true);
  return before - active_.size();
}

void Controller::shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == controller_state::STOPPED) {
    return;
  }

  const std::size_t reverted = revert_all_locked();
  std::cerr << "[controller] shutdown reverted " << reverted << " actions";
  if (!active_.empty()) {
    std::cerr << ", " << active_.size() << " left stuck";
  }
  std::cerr << '\n';

  transition(controller_state::STOPPED, "shutdown");
  persist_active_table();
  publish_status();

  if (learner_ != nullptr) {
    learner_->shutdown();
  }
}

ControllerStatus Controller::run_for_ticks(const std::size_t total_ticks) {
  if (first_tick_) {
    next_wakeup_ = std::chrono::steady_clock::now();
    first_tick_ = false;
  }

  for (std::size_t i = 0; total_ticks == 0 || i < total_ticks; ++i) {
    if (stop_requested_.load()) {
      break;
    }
    tick();
    next_wakeup_ += config_.decision_interval;
    std::this_thread::sleep_until(next_wakeup_);
  }
  return status();
}

bool Controller::pause() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != controller_state::RUNNING && state_ != controller_state::EMERGENCY) {
    return false;
  }
  transition(controller_state::PAUSED, "pause requested");
  retry_stuck_reverts();
  persist_active_table();
  publish_status();
  return true;
}

bool Controller::resume() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != controller_state::PAUSED) {
    return false;
  }
  transition(controller_state::RUNNING, "resume requested");
  publish_status();
  return true;
}

std::size_t Controller::revert_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t reverted = revert_all_locked();
  persist_active_table();
  publish_status();
  return reverted;
}

std::size_t Controller::emergency_revert() {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t reverted = revert_all_locked();
  if (state_ != controller_state::STOPPED) {
    transition(controller_state::PAUSED, "emergency revert");
  }
  persist_active_table();
  publish_status();
  return reverted;
}

void Controller::set_mode(const model::mode_name mode) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mode_ != mode) {
    std::cerr << "[controller] mode " << model::to_string(mode_) << " -> " << model::to_string(mode) << '\n';
    mode_ = mode;
  }
  counters_.mode = mode_;
  publish_status();
}

bool Controller::submit_feedback(model::feedback_record feedback) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (feedback.decision_id.empty()) {
    if (last_decision_id_.empty()) {
      return false;
    }
    feedback.decision_id = last_decision_id_;
  }
  if (feedback.timestamp_ms == 0) {
    feedback.timestamp_ms = clock_();
  }
  feedback.satisfaction = std::clamp(feedback.satisfaction, 0.0F, 1.0F);

  counters_.running_satisfaction =
      (kSatisfactionDecay * counters_.running_satisfaction) + ((1.0F - kSatisfactionDecay) * feedback.satisfaction);
  if (learner_ != nullptr) {
    learner_->submit_feedback(std::move(feedback));
  }
  publish_status();
  return true;
}

ControllerStatus Controller::status() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return status_;
}

std::vector<model::optimization_action> Controller::active_actions() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return active_copy_;
}

controller_state Controller::state() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return status_.state;
}

void Controller::transition(const controller_state next, const char* reason) {
  if (state_ == next) {
    return;
  }
  std::cerr << "[controller] " << to_string(state_) << " -> " << to_string(next) << " (" << reason << ")\n";
  state_ = next;
  // Applies that failed under the previous state get a fresh attempt.
  failed_applies_.clear();
}

bool Controller::has_emergency_entries() const noexcept {
  return std::any_of(active_.begin(), active_.end(), [](const auto& item) {
    return item.second.issued_by == model::decision_source::EMERGENCY;
  });
}

void Controller::record_outcome(const model::system_snapshot& snapshot, const model::context_state& context,
                                const reasoning::Decision& decision, const model::decision_source source,
                                std::vector<std::string> issued, const std::uint64_t now_ms) {
  model::decision_outcome outcome{};
  outcome.decision_id = "dec-" + std::to_string(now_ms) + "-" + std::to_string(++id_counter_);
  outcome.snapshot = snapshot;
  outcome.context_score = context.context_score;
  outcome.decided = decision.level;
  outcome.source = source;
  outcome.actions_applied = std::move(issued);
  if (previous_power_draw_.has_value() && *previous_power_draw_ > 0.0F) {
    outcome.observed_savings =
        (*previous_power_draw_ - snapshot.battery_power_draw) / *previous_power_draw_ * 100.0F;
  }
  outcome.observed_satisfaction = counters_.running_satisfaction;
  outcome.timestamp_ms = now_ms;
  previous_power_draw_ = snapshot.battery_power_draw;

  ++counters_.decisions;
  counters_.last_decision_id = outcome.decision_id;
  counters_.last_source = source;
  counters_.last_severity = decision.level;
  last_decision_id_ = outcome.decision_id;

  if (learner_ != nullptr) {
    learner_->record_outcome(std::move(outcome));
  }
}

void Controller::persist_active_table() {
  if (!table_dirty_ || store_ == nullptr) {
    return;
  }
  if (table_unread_) {
    try {
      (void)store_->load(store::kActiveActionsKey);
    } catch (const store::StoreUnavailable&) {
      return;
    } catch (const std::exception&) {
      // Readable but corrupt; the live table replaces it.
    }
    table_unread_ = false;
  }

  nlohmann::json actions = nlohmann::json::array();
  for (const auto& [target, entry] : active_) {
    actions.push_back({
        {"action", store::action_to_json(entry.action)},
        {"source", model::to_string(entry.issued_by)},
        {"stuck", entry.stuck},
    });
  }
  if (store_->save(store::kActiveActionsKey, nlohmann::json{{"actions", std::move(actions)}})) {
    table_dirty_ = false;
  }
}

void Controller::publish_status() {
  ControllerStatus snapshot = counters_;
  snapshot.state = state_;
  snapshot.mode = mode_;
  snapshot.active_count = active_.size();
  snapshot.pending_dispatches = pending_.size();
  snapshot.aggregate_savings = 0.0F;
  snapshot.stuck_actions = failed_applies_.size();

  std::vector<model::optimization_action> copy;
  copy.reserve(active_.size());
  for (const auto& [target, entry] : active_) {
    snapshot.aggregate_savings += entry.action.estimated_savings;
    if (entry.stuck) {
      ++snapshot.stuck_actions;
    }
    copy.push_back(entry.action);
  }
  std::sort(copy.begin(), copy.end(), [](const auto& lhs, const auto& rhs) {
    return lhs.target_component < rhs.target_component;
  });

  if (learner_ != nullptr) {
    const learning::LearnerStats learner = learner_->stats();
    snapshot.retrain_failures = learner.retrain_failures;
    snapshot.model_samples = learner.model_samples;
    snapshot.historical_accuracy = learner.historical_accuracy;
  }

  std::lock_guard<std::mutex> lock(status_mutex_);
  status_ = std::move(snapshot);
  active_copy_ = std::move(copy);
}

std::string Controller::next_action_id(const std::uint64_t now_ms) {
  return "act-" + std::to_string(now_ms) + "-" + std::to_string(++id_counter_);
}

}  // namespace pwr_agent::control
